#define BOOST_TEST_MODULE OptionsTests
#include <boost/test/unit_test.hpp>

#include "flappy_pilot/options.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using flappy_pilot::options_t;

namespace {

options_t parse(std::vector<const char*> args) {
	args.insert(args.begin(), "flappy_pilot");
	return flappy_pilot::parse_options(static_cast<int>(args.size()), args.data());
}

} // namespace

// ============================================================================
// ACCEPTED INPUT
// ============================================================================

BOOST_AUTO_TEST_SUITE(AcceptedTests)

BOOST_AUTO_TEST_CASE(TestDefaults) {
	const auto options = parse({});

	BOOST_CHECK(not options.headless);
	BOOST_CHECK(not options.level_id.has_value());
	BOOST_CHECK_EQUAL(options.seed, 0u);
	BOOST_CHECK_EQUAL(options.seed_count, 10u);
	BOOST_CHECK_EQUAL(options.max_frames, 10'000u);
	BOOST_CHECK_GE(options.thread_count, 1u);
}

BOOST_AUTO_TEST_CASE(TestEveryFlag) {
	const auto options = parse(
		{ "--headless", "--level", "hard", "--seed", "42", "--seeds", "3", "--frames", "500", "--threads", "2" }
	);

	BOOST_CHECK(options.headless);
	BOOST_REQUIRE(options.level_id.has_value());
	BOOST_CHECK_EQUAL(*options.level_id, "hard");
	BOOST_CHECK_EQUAL(options.seed, 42u);
	BOOST_CHECK_EQUAL(options.seed_count, 3u);
	BOOST_CHECK_EQUAL(options.max_frames, 500u);
	BOOST_CHECK_EQUAL(options.thread_count, 2u);
}

BOOST_AUTO_TEST_CASE(TestLargestSeedAccepted) {
	const auto largest = std::to_string(std::numeric_limits<std::uint32_t>::max());
	const auto options = parse({ "--seed", largest.c_str() });
	BOOST_CHECK_EQUAL(options.seed, std::numeric_limits<std::uint32_t>::max());
}

BOOST_AUTO_TEST_CASE(TestZeroThreadsMeansOne) {
	BOOST_CHECK_EQUAL(parse({ "--threads", "0" }).thread_count, 1u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// REJECTED INPUT
// ============================================================================

BOOST_AUTO_TEST_SUITE(RejectedTests)

BOOST_AUTO_TEST_CASE(TestNegativeNumbersRejected) {
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--threads", "-1" })), std::invalid_argument);
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--frames", "-5" })), std::invalid_argument);
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--seed", "-0" })), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeRejected) {
	const auto too_large = std::to_string(std::uint64_t{ std::numeric_limits<std::uint32_t>::max() } + 1);
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--threads", too_large.c_str() })), std::invalid_argument);
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--seeds", too_large.c_str() })), std::invalid_argument);
	BOOST_CHECK_THROW(
		static_cast<void>(parse({ "--frames", "99999999999999999999999999" })), std::invalid_argument
	);
}

BOOST_AUTO_TEST_CASE(TestMalformedNumbersRejected) {
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--seed", "12abc" })), std::invalid_argument);
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--seed", "" })), std::invalid_argument);
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--seed", " 7" })), std::invalid_argument);
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--seed", "+7" })), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestMissingValueRejected) {
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--level" })), std::invalid_argument);
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--headless", "--frames" })), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestUnknownFlagRejected) {
	BOOST_CHECK_THROW(static_cast<void>(parse({ "--fast" })), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
