#define BOOST_TEST_MODULE LevelMaterializeTests
#include <boost/test/unit_test.hpp>

#include "flappy_pilot/levels/builtin_levels.hpp"
#include "flappy_pilot/levels/level_config.hpp"
#include "flappy_pilot/levels/materialize.hpp"

#include <limits>
#include <random>
#include <set>
#include <stdexcept>

using namespace flappy_pilot::levels;

// ============================================================================
// PIPE PLACEMENT
// ============================================================================

BOOST_AUTO_TEST_SUITE(PlacementTests)

BOOST_AUTO_TEST_CASE(TestFeasibleRequestKeptExactly) {
	const auto config = materialize_config_t{};
	const auto pipe = place_pipe(config, { 400.0f, 300.0f, 150.0f }, 550.0f);

	BOOST_CHECK_EQUAL(pipe.position_x, 400.0f);
	BOOST_CHECK_EQUAL(pipe.gap_top, 225.0f);
	BOOST_CHECK_EQUAL(pipe.gap_bottom, 375.0f);
}

BOOST_AUTO_TEST_CASE(TestLowGapClampedAboveFloorClearance) {
	const auto config = materialize_config_t{};
	const auto pipe = place_pipe(config, { 400.0f, 500.0f, 150.0f }, 550.0f);

	BOOST_CHECK_EQUAL(pipe.gap_bottom, 540.0f);
	BOOST_CHECK_EQUAL(pipe.gap_top, 390.0f);
	BOOST_CHECK_EQUAL(pipe.gap_height(), 150.0f);
}

BOOST_AUTO_TEST_CASE(TestHighGapClampedBelowTop) {
	const auto config = materialize_config_t{};
	const auto pipe = place_pipe(config, { 400.0f, 20.0f, 150.0f }, 550.0f);

	BOOST_CHECK_EQUAL(pipe.gap_top, 0.0f);
	BOOST_CHECK_EQUAL(pipe.gap_bottom, 150.0f);
}

BOOST_AUTO_TEST_CASE(TestBoundaryCentresAreFeasible) {
	const auto config = materialize_config_t{};

	const auto lowest = place_pipe(config, { 400.0f, 465.0f, 150.0f }, 550.0f);
	BOOST_CHECK_EQUAL(lowest.gap_center(), 465.0f);

	const auto highest = place_pipe(config, { 400.0f, 75.0f, 150.0f }, 550.0f);
	BOOST_CHECK_EQUAL(highest.gap_center(), 75.0f);
}

BOOST_AUTO_TEST_CASE(TestInfeasibleBandUsesMidpoint) {
	const auto config = materialize_config_t{};

	// Feasible centres would be [300, 240]: inverted, so the centre is 270.
	const auto pipe = place_pipe(config, { 400.0f, 100.0f, 600.0f }, 550.0f);

	BOOST_CHECK_EQUAL(pipe.gap_center(), 270.0f);
	BOOST_CHECK_EQUAL(pipe.gap_top, -30.0f);
	BOOST_CHECK_EQUAL(pipe.gap_bottom, 570.0f);
	BOOST_CHECK_EQUAL(pipe.gap_height(), 600.0f);
}

BOOST_AUTO_TEST_CASE(TestMarginsAreConfigurable) {
	const auto config = materialize_config_t{ .margin_top = 40.0f, .margin_bottom_from_floor = 30.0f };

	const auto high = place_pipe(config, { 400.0f, 50.0f, 100.0f }, 550.0f);
	BOOST_CHECK_EQUAL(high.gap_top, 40.0f);

	const auto low = place_pipe(config, { 400.0f, 500.0f, 100.0f }, 550.0f);
	BOOST_CHECK_EQUAL(low.gap_bottom, 520.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// FLOOR SAMPLING
// ============================================================================

BOOST_AUTO_TEST_SUITE(FloorTests)

BOOST_AUTO_TEST_CASE(TestFloorSampledWithinInclusiveBand) {
	std::mt19937 rng{ 7 };
	std::set<int> seen;

	for (int i{}; i != 500; ++i) {
		const auto floor_y = sample_floor({ .min_y = 500, .max_y = 503 }, rng);
		BOOST_CHECK_GE(floor_y, 500);
		BOOST_CHECK_LE(floor_y, 503);
		seen.insert(floor_y);
	}

	BOOST_CHECK_EQUAL(seen.size(), 4u);
}

BOOST_AUTO_TEST_CASE(TestSameSeedSameFloor) {
	std::mt19937 first{ 42 }, second{ 42 };
	const auto level = hard_level();

	const auto a = materialize(materialize_config_t{}, level, first);
	const auto b = materialize(materialize_config_t{}, level, second);

	BOOST_CHECK_EQUAL(a.floor_y, b.floor_y);
	BOOST_REQUIRE_EQUAL(a.pipes.size(), b.pipes.size());
	for (std::size_t i{}; i != a.pipes.size(); ++i) {
		BOOST_CHECK_EQUAL(a.pipes[i].gap_top, b.pipes[i].gap_top);
	}
}

BOOST_AUTO_TEST_CASE(TestFloorOnlyLevelClampedIntoField) {
	std::mt19937 rng{ 1 };
	const auto level = level_config_t{ .id = "below_field",
		                               .name = "Below field",
		                               .description = "",
		                               .floor_band = { .min_y = 650, .max_y = 700 },
		                               .pipes = {} };

	const auto materialized = materialize(materialize_config_t{}, level, rng);
	BOOST_CHECK_EQUAL(materialized.floor_y, 599.0f);
	BOOST_CHECK(materialized.pipes.empty());
}

BOOST_AUTO_TEST_CASE(TestFloorWithPipesNotClamped) {
	std::mt19937 rng{ 1 };
	const auto level = level_config_t{ .id = "low_floor",
		                               .name = "Low floor",
		                               .description = "",
		                               .floor_band = { .min_y = 650, .max_y = 650 },
		                               .pipes = { { 400.0f, 300.0f, 150.0f } } };

	const auto materialized = materialize(materialize_config_t{}, level, rng);
	BOOST_CHECK_EQUAL(materialized.floor_y, 650.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// VALIDATION
// ============================================================================

BOOST_AUTO_TEST_SUITE(ValidationTests)

BOOST_AUTO_TEST_CASE(TestRejectsInvertedFloorBand) {
	auto level = simple_level();
	level.floor_band = { .min_y = 600, .max_y = 500 };
	BOOST_CHECK_THROW(validate(level), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestRejectsNonPositiveGapHeight) {
	auto level = simple_level();
	level.pipes.front().gap_height = 0.0f;
	BOOST_CHECK_THROW(validate(level), std::invalid_argument);

	std::mt19937 rng{ 3 };
	BOOST_CHECK_THROW(static_cast<void>(materialize(materialize_config_t{}, level, rng)), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestRejectsNonFiniteRequest) {
	auto level = simple_level();
	level.pipes.front().gap_center = std::numeric_limits<float>::quiet_NaN();
	BOOST_CHECK_THROW(validate(level), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestRejectsUnsortedPipes) {
	auto level = simple_level();
	level.pipes.push_back({ 200.0f, 300.0f, 150.0f });
	BOOST_CHECK_THROW(validate(level), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestRejectsBadMaterializeConfig) {
	const auto inf = std::numeric_limits<float>::infinity();

	BOOST_CHECK_NO_THROW(validate(materialize_config_t{}));
	BOOST_CHECK_THROW(validate(materialize_config_t{ .margin_top = inf }), std::invalid_argument);
	BOOST_CHECK_THROW(validate(materialize_config_t{ .margin_bottom_from_floor = -1.0f }), std::invalid_argument);
	BOOST_CHECK_THROW(validate(materialize_config_t{ .field_height = 0.0f }), std::invalid_argument);

	std::mt19937 rng{ 3 };
	BOOST_CHECK_THROW(
		static_cast<void>(materialize(materialize_config_t{ .margin_top = inf }, simple_level(), rng)),
		std::invalid_argument
	);
}

BOOST_AUTO_TEST_CASE(TestBuiltinLevelsAreValid) {
	std::mt19937 rng{ 11 };
	for (const auto& id : builtin_level_ids()) {
		BOOST_CHECK_NO_THROW(validate(builtin_level(id, rng)));
	}
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// BUILT-IN LEVELS
// ============================================================================

BOOST_AUTO_TEST_SUITE(BuiltinLevelTests)

BOOST_AUTO_TEST_CASE(TestCatalogue) {
	std::mt19937 rng{ 0 };

	BOOST_CHECK_EQUAL(builtin_level_ids().size(), 5u);
	BOOST_CHECK_EQUAL(builtin_level("simple", rng).pipes.size(), 1u);
	BOOST_CHECK_EQUAL(builtin_level("medium", rng).pipes.size(), 5u);
	BOOST_CHECK_EQUAL(builtin_level("hard", rng).pipes.size(), 10u);
	BOOST_CHECK(builtin_level("floor_test", rng).pipes.empty());
	BOOST_CHECK_EQUAL(builtin_level("marathon", rng).pipes.size(), 200u);
}

BOOST_AUTO_TEST_CASE(TestUnknownIdFallsBackToMarathon) {
	std::mt19937 rng{ 0 };
	BOOST_CHECK_EQUAL(builtin_level("no_such_level", rng).id, "marathon");
}

BOOST_AUTO_TEST_CASE(TestMarathonLayout) {
	std::mt19937 rng{ 5 };
	const auto level = marathon_level(rng);

	for (std::size_t i{}; i != level.pipes.size(); ++i) {
		const auto& request = level.pipes[i];
		BOOST_CHECK_EQUAL(request.position_x, 400.0f + 350.0f * static_cast<float>(i));
		BOOST_CHECK_GE(request.gap_height, 150.0f);
		BOOST_CHECK_LE(request.gap_height, 200.0f);
		BOOST_CHECK_GE(request.gap_center - request.gap_height / 2.0f, 40.0f - 1e-3f);
		BOOST_CHECK_LE(request.gap_center + request.gap_height / 2.0f, 560.0f + 1e-3f);
	}
}

BOOST_AUTO_TEST_CASE(TestMarathonReplaysFromSeed) {
	std::mt19937 first{ 9 }, second{ 9 };
	const auto a = marathon_level(first);
	const auto b = marathon_level(second);

	for (std::size_t i{}; i != a.pipes.size(); ++i) {
		BOOST_CHECK_EQUAL(a.pipes[i].gap_center, b.pipes[i].gap_center);
		BOOST_CHECK_EQUAL(a.pipes[i].gap_height, b.pipes[i].gap_height);
	}
}

BOOST_AUTO_TEST_CASE(TestSimpleLevelGapUnclampedForAnyFloor) {
	std::mt19937 rng{ 21 };
	for (int i{}; i != 50; ++i) {
		const auto level = materialize(materialize_config_t{}, simple_level(), rng);
		BOOST_CHECK_GE(level.floor_y, 500.0f);
		BOOST_CHECK_LE(level.floor_y, 600.0f);
		BOOST_CHECK_EQUAL(level.pipes.front().gap_top, 225.0f);
		BOOST_CHECK_EQUAL(level.pipes.front().gap_bottom, 375.0f);
	}
}

BOOST_AUTO_TEST_SUITE_END()
