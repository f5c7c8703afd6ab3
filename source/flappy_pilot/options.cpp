#include "flappy_pilot/options.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>

namespace flappy_pilot {

namespace {

template<typename Unsigned>
Unsigned parse_unsigned(const std::string_view flag, const std::string_view value) {
	Unsigned number{};
	const auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), number);

	if (error == std::errc::result_out_of_range) {
		throw std::invalid_argument(std::string(flag) + ": value out of range: " + std::string(value));
	}
	if (error != std::errc{} or end != value.data() + value.size()) {
		throw std::invalid_argument(std::string(flag) + ": not an unsigned number: " + std::string(value));
	}

	return number;
}

} // namespace

options_t parse_options(const int argc, const char* const* argv) {

	auto options = options_t{};
	options.thread_count = std::max(1u, std::thread::hardware_concurrency());

	const auto next_value = [&](int& i) -> std::string_view {
		if (i + 1 >= argc) {
			throw std::invalid_argument(std::string("missing value for ") + argv[i]);
		}
		return argv[++i];
	};

	for (int i{ 1 }; i < argc; ++i) {
		const auto flag = std::string_view(argv[i]);
		if (flag == "--headless") {
			options.headless = true;
		} else if (flag == "--level") {
			options.level_id = std::string(next_value(i));
		} else if (flag == "--seed") {
			options.seed = parse_unsigned<std::uint32_t>(flag, next_value(i));
		} else if (flag == "--seeds") {
			options.seed_count = parse_unsigned<std::uint32_t>(flag, next_value(i));
		} else if (flag == "--frames") {
			options.max_frames = parse_unsigned<std::size_t>(flag, next_value(i));
		} else if (flag == "--threads") {
			options.thread_count = std::max(1u, parse_unsigned<std::uint32_t>(flag, next_value(i)));
		} else {
			throw std::invalid_argument("unknown option: " + std::string(flag));
		}
	}

	return options;
}

} // namespace flappy_pilot
