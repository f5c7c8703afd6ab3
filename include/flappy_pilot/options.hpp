#pragma once

#include <cinttypes>
#include <cstddef>
#include <optional>
#include <string>

namespace flappy_pilot {

struct options_t {
	bool headless{ false };
	std::optional<std::string> level_id;
	std::uint32_t seed{ 0 };
	std::uint32_t seed_count{ 10 };
	std::size_t max_frames{ 10'000 };
	std::uint32_t thread_count{ 1 };
};

// Defaults to one thread per hardware thread. Throws std::invalid_argument for
// unknown flags, missing values, and numbers that are negative, malformed or
// out of range for their field.
[[nodiscard]] options_t parse_options(int argc, const char* const* argv);

} // namespace flappy_pilot
