#include "flappy_pilot/evaluation/evaluation.hpp"

#include "flappy_pilot/simulation.hpp"
#include "util/integer_range.hpp"

#include <exception>
#include <random>
#include <thread>

namespace flappy_pilot::evaluation {

run_result_t run(const config_t& config, const run_request_t& request) {

	std::mt19937 rng{ request.seed };
	const auto level = levels::materialize(config.materialize_config, request.level, rng);

	simulation_t simulation(config.game_config, config.autopilot_config);
	simulation.load(level);
	simulation.set_autopilot(true);

	auto result = run_result_t{ .level_id = request.level.id,
		                        .seed = request.seed,
		                        .floor_y = level.floor_y,
		                        .frames = 0,
		                        .score = 0,
		                        .pipe_count = level.pipes.size(),
		                        .collision = game_logic::collision_t::none,
		                        .completed = false,
		                        .rule_counts = {},
		                        .jump_count = 0 };

	const auto all_pipes_passed = [&]() {
		return not level.pipes.empty() and simulation.state().score == level.pipes.size();
	};

	while (result.frames != request.max_frames and not all_pipes_passed()) {
		const auto tick = simulation.update();
		++result.frames;

		if (tick.decision) {
			++result.rule_counts[static_cast<std::size_t>(tick.decision->rule)];
		}
		result.jump_count += static_cast<std::size_t>(tick.step.jumped);

		if (tick.step.game_over) {
			break;
		}
	}

	const auto& state = simulation.state();
	result.score = state.score;
	result.collision = state.collision;
	result.completed = not state.game_over;

	return result;
}

std::vector<run_result_t> evaluate_batch(
	const config_t& config, const std::span<const run_request_t> requests, const std::uint32_t thread_count
) {
	// Reject bad input before any worker starts.
	game_logic::validate(config.game_config);
	levels::validate(config.materialize_config);
	for (const auto& request : requests) {
		levels::validate(request.level);
	}

	std::vector<run_result_t> results(requests.size());

	const auto request_range = integer_range<std::size_t>::from_index_count(0, requests.size());

	const auto run_segment = [&](const integer_range<std::size_t>& segment) {
		for (const auto i : segment.indices()) {
			results[i] = run(config, requests[i]);
		}
	};

	if (thread_count <= 1) {
		run_segment(request_range);
		return results;
	}

	const auto segments = request_range.balanced_segments(thread_count);

	std::vector<std::thread> threads;
	threads.reserve(segments.size());

	// One slot per worker; rethrown on the calling thread after every join.
	std::vector<std::exception_ptr> worker_errors(segments.size());

	for (std::size_t worker_index{}; worker_index != segments.size(); ++worker_index) {
		threads.emplace_back([&, worker_index]() {
			try {
				run_segment(segments[worker_index]);
			} catch (...) {
				worker_errors[worker_index] = std::current_exception();
			}
		});
	}
	for (auto& thread : threads) {
		thread.join();
	}

	for (const auto& error : worker_errors) {
		if (error) {
			std::rethrow_exception(error);
		}
	}

	return results;
}

} // namespace flappy_pilot::evaluation
