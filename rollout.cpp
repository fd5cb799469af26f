#include "arcade/flyer/autopilot.hpp"
#include "arcade/flyer/environment.hpp"
#include "arcade/rollout.hpp"
#include "arcade/runner/autopilot.hpp"
#include "arcade/runner/environment.hpp"
#include "util/cli_parse.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

struct options_t {
	std::string game{ "runner" };
	arcade::rollout::config_t rollout{ .thread_count = std::max(std::thread::hardware_concurrency(), 1u) };
	bool per_copy{ false };
};

void print_usage() {
	std::cout << "Usage: arcade_rollout [--game runner|flyer] [--copies N] [--episodes N] [--threads N]\n"
				 "                      [--seed N] [--max-steps N] [--per-copy]"
			  << std::endl;
}

options_t parse_options(const int argc, char** argv) {
	auto options = options_t{};
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--game") {
			options.game = require_arg(i, argc, argv, arg);
			if (options.game != "runner" and options.game != "flyer") {
				throw std::runtime_error("Unknown game: " + options.game);
			}
		} else if (arg == "--copies") {
			options.rollout.copies = parse_u32(require_arg(i, argc, argv, arg));
		} else if (arg == "--episodes") {
			options.rollout.episodes_per_copy = parse_u32(require_arg(i, argc, argv, arg));
		} else if (arg == "--threads") {
			options.rollout.thread_count = parse_u32(require_arg(i, argc, argv, arg));
		} else if (arg == "--seed") {
			options.rollout.base_seed = parse_u64(require_arg(i, argc, argv, arg));
		} else if (arg == "--max-steps") {
			options.rollout.max_steps_per_episode = parse_u32(require_arg(i, argc, argv, arg));
		} else if (arg == "--per-copy") {
			options.per_copy = true;
		} else if (arg == "-h" or arg == "--help") {
			print_usage();
			std::exit(EXIT_SUCCESS);
		} else {
			throw std::runtime_error("Unknown argument: " + arg);
		}
	}
	if (options.rollout.copies == 0 or options.rollout.episodes_per_copy == 0) {
		throw std::runtime_error("--copies and --episodes must be positive.");
	}
	return options;
}

std::vector<arcade::rollout::copy_result_t> run(const options_t& options) {
	if (options.game == "runner") {
		return arcade::rollout::run<arcade::runner::environment_t>(
			arcade::runner::config_t{},
			[](const arcade::runner::environment_t& environment) {
				return arcade::runner::autopilot_t(environment.geometry());
			},
			options.rollout
		);
	}
	return arcade::rollout::run<arcade::flyer::environment_t>(
		arcade::flyer::config_t{},
		[](const arcade::flyer::environment_t&) { return arcade::flyer::autopilot_t{}; },
		options.rollout
	);
}

} // namespace

int main(int argc, char** argv) {
	try {
		const auto options = parse_options(argc, argv);

		std::cout << "|--------[ " << options.game << ": " << options.rollout.copies << " copies x "
				  << options.rollout.episodes_per_copy << " episodes on " << options.rollout.thread_count
				  << " threads ]--------|" << std::endl;

		const auto start = std::chrono::steady_clock::now();
		const auto copies = run(options);
		const auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

		std::cout << std::fixed << std::setprecision(2);

		if (options.per_copy) {
			for (const auto& copy : copies) {
				std::cout << "seed " << copy.seed << ": score " << copy.mean_score() << " return "
						  << copy.mean_return() << std::endl;
			}
		}

		const auto summary = arcade::rollout::summarize(copies);
		std::cout << "Average scores min: " << summary.min_score << " mean: " << summary.mean_score
				  << " max: " << summary.max_score << std::endl;
		std::cout << "Average return: " << summary.mean_return << std::endl;
		std::cout << summary.total_steps << " steps in " << seconds << " s ("
				  << static_cast<double>(summary.total_steps) / std::max(seconds, 1e-9) << " steps/s)" << std::endl;

	} catch (const std::exception& e) {
		std::cerr << "arcade_rollout: " << e.what() << std::endl;
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
