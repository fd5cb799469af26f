#include "arcade/flyer/autopilot.hpp"
#include "arcade/flyer/environment.hpp"
#include "arcade/rendering/flyer_renderer.hpp"
#include "arcade/rendering/runner_renderer.hpp"
#include "arcade/runner/autopilot.hpp"
#include "arcade/runner/environment.hpp"
#include "util/cli_parse.hpp"

#include <SFML/Window/Event.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

enum class game_t { runner, flyer };
enum class play_mode_t { manual, autopilot };

struct options_t {
	game_t game{ game_t::runner };
	play_mode_t mode{ play_mode_t::manual };
	std::optional<arcade::seed_t> seed;
	std::optional<unsigned> fps;
	unsigned window_size{ 600 };
	std::filesystem::path font_file;
};

void print_usage() {
	std::cout << "Usage: arcade_play [--game runner|flyer] [--mode manual|auto] [--seed N] [--fps N]\n"
				 "                   [--window PIXELS] [--font FILE.ttf]\n"
				 "Keys: SPACE impulse, R restart after game over, TAB pause, ESC quit."
			  << std::endl;
}

options_t parse_options(const int argc, char** argv) {
	auto options = options_t{};
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--game") {
			const auto value = require_arg(i, argc, argv, arg);
			if (value == "runner") {
				options.game = game_t::runner;
			} else if (value == "flyer") {
				options.game = game_t::flyer;
			} else {
				throw std::runtime_error("Unknown game: " + value);
			}
		} else if (arg == "--mode") {
			const auto value = require_arg(i, argc, argv, arg);
			if (value == "manual") {
				options.mode = play_mode_t::manual;
			} else if (value == "auto") {
				options.mode = play_mode_t::autopilot;
			} else {
				throw std::runtime_error("Unknown mode: " + value);
			}
		} else if (arg == "--seed") {
			options.seed = parse_u64(require_arg(i, argc, argv, arg));
		} else if (arg == "--fps") {
			options.fps = parse_u32(require_arg(i, argc, argv, arg));
		} else if (arg == "--window") {
			options.window_size = parse_u32(require_arg(i, argc, argv, arg));
		} else if (arg == "--font") {
			options.font_file = require_arg(i, argc, argv, arg);
		} else if (arg == "-h" or arg == "--help") {
			print_usage();
			std::exit(EXIT_SUCCESS);
		} else {
			throw std::runtime_error("Unknown argument: " + arg);
		}
	}
	if (options.fps and *options.fps == 0) {
		throw std::runtime_error("--fps must be positive.");
	}
	if (options.window_size == 0) {
		throw std::runtime_error("--window must be positive.");
	}
	return options;
}

template<class Environment, class Renderer, class Autopilot>
void play(
	Environment& environment,
	Renderer& renderer,
	const Autopilot& autopilot,
	const options_t& options,
	const unsigned fps,
	const std::string& title
) {
	using seconds_t = std::chrono::duration<float>;
	const auto frame_time = seconds_t{ 1.0f } / static_cast<float>(fps);

	auto window = sf::RenderWindow(sf::VideoMode(options.window_size, options.window_size), title);

	auto observation = environment.reset(options.seed).observation;
	auto episode_return = 0.0f;

	bool running = true;
	bool game_over = false;
	bool pause = false;

	//----------------------[ Game Loop ]----------------------//

	while (running) {
		const auto start = std::chrono::high_resolution_clock::now();

		bool impulse_requested = false;

		sf::Event event;
		while (window.pollEvent(event)) {
			if (event.type == sf::Event::Closed) {
				running = false;
			} else if (event.type == sf::Event::Resized) {
				window.setView(sf::View(
					{ 0.0f, 0.0f, static_cast<float>(event.size.width), static_cast<float>(event.size.height) }
				));
			} else if (event.type == sf::Event::KeyPressed) {
				switch (event.key.code) {
				case sf::Keyboard::Escape:
					running = false;
					break;
				case sf::Keyboard::Tab:
					pause = !pause;
					break;
				case sf::Keyboard::Space:
					impulse_requested = true;
					break;
				case sf::Keyboard::R:
					if (game_over) {
						observation = environment.reset(std::nullopt).observation;
						game_over = false;
					}
					break;
				default:
					break;
				}
			}
		}

		if (not pause and not game_over) {
			const auto action = options.mode == play_mode_t::autopilot
				? autopilot.act(observation)
				: (impulse_requested ? arcade::action_t::impulse : arcade::action_t::idle);

			const auto result = environment.step(action);
			observation = result.observation;
			episode_return += result.reward;

			if (result.done()) {
				std::cout << "Episode finished. Score=" << result.info.score << ", Return=" << std::fixed
						  << std::setprecision(2) << episode_return << std::endl;
				episode_return = 0.0f;

				if (options.mode == play_mode_t::autopilot) {
					observation = environment.reset(std::nullopt).observation;
				} else {
					game_over = true;
				}
			}
		}

		renderer.render(environment, window);
		window.display();

		const auto finish = std::chrono::high_resolution_clock::now();
		std::this_thread::sleep_for(frame_time - (finish - start));
	}

	environment.close();
}

} // namespace

int main(int argc, char** argv) {
	try {
		const auto options = parse_options(argc, argv);

		if (options.game == game_t::runner) {
			auto environment = arcade::runner::environment_t{};
			auto renderer = arcade::rendering::runner_renderer_t({}, options.font_file);
			const auto autopilot = arcade::runner::autopilot_t(environment.geometry());
			play(environment, renderer, autopilot, options, options.fps.value_or(60), "Runner");
		} else {
			auto environment = arcade::flyer::environment_t{};
			auto renderer = arcade::rendering::flyer_renderer_t({}, options.font_file);
			const auto autopilot = arcade::flyer::autopilot_t{};
			play(environment, renderer, autopilot, options, options.fps.value_or(30), "Flyer");
		}
	} catch (const std::exception& e) {
		std::cerr << "arcade_play: " << e.what() << std::endl;
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
