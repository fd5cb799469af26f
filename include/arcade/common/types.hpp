#pragma once

#include <cinttypes>
#include <string_view>
#include <vector>

namespace arcade {

enum class action_t : std::uint8_t {
	idle = 0,
	impulse = 1
};

inline constexpr std::size_t action_count{ 2 };

// Unready until the first reset, Done after a terminated or truncated step.
// step() does not consult the phase; stepping a Done instance is a caller error.
enum class episode_phase_t : std::uint8_t {
	unready,
	running,
	done
};

struct box_space_t {
	std::vector<float> low, high;
	std::vector<std::size_t> shape;
	std::string_view dtype;
};

struct discrete_space_t {
	std::size_t n{ action_count };
};

template<class Observation, class Info>
struct reset_result_t {
	Observation observation;
	Info info;
};

template<class Observation, class Info>
struct step_result_t {
	Observation observation;
	float reward{};
	bool terminated{ false };
	bool truncated{ false };
	Info info;

	[[nodiscard]] bool done() const {
		return terminated or truncated;
	}
};

} // namespace arcade
