#pragma once

#include "config.hpp"
#include "state.hpp"

#include <cinttypes>
#include <deque>
#include <vector>

namespace arcade::runner {

inline constexpr std::uint8_t background_intensity{ 0 };
inline constexpr std::uint8_t foreground_intensity{ 255 };

// Row-major intensity image with `channels` interleaved values per pixel.
struct frame_t {
	int height{}, width{}, channels{ 1 };
	std::vector<std::uint8_t> pixels;

	[[nodiscard]] std::uint8_t at(int row, int column, int channel = 0) const {
		return pixels[(static_cast<std::size_t>(row) * width + column) * channels + channel];
	}

	bool operator==(const frame_t&) const = default;
};

class observation_encoder_t {
public:
	explicit observation_encoder_t(const config_t& config, const geometry_t& geometry);

	[[nodiscard]] frame_t make_frame() const;

	void encode(const agent_state_t& agent, const std::deque<obstacle_t>& obstacles, frame_t& frame) const;

	// Grayscale expanded to three identical channels.
	[[nodiscard]] static frame_t to_rgb(const frame_t& frame);

private:
	// Clamps the half-open rectangle to the frame before writing.
	static void fill(frame_t& frame, int top, int bottom, int left, int right);

	geometry_t m_geometry;
	int m_ground_band_rows;
};

} // namespace arcade::runner
