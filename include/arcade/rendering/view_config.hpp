#pragma once

namespace arcade::rendering {

// Window pixels per world unit, and the world point shown at the window centre.
struct view_config_t {
	float scale{ 1.0f };
	float center_x{ 0.0f };
	float center_y{ 0.0f };
};

// Largest scale that fits the world rectangle into the window, centred.
view_config_t fit_view(float world_width, float world_height, unsigned window_width, unsigned window_height);

} // namespace arcade::rendering
