#include "arcade/rendering/view_config.hpp"

#include <algorithm>

namespace arcade::rendering {

view_config_t fit_view(
	const float world_width, const float world_height, const unsigned window_width, const unsigned window_height
) {
	const auto scale_x = static_cast<float>(window_width) / world_width;
	const auto scale_y = static_cast<float>(window_height) / world_height;

	return { .scale = std::min(scale_x, scale_y), .center_x = world_width / 2.0f, .center_y = world_height / 2.0f };
}

} // namespace arcade::rendering
