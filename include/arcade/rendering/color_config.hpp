#pragma once

#include <SFML/Graphics/Color.hpp>

namespace arcade::rendering {

struct runner_color_config_t {
	sf::Color background_color{ 0, 0, 0 };
	sf::Color foreground_color{ 255, 255, 255 };
	sf::Color letterbox_color{ 32, 32, 32 };
};

struct flyer_color_config_t {
	sf::Color background_color{ 135, 206, 250 };
	sf::Color ground_color{ 222, 184, 135 };
	sf::Color bird_color{ 225, 50, 110 };
	sf::Color pipe_color{ 34, 139, 34 };
	sf::Color pipe_cap_color{ 40, 160, 40 };
	// Purely visual sizes in world units; collisions use flyer::config_t.
	float bird_radius{ 0.025f };
	float pipe_width{ 0.075f };
	float pipe_cap_height{ 0.033f };
	float ground_height{ 0.05f };
};

} // namespace arcade::rendering
