#pragma once

#include "arcade/flyer/environment.hpp"
#include "arcade/rendering/color_config.hpp"
#include "arcade/rendering/score_overlay.hpp"
#include "arcade/rendering/view_config.hpp"

#include <SFML/Graphics/CircleShape.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <filesystem>

namespace arcade::rendering {

class flyer_renderer_t {
public:
	using config_t = flyer_color_config_t;

	flyer_renderer_t(const config_t& color_config, const std::filesystem::path& font_file);

	void render(const flyer::environment_t& environment, sf::RenderWindow& window);

private:
	const config_t m_color_config;
	score_overlay_t m_score_overlay;

	sf::CircleShape m_bird_circ;
	sf::RectangleShape m_pipe_rect, m_cap_rect;
	sf::RectangleShape m_ground_rect;
};

} // namespace arcade::rendering
