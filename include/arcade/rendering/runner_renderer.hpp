#pragma once

#include "arcade/rendering/color_config.hpp"
#include "arcade/rendering/score_overlay.hpp"
#include "arcade/rendering/view_config.hpp"
#include "arcade/runner/environment.hpp"

#include <SFML/Graphics/Image.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Graphics/Sprite.hpp>
#include <SFML/Graphics/Texture.hpp>
#include <filesystem>

namespace arcade::rendering {

// Shows the observation frame itself, upscaled without filtering.
class runner_renderer_t {
public:
	using config_t = runner_color_config_t;

	runner_renderer_t(const config_t& color_config, const std::filesystem::path& font_file);

	void render(const runner::environment_t& environment, sf::RenderWindow& window);

private:
	const config_t m_color_config;
	score_overlay_t m_score_overlay;

	sf::Image m_image;
	sf::Texture m_texture;
	sf::Sprite m_sprite;
};

} // namespace arcade::rendering
