#include "arcade/rendering/runner_renderer.hpp"

#include <cinttypes>

namespace arcade::rendering {

runner_renderer_t::runner_renderer_t(const config_t& color_config, const std::filesystem::path& font_file) :
	m_color_config{ color_config }, m_score_overlay{ font_file } {
}

void runner_renderer_t::render(const runner::environment_t& environment, sf::RenderWindow& window) {

	window.clear(m_color_config.letterbox_color);

	const auto frame = environment.render_rgb();
	const auto frame_width = static_cast<unsigned>(frame.width);
	const auto frame_height = static_cast<unsigned>(frame.height);

	if (m_image.getSize() != sf::Vector2u(frame_width, frame_height)) {
		m_image.create(frame_width, frame_height, m_color_config.background_color);
		m_texture.create(frame_width, frame_height);
		m_texture.setSmooth(false);
		m_sprite.setTexture(m_texture, true);
	}

	const auto& background = m_color_config.background_color;
	const auto& foreground = m_color_config.foreground_color;

	// Intensity 0 maps to the background colour and 255 to the foreground colour, per channel.
	const auto tint = [](const sf::Uint8 from, const sf::Uint8 to, const std::uint8_t intensity) {
		return static_cast<sf::Uint8>(from + (static_cast<int>(to) - static_cast<int>(from)) * intensity / 255);
	};

	for (unsigned row{}; row != frame_height; ++row) {
		for (unsigned column{}; column != frame_width; ++column) {
			const auto r = static_cast<int>(row);
			const auto c = static_cast<int>(column);
			m_image.setPixel(
				column,
				row,
				sf::Color(
					tint(background.r, foreground.r, frame.at(r, c, 0)),
					tint(background.g, foreground.g, frame.at(r, c, 1)),
					tint(background.b, foreground.b, frame.at(r, c, 2))
				)
			);
		}
	}
	m_texture.update(m_image);

	const auto window_size = window.getSize();
	const auto view = fit_view(
		static_cast<float>(frame_width), static_cast<float>(frame_height), window_size.x, window_size.y
	);

	m_sprite.setScale(view.scale, view.scale);
	m_sprite.setPosition(
		static_cast<float>(window_size.x) / 2.0f - view.scale * view.center_x,
		static_cast<float>(window_size.y) / 2.0f - view.scale * view.center_y
	);
	window.draw(m_sprite);

	m_score_overlay.render(
		environment.info().score, environment.phase() == episode_phase_t::done, window
	);
}

} // namespace arcade::rendering
