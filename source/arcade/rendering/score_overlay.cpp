#include "arcade/rendering/score_overlay.hpp"

#include <iostream>
#include <string>

namespace arcade::rendering {

score_overlay_t::score_overlay_t(const std::filesystem::path& font_file) {
	m_shade.setFillColor(sf::Color(0, 0, 0, 128));

	if (font_file.empty()) {
		return;
	}
	if (not m_font.loadFromFile(font_file.string())) {
		std::cerr << "Could not open font file: " << font_file << ", drawing without score text." << std::endl;
		return;
	}
	m_has_font = true;

	m_score_text.setFont(m_font);
	m_score_text.setFillColor(sf::Color::White);
	m_score_text.setOutlineColor(sf::Color::Black);

	m_banner_text.setFont(m_font);
	m_banner_text.setFillColor(sf::Color(255, 0, 0));
	m_banner_text.setOutlineColor(sf::Color::Black);
	m_banner_text.setString("GAME OVER");
}

void score_overlay_t::render(const std::uint32_t score, const bool game_over, sf::RenderWindow& window) {

	const auto window_size = window.getSize();
	const auto window_width = static_cast<float>(window_size.x);
	const auto window_height = static_cast<float>(window_size.y);

	if (game_over) {
		m_shade.setPosition(0, 0);
		m_shade.setSize({ window_width, window_height });
		window.draw(m_shade);
	}

	if (not m_has_font) {
		return;
	}

	const auto text_size = 0.1f * window_height;

	m_score_text.setString(std::to_string(score));
	m_score_text.setCharacterSize(static_cast<unsigned int>(text_size));
	m_score_text.setOutlineThickness(0.05f * text_size);

	const auto score_dim = m_score_text.getGlobalBounds().getSize();
	m_score_text.setPosition(window_width / 2.0f - score_dim.x / 2.0f, window_height * 0.1f - score_dim.y / 2.0f);
	window.draw(m_score_text);

	if (game_over) {
		m_banner_text.setCharacterSize(static_cast<unsigned int>(text_size));
		m_banner_text.setOutlineThickness(0.05f * text_size);

		const auto banner_dim = m_banner_text.getGlobalBounds().getSize();
		m_banner_text.setPosition(window_width / 2.0f - banner_dim.x / 2.0f, window_height / 2.0f - banner_dim.y / 2.0f);
		window.draw(m_banner_text);
	}
}

} // namespace arcade::rendering
