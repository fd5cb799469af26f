#pragma once

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Graphics/Text.hpp>
#include <cinttypes>
#include <filesystem>

namespace arcade::rendering {

// Score text and a game-over shade. Without a font only the shade is drawn.
class score_overlay_t {
public:
	explicit score_overlay_t(const std::filesystem::path& font_file);

	void render(std::uint32_t score, bool game_over, sf::RenderWindow& window);

private:
	bool m_has_font{ false };
	sf::Font m_font;
	sf::Text m_score_text;
	sf::Text m_banner_text;
	sf::RectangleShape m_shade;
};

} // namespace arcade::rendering
