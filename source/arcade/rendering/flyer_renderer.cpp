#include "arcade/rendering/flyer_renderer.hpp"

namespace arcade::rendering {

flyer_renderer_t::flyer_renderer_t(const config_t& color_config, const std::filesystem::path& font_file) :
	m_color_config{ color_config }, m_score_overlay{ font_file } {
	m_bird_circ.setFillColor(m_color_config.bird_color);
	m_pipe_rect.setFillColor(m_color_config.pipe_color);
	m_cap_rect.setFillColor(m_color_config.pipe_cap_color);
	m_ground_rect.setFillColor(m_color_config.ground_color);
}

void flyer_renderer_t::render(const flyer::environment_t& environment, sf::RenderWindow& window) {

	window.clear(m_color_config.background_color);

	const auto window_size = window.getSize();
	const auto window_width = static_cast<float>(window_size.x);
	const auto window_height = static_cast<float>(window_size.y);
	const auto half_window_width = window_width / 2.0f;
	const auto half_window_height = window_height / 2.0f;

	const auto view_config = fit_view(1.0f, 1.0f, window_size.x, window_size.y);

	const auto to_window_space_x = [&](const float x) {
		return half_window_width + view_config.scale * (x - view_config.center_x);
	};
	const auto to_window_space_y = [&](const float y) {
		return half_window_height - view_config.scale * (y - view_config.center_y);
	};
	const auto measure_in_window_space = [&](const float size) { return view_config.scale * size; };

	const auto& game_config = environment.config();
	const auto& pipe = environment.pipe_stream().pipe();
	const auto& agent = environment.state().agent;

	const auto floor_window_y = to_window_space_y(0.0f);
	const auto ceiling_window_y = to_window_space_y(1.0f);

	// Draw pipes
	const auto pipe_window_width = measure_in_window_space(m_color_config.pipe_width);
	const auto cap_window_height = measure_in_window_space(m_color_config.pipe_cap_height);
	const auto cap_overhang = 0.1f * pipe_window_width;
	const auto pipe_window_x = to_window_space_x(pipe.position_x) - pipe_window_width / 2.0f;

	const auto upper_edge_window_y = to_window_space_y(pipe.gap_center_y + game_config.gap_half_height);
	const auto lower_edge_window_y = to_window_space_y(pipe.gap_center_y - game_config.gap_half_height);

	if (upper_edge_window_y > ceiling_window_y) {
		m_pipe_rect.setPosition(pipe_window_x, ceiling_window_y);
		m_pipe_rect.setSize({ pipe_window_width, upper_edge_window_y - ceiling_window_y });
		window.draw(m_pipe_rect);

		m_cap_rect.setPosition(pipe_window_x - cap_overhang, upper_edge_window_y - cap_window_height);
		m_cap_rect.setSize({ pipe_window_width + 2.0f * cap_overhang, cap_window_height });
		window.draw(m_cap_rect);
	}

	if (lower_edge_window_y < floor_window_y) {
		m_pipe_rect.setPosition(pipe_window_x, lower_edge_window_y);
		m_pipe_rect.setSize({ pipe_window_width, floor_window_y - lower_edge_window_y });
		window.draw(m_pipe_rect);

		m_cap_rect.setPosition(pipe_window_x - cap_overhang, lower_edge_window_y);
		m_cap_rect.setSize({ pipe_window_width + 2.0f * cap_overhang, cap_window_height });
		window.draw(m_cap_rect);
	}

	// Draw ground
	const auto ground_window_y = to_window_space_y(m_color_config.ground_height);
	m_ground_rect.setPosition(to_window_space_x(0.0f), ground_window_y);
	m_ground_rect.setSize({ measure_in_window_space(1.0f), floor_window_y - ground_window_y });
	window.draw(m_ground_rect);

	// Draw bird
	const auto window_bird_radius = measure_in_window_space(m_color_config.bird_radius);
	m_bird_circ.setRadius(window_bird_radius);
	m_bird_circ.setPosition(
		to_window_space_x(game_config.agent_x) - window_bird_radius,
		to_window_space_y(agent.position_y) - window_bird_radius
	);
	window.draw(m_bird_circ);

	m_score_overlay.render(environment.info().score, environment.phase() == episode_phase_t::done, window);
}

} // namespace arcade::rendering
