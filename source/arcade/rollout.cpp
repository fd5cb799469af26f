#include "arcade/rollout.hpp"

#include <algorithm>
#include <limits>

namespace arcade::rollout {

float copy_result_t::mean_score() const {
	if (episodes.empty()) {
		return 0.0f;
	}
	auto total = 0.0f;
	for (const auto& episode : episodes) {
		total += static_cast<float>(episode.score);
	}
	return total / static_cast<float>(episodes.size());
}

float copy_result_t::mean_return() const {
	if (episodes.empty()) {
		return 0.0f;
	}
	auto total = 0.0f;
	for (const auto& episode : episodes) {
		total += episode.total_reward;
	}
	return total / static_cast<float>(episodes.size());
}

summary_t summarize(const std::vector<copy_result_t>& copies) {
	auto summary = summary_t{};
	if (copies.empty()) {
		return summary;
	}

	summary.min_score = std::numeric_limits<float>::max();
	summary.max_score = std::numeric_limits<float>::lowest();

	for (const auto& copy : copies) {
		const auto score = copy.mean_score();
		summary.min_score = std::min(summary.min_score, score);
		summary.max_score = std::max(summary.max_score, score);
		summary.mean_score += score;
		summary.mean_return += copy.mean_return();
		for (const auto& episode : copy.episodes) {
			summary.total_steps += episode.steps;
		}
	}

	const auto copy_count = static_cast<float>(copies.size());
	summary.mean_score /= copy_count;
	summary.mean_return /= copy_count;

	return summary;
}

} // namespace arcade::rollout
