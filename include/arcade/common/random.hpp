#pragma once

#include <cinttypes>
#include <random>

namespace arcade {

using seed_t = std::uint64_t;

// One engine per environment instance; never shared between instances.
using rng_t = std::mt19937_64;

inline seed_t entropy_seed() {
	std::random_device device;
	return (static_cast<seed_t>(device()) << 32) | static_cast<seed_t>(device());
}

} // namespace arcade
