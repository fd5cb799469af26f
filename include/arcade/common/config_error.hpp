#pragma once

#include <stdexcept>
#include <string>

namespace arcade {

// Thrown by environment constructors when a config_t describes an impossible world.
class config_error : public std::invalid_argument {
public:
	explicit config_error(const std::string& what) : std::invalid_argument(what) {
	}
};

} // namespace arcade
