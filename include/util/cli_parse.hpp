#pragma once

#include <cinttypes>
#include <stdexcept>
#include <string>

inline std::string require_arg(int& i, const int argc, char** argv, const std::string& flag) {
	if (i + 1 >= argc) {
		throw std::runtime_error("Missing value for " + flag + ".");
	}
	return argv[++i];
}

inline std::uint32_t parse_u32(const std::string& s) {
	std::size_t pos{};
	const auto value = std::stoull(s, &pos);
	if (pos != s.size() or value > UINT32_MAX or s.find('-') != std::string::npos) {
		throw std::runtime_error("Invalid unsigned integer: " + s);
	}
	return static_cast<std::uint32_t>(value);
}

inline std::uint64_t parse_u64(const std::string& s) {
	std::size_t pos{};
	const auto value = std::stoull(s, &pos);
	if (pos != s.size() or s.find('-') != std::string::npos) {
		throw std::runtime_error("Invalid unsigned integer: " + s);
	}
	return static_cast<std::uint64_t>(value);
}
