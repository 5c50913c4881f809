#pragma once

#include "core/gameConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notakto::cli {

//! Settings taken from the command line.
struct Options {
	GameConfig config{};
	std::optional<std::uint32_t> seed{}; //!< Seed of the computer opponent. Random if not given.
	bool showHelp{false};
};

//! Parse a non-negative decimal number. The whole text has to be consumed.
std::optional<unsigned long> parseNumber(std::string_view text);

//! Parse command line arguments (without program name). Returns nullopt and fills error on invalid input.
std::optional<Options> parseOptions(const std::vector<std::string>& args, std::string& error);

//! Usage text for the command line options.
std::string usage(const std::string& program);

} // namespace notakto::cli
