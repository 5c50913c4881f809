#include "options.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <limits>

namespace notakto::cli {

std::optional<unsigned long> parseNumber(const std::string_view text) {
	unsigned long value = 0;
	const auto* end     = text.data() + text.size();

	const auto [ptr, ec] = std::from_chars(text.data(), end, value);
	if (ec != std::errc{} || ptr != end) {
		return std::nullopt;
	}
	return value;
}

std::optional<Options> parseOptions(const std::vector<std::string>& args, std::string& error) {
	Options options{};
	auto boards = options.config.numberOfBoards;
	auto size   = options.config.boardSize;
	std::optional<std::string> playerOne;
	std::optional<std::string> playerTwo;

	for (std::size_t i = 0; i < args.size(); ++i) {
		const auto& arg = args[i];
		if (arg == "-h" || arg == "--help") {
			options.showHelp = true;
			continue;
		}

		if (i + 1 == args.size()) {
			error = std::format("Missing value for option '{}'.", arg);
			return std::nullopt;
		}
		const auto& value = args[++i];

		if (arg == "--mode") {
			if (value == "pvp") {
				options.config.setMode(GameMode::VsPlayer);
			} else if (value == "cpu") {
				options.config.setMode(GameMode::VsComputer);
			} else {
				error = std::format("Unknown mode '{}'. Expected 'pvp' or 'cpu'.", value);
				return std::nullopt;
			}
		} else if (arg == "--p1") {
			playerOne = value;
		} else if (arg == "--p2") {
			playerTwo = value;
		} else {
			const auto number = parseNumber(value);
			if (!number) {
				error = std::format("Option '{}' expects a non-negative number, got '{}'.", arg, value);
				return std::nullopt;
			}

			if (arg == "--boards") {
				boards = *number;
			} else if (arg == "--size") {
				size = *number;
			} else if (arg == "--difficulty") {
				options.config.setDifficulty(static_cast<unsigned>(std::min<unsigned long>(*number, kMaxDifficulty)));
			} else if (arg == "--seed") {
				if (*number > std::numeric_limits<std::uint32_t>::max()) {
					error = std::format("Seed '{}' is out of range.", value);
					return std::nullopt;
				}
				options.seed = static_cast<std::uint32_t>(*number);
			} else {
				error = std::format("Unknown option '{}'.", arg);
				return std::nullopt;
			}
		}
	}

	options.config.setBoards(boards, size);
	// Names only apply to two human players. Mode may come after the names on the command line.
	if (options.config.mode == GameMode::VsPlayer) {
		options.config.playerOneName = playerOne.value_or(options.config.playerOneName);
		options.config.playerTwoName = playerTwo.value_or(options.config.playerTwoName);
	}
	return options;
}

std::string usage(const std::string& program) {
	return std::format("Usage: {} [options]\n"
	                   "  --mode pvp|cpu      Play against a friend or the computer (default cpu)\n"
	                   "  --boards N          Number of boards, 1 to 5 (default 3)\n"
	                   "  --size N            Board edge length, 2 to 5 (default 3)\n"
	                   "  --difficulty N      Computer strength, 1 to 3 (default 1)\n"
	                   "  --seed N            Seed of the computer opponent\n"
	                   "  --p1 NAME           Name of player one (pvp only)\n"
	                   "  --p2 NAME           Name of player two (pvp only)\n"
	                   "  -h, --help          Show this help\n",
	                   program);
}

} // namespace notakto::cli
