#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>

namespace notakto {

inline constexpr std::size_t kMinBoards    = 1u;
inline constexpr std::size_t kMaxBoards    = 5u;
inline constexpr std::size_t kMinBoardSize = 2u;
inline constexpr std::size_t kMaxBoardSize = 5u;
inline constexpr unsigned kMinDifficulty   = 1u;
inline constexpr unsigned kMaxDifficulty   = 3u;

enum class GameMode {
	VsPlayer,  //!< Two humans share the device.
	VsComputer //!< Side two is played by the computer.
};

//! Match setup chosen by the user.
struct GameConfig {
	std::size_t numberOfBoards{3u};
	std::size_t boardSize{3u};
	unsigned difficulty{1u};
	GameMode mode{GameMode::VsComputer};
	std::string playerOneName{"You"};
	std::string playerTwoName{"Computer"};

	void setBoards(std::size_t numberOfBoards, std::size_t boardSize); //!< Values are clamped into the supported range.
	void setDifficulty(unsigned difficulty);                           //!< Value is clamped into the supported range.
	void setMode(GameMode mode);                                       //!< Also resets the player names to the mode defaults.

	const std::string& playerName(Player player) const; //!< Display name of the given side.
};

} // namespace notakto
