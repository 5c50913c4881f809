#include "core/gameConfig.hpp"

#include <algorithm>

namespace notakto {

void GameConfig::setBoards(const std::size_t boards, const std::size_t size) {
	numberOfBoards = std::clamp(boards, kMinBoards, kMaxBoards);
	boardSize      = std::clamp(size, kMinBoardSize, kMaxBoardSize);
}

void GameConfig::setDifficulty(const unsigned level) {
	difficulty = std::clamp(level, kMinDifficulty, kMaxDifficulty);
}

void GameConfig::setMode(const GameMode gameMode) {
	mode = gameMode;
	if (mode == GameMode::VsComputer) {
		playerOneName = "You";
		playerTwoName = "Computer";
	} else {
		playerOneName = "Player 1";
		playerTwoName = "Player 2";
	}
}

const std::string& GameConfig::playerName(const Player player) const {
	return player == Player::Two ? playerTwoName : playerOneName;
}

} // namespace notakto
