#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

namespace notakto {

//! The current match position.
struct Position {
	BoardSet boards;                   //!< Current boards.
	Player currentPlayer{Player::One}; //!< Side to move.
	unsigned moveId{0};                //!< Number of marks placed so far.

public:
	Position(std::size_t numberOfBoards, std::size_t boardSize);

	std::size_t boardSize() const; //!< Edge length shared by all boards.

	void putMark(Move move); //!< Current player marks a cell (assumes legal move). Does not change the side to move.
	void pass();             //!< Hand the turn to the opponent.

	bool operator==(const Position&) const = default;
};

} // namespace notakto
