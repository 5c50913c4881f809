#pragma once

#include "core/board.hpp"
#include "core/position.hpp"
#include "core/types.hpp"

namespace notakto {

//! Full legality check: indices in range, target board alive and target cell empty.
bool isValidMove(const BoardSet& boards, Move move);

//! Compute the position after the current player marks the target cell. Returns false when illegal.
//! \note The side to move is handed over unless the move killed the last board; then the mover stays current and loses.
bool isNextPositionLegal(const Position& current, Move move, Position& out);

//! Copy of the boards with the target cell marked. Assumes a legal move.
BoardSet applyMark(const BoardSet& boards, Move move);

} // namespace notakto
