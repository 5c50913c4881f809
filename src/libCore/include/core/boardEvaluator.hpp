#pragma once

#include "core/board.hpp"
#include "core/patternCatalog.hpp"
#include "core/types.hpp"

#include <vector>

namespace notakto {

//! Returns the number of marked cells of the pattern on the board.
std::size_t markedCount(const Board& board, const Pattern& pattern);

//! True if any row, column or diagonal of the board is fully marked.
//! \note A dead board stays dead; marks are never removed from a board.
bool isDead(const Board& board);

//! True if every board of the set is dead. This ends the match.
bool allDead(const BoardSet& boards);

//! Positional value of a cell: negated manhattan distance to the board center.
//! Central cells have the highest value. Cached per board size.
int cellValue(std::size_t cellIndex, std::size_t size);

//! All empty cells of all boards that are not dead.
//! Sorted by descending cell value; equal values keep board then cell order.
std::vector<Move> legalMoves(const BoardSet& boards, std::size_t size);

} // namespace notakto
