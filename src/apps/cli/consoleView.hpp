#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace notakto::cli {

//! Text rendering of all boards side by side. Dead boards are labelled.
std::string renderBoards(const BoardSet& boards);

//! Human readable coordinate of a move, e.g. "2 b3" for the second board, column b, row 3.
std::string toText(Move move, std::size_t boardSize);

//! Parse a move typed as "<board> <column><row>" with 1-based board and row numbers. Does not check legality.
std::optional<Move> parseMove(const std::string& text, std::size_t numberOfBoards, std::size_t boardSize);

} // namespace notakto::cli
