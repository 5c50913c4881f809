#pragma once

#include "core/board.hpp"
#include "core/types.hpp"

#include <limits>
#include <optional>
#include <random>
#include <vector>

namespace notakto::ai {

using Score = int;

//! Value of a decided position. Heuristic scores stay far below.
inline constexpr Score kInfinity = std::numeric_limits<Score>::max();

//! Plies to look ahead. Larger configurations trade depth for breadth.
//! complexity = size * numberOfBoards
//!   <= 9  : min(5, difficulty + 2)
//!   <= 16 : min(4, difficulty + 1)
//!   else  : min(3, difficulty)
unsigned searchDepth(std::size_t size, std::size_t numberOfBoards, unsigned difficulty);

//! Minimax value of the position with alpha-beta pruning.
//! A position where every board is dead is worth -kInfinity if the maximizing side is to move, +kInfinity otherwise.
//! At depth 0 the static heuristic score is returned.
Score minimax(const BoardSet& boards, unsigned depth, bool maximizing, std::size_t size, Score alpha, Score beta);

//! All legal moves sharing the best score, in search order.
//! Each candidate is scored by minimax of the resulting position with the minimizing side to move.
//! Evaluation stops at the first candidate scoring +kInfinity. Empty if there is no legal move.
std::vector<Move> bestMoves(const BoardSet& boards, unsigned difficulty, std::size_t size, std::size_t numberOfBoards);

//! Move of the computer opponent: uniformly random among bestMoves.
//! \note Does not modify the given boards. Returns nullopt if every board is dead.
std::optional<Move> findBestMove(const BoardSet& boards, unsigned difficulty, std::size_t size, std::size_t numberOfBoards, std::mt19937& rng);

} // namespace notakto::ai
