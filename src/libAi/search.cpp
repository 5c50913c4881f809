#include "ai/search.hpp"

#include "ai/heuristic.hpp"
#include "core/boardEvaluator.hpp"
#include "core/moveChecker.hpp"

#include <algorithm>

namespace notakto::ai {

unsigned searchDepth(const std::size_t size, const std::size_t numberOfBoards, const unsigned difficulty) {
	const auto complexity = size * numberOfBoards;

	if (complexity <= 9u) {
		return std::min(5u, difficulty + 2u);
	}
	if (complexity <= 16u) {
		return std::min(4u, difficulty + 1u);
	}
	return std::min(3u, difficulty);
}

Score minimax(const BoardSet& boards, const unsigned depth, const bool maximizing, const std::size_t size, Score alpha, Score beta) {
	if (allDead(boards)) {
		return maximizing ? -kInfinity : kInfinity;
	}
	if (depth == 0u) {
		return score(boards, size);
	}

	Score best = maximizing ? -kInfinity : kInfinity;
	for (const auto& move: legalMoves(boards, size)) {
		const auto value = minimax(applyMark(boards, move), depth - 1u, !maximizing, size, alpha, beta);

		if (maximizing) {
			best  = std::max(best, value);
			alpha = std::max(alpha, value);
		} else {
			best = std::min(best, value);
			beta = std::min(beta, value);
		}

		if (beta <= alpha) {
			break;
		}
	}

	return best;
}

std::vector<Move> bestMoves(const BoardSet& boards, const unsigned difficulty, const std::size_t size, const std::size_t numberOfBoards) {
	const auto depth = searchDepth(size, numberOfBoards, difficulty);

	Score bestScore = -kInfinity;
	std::vector<Move> best;
	for (const auto& move: legalMoves(boards, size)) {
		const auto value = minimax(applyMark(boards, move), depth, false, size, -kInfinity, kInfinity);

		if (value > bestScore) {
			bestScore = value;
			best.assign(1u, move);
		} else if (value == bestScore) {
			best.push_back(move);
		}

		if (value == kInfinity) {
			break;
		}
	}

	return best;
}

std::optional<Move> findBestMove(const BoardSet& boards, const unsigned difficulty, const std::size_t size, const std::size_t numberOfBoards,
                                 std::mt19937& rng) {
	const auto candidates = bestMoves(boards, difficulty, size, numberOfBoards);
	if (candidates.empty()) {
		return std::nullopt;
	}

	std::uniform_int_distribution<std::size_t> pick(0u, candidates.size() - 1u);
	return candidates[pick(rng)];
}

} // namespace notakto::ai
