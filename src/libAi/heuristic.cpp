#include "ai/heuristic.hpp"

#include "core/boardEvaluator.hpp"
#include "core/patternCatalog.hpp"

namespace notakto::ai {

static int scoreBoard(const Board& board, const std::vector<Pattern>& patterns, const std::size_t size) {
	int boardScore = 0;
	for (const auto& pattern: patterns) {
		const auto marked = markedCount(board, pattern);

		if (marked + 1u == size) {
			// Worst threat found, remaining lines are not inspected.
			return boardScore - kNearDeathPenalty;
		}
		if (marked + 2u == size) {
			boardScore -= kThreatPenalty;
		}
	}
	return boardScore;
}

int score(const BoardSet& boards, const std::size_t size) {
	const auto& patterns = patternsFor(size);

	int total = 0;
	for (const auto& board: boards) {
		if (isDead(board)) {
			continue;
		}
		total += scoreBoard(board, patterns, size);
	}
	return total;
}

} // namespace notakto::ai
