#include "core/boardEvaluator.hpp"

#include "sizeCache.hpp"

#include <algorithm>
#include <cassert>
#include <cstdlib>

namespace notakto {

//! Values for all cells of a board of given size.
//! Distances are computed on doubled coordinates so that the center of even sized boards stays integral.
static std::vector<int> buildCellValues(const std::size_t size) {
	const auto doubledCenter = static_cast<int>(size) - 1;

	std::vector<int> values(size * size);
	for (std::size_t i = 0; i != values.size(); ++i) {
		const auto row = static_cast<int>(i / size);
		const auto col = static_cast<int>(i % size);

		values[i] = -(std::abs(2 * row - doubledCenter) + std::abs(2 * col - doubledCenter)) / 2;
	}
	return values;
}

std::size_t markedCount(const Board& board, const Pattern& pattern) {
	return static_cast<std::size_t>(std::count_if(pattern.begin(), pattern.end(), [&](const std::size_t i) { return !board.isEmpty(i); }));
}

bool isDead(const Board& board) {
	const auto& patterns = patternsFor(board.size());

	return std::any_of(patterns.begin(), patterns.end(), [&](const Pattern& pattern) {
		return std::all_of(pattern.begin(), pattern.end(), [&](const std::size_t i) { return !board.isEmpty(i); });
	});
}

bool allDead(const BoardSet& boards) {
	return std::all_of(boards.begin(), boards.end(), [](const Board& board) { return isDead(board); });
}

int cellValue(const std::size_t cellIndex, const std::size_t size) {
	static SizeCache<std::vector<int>> cache;

	const auto& values = cache.get(size, buildCellValues);
	assert(cellIndex < values.size());
	return values[cellIndex];
}

std::vector<Move> legalMoves(const BoardSet& boards, const std::size_t size) {
	std::vector<Move> moves;

	for (std::size_t boardIndex = 0; boardIndex != boards.size(); ++boardIndex) {
		const auto& board = boards[boardIndex];
		assert(board.size() == size);

		if (isDead(board)) {
			continue;
		}
		for (std::size_t cellIndex = 0; cellIndex != board.cellCount(); ++cellIndex) {
			if (board.isEmpty(cellIndex)) {
				moves.push_back({boardIndex, cellIndex});
			}
		}
	}

	// Center first. Improves alpha-beta cutoffs.
	std::stable_sort(moves.begin(), moves.end(),
	                 [size](const Move& lhs, const Move& rhs) { return cellValue(lhs.cellIndex, size) > cellValue(rhs.cellIndex, size); });

	return moves;
}

} // namespace notakto
