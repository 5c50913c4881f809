#include "core/moveChecker.hpp"

#include "core/boardEvaluator.hpp"

#include <cassert>

namespace notakto {

bool isValidMove(const BoardSet& boards, const Move move) {
	if (move.boardIndex >= boards.size()) {
		return false;
	}

	const auto& board = boards[move.boardIndex];
	if (move.cellIndex >= board.cellCount()) {
		return false;
	}

	return board.isEmpty(move.cellIndex) && !isDead(board);
}

bool isNextPositionLegal(const Position& current, const Move move, Position& out) {
	if (!isValidMove(current.boards, move)) {
		return false;
	}

	Position next = current;
	next.putMark(move);

	// Misere rule: whoever kills the last board loses and keeps the turn marker.
	if (!allDead(next.boards)) {
		next.pass();
	}

	out = std::move(next);
	return true;
}

BoardSet applyMark(const BoardSet& boards, const Move move) {
	assert(move.boardIndex < boards.size());

	BoardSet next = boards;
	[[maybe_unused]] const bool marked = next[move.boardIndex].mark(move.cellIndex);
	assert(marked);
	return next;
}

} // namespace notakto
