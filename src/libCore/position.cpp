#include "core/position.hpp"

#include <cassert>

namespace notakto {

Position::Position(const std::size_t numberOfBoards, const std::size_t boardSize) : boards{makeBoardSet(numberOfBoards, boardSize)} {
}

std::size_t Position::boardSize() const {
	return boards.front().size();
}

void Position::putMark(const Move move) {
	assert(move.boardIndex < boards.size());

	[[maybe_unused]] const bool marked = boards[move.boardIndex].mark(move.cellIndex);
	assert(marked);

	++moveId;
}

void Position::pass() {
	currentPlayer = opponent(currentPlayer);
}

} // namespace notakto
