#include "core/board.hpp"

#include <cassert>

namespace notakto {

Board::Board(const std::size_t size) : m_size(size), m_cells(size * size, Cell::Empty) {
	assert(size >= 1u);
}

std::size_t Board::size() const {
	return m_size;
}

std::size_t Board::cellCount() const {
	return m_cells.size();
}

bool Board::mark(const std::size_t cellIndex) {
	assert(cellIndex < m_cells.size());

	if (m_cells[cellIndex] == Cell::Marked) {
		return false;
	}
	m_cells[cellIndex] = Cell::Marked;
	return true;
}

Board::Cell Board::get(const std::size_t cellIndex) const {
	assert(cellIndex < m_cells.size());

	return m_cells[cellIndex];
}

bool Board::isEmpty(const std::size_t cellIndex) const {
	return get(cellIndex) == Cell::Empty;
}

BoardSet makeBoardSet(const std::size_t numberOfBoards, const std::size_t size) {
	assert(numberOfBoards >= 1u);

	return BoardSet(numberOfBoards, Board{size});
}

} // namespace notakto
