#pragma once

#include <cstddef>
#include <vector>

namespace notakto {

//! A square grid of cells with a single kind of mark.
//! \note Cells are addressed row-major: index = row * size + col.
class Board {
public:
	enum class Cell { Empty, Marked };

public:
	Board(std::size_t size);

	std::size_t size() const;      //!< Edge length.
	std::size_t cellCount() const; //!< Number of cells (size * size).

	bool mark(std::size_t cellIndex);          //!< Mark the given cell. False if it was already marked.
	Cell get(std::size_t cellIndex) const;     //!< Get the cell value at given index.
	bool isEmpty(std::size_t cellIndex) const; //!< True if the given cell is not marked.

	bool operator==(const Board&) const = default;

private:
	std::size_t m_size{0u};      //!< Edge length.
	std::vector<Cell> m_cells{}; //!< Cell values.
};

//! The boards of one match. All boards share the same edge length.
using BoardSet = std::vector<Board>;

//! Create a set of numberOfBoards empty boards.
BoardSet makeBoardSet(std::size_t numberOfBoards, std::size_t size);

} // namespace notakto
