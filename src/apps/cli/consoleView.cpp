#include "consoleView.hpp"

#include "core/boardEvaluator.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <sstream>

namespace notakto::cli {

std::string renderBoards(const BoardSet& boards) {
	if (boards.empty()) {
		return {};
	}

	const auto size = boards.front().size();
	const std::string gap(4u, ' ');
	std::ostringstream out;

	// Board titles
	for (std::size_t b = 0; b != boards.size(); ++b) {
		const auto title = std::format("#{}{}", b + 1, isDead(boards[b]) ? " dead" : "");
		out << std::format("   {:<{}}", title, 2 * size) << gap;
	}
	out << "\n";

	// Column letters
	for (std::size_t b = 0; b != boards.size(); ++b) {
		out << "   ";
		for (std::size_t col = 0; col != size; ++col) {
			out << static_cast<char>('a' + col) << ' ';
		}
		out << gap;
	}
	out << "\n";

	for (std::size_t row = 0; row != size; ++row) {
		for (const auto& board: boards) {
			out << std::format("{:>2} ", row + 1);
			for (std::size_t col = 0; col != size; ++col) {
				out << (board.isEmpty(row * size + col) ? '.' : 'X') << ' ';
			}
			out << gap;
		}
		out << "\n";
	}

	return out.str();
}

std::string toText(const Move move, const std::size_t boardSize) {
	const auto row = move.cellIndex / boardSize;
	const auto col = move.cellIndex % boardSize;
	return std::format("{} {}{}", move.boardIndex + 1, static_cast<char>('a' + col), row + 1);
}

std::optional<Move> parseMove(const std::string& text, const std::size_t numberOfBoards, const std::size_t boardSize) {
	std::istringstream in(text);
	std::size_t board = 0;
	std::string cell;
	if (!(in >> board >> cell) || cell.size() < 2u) {
		return std::nullopt;
	}

	const auto col = static_cast<std::size_t>(std::tolower(static_cast<unsigned char>(cell[0])) - 'a');
	std::size_t row = 0;
	const auto* end      = cell.data() + cell.size();
	const auto [ptr, ec] = std::from_chars(cell.data() + 1, end, row);
	if (ec != std::errc{} || ptr != end) {
		return std::nullopt;
	}

	if (board < 1u || board > numberOfBoards || col >= boardSize || row < 1u || row > boardSize) {
		return std::nullopt;
	}
	return Move{board - 1u, (row - 1u) * boardSize + col};
}

} // namespace notakto::cli
