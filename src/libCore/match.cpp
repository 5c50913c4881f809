#include "core/match.hpp"

#include "core/boardEvaluator.hpp"
#include "core/moveChecker.hpp"

namespace notakto {

Match::Match(const std::size_t numberOfBoards, const std::size_t boardSize) : m_position{numberOfBoards, boardSize}, m_history{m_position} {
}

void Match::reset(const std::size_t numberOfBoards, const std::size_t boardSize) {
	m_position = Position{numberOfBoards, boardSize};
	m_outcome  = MatchOutcome{};
	m_history  = {m_position};
}

bool Match::applyMove(const Move move) {
	if (isOver()) {
		return false;
	}

	Position next{m_position};
	if (!isNextPositionLegal(m_position, move, next)) {
		return false;
	}

	if (allDead(next.boards)) {
		m_outcome = MatchOutcome{.status = MatchStatus::Over, .loser = m_position.currentPlayer};
	}

	m_position = std::move(next);
	m_history.push_back(m_position);
	return true;
}

bool Match::skipTurn() {
	if (isOver()) {
		return false;
	}

	m_position.pass();
	return true;
}

bool Match::rollback(const std::size_t plies) {
	if (plies == 0u || m_history.size() <= plies) {
		return false;
	}

	m_history.erase(m_history.end() - static_cast<std::ptrdiff_t>(plies), m_history.end());
	m_position = m_history.back();
	m_outcome  = MatchOutcome{};
	return true;
}

const Position& Match::position() const {
	return m_position;
}

const BoardSet& Match::boards() const {
	return m_position.boards;
}

Player Match::currentPlayer() const {
	return m_position.currentPlayer;
}

const MatchOutcome& Match::outcome() const {
	return m_outcome;
}

bool Match::isOver() const {
	return m_outcome.status == MatchStatus::Over;
}

const std::vector<Position>& Match::history() const {
	return m_history;
}

std::size_t Match::boardSize() const {
	return m_position.boardSize();
}

std::size_t Match::numberOfBoards() const {
	return m_position.boards.size();
}

} // namespace notakto
