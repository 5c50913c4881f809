#pragma once

#include "core/position.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace notakto {

enum class MatchStatus {
	InProgress, //!< At least one board is alive.
	Over        //!< Every board is dead.
};

//! Result of the match so far.
struct MatchOutcome {
	MatchStatus status{MatchStatus::InProgress};
	std::optional<Player> loser{}; //!< Side that killed the last board. Set when the match is over.

	bool operator==(const MatchOutcome&) const = default;
};

//! Rules state machine of one match.
//! Owns the authoritative position and the history of snapshots needed for undo.
class Match {
public:
	//! Start a match of numberOfBoards empty boards.
	Match(std::size_t numberOfBoards, std::size_t boardSize);

	//! Replace the whole match with fresh empty boards. Side one starts.
	void reset(std::size_t numberOfBoards, std::size_t boardSize);

	//! Current player marks the target cell.
	//! Returns false and leaves the match untouched if the move is illegal or the match is over.
	bool applyMove(Move move);

	//! Current player hands the turn over without marking. False if the match is over.
	bool skipTurn();

	//! Take back the last plies moves. False if the history does not go back that far.
	bool rollback(std::size_t plies);

	const Position& position() const;
	const BoardSet& boards() const;
	Player currentPlayer() const;
	const MatchOutcome& outcome() const;
	bool isOver() const;

	//! Position snapshots. First entry is the initial position, one entry per applied move follows.
	const std::vector<Position>& history() const;

	std::size_t boardSize() const;
	std::size_t numberOfBoards() const;

private:
	Position m_position;
	MatchOutcome m_outcome;
	std::vector<Position> m_history;
};

} // namespace notakto
