#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace notakto {

struct PlaceMarkEvent {
	Player player;
	Move move;
};
struct SkipEvent {
	Player player;
};
struct UndoEvent {
	std::size_t plies;
};
struct ResetEvent {
	std::size_t numberOfBoards;
	std::size_t boardSize;
};
struct ShutdownEvent {};

using GameEvent = std::variant<PlaceMarkEvent, SkipEvent, UndoEvent, ResetEvent, ShutdownEvent>;


//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Board was modified.
	GS_PlayerChange = 1 << 1, //!< Active player changed.
	GS_StateChange  = 1 << 2, //!< Match state changed. Started or finished.
};


//! Type of action.
enum class GameAction { Place, Skip, Undo, Reset };

//! Symbolises the match state change after one action.
struct GameDelta {
	unsigned moveId;             //!< Marks placed after the action.
	GameAction action;           //!< Action type.
	Player player;               //!< Player that acted.
	std::optional<Move> move;    //!< For place action: Target of the mark.
	Player nextPlayer;           //!< Side to move after the action.
	bool gameActive;             //!< Match active after the action.
	std::optional<Player> loser; //!< Set when the action ended the match.
};

} // namespace notakto
