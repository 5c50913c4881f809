#pragma once

#include "core/SafeQueue.hpp"
#include "core/eventHub.hpp"
#include "core/gameEvent.hpp"
#include "core/match.hpp"

#include <atomic>
#include <mutex>

namespace notakto {

using EventQueue = SafeQueue<GameEvent>;

//! Core game setup.
//! This owns the rules loop and emits deltas; external code should only push events and listen.
class Game {
public:
	//! Setup a match without starting the game loop.
	Game(std::size_t numberOfBoards, std::size_t boardSize);

	void run();                      //!< Run the main game loop/start handling the event loop (blocking).
	void pushEvent(GameEvent event); //!< Push an event to the event queue.

	bool isRunning() const; //!< True while the event loop handles events.
	bool isActive() const;  //!< True while the loop runs and the match is not decided.

	// Snapshots of the match state. Safe to call from any thread.
	BoardSet boards() const;
	Player currentPlayer() const;
	MatchOutcome outcome() const;
	unsigned moveId() const;
	std::size_t historySize() const;
	std::size_t boardSize() const;
	std::size_t numberOfBoards() const;

public:
	void subscribeSignals(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribeSignals(IGameSignalListener* listener);
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	void handleEvent(const PlaceMarkEvent& event);
	void handleEvent(const SkipEvent& event);
	void handleEvent(const UndoEvent& event);
	void handleEvent(const ResetEvent& event);
	void handleEvent(const ShutdownEvent& event);

	GameDelta makeDelta(GameAction action, Player player, std::optional<Move> move) const; //!< Assumes the state mutex is held.

private:
	std::atomic<bool> m_running{false};

	mutable std::mutex m_stateMutex; //!< Guards the match. Never held while signalling listeners.
	Match m_match;

	EventQueue m_eventQueue; //!< Queue of internal game events we have to handle.
	EventHub m_eventHub;     //!< Hub to signal updates of the game state to external components.
};

} // namespace notakto
