#include "core/game.hpp"

namespace notakto {

Game::Game(const std::size_t numberOfBoards, const std::size_t boardSize) : m_match{numberOfBoards, boardSize} {
}

void Game::pushEvent(GameEvent event) {
	m_eventQueue.Push(event);
}

void Game::run() {
	// Blocking loop: intended to live on its own thread.
	m_running = true;

	while (m_running) {
		const auto event = m_eventQueue.Pop();
		if (!event) {
			break;
		}
		std::visit([&](auto&& ev) { handleEvent(ev); }, *event);
	}

	m_running = false;
}

bool Game::isRunning() const {
	return m_running;
}

bool Game::isActive() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_running && !m_match.isOver();
}

BoardSet Game::boards() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_match.boards();
}

Player Game::currentPlayer() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_match.currentPlayer();
}

MatchOutcome Game::outcome() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_match.outcome();
}

unsigned Game::moveId() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_match.position().moveId;
}

std::size_t Game::historySize() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_match.history().size();
}

std::size_t Game::boardSize() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_match.boardSize();
}

std::size_t Game::numberOfBoards() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_match.numberOfBoards();
}

GameDelta Game::makeDelta(const GameAction action, const Player player, const std::optional<Move> move) const {
	return GameDelta{
	        .moveId     = m_match.position().moveId,
	        .action     = action,
	        .player     = player,
	        .move       = move,
	        .nextPlayer = m_match.currentPlayer(),
	        .gameActive = !m_match.isOver(),
	        .loser      = m_match.outcome().loser,
	};
}

void Game::handleEvent(const PlaceMarkEvent& event) {
	GameDelta delta{};
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (event.player != m_match.currentPlayer() || !m_match.applyMove(event.move)) {
			return;
		}
		delta = makeDelta(GameAction::Place, event.player, event.move);
	}

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(delta.gameActive ? GS_PlayerChange : GS_StateChange);
	m_eventHub.signalDelta(delta);
}

void Game::handleEvent(const SkipEvent& event) {
	GameDelta delta{};
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (event.player != m_match.currentPlayer() || !m_match.skipTurn()) {
			return;
		}
		delta = makeDelta(GameAction::Skip, event.player, std::nullopt);
	}

	m_eventHub.signal(GS_PlayerChange);
	m_eventHub.signalDelta(delta);
}

void Game::handleEvent(const UndoEvent& event) {
	GameDelta delta{};
	bool wasOver = false;
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		const auto requester = m_match.currentPlayer();

		wasOver = m_match.isOver();
		if (!m_match.rollback(event.plies)) {
			return;
		}
		delta = makeDelta(GameAction::Undo, requester, std::nullopt);
	}

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(GS_PlayerChange);
	if (wasOver) {
		m_eventHub.signal(GS_StateChange);
	}
	m_eventHub.signalDelta(delta);
}

void Game::handleEvent(const ResetEvent& event) {
	GameDelta delta{};
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		const auto requester = m_match.currentPlayer();

		m_match.reset(event.numberOfBoards, event.boardSize);
		delta = makeDelta(GameAction::Reset, requester, std::nullopt);
	}

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(GS_PlayerChange);
	m_eventHub.signal(GS_StateChange);
	m_eventHub.signalDelta(delta);
}

void Game::handleEvent(const ShutdownEvent&) {
	m_running = false;
}

void Game::subscribeSignals(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribeSignals(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

void Game::subscribeState(IGameStateListener* listener) {
	m_eventHub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace notakto
