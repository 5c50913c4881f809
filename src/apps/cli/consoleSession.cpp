#include "consoleSession.hpp"

#include "Logging.hpp"
#include "consoleView.hpp"

#include "ai/search.hpp"
#include "core/moveChecker.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <future>
#include <iostream>
#include <sstream>

namespace notakto::cli {

//! Interval of the progress dots while the opponent searches.
static constexpr std::chrono::milliseconds kThinkingTick{250};

static int sideNumber(const Player player) {
	return static_cast<int>(player);
}

static std::mt19937 makeRng(const std::optional<std::uint32_t> seed) {
	if (seed) {
		return std::mt19937{*seed};
	}
	std::random_device device;
	return std::mt19937{device()};
}

ConsoleSession::ConsoleSession(Options options, std::istream& in, std::ostream& out)
    : m_config{std::move(options.config)}, m_rng{makeRng(options.seed)}, m_in{in}, m_out{out},
      m_game{m_config.numberOfBoards, m_config.boardSize} {
	m_game.subscribeState(this);
	m_gameThread = std::thread([this] { m_game.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[Cli] Match started: {} boards of size {}, difficulty {}, {}.", m_config.numberOfBoards,
	                                                  m_config.boardSize, m_config.difficulty,
	                                                  m_config.mode == GameMode::VsComputer ? "vs computer" : "vs player"));
}

ConsoleSession::~ConsoleSession() {
	m_game.pushEvent(ShutdownEvent{});
	if (m_gameThread.joinable()) {
		m_gameThread.join();
	}
	m_game.unsubscribeState(this);
}

void ConsoleSession::run() {
	m_out << "Notakto: every move marks an X. Whoever completes a line on the last live board loses.\n"
	      << "Commands: '<board> <cell>' (e.g. 1 b2), skip, undo, reset, config <boards> <size>, difficulty <n>, quit\n\n";

	while (true) {
		if (m_config.mode == GameMode::VsComputer && matchActive() && m_game.currentPlayer() == Player::Two) {
			if (!playComputerMove()) {
				break;
			}
			continue;
		}

		printState();
		if (!matchActive()) {
			announceOutcome();
			m_out << "Type 'reset' to play again or 'quit' to leave.\n";
		}
		m_out << "> " << std::flush;

		std::string line;
		if (!std::getline(m_in, line) || !handleCommand(line)) {
			break;
		}
	}
}

void ConsoleSession::onGameDelta(const GameDelta& delta) {
	auto logger = Logger();
	switch (delta.action) {
	case GameAction::Place:
		logger.Log(Logging::LogLevel::Debug, std::format("[Match] Move {}: player {} marked {}.", delta.moveId, sideNumber(delta.player),
		                                                 toText(*delta.move, m_game.boardSize())));
		if (delta.loser) {
			logger.Log(Logging::LogLevel::Info, std::format("[Match] All boards dead. Player {} loses.", sideNumber(*delta.loser)));
		}
		break;
	case GameAction::Skip:
		logger.Log(Logging::LogLevel::Info, std::format("[Match] Player {} skipped the turn.", sideNumber(delta.player)));
		break;
	case GameAction::Undo:
		logger.Log(Logging::LogLevel::Info, std::format("[Match] Undo requested by player {}. Back to move {}.", sideNumber(delta.player), delta.moveId));
		break;
	case GameAction::Reset:
		logger.Log(Logging::LogLevel::Info, "[Match] Match reset.");
		break;
	}

	{
		std::lock_guard<std::mutex> lock(m_deltaMutex);
		++m_handledDeltas;
	}
	m_deltaSignal.notify_all();
}

void ConsoleSession::submit(GameEvent event) {
	std::unique_lock<std::mutex> lock(m_deltaMutex);
	const auto target = m_handledDeltas + 1;

	m_game.pushEvent(std::move(event));
	m_deltaSignal.wait(lock, [&] { return m_handledDeltas >= target; });
}

bool ConsoleSession::handleCommand(const std::string& line) {
	std::istringstream in(line);
	std::string command;
	if (!(in >> command)) {
		return true;
	}

	if (command == "quit" || command == "exit") {
		return false;
	}

	if (command == "reset") {
		submit(ResetEvent{m_config.numberOfBoards, m_config.boardSize});
		return true;
	}

	if (command == "config") {
		std::string boardsText;
		std::string sizeText;
		in >> boardsText >> sizeText;
		const auto boards = parseNumber(boardsText);
		const auto size   = parseNumber(sizeText);
		if (!boards || !size) {
			m_out << "Usage: config <boards> <size>\n";
			return true;
		}
		m_config.setBoards(*boards, *size);
		Logger().Log(Logging::LogLevel::Info,
		             std::format("[Cli] Board configuration changed to {} boards of size {}.", m_config.numberOfBoards, m_config.boardSize));
		submit(ResetEvent{m_config.numberOfBoards, m_config.boardSize});
		return true;
	}

	if (command == "difficulty") {
		std::string levelText;
		in >> levelText;
		const auto level = parseNumber(levelText);
		if (!level) {
			m_out << "Usage: difficulty <n>\n";
			return true;
		}
		m_config.setDifficulty(static_cast<unsigned>(std::min<unsigned long>(*level, kMaxDifficulty)));
		Logger().Log(Logging::LogLevel::Info, std::format("[Cli] Difficulty changed to {}.", m_config.difficulty));
		submit(ResetEvent{m_config.numberOfBoards, m_config.boardSize});
		return true;
	}

	if (command == "undo") {
		// One move of each side is taken back.
		if (m_game.historySize() < 3u) {
			m_out << "There are no moves to undo!\n";
			return true;
		}
		submit(UndoEvent{2u});
		return true;
	}

	if (command == "skip") {
		if (!matchActive()) {
			m_out << "The match is over.\n";
			return true;
		}
		submit(SkipEvent{m_game.currentPlayer()});
		return true;
	}

	const auto move = parseMove(line, m_game.numberOfBoards(), m_game.boardSize());
	if (!move) {
		m_out << "Unknown command or coordinate. Example: '1 b2' marks column b, row 2 of board 1.\n";
		return true;
	}
	if (!matchActive() || !isValidMove(m_game.boards(), *move)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Cli] Refused illegal move {}.", toText(*move, m_game.boardSize())));
		m_out << "Illegal move: the cell is taken or the board is dead.\n";
		return true;
	}

	submit(PlaceMarkEvent{m_game.currentPlayer(), *move});
	return true;
}

bool ConsoleSession::matchActive() const {
	return m_game.outcome().status == MatchStatus::InProgress;
}

bool ConsoleSession::playComputerMove() {
	const auto boards         = m_game.boards();
	const auto size           = m_game.boardSize();
	const auto numberOfBoards = m_game.numberOfBoards();
	const auto difficulty     = m_config.difficulty;

	printState();
	m_out << m_config.playerTwoName << " is thinking" << std::flush;

	const auto start = std::chrono::steady_clock::now();
	auto pending     = std::async(std::launch::async, [&] { return ai::findBestMove(boards, difficulty, size, numberOfBoards, m_rng); });
	while (pending.wait_for(kThinkingTick) != std::future_status::ready) {
		m_out << '.' << std::flush;
	}
	m_out << "\n";

	const auto move = pending.get();
	const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	if (!move) {
		Logger().Log(Logging::LogLevel::Error, "[Opponent] No legal move in an active match.");
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Opponent] Chose {} at depth {} in {} ms.", toText(*move, size),
	                                                  ai::searchDepth(size, numberOfBoards, difficulty), took.count()));
	m_out << m_config.playerTwoName << " plays " << toText(*move, size) << "\n";
	submit(PlaceMarkEvent{Player::Two, *move});
	return true;
}

void ConsoleSession::announceOutcome() {
	const auto outcome = m_game.outcome();
	if (!outcome.loser) {
		return;
	}

	const auto winner = opponent(*outcome.loser);
	m_out << std::format("{} completed the last line. {} wins!\n", m_config.playerName(*outcome.loser), m_config.playerName(winner));
}

void ConsoleSession::printState() {
	m_out << "\n" << renderBoards(m_game.boards());
	if (matchActive()) {
		m_out << std::format("Move {}: {} to play.\n", m_game.moveId() + 1, m_config.playerName(m_game.currentPlayer()));
	}
}

} // namespace notakto::cli
