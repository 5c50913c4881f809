#pragma once

#include "options.hpp"

#include "core/IGameStateListener.hpp"
#include "core/game.hpp"

#include <condition_variable>
#include <iosfwd>
#include <mutex>
#include <random>
#include <thread>

namespace notakto::cli {

//! Drives one console match: reads commands, runs the computer opponent and prints the boards.
class ConsoleSession : public IGameStateListener {
public:
	ConsoleSession(Options options, std::istream& in, std::ostream& out);
	~ConsoleSession() override;

	//! Play until the user quits or the input ends.
	void run();

	void onGameDelta(const GameDelta& delta) override;

	const Game& game() const {
		return m_game;
	}

private:
	//! Handle one line of user input. Returns false when the user wants to quit.
	bool handleCommand(const std::string& line);

	bool matchActive() const;
	bool playComputerMove(); //!< False if the opponent found no move.
	void announceOutcome();
	void printState();

	//! Push an event the game is known to accept and wait until it has been handled.
	void submit(GameEvent event);

private:
	GameConfig m_config;
	std::mt19937 m_rng;
	std::istream& m_in;
	std::ostream& m_out;

	Game m_game;
	std::thread m_gameThread;

	std::mutex m_deltaMutex;
	std::condition_variable m_deltaSignal;
	unsigned long m_handledDeltas{0}; //!< Deltas received from the game loop.
};

} // namespace notakto::cli
