#include "ai/heuristic.hpp"
#include "ai/search.hpp"
#include "core/boardEvaluator.hpp"
#include "core/moveChecker.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <map>

namespace notakto::ai::gtest {

static Board makeBoard(std::size_t size, std::initializer_list<std::size_t> marks) {
	Board board(size);
	for (const auto index: marks) {
		board.mark(index);
	}
	return board;
}

static bool contains(const std::vector<Move>& moves, const Move move) {
	return std::find(moves.begin(), moves.end(), move) != moves.end();
}

//! Reference search without pruning.
static Score plainMinimax(const BoardSet& boards, unsigned depth, bool maximizing, std::size_t size) {
	if (allDead(boards)) {
		return maximizing ? -kInfinity : kInfinity;
	}
	if (depth == 0u) {
		return score(boards, size);
	}

	Score best = maximizing ? -kInfinity : kInfinity;
	for (const auto& move: legalMoves(boards, size)) {
		const auto value = plainMinimax(applyMark(boards, move), depth - 1u, !maximizing, size);
		best             = maximizing ? std::max(best, value) : std::min(best, value);
	}
	return best;
}

TEST(Search, DepthTable) {
	struct Row {
		std::size_t size;
		std::size_t boards;
		unsigned depthByDifficulty[3];
	};
	const Row table[] = {
	        {2u, 1u, {3u, 4u, 5u}}, {2u, 2u, {3u, 4u, 5u}}, {2u, 3u, {3u, 4u, 5u}}, {2u, 4u, {3u, 4u, 5u}}, {2u, 5u, {2u, 3u, 4u}},
	        {3u, 1u, {3u, 4u, 5u}}, {3u, 2u, {3u, 4u, 5u}}, {3u, 3u, {3u, 4u, 5u}}, {3u, 4u, {2u, 3u, 4u}}, {3u, 5u, {2u, 3u, 4u}},
	        {4u, 1u, {3u, 4u, 5u}}, {4u, 2u, {3u, 4u, 5u}}, {4u, 3u, {2u, 3u, 4u}}, {4u, 4u, {2u, 3u, 4u}}, {4u, 5u, {1u, 2u, 3u}},
	        {5u, 1u, {3u, 4u, 5u}}, {5u, 2u, {2u, 3u, 4u}}, {5u, 3u, {2u, 3u, 4u}}, {5u, 4u, {1u, 2u, 3u}}, {5u, 5u, {1u, 2u, 3u}},
	};

	for (const auto& row: table) {
		for (unsigned difficulty = 1; difficulty <= 3; ++difficulty) {
			EXPECT_EQ(searchDepth(row.size, row.boards, difficulty), row.depthByDifficulty[difficulty - 1])
			        << "size " << row.size << ", boards " << row.boards << ", difficulty " << difficulty;
		}
	}

	EXPECT_EQ(searchDepth(3u, 3u, 1u), 3u);
	EXPECT_EQ(searchDepth(4u, 4u, 1u), 2u);
}

TEST(Search, NoMoveWhenAllDead) {
	const BoardSet boards{makeBoard(3u, {0, 1, 2}), makeBoard(3u, {2, 4, 6})};
	std::mt19937 rng(1u);

	EXPECT_TRUE(bestMoves(boards, 1u, 3u, 2u).empty());
	EXPECT_FALSE(findBestMove(boards, 1u, 3u, 2u, rng).has_value());
}

// Three boards, two of them dead: the empty cell of the third is the only legal move
TEST(Search, SingleLegalMove) {
	const BoardSet boards{makeBoard(1u, {0}), Board(1u), makeBoard(1u, {0})};

	for (std::uint32_t seed = 0; seed != 20u; ++seed) {
		std::mt19937 rng(seed);
		EXPECT_EQ(findBestMove(boards, 1u, 1u, 3u, rng), (Move{1u, 0u}));
	}
}

// Two dead 3x3 boards and a live board with six marks leave three candidates
TEST(Search, OnlyLiveBoardTargeted) {
	const BoardSet boards{makeBoard(3u, {0, 1, 2}), makeBoard(3u, {0, 1, 3, 5, 7, 8}), makeBoard(3u, {3, 4, 5})};
	const std::vector<Move> legal{{1u, 2u}, {1u, 4u}, {1u, 6u}};

	for (std::uint32_t seed = 0; seed != 10u; ++seed) {
		std::mt19937 rng(seed);
		const auto move = findBestMove(boards, 1u, 3u, 3u, rng);
		ASSERT_TRUE(move.has_value());
		EXPECT_TRUE(contains(legal, *move));
	}
}

// Completing the last line is scored as a win for the side searching the root
TEST(Search, TerminalValueConvention) {
	const BoardSet boards{makeBoard(3u, {0, 1, 2}), makeBoard(3u, {0, 1, 2})};

	EXPECT_EQ(minimax(boards, 3u, false, 3u, -kInfinity, kInfinity), kInfinity);
	EXPECT_EQ(minimax(boards, 3u, true, 3u, -kInfinity, kInfinity), -kInfinity);
	EXPECT_EQ(minimax(boards, 0u, true, 3u, -kInfinity, kInfinity), -kInfinity);
}

TEST(Search, HorizonUsesHeuristic) {
	const BoardSet boards{makeBoard(3u, {0, 8}), makeBoard(3u, {4})};

	EXPECT_EQ(minimax(boards, 0u, true, 3u, -kInfinity, kInfinity), score(boards, 3u));
	EXPECT_EQ(minimax(boards, 0u, false, 3u, -kInfinity, kInfinity), score(boards, 3u));
}

// Pruning never changes the value of the root
TEST(Search, AlphaBetaMatchesPlainMinimax) {
	const std::vector<BoardSet> fixtures{
	        {Board(3u), Board(3u)},
	        {makeBoard(3u, {4}), makeBoard(3u, {0, 8})},
	        {makeBoard(3u, {0, 1, 5, 6}), makeBoard(3u, {4, 2})},
	        {makeBoard(3u, {0, 1, 2}), makeBoard(3u, {1, 3, 5, 7})},
	        {makeBoard(3u, {0, 4}), makeBoard(3u, {2, 4, 6})},
	};

	for (const auto& boards: fixtures) {
		for (unsigned depth = 0; depth <= 3u; ++depth) {
			for (const bool maximizing: {true, false}) {
				EXPECT_EQ(minimax(boards, depth, maximizing, 3u, -kInfinity, kInfinity), plainMinimax(boards, depth, maximizing, 3u))
				        << "depth " << depth << ", maximizing " << maximizing;
			}
		}
	}
}

// Every candidate of the best set has the best minimax score
TEST(Search, BestMovesShareScore) {
	const BoardSet boards{makeBoard(3u, {4}), makeBoard(3u, {0})};
	const auto depth = searchDepth(3u, 2u, 1u);
	const auto best  = bestMoves(boards, 1u, 3u, 2u);
	ASSERT_FALSE(best.empty());

	const auto bestScore = minimax(applyMark(boards, best.front()), depth, false, 3u, -kInfinity, kInfinity);
	for (const auto& move: legalMoves(boards, 3u)) {
		const auto value = minimax(applyMark(boards, move), depth, false, 3u, -kInfinity, kInfinity);
		EXPECT_LE(value, bestScore);
		EXPECT_EQ(contains(best, move), value == bestScore);
	}
}

// Tied moves are all picked over many trials
TEST(Search, RandomTieBreak) {
	const BoardSet boards{Board(1u), Board(1u), Board(1u), Board(1u)};
	const auto best = bestMoves(boards, 1u, 1u, 4u);
	ASSERT_EQ(best.size(), 4u);

	std::map<std::size_t, unsigned> picks;
	for (std::uint32_t seed = 0; seed != 400u; ++seed) {
		std::mt19937 rng(seed);
		const auto move = findBestMove(boards, 1u, 1u, 4u, rng);
		ASSERT_TRUE(move.has_value());
		ASSERT_TRUE(contains(best, *move));
		++picks[move->boardIndex];
	}

	ASSERT_EQ(picks.size(), 4u);
	for (const auto& [board, count]: picks) {
		EXPECT_GT(count, 0u) << "board " << board;
	}
}

TEST(Search, ChoiceWithinBestSet) {
	const BoardSet boards{makeBoard(3u, {4}), Board(3u)};
	const auto best = bestMoves(boards, 1u, 3u, 2u);
	ASSERT_FALSE(best.empty());

	for (std::uint32_t seed = 0; seed != 30u; ++seed) {
		std::mt19937 rng(seed);
		const auto move = findBestMove(boards, 1u, 3u, 2u, rng);
		ASSERT_TRUE(move.has_value());
		EXPECT_TRUE(contains(best, *move));
	}
}

// Whole matches between two computer players only ever produce legal moves
TEST(Search, SelfPlayLegal) {
	for (std::uint32_t seed = 0; seed != 3u; ++seed) {
		std::mt19937 rng(seed);
		BoardSet boards = makeBoardSet(2u, 3u);

		while (!allDead(boards)) {
			const auto before = boards;
			const auto move   = findBestMove(boards, 1u, 3u, 2u, rng);
			ASSERT_TRUE(move.has_value());
			EXPECT_EQ(boards, before);
			ASSERT_TRUE(isValidMove(boards, *move));

			boards = applyMark(boards, *move);
		}
	}
}

} // namespace notakto::ai::gtest
