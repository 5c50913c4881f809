#include "core/boardEvaluator.hpp"
#include "core/match.hpp"

#include <gtest/gtest.h>

namespace notakto::gtest {

TEST(Match, Reset) {
	Match match(3u, 3u);
	ASSERT_TRUE(match.applyMove({0u, 4u}));

	match.reset(4u, 5u);
	EXPECT_EQ(match.numberOfBoards(), 4u);
	EXPECT_EQ(match.boardSize(), 5u);
	EXPECT_EQ(match.currentPlayer(), Player::One);
	EXPECT_EQ(match.outcome(), MatchOutcome{});
	ASSERT_EQ(match.history().size(), 1u);
	EXPECT_EQ(match.history().front().boards, makeBoardSet(4u, 5u));
	EXPECT_EQ(match.boards(), makeBoardSet(4u, 5u));
}

TEST(Match, MovesAlternateAndExtendHistory) {
	Match match(2u, 3u);

	ASSERT_TRUE(match.applyMove({0u, 4u}));
	EXPECT_EQ(match.currentPlayer(), Player::Two);
	ASSERT_TRUE(match.applyMove({1u, 0u}));
	EXPECT_EQ(match.currentPlayer(), Player::One);

	ASSERT_EQ(match.history().size(), 3u);
	EXPECT_TRUE(match.history()[0].boards[0].isEmpty(4u));
	EXPECT_FALSE(match.history()[1].boards[0].isEmpty(4u));
	EXPECT_TRUE(match.history()[1].boards[1].isEmpty(0u));
	EXPECT_FALSE(match.history()[2].boards[1].isEmpty(0u));
	EXPECT_EQ(match.position().moveId, 2u);
}

// Refused moves leave boards, turn and history unchanged
TEST(Match, IllegalMoveRefused) {
	Match match(2u, 3u);
	ASSERT_TRUE(match.applyMove({0u, 0u}));
	ASSERT_TRUE(match.applyMove({0u, 1u}));
	ASSERT_TRUE(match.applyMove({0u, 2u})); // Board 0 dead

	const auto before        = match.position();
	const auto historyBefore = match.history();

	EXPECT_FALSE(match.applyMove({0u, 0u})); // Dead board, marked cell
	EXPECT_FALSE(match.applyMove({0u, 5u})); // Dead board, empty cell
	EXPECT_EQ(match.position(), before);
	EXPECT_EQ(match.history(), historyBefore);

	ASSERT_TRUE(match.applyMove({1u, 4u}));
	EXPECT_FALSE(match.applyMove({1u, 4u})); // Alive board, marked cell

	ASSERT_TRUE(match.rollback(1u));
	EXPECT_EQ(match.position(), before);
	EXPECT_EQ(match.history(), historyBefore);
}

// The side completing the last line loses and stays on turn
TEST(Match, LastLineLoses) {
	Match match(1u, 3u);
	ASSERT_TRUE(match.applyMove({0u, 0u})); // One
	ASSERT_TRUE(match.applyMove({0u, 4u})); // Two
	EXPECT_EQ(match.outcome().status, MatchStatus::InProgress);
	ASSERT_TRUE(match.applyMove({0u, 8u})); // One completes the diagonal

	EXPECT_TRUE(match.isOver());
	EXPECT_EQ(match.outcome().loser, Player::One);
	EXPECT_EQ(match.currentPlayer(), Player::One);
	EXPECT_EQ(match.history().size(), 4u);

	EXPECT_FALSE(match.applyMove({0u, 1u}));
	EXPECT_FALSE(match.skipTurn());
}

TEST(Match, LoserIsSideTwo) {
	Match match(2u, 3u);
	ASSERT_TRUE(match.applyMove({0u, 0u})); // One
	ASSERT_TRUE(match.applyMove({0u, 1u})); // Two
	ASSERT_TRUE(match.applyMove({0u, 2u})); // One kills board 0, match continues
	EXPECT_FALSE(match.isOver());
	EXPECT_EQ(match.currentPlayer(), Player::Two);

	ASSERT_TRUE(match.applyMove({1u, 3u})); // Two
	ASSERT_TRUE(match.applyMove({1u, 4u})); // One
	ASSERT_TRUE(match.applyMove({1u, 5u})); // Two kills the last board

	EXPECT_EQ(match.outcome().status, MatchStatus::Over);
	EXPECT_EQ(match.outcome().loser, Player::Two);
	EXPECT_EQ(match.currentPlayer(), Player::Two);
}

TEST(Match, SkipTurn) {
	Match match(1u, 3u);

	ASSERT_TRUE(match.skipTurn());
	EXPECT_EQ(match.currentPlayer(), Player::Two);
	EXPECT_EQ(match.history().size(), 1u);
	EXPECT_EQ(match.position().moveId, 0u);
}

TEST(Match, RollbackTwoPlies) {
	Match match(2u, 3u);
	ASSERT_TRUE(match.applyMove({0u, 4u}));
	const auto afterFirst = match.position();
	ASSERT_TRUE(match.applyMove({1u, 4u}));
	ASSERT_TRUE(match.applyMove({0u, 0u}));

	ASSERT_TRUE(match.rollback(2u));
	EXPECT_EQ(match.position(), afterFirst);
	EXPECT_EQ(match.history().size(), 2u);
	EXPECT_EQ(match.currentPlayer(), Player::Two);
}

// Rollback needs the initial snapshot to remain
TEST(Match, RollbackLimits) {
	Match match(1u, 3u);
	EXPECT_FALSE(match.rollback(1u));
	EXPECT_FALSE(match.rollback(0u));

	ASSERT_TRUE(match.applyMove({0u, 4u}));
	EXPECT_FALSE(match.rollback(2u));
	EXPECT_EQ(match.history().size(), 2u);

	ASSERT_TRUE(match.rollback(1u));
	EXPECT_EQ(match.boards(), makeBoardSet(1u, 3u));
	EXPECT_EQ(match.currentPlayer(), Player::One);
}

TEST(Match, RollbackReopensFinishedMatch) {
	Match match(1u, 3u);
	ASSERT_TRUE(match.applyMove({0u, 3u}));
	ASSERT_TRUE(match.applyMove({0u, 4u}));
	ASSERT_TRUE(match.applyMove({0u, 5u}));
	ASSERT_TRUE(match.isOver());

	ASSERT_TRUE(match.rollback(1u));
	EXPECT_FALSE(match.isOver());
	EXPECT_FALSE(match.outcome().loser.has_value());
	EXPECT_EQ(match.currentPlayer(), Player::One);
	EXPECT_FALSE(allDead(match.boards()));
}

} // namespace notakto::gtest
