#pragma once

#include <cstddef>

namespace notakto {

//! Both sides place the same mark. Sides only differ by turn order.
enum class Player { One = 1, Two = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::Two ? Player::One : Player::Two;
}

//! Target of a mark: one cell of one board in the board set.
//! \note Cell indices are row-major: index = row * size + col.
struct Move {
	std::size_t boardIndex;
	std::size_t cellIndex;

	bool operator==(const Move&) const = default;
};

} // namespace notakto
