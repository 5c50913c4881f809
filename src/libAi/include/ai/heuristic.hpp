#pragma once

#include "core/board.hpp"

namespace notakto::ai {

//! Penalty for a line on a live board that one more mark completes.
inline constexpr int kNearDeathPenalty = 10;
//! Penalty for a line on a live board that two more marks complete.
inline constexpr int kThreatPenalty = 1;

//! Static evaluation of a position at the search horizon.
//! Lines of every live board are inspected in catalog order: each line lacking two marks costs kThreatPenalty,
//! the first line lacking a single mark costs kNearDeathPenalty and ends the inspection of that board.
//! Dead boards contribute nothing.
//! \note The value is not adjusted for the side to move.
int score(const BoardSet& boards, std::size_t size);

} // namespace notakto::ai
