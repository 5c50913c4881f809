#pragma once

#include <cstddef>
#include <vector>

namespace notakto {

//! Cell indices of one row, column or diagonal. Always contains exactly size indices.
using Pattern = std::vector<std::size_t>;

//! Returns all lines that kill a board of the given edge length when fully marked.
//! Order: row i and column i for every i, followed by the main and the anti diagonal.
//! \note Contains exactly 2 * size + 2 patterns. The result is cached per size and stays valid for the process lifetime.
const std::vector<Pattern>& patternsFor(std::size_t size);

} // namespace notakto
