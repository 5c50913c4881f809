#include "core/patternCatalog.hpp"

#include "sizeCache.hpp"

#include <cassert>

namespace notakto {

static std::vector<Pattern> buildPatterns(const std::size_t size) {
	std::vector<Pattern> patterns;
	patterns.reserve(2u * size + 2u);

	for (std::size_t i = 0; i != size; ++i) {
		Pattern row(size);
		Pattern col(size);
		for (std::size_t j = 0; j != size; ++j) {
			row[j] = i * size + j;
			col[j] = i + j * size;
		}
		patterns.push_back(std::move(row));
		patterns.push_back(std::move(col));
	}

	Pattern diagonal(size);
	Pattern antiDiagonal(size);
	for (std::size_t i = 0; i != size; ++i) {
		diagonal[i]     = i * (size + 1u);
		antiDiagonal[i] = (i + 1u) * (size - 1u);
	}
	patterns.push_back(std::move(diagonal));
	patterns.push_back(std::move(antiDiagonal));

	return patterns;
}

const std::vector<Pattern>& patternsFor(const std::size_t size) {
	assert(size >= 1u);

	static SizeCache<std::vector<Pattern>> cache;
	return cache.get(size, buildPatterns);
}

} // namespace notakto
