#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace notakto {

//! Process wide read-mostly table of values derived from the board edge length.
//! Entries are computed on first use and never modified or removed afterwards.
//! \note Two threads may compute the same entry concurrently. The build function has to be pure,
//!       the first inserted result is kept and both results are identical.
template <class Value>
class SizeCache {
public:
	template <class BuildFn>
	const Value& get(std::size_t size, BuildFn&& build) {
		{
			std::shared_lock<std::shared_mutex> lock(m_mutex);
			if (const auto it = m_entries.find(size); it != m_entries.end()) {
				return *it->second;
			}
		}

		// Build without holding the lock; catalog construction may be slow for large boards.
		auto entry = std::make_unique<const Value>(build(size));

		std::unique_lock<std::shared_mutex> lock(m_mutex);
		const auto it = m_entries.try_emplace(size, std::move(entry)).first;
		return *it->second;
	}

private:
	std::shared_mutex m_mutex;
	std::unordered_map<std::size_t, std::unique_ptr<const Value>> m_entries; //!< Stable addresses for returned references.
};

} // namespace notakto
