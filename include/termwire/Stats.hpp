// Copyright (C) 2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#ifndef TERMWIRE_STATS_HPP
#define TERMWIRE_STATS_HPP

#include <cstdint>
#include <cstddef>

#include <atomic>

#include "Time.hpp"

namespace termwire
{
struct MemoryStats {
	alignas(64) std::atomic<int64_t> allocations = 0;
	alignas(64) std::atomic<int64_t> deallocations = 0;
	alignas(64) std::atomic<int64_t> allocatedBytes = 0;
	alignas(64) std::atomic<int64_t> deallocatedBytes = 0;
	alignas(64) std::atomic<int64_t> maxInUseAtOnce = 0;

	alignas(64) std::atomic<int64_t> smallAllocations = 0;
	alignas(64) std::atomic<int64_t> mediumAllocations = 0;
	alignas(64) std::atomic<int64_t> largeAllocations = 0;

	time::Timestamp startTimestamp = {0};

	MemoryStats();

	inline int64_t InUseBytes() const
	{
		return allocatedBytes.load() - deallocatedBytes.load();
	}

	inline const static size_t MAX_BYTES_FOR_SMALL_ALLOCATIONS = 256;
	inline const static size_t MAX_BYTES_FOR_MEDIUM_ALLOCATIONS = 4096;
};
} // namespace termwire

#endif
