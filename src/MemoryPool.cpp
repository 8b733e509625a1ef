// Copyright (C) 2024-2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#include "../include/termwire/Debug.hpp"
#include "../include/termwire/Time.hpp"

#if TERMWIRE_USE_RPMALLOC
#include <rpmalloc.h>
#else
#include <cstdlib>
#endif

#include "../include/termwire/MemoryPool.hpp"

namespace termwire
{
MemoryStats::MemoryStats() { startTimestamp = time::GetTimestamp(); }

MemoryStats MemoryPool::stats;

MemoryStats &MemoryPool::Stats() { return stats; }

static void CountAllocation(MemoryStats &stats, size_t bytes)
{
	stats.allocations += 1;
	int64_t max = (stats.allocatedBytes += bytes) - stats.deallocatedBytes;
	int64_t v = stats.maxInUseAtOnce;
	while (max > v) {
		if (stats.maxInUseAtOnce.compare_exchange_weak(
				v, max, std::memory_order_release, std::memory_order_relaxed)) {
			break;
		}
	}

	if (bytes <= MemoryStats::MAX_BYTES_FOR_SMALL_ALLOCATIONS) {
		stats.smallAllocations += 1;
	} else if (bytes <= MemoryStats::MAX_BYTES_FOR_MEDIUM_ALLOCATIONS) {
		stats.mediumAllocations += 1;
	} else {
		stats.largeAllocations += 1;
	}
}

AllocatedObject<void> MemoryPool::Allocate(size_t bytes)
{
#if TERMWIRE_USE_RPMALLOC
	static int ____staticInitilizeRpmalloc = (rpmalloc_initialize(), 0);
	(void)____staticInitilizeRpmalloc;
	class __RpMallocThreadLocalDestructor final
	{
	public:
		__RpMallocThreadLocalDestructor() { rpmalloc_thread_initialize(); }
		~__RpMallocThreadLocalDestructor() { rpmalloc_thread_finalize(1); }
	};
	thread_local __RpMallocThreadLocalDestructor
		____staticThreadLocalDestructorRpmalloc;

	void *ptr = rpmalloc(bytes);
	if (ptr == nullptr) {
		LOG_FATAL("rpmalloc failed to allocate %lu bytes",
				  (unsigned long)bytes);
		return {nullptr, 0};
	}
	const size_t usable = rpmalloc_usable_size(ptr);
	if (usable < bytes) {
		rpfree(ptr);
		LOG_FATAL("Allocated memory is smaller than requested");
		return {nullptr, 0};
	}
	CountAllocation(stats, usable);
	return {ptr, usable};
#else
	void *ptr = malloc(bytes);
	if (ptr == nullptr) {
		LOG_FATAL("malloc failed to allocate %lu bytes", (unsigned long)bytes);
		return {nullptr, 0};
	}
	CountAllocation(stats, bytes);
	return {ptr, bytes};
#endif
}

void MemoryPool::Release(void *ptr, size_t bytes)
{
	if (ptr == nullptr) {
		return;
	}
#if TERMWIRE_USE_RPMALLOC
	bytes = rpmalloc_usable_size(ptr);
#endif
	stats.deallocations += 1;
	stats.deallocatedBytes += bytes;
#if TERMWIRE_USE_RPMALLOC
	rpfree(ptr);
#else
	free(ptr);
#endif
}
} // namespace termwire
