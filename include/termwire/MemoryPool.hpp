// Copyright (C) 2024-2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#ifndef TERMWIRE_MEMORY_POOL_HPP
#define TERMWIRE_MEMORY_POOL_HPP

#include <cstddef>

#include "Stats.hpp"

namespace termwire
{
template <typename T> struct AllocatedObject {
	T *object;
	size_t capacity;
};

/*
 * Every owning buffer of the library is allocated here. With
 * TERMWIRE_USE_RPMALLOC=1 allocations go through rpmalloc, otherwise
 * through malloc. Returned capacity may be larger than requested.
 */
class MemoryPool
{
public:
	MemoryPool() = delete;

	__attribute__((noinline)) static AllocatedObject<void>
	Allocate(size_t bytes);
	__attribute__((noinline)) static void Release(void *ptr, size_t bytes);

	static MemoryStats &Stats();

private:
	static MemoryStats stats;
};
} // namespace termwire

#endif
