// Copyright (C) 2023-2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#include <cstring>

#include <new>

#include "../include/termwire/MemoryPool.hpp"
#include "../include/termwire/Debug.hpp"

#include "../include/termwire/ByteBuffer.hpp"

namespace termwire
{
ByteBufferStorageHeader *ByteBufferStorageHeader::Allocate(uint32_t capacity)
{
	const uint32_t S = sizeof(ByteBufferStorageHeader);

	AllocatedObject<void> allocated = MemoryPool::Allocate(capacity + S);
	if (allocated.object == nullptr) {
		throw std::bad_alloc();
	}

	ByteBufferStorageHeader *ptr =
		new (allocated.object) ByteBufferStorageHeader;
	ptr->refCounter = 1;
	ptr->size = 0;
	ptr->capacity = allocated.capacity - S;
	return ptr;
}

void ByteBufferStorageHeader::Release(ByteBufferStorageHeader *ptr)
{
	if (ptr == nullptr || --ptr->refCounter != 0) {
		return;
	}
	const size_t bytes = ptr->capacity + sizeof(ByteBufferStorageHeader);
	ptr->~ByteBufferStorageHeader();
	MemoryPool::Release(ptr, bytes);
}

void ByteBuffer::resize(uint32_t newSize)
{
	if (newSize > capacity()) {
		ByteBufferStorageHeader *grown =
			ByteBufferStorageHeader::Allocate(newSize);
		if (storage) {
			LOG_TRACE("Growing buffer from %u to %u bytes", storage->capacity,
					  newSize);
			memcpy(grown->data(), storage->data(), storage->size);
			ByteBufferStorageHeader::Release(storage);
		}
		storage = grown;
	}
	storage->size = newSize;
}
} // namespace termwire
