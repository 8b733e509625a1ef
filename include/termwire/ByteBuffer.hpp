// Copyright (C) 2023-2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#ifndef TERMWIRE_BYTE_BUFFER_HPP
#define TERMWIRE_BYTE_BUFFER_HPP

#include <cstdint>
#include <cstddef>

#include <atomic>
#include <utility>

namespace termwire
{
struct ByteBufferStorageHeader {
	std::atomic<uint32_t> refCounter;
	uint32_t size;
	uint32_t capacity;

	inline uint8_t *data() { return (uint8_t *)(this + 1); }

	static ByteBufferStorageHeader *Allocate(uint32_t capacity);
	static void Release(ByteBufferStorageHeader *ptr);
};

/*
 * Reference counted, heap allocated byte storage. Copies share the same
 * storage; the last owner releases it back to MemoryPool.
 */
class ByteBuffer
{
public:
	inline ByteBuffer() : storage(nullptr) {}
	inline explicit ByteBuffer(uint32_t initialCapacity)
		: storage(ByteBufferStorageHeader::Allocate(initialCapacity))
	{
	}
	inline ByteBuffer(const ByteBuffer &o) : storage(o.storage)
	{
		if (storage)
			storage->refCounter++;
	}
	inline ByteBuffer(ByteBuffer &&o) : storage(o.storage)
	{
		o.storage = nullptr;
	}
	inline ~ByteBuffer() { ByteBufferStorageHeader::Release(storage); }

	inline ByteBuffer &operator=(const ByteBuffer &o)
	{
		ByteBuffer copy(o);
		std::swap(storage, copy.storage);
		return *this;
	}
	inline ByteBuffer &operator=(ByteBuffer &&o)
	{
		std::swap(storage, o.storage);
		return *this;
	}

	inline bool valid() const { return storage != nullptr; }

	inline uint8_t *data() { return storage->data(); }
	inline const uint8_t *data() const { return storage->data(); }
	inline uint32_t size() const { return storage ? storage->size : 0; }
	inline uint32_t capacity() const { return storage ? storage->capacity : 0; }

	/*
	 * Grows into fresh storage when needed, keeping the first size() bytes.
	 * Other copies keep the old storage.
	 */
	void resize(uint32_t newSize);

private:
	ByteBufferStorageHeader *storage;
};
} // namespace termwire

#endif
