// Copyright (C) 2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#ifndef TERMWIRE_BUFFER_VIEW_HPP
#define TERMWIRE_BUFFER_VIEW_HPP

#include <cstdint>
#include <cstring>

#include <bit>
#include <stdexcept>
#include <string>

namespace termwire
{
class ByteBuffer;

/*
 * Raised when an access or a sub-range does not fit inside the bound
 * region. Nothing in this library catches it.
 */
class BoundsViolation : public std::out_of_range
{
public:
	BoundsViolation(uint64_t offset, uint64_t width, uint64_t capacity);

	const uint64_t offset;
	const uint64_t width;
	const uint64_t capacity;
};

/*
 * Non-owning window of `capacity` bytes with bounds checked little-endian
 * access. Copying a BufferView copies the pointer, never the bytes.
 *
 * Checks are compiled out with TERMWIRE_DISABLE_BOUNDS_CHECKS.
 */
class BufferView
{
public:
	inline BufferView() : _data(nullptr), _capacity(0) {}
	inline BufferView(uint8_t *data, uint32_t capacity)
		: _data(data), _capacity(capacity)
	{
	}
	explicit BufferView(ByteBuffer &buffer);
	inline BufferView(const BufferView &parent, uint32_t offset,
					  uint32_t length)
		: _data(nullptr), _capacity(0)
	{
		Wrap(parent, offset, length);
	}

	inline void Wrap(uint8_t *data, uint32_t capacity)
	{
		_data = data;
		_capacity = capacity;
	}
	void Wrap(ByteBuffer &buffer);
	inline void Wrap(const BufferView &parent, uint32_t offset,
					 uint32_t length)
	{
		parent.BoundsCheck(offset, length);
		_data = parent._data + offset;
		_capacity = length;
	}

	inline uint8_t *data() const { return _data; }
	inline uint32_t capacity() const { return _capacity; }
	inline bool valid() const { return _data != nullptr; }

	inline uint8_t GetUint8(uint32_t index) const
	{
		BoundsCheck(index, 1);
		return _data[index];
	}
	inline void PutUint8(uint32_t index, uint8_t value)
	{
		BoundsCheck(index, 1);
		_data[index] = value;
	}

	inline uint16_t GetUint16(uint32_t index) const
	{
		return Load<uint16_t>(index);
	}
	inline void PutUint16(uint32_t index, uint16_t value)
	{
		Store<uint16_t>(index, value);
	}

	inline int16_t GetInt16(uint32_t index) const
	{
		return (int16_t)Load<uint16_t>(index);
	}
	inline void PutInt16(uint32_t index, int16_t value)
	{
		Store<uint16_t>(index, (uint16_t)value);
	}

	inline int32_t GetInt32(uint32_t index) const
	{
		return (int32_t)Load<uint32_t>(index);
	}
	inline void PutInt32(uint32_t index, int32_t value)
	{
		Store<uint32_t>(index, (uint32_t)value);
	}

	inline int64_t GetInt64(uint32_t index) const
	{
		return (int64_t)Load<uint64_t>(index);
	}
	inline void PutInt64(uint32_t index, int64_t value)
	{
		Store<uint64_t>(index, (uint64_t)value);
	}

	inline void GetBytes(uint32_t index, uint8_t *dst, uint32_t length) const
	{
		BoundsCheck(index, length);
		memcpy(dst, _data + index, length);
	}
	inline void PutBytes(uint32_t index, const uint8_t *src, uint32_t length)
	{
		BoundsCheck(index, length);
		memcpy(_data + index, src, length);
	}
	inline void SetMemory(uint32_t index, uint32_t length, uint8_t value)
	{
		BoundsCheck(index, length);
		memset(_data + index, value, length);
	}

	inline void BoundsCheck(uint32_t index, uint32_t width) const
	{
#ifndef TERMWIRE_DISABLE_BOUNDS_CHECKS
		if ((uint64_t)index + (uint64_t)width > (uint64_t)_capacity) {
			ThrowBoundsViolation(index, width);
		}
#endif
	}

private:
	template <typename T> static inline T ToLittleEndian(T v)
	{
		if constexpr (std::endian::native == std::endian::little) {
			return v;
		} else if constexpr (sizeof(T) == 2) {
			return __builtin_bswap16(v);
		} else if constexpr (sizeof(T) == 4) {
			return __builtin_bswap32(v);
		} else {
			return __builtin_bswap64(v);
		}
	}

	template <typename T> inline T Load(uint32_t index) const
	{
		BoundsCheck(index, sizeof(T));
		T v;
		memcpy(&v, _data + index, sizeof(T));
		return ToLittleEndian(v);
	}

	template <typename T> inline void Store(uint32_t index, T value)
	{
		BoundsCheck(index, sizeof(T));
		value = ToLittleEndian(value);
		memcpy(_data + index, &value, sizeof(T));
	}

	[[noreturn]] void ThrowBoundsViolation(uint32_t index,
										   uint32_t width) const;

private:
	uint8_t *_data;
	uint32_t _capacity;
};
} // namespace termwire

#endif
