// Copyright (C) 2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#ifndef TERMWIRE_HEADER_VIEW_HPP
#define TERMWIRE_HEADER_VIEW_HPP

#include <cstdint>

#include <string>

#include "BufferView.hpp"

namespace termwire
{
class ByteBuffer;

/*
 * Fields shared by every frame kind, little-endian:
 *
 *  0                   1                   2                   3
 *  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
 * +---------------------------------------------------------------+
 * |                         Frame Length                          |
 * +---------------+---------------+-------------------------------+
 * |    Version    |     Flags     |             Type              |
 * +---------------+---------------+-------------------------------+
 *
 * The view does not own the bytes and does not cache any field.
 */
class HeaderView
{
public:
	inline static constexpr uint8_t CURRENT_VERSION = 0x0;

	inline static constexpr uint16_t HDR_TYPE_PAD = 0x00;
	inline static constexpr uint16_t HDR_TYPE_DATA = 0x01;
	inline static constexpr uint16_t HDR_TYPE_NAK = 0x02;
	inline static constexpr uint16_t HDR_TYPE_SM = 0x03;
	inline static constexpr uint16_t HDR_TYPE_ERR = 0x04;
	inline static constexpr uint16_t HDR_TYPE_SETUP = 0x05;
	inline static constexpr uint16_t HDR_TYPE_RTTM = 0x06;
	inline static constexpr uint16_t HDR_TYPE_RES = 0x07;
	inline static constexpr uint16_t HDR_TYPE_EXT = 0xFFFF;

	inline static constexpr uint32_t FRAME_LENGTH_FIELD_OFFSET = 0;
	inline static constexpr uint32_t VERSION_FIELD_OFFSET = 4;
	inline static constexpr uint32_t FLAGS_FIELD_OFFSET = 5;
	inline static constexpr uint32_t TYPE_FIELD_OFFSET = 6;
	inline static constexpr uint32_t HEADER_LENGTH = 8;

public:
	inline HeaderView() {}
	inline explicit HeaderView(const BufferView &buffer) : buffer(buffer) {}
	inline HeaderView(const BufferView &buffer, uint32_t offset,
					  uint32_t length)
		: buffer(buffer, offset, length)
	{
	}
	explicit HeaderView(ByteBuffer &buffer);

	inline void Wrap(const BufferView &buffer) { this->buffer = buffer; }
	inline void Wrap(const BufferView &buffer, uint32_t offset,
					 uint32_t length)
	{
		this->buffer.Wrap(buffer, offset, length);
	}

	inline const BufferView &Buffer() const { return buffer; }

	inline int32_t FrameLength() const
	{
		return buffer.GetInt32(FRAME_LENGTH_FIELD_OFFSET);
	}
	inline HeaderView &FrameLength(int32_t frameLength)
	{
		buffer.PutInt32(FRAME_LENGTH_FIELD_OFFSET, frameLength);
		return *this;
	}

	inline uint8_t Version() const
	{
		return buffer.GetUint8(VERSION_FIELD_OFFSET);
	}
	inline HeaderView &Version(uint8_t version)
	{
		buffer.PutUint8(VERSION_FIELD_OFFSET, version);
		return *this;
	}

	inline uint8_t Flags() const { return buffer.GetUint8(FLAGS_FIELD_OFFSET); }
	inline HeaderView &Flags(uint8_t flags)
	{
		buffer.PutUint8(FLAGS_FIELD_OFFSET, flags);
		return *this;
	}

	inline uint16_t HeaderType() const
	{
		return buffer.GetUint16(TYPE_FIELD_OFFSET);
	}
	inline HeaderView &HeaderType(uint16_t type)
	{
		buffer.PutUint16(TYPE_FIELD_OFFSET, type);
		return *this;
	}

	std::string ToString() const;

private:
	BufferView buffer;
};

/*
 * Renders flags as 8 characters of '0'/'1', most significant bit first.
 */
std::string FlagsToString(uint8_t flags);
} // namespace termwire

#endif
