// Copyright (C) 2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#ifndef TERMWIRE_DATA_HEADER_VIEW_HPP
#define TERMWIRE_DATA_HEADER_VIEW_HPP

#include <cstdint>

#include <string>

#include "BufferView.hpp"
#include "HeaderView.hpp"

namespace termwire
{
class ByteBuffer;

/*
 * Header of a data frame, little-endian, payload follows at DATA_OFFSET:
 *
 *  0                   1                   2                   3
 *  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
 * +---------------------------------------------------------------+
 * |                         Frame Length                          |
 * +---------------+-+-+-----------+-------------------------------+
 * |    Version    |B|E|  Flags    |             Type              |
 * +---------------+-+-+-----------+-------------------------------+
 * |                          Term Offset                          |
 * +---------------------------------------------------------------+
 * |                          Session ID                           |
 * +---------------------------------------------------------------+
 * |                           Stream ID                           |
 * +---------------------------------------------------------------+
 * |                            Term ID                            |
 * +---------------------------------------------------------------+
 * |                        Reserved Value                         |
 * |                                                               |
 * +---------------------------------------------------------------+
 *
 * The generic part is reached through Header(), which is pointed back at
 * the data fields' region on every call. A HeaderView reference kept past
 * that call and rebound by the caller no longer follows this view. Frame
 * length is never computed here.
 */
class DataHeaderView
{
public:
	inline static constexpr uint32_t HEADER_LENGTH = 32;

	inline static constexpr uint8_t BEGIN_FLAG = 0x80;
	inline static constexpr uint8_t END_FLAG = 0x40;
	inline static constexpr uint8_t BEGIN_AND_END_FLAGS = BEGIN_FLAG | END_FLAG;

	inline static constexpr int64_t DEFAULT_RESERVE_VALUE = 0;

	inline static constexpr uint32_t TERM_OFFSET_FIELD_OFFSET = 8;
	inline static constexpr uint32_t SESSION_ID_FIELD_OFFSET = 12;
	inline static constexpr uint32_t STREAM_ID_FIELD_OFFSET = 16;
	inline static constexpr uint32_t TERM_ID_FIELD_OFFSET = 20;
	inline static constexpr uint32_t RESERVED_VALUE_OFFSET = 24;
	inline static constexpr uint32_t DATA_OFFSET = HEADER_LENGTH;

public:
	inline DataHeaderView() {}
	inline explicit DataHeaderView(const BufferView &buffer)
		: buffer(buffer), header(buffer)
	{
	}
	inline DataHeaderView(const BufferView &buffer, uint32_t offset,
						  uint32_t length)
		: buffer(buffer, offset, length), header(this->buffer)
	{
	}
	explicit DataHeaderView(ByteBuffer &buffer);

	inline HeaderView &Header()
	{
		header.Wrap(buffer);
		return header;
	}
	inline const HeaderView &Header() const
	{
		header.Wrap(buffer);
		return header;
	}

	inline const BufferView &Buffer() const { return buffer; }

	/*
	 * Retargets the view, data fields and Header() alike. Nothing is
	 * written; fields show whatever bytes are already there.
	 */
	inline void Wrap(const BufferView &buffer)
	{
		this->buffer = buffer;
		header.Wrap(this->buffer);
	}
	inline void Wrap(const BufferView &buffer, uint32_t offset,
					 uint32_t length)
	{
		this->buffer.Wrap(buffer, offset, length);
		header.Wrap(this->buffer);
	}

	inline int32_t SessionId() const
	{
		return buffer.GetInt32(SESSION_ID_FIELD_OFFSET);
	}
	inline DataHeaderView &SessionId(int32_t sessionId)
	{
		buffer.PutInt32(SESSION_ID_FIELD_OFFSET, sessionId);
		return *this;
	}

	inline int32_t StreamId() const
	{
		return buffer.GetInt32(STREAM_ID_FIELD_OFFSET);
	}
	inline DataHeaderView &StreamId(int32_t streamId)
	{
		buffer.PutInt32(STREAM_ID_FIELD_OFFSET, streamId);
		return *this;
	}

	inline int32_t TermId() const
	{
		return buffer.GetInt32(TERM_ID_FIELD_OFFSET);
	}
	inline DataHeaderView &TermId(int32_t termId)
	{
		buffer.PutInt32(TERM_ID_FIELD_OFFSET, termId);
		return *this;
	}

	inline int32_t TermOffset() const
	{
		return buffer.GetInt32(TERM_OFFSET_FIELD_OFFSET);
	}
	inline DataHeaderView &TermOffset(int32_t termOffset)
	{
		buffer.PutInt32(TERM_OFFSET_FIELD_OFFSET, termOffset);
		return *this;
	}

	inline int64_t ReservedValue() const
	{
		return buffer.GetInt64(RESERVED_VALUE_OFFSET);
	}
	// The argument is sign-extended into the 8 byte field: -1 reads back as
	// 0xFFFFFFFFFFFFFFFF.
	inline DataHeaderView &ReservedValue(int32_t reservedValue)
	{
		buffer.PutInt64(RESERVED_VALUE_OFFSET, (int64_t)reservedValue);
		return *this;
	}

	inline uint32_t DataOffset() const { return DATA_OFFSET; }

	/*
	 * Field readers for a frame starting at frameOffset inside a larger
	 * buffer, e.g. while scanning a term, without binding a view.
	 */
	static int32_t TermOffset(const BufferView &buffer, uint32_t frameOffset);
	static int32_t SessionId(const BufferView &buffer, uint32_t frameOffset);
	static int32_t StreamId(const BufferView &buffer, uint32_t frameOffset);
	static int32_t TermId(const BufferView &buffer, uint32_t frameOffset);
	static int64_t ReservedValue(const BufferView &buffer,
								 uint32_t frameOffset);

	/*
	 * Allocates a zeroed HEADER_LENGTH buffer holding a single unfragmented
	 * data frame header for the given ids. Frame length and term offset are
	 * left 0 for whoever finalizes the frame.
	 */
	static ByteBuffer CreateDefaultHeader(int32_t sessionId, int32_t streamId,
										  int32_t termId);

	std::string ToString() const;

private:
	BufferView buffer;
	mutable HeaderView header;
};
} // namespace termwire

#endif
