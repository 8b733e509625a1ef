// Copyright (C) 2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#include <cinttypes>
#include <cstdio>

#include "../include/termwire/ByteBuffer.hpp"
#include "../include/termwire/Debug.hpp"

#include "../include/termwire/DataHeaderView.hpp"

namespace termwire
{
// Static readers check the frame offset and the field end together so that
// frameOffset + FIELD_OFFSET cannot wrap around.

DataHeaderView::DataHeaderView(ByteBuffer &buffer)
	: buffer(buffer), header(this->buffer)
{
}

int32_t DataHeaderView::TermOffset(const BufferView &buffer,
								   uint32_t frameOffset)
{
	buffer.BoundsCheck(frameOffset, TERM_OFFSET_FIELD_OFFSET + 4);
	return buffer.GetInt32(frameOffset + TERM_OFFSET_FIELD_OFFSET);
}

int32_t DataHeaderView::SessionId(const BufferView &buffer,
								  uint32_t frameOffset)
{
	buffer.BoundsCheck(frameOffset, SESSION_ID_FIELD_OFFSET + 4);
	return buffer.GetInt32(frameOffset + SESSION_ID_FIELD_OFFSET);
}

int32_t DataHeaderView::StreamId(const BufferView &buffer,
								 uint32_t frameOffset)
{
	buffer.BoundsCheck(frameOffset, STREAM_ID_FIELD_OFFSET + 4);
	return buffer.GetInt32(frameOffset + STREAM_ID_FIELD_OFFSET);
}

int32_t DataHeaderView::TermId(const BufferView &buffer, uint32_t frameOffset)
{
	buffer.BoundsCheck(frameOffset, TERM_ID_FIELD_OFFSET + 4);
	return buffer.GetInt32(frameOffset + TERM_ID_FIELD_OFFSET);
}

int64_t DataHeaderView::ReservedValue(const BufferView &buffer,
									  uint32_t frameOffset)
{
	buffer.BoundsCheck(frameOffset, RESERVED_VALUE_OFFSET + 8);
	return buffer.GetInt64(frameOffset + RESERVED_VALUE_OFFSET);
}

ByteBuffer DataHeaderView::CreateDefaultHeader(int32_t sessionId,
											   int32_t streamId, int32_t termId)
{
	ByteBuffer buffer(HEADER_LENGTH);
	buffer.resize(HEADER_LENGTH);

	BufferView region(buffer);
	region.SetMemory(0, HEADER_LENGTH, 0);

	DataHeaderView view(region);
	view.Header()
		.Version(HeaderView::CURRENT_VERSION)
		.Flags(BEGIN_AND_END_FLAGS)
		.HeaderType(HeaderView::HDR_TYPE_DATA);
	view.SessionId(sessionId).StreamId(streamId).TermId(termId);
	region.PutInt64(RESERVED_VALUE_OFFSET, DEFAULT_RESERVE_VALUE);

	LOG_TRACE("Created default data header: session_id=%i stream_id=%i "
			  "term_id=%i",
			  sessionId, streamId, termId);
	return buffer;
}

std::string DataHeaderView::ToString() const
{
	const HeaderView &header = Header();
	char buf[320];
	snprintf(buf, sizeof(buf),
			 "Data Header{frame_length=%i version=%u flags=%s type=%u "
			 "term_offset=%i session_id=%i stream_id=%i term_id=%i "
			 "reserved_value=%" PRId64 "}",
			 (int)header.FrameLength(), (unsigned)header.Version(),
			 FlagsToString(header.Flags()).c_str(),
			 (unsigned)header.HeaderType(), (int)TermOffset(),
			 (int)SessionId(), (int)StreamId(), (int)TermId(),
			 ReservedValue());
	return buf;
}
} // namespace termwire
