// Copyright (C) 2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#include <cinttypes>
#include <cstdio>

#include "../include/termwire/ByteBuffer.hpp"
#include "../include/termwire/Debug.hpp"

#include "../include/termwire/BufferView.hpp"

namespace termwire
{
static std::string BoundsViolationMessage(uint64_t offset, uint64_t width,
										  uint64_t capacity)
{
	char buf[128];
	snprintf(buf, sizeof(buf),
			 "index=%" PRIu64 " length=%" PRIu64 " capacity=%" PRIu64, offset,
			 width, capacity);
	return buf;
}

BoundsViolation::BoundsViolation(uint64_t offset, uint64_t width,
								 uint64_t capacity)
	: std::out_of_range(BoundsViolationMessage(offset, width, capacity)),
	  offset(offset), width(width), capacity(capacity)
{
}

BufferView::BufferView(ByteBuffer &buffer)
	: _data(buffer.valid() ? buffer.data() : nullptr),
	  _capacity(buffer.size())
{
}

void BufferView::Wrap(ByteBuffer &buffer)
{
	_data = buffer.valid() ? buffer.data() : nullptr;
	_capacity = buffer.size();
}

void BufferView::ThrowBoundsViolation(uint32_t index, uint32_t width) const
{
	LOG_FATAL("Out of bounds access on buffer [%p]: index=%u length=%u "
			  "capacity=%u",
			  (void *)_data, index, width, _capacity);
	throw BoundsViolation(index, width, _capacity);
}
} // namespace termwire
