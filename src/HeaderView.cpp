// Copyright (C) 2025 Marek Zalewski aka Drwalin
//
// This file is part of TermWire project under MIT License
// You should have received a copy of the MIT License along with this program.

#include <cstdio>

#include "../include/termwire/ByteBuffer.hpp"

#include "../include/termwire/HeaderView.hpp"

namespace termwire
{
HeaderView::HeaderView(ByteBuffer &buffer) : buffer(buffer) {}

std::string HeaderView::ToString() const
{
	char buf[128];
	snprintf(buf, sizeof(buf),
			 "Header{frame_length=%i version=%u flags=%s type=%u}",
			 (int)FrameLength(), (unsigned)Version(),
			 FlagsToString(Flags()).c_str(), (unsigned)HeaderType());
	return buf;
}

std::string FlagsToString(uint8_t flags)
{
	std::string str(8, '0');
	for (int i = 0; i < 8; ++i) {
		if (flags & (0x80 >> i)) {
			str[i] = '1';
		}
	}
	return str;
}
} // namespace termwire
