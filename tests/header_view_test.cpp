#include <cstdint>
#include <cstring>

#include <string>

#include "../include/termwire/BufferView.hpp"
#include "../include/termwire/HeaderView.hpp"
#include "../include/termwire/Debug.hpp"

#include "utility.hpp"

using namespace termwire;

void TestFieldOffsets()
{
	uint8_t bytes[HeaderView::HEADER_LENGTH];
	memset(bytes, 0, sizeof(bytes));
	HeaderView header(BufferView{bytes, sizeof(bytes)});

	header.FrameLength(0x11223344).Version(0x05).Flags(0xA5).HeaderType(
		0xCAFE);

	const uint8_t expected[8] = {0x44, 0x33, 0x22, 0x11, 0x05, 0xA5, 0xFE, 0xCA};
	for (int i = 0; i < 8; ++i) {
		CHECK_EQ(bytes[i], expected[i]);
	}

	CHECK_EQ(header.FrameLength(), 0x11223344);
	CHECK_EQ(header.Version(), 0x05);
	CHECK_EQ(header.Flags(), 0xA5);
	CHECK_EQ(header.HeaderType(), 0xCAFE);
}

void TestNoValidation()
{
	uint8_t bytes[8];
	memset(bytes, 0xFF, sizeof(bytes));
	HeaderView header(BufferView{bytes, sizeof(bytes)});

	CHECK_EQ(header.FrameLength(), -1);
	CHECK_EQ(header.Version(), 0xFF);
	CHECK_EQ(header.Flags(), 0xFF);
	CHECK_EQ(header.HeaderType(), HeaderView::HDR_TYPE_EXT);

	header.FrameLength(-100);
	CHECK_EQ(header.FrameLength(), -100);
}

void TestRebinding()
{
	uint8_t bytes[64];
	memset(bytes, 0, sizeof(bytes));
	BufferView term(bytes, sizeof(bytes));

	HeaderView header(term, 0, 32);
	header.HeaderType(HeaderView::HDR_TYPE_DATA).FrameLength(32);

	header.Wrap(term, 32, 32);
	CHECK_EQ(header.HeaderType(), HeaderView::HDR_TYPE_PAD);
	CHECK_EQ(header.FrameLength(), 0);
	header.HeaderType(HeaderView::HDR_TYPE_PAD).FrameLength(32);
	CHECK_EQ(bytes[32], 32);

	header.Wrap(term);
	CHECK_EQ(header.HeaderType(), HeaderView::HDR_TYPE_DATA);
	CHECK_EQ(header.Buffer().capacity(), 64u);

	header.Wrap(BufferView(bytes + 4, 4));
	CHECK_THROWS(header.Flags(), BoundsViolation);
	CHECK_THROWS(header.Wrap(term, 60, 8), BoundsViolation);
}

void TestFormatting()
{
	CHECK_EQ(FlagsToString(0xC0), std::string("11000000"));
	CHECK_EQ(FlagsToString(0x00), std::string("00000000"));
	CHECK_EQ(FlagsToString(0x01), std::string("00000001"));
	CHECK_EQ(FlagsToString(0xFF), std::string("11111111"));
	CHECK_EQ(FlagsToString(0x80), std::string("10000000"));
	CHECK_EQ(FlagsToString(0x21), std::string("00100001"));

	uint8_t bytes[8];
	memset(bytes, 0, sizeof(bytes));
	HeaderView header(BufferView{bytes, sizeof(bytes)});
	header.FrameLength(96).Flags(0x40).HeaderType(HeaderView::HDR_TYPE_SETUP);

	CHECK_EQ(header.ToString(),
			 std::string("Header{frame_length=96 version=0 flags=01000000 "
						 "type=5}"));
}

int main(int argc, char **argv)
{
	ArgsParser args(argc, argv);
	args.ApplyLogLevel();

	TestFieldOffsets();
	TestNoValidation();
	TestRebinding();
	TestFormatting();

	return test::Summary("header_view_test");
}
