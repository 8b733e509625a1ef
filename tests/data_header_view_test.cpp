#include <cstdint>
#include <cstring>

#include <limits>
#include <string>
#include <vector>

#include "../include/termwire/BufferView.hpp"
#include "../include/termwire/ByteBuffer.hpp"
#include "../include/termwire/DataHeaderView.hpp"
#include "../include/termwire/HeaderView.hpp"
#include "../include/termwire/MemoryPool.hpp"
#include "../include/termwire/Debug.hpp"

#include "utility.hpp"

using namespace termwire;

static const std::vector<int32_t> interestingIds = {
	0,
	-1,
	1,
	7,
	99,
	0x12345678,
	std::numeric_limits<int32_t>::min(),
	std::numeric_limits<int32_t>::max(),
};

void TestDefaultHeaderRoundTrip()
{
	for (int32_t sessionId : interestingIds) {
		for (int32_t streamId : interestingIds) {
			for (int32_t termId : interestingIds) {
				ByteBuffer buffer = DataHeaderView::CreateDefaultHeader(
					sessionId, streamId, termId);
				DataHeaderView view(buffer);
				CHECK_EQ(view.SessionId(), sessionId);
				CHECK_EQ(view.StreamId(), streamId);
				CHECK_EQ(view.TermId(), termId);
			}
		}
	}
}

void TestDefaultHeader()
{
	ByteBuffer buffer = DataHeaderView::CreateDefaultHeader(7, 3, 99);
	CHECK_EQ(buffer.size(), DataHeaderView::HEADER_LENGTH);

	DataHeaderView view(buffer);
	CHECK_EQ(view.SessionId(), 7);
	CHECK_EQ(view.StreamId(), 3);
	CHECK_EQ(view.TermId(), 99);
	CHECK_EQ(view.ReservedValue(), 0);
	CHECK_EQ(view.TermOffset(), 0);
	CHECK_EQ(view.Header().FrameLength(), 0);
	CHECK_EQ(view.Header().Version(), HeaderView::CURRENT_VERSION);
	CHECK_EQ(view.Header().HeaderType(), HeaderView::HDR_TYPE_DATA);
	CHECK_EQ(view.Header().Flags(), 0xC0);
	CHECK_EQ(buffer.data()[HeaderView::FLAGS_FIELD_OFFSET], 0xC0);
	CHECK_EQ(FlagsToString(view.Header().Flags()), std::string("11000000"));

	const uint8_t expected[32] = {
		0, 0, 0, 0, HeaderView::CURRENT_VERSION, 0xC0, 0x01, 0x00, // generic
		0, 0, 0, 0, 7, 0, 0, 0,	  // term offset, session id
		3, 0, 0, 0, 99, 0, 0, 0,  // stream id, term id
		0, 0, 0, 0, 0, 0, 0, 0,	  // reserved value
	};
	CHECK(memcmp(buffer.data(), expected, sizeof(expected)) == 0);
}

void TestDefaultHeaderAllocatesOnce()
{
	MemoryStats &stats = MemoryPool::Stats();
	const int64_t before = stats.allocations.load();
	ByteBuffer buffer = DataHeaderView::CreateDefaultHeader(1, 2, 3);
	CHECK_EQ(stats.allocations.load() - before, 1);

	const int64_t afterCreate = stats.allocations.load();
	DataHeaderView view(buffer);
	view.TermOffset(64).SessionId(5).StreamId(6).TermId(7).ReservedValue(8);
	view.Wrap(BufferView(buffer), 0, DataHeaderView::HEADER_LENGTH);
	CHECK_EQ(view.TermId(), 7);
	CHECK_EQ(stats.allocations.load(), afterCreate);
}

void TestFieldIsolation()
{
	uint8_t bytes[DataHeaderView::HEADER_LENGTH];
	memset(bytes, 0, sizeof(bytes));
	DataHeaderView view(BufferView{bytes, sizeof(bytes)});

	view.TermOffset(1).SessionId(2).StreamId(3).TermId(4).ReservedValue(5);
	view.Header().FrameLength(6).Flags(DataHeaderView::BEGIN_FLAG);

	view.TermOffset(-11);
	CHECK_EQ(view.TermOffset(), -11);
	CHECK_EQ(view.SessionId(), 2);
	CHECK_EQ(view.StreamId(), 3);
	CHECK_EQ(view.TermId(), 4);
	CHECK_EQ(view.ReservedValue(), 5);

	view.SessionId(std::numeric_limits<int32_t>::min());
	CHECK_EQ(view.TermOffset(), -11);
	CHECK_EQ(view.SessionId(), std::numeric_limits<int32_t>::min());
	CHECK_EQ(view.StreamId(), 3);
	CHECK_EQ(view.TermId(), 4);
	CHECK_EQ(view.ReservedValue(), 5);

	view.StreamId(-1);
	CHECK_EQ(view.TermOffset(), -11);
	CHECK_EQ(view.SessionId(), std::numeric_limits<int32_t>::min());
	CHECK_EQ(view.StreamId(), -1);
	CHECK_EQ(view.TermId(), 4);
	CHECK_EQ(view.ReservedValue(), 5);

	view.TermId(std::numeric_limits<int32_t>::max());
	CHECK_EQ(view.TermOffset(), -11);
	CHECK_EQ(view.SessionId(), std::numeric_limits<int32_t>::min());
	CHECK_EQ(view.StreamId(), -1);
	CHECK_EQ(view.TermId(), std::numeric_limits<int32_t>::max());
	CHECK_EQ(view.ReservedValue(), 5);

	view.ReservedValue(-1);
	CHECK_EQ(view.TermOffset(), -11);
	CHECK_EQ(view.SessionId(), std::numeric_limits<int32_t>::min());
	CHECK_EQ(view.StreamId(), -1);
	CHECK_EQ(view.TermId(), std::numeric_limits<int32_t>::max());

	CHECK_EQ(view.Header().FrameLength(), 6);
	CHECK_EQ(view.Header().Flags(), DataHeaderView::BEGIN_FLAG);
	CHECK_EQ(view.Header().Version(), 0);
	CHECK_EQ(view.Header().HeaderType(), HeaderView::HDR_TYPE_PAD);
}

void TestReservedValueSignExtension()
{
	uint8_t bytes[DataHeaderView::HEADER_LENGTH];
	memset(bytes, 0, sizeof(bytes));
	DataHeaderView view(BufferView{bytes, sizeof(bytes)});

	view.ReservedValue(-1);
	CHECK_EQ(view.ReservedValue(), (int64_t)-1);
	CHECK_EQ((uint64_t)view.ReservedValue(), 0xFFFFFFFFFFFFFFFFull);
	for (uint32_t i = DataHeaderView::RESERVED_VALUE_OFFSET;
		 i < DataHeaderView::HEADER_LENGTH; ++i) {
		CHECK_EQ(bytes[i], 0xFF);
	}

	view.ReservedValue(std::numeric_limits<int32_t>::min());
	CHECK_EQ((uint64_t)view.ReservedValue(), 0xFFFFFFFF80000000ull);

	view.ReservedValue(0x7FFFFFFF);
	CHECK_EQ(view.ReservedValue(), (int64_t)0x7FFFFFFF);
	CHECK_EQ(bytes[28], 0x00);

	// a full width value written by a peer is read back intact
	BufferView(bytes, sizeof(bytes))
		.PutInt64(DataHeaderView::RESERVED_VALUE_OFFSET, 0x0123456789ABCDEFll);
	CHECK_EQ(view.ReservedValue(), (int64_t)0x0123456789ABCDEFll);
}

void TestDataOffset()
{
	uint8_t bytes[DataHeaderView::HEADER_LENGTH];
	memset(bytes, 0xAB, sizeof(bytes));
	DataHeaderView view(BufferView{bytes, sizeof(bytes)});
	CHECK_EQ(view.DataOffset(), 32u);

	view.Header().FrameLength(1000);
	view.TermOffset(4096);
	CHECK_EQ(view.DataOffset(), 32u);

	DataHeaderView unbound;
	CHECK_EQ(unbound.DataOffset(), 32u);
	CHECK_EQ(DataHeaderView::DATA_OFFSET, DataHeaderView::HEADER_LENGTH);
}

void TestWrapZeroedBuffer()
{
	// 64 zero bytes, header bound to the first 32
	std::vector<uint8_t> bytes(64, 0);
	DataHeaderView view;
	view.Wrap(BufferView(bytes.data(), bytes.size()), 0, 32);

	view.TermOffset(16);
	CHECK_EQ(view.TermOffset(), 16);
	CHECK_EQ(view.SessionId(), 0);
	CHECK_EQ(view.StreamId(), 0);
	CHECK_EQ(view.TermId(), 0);
	for (size_t i = 32; i < bytes.size(); ++i) {
		CHECK_EQ(bytes[i], 0);
	}
}

void TestRebinding()
{
	std::vector<uint8_t> first(64, 0), second(64, 0);
	BufferView a(first.data(), first.size());
	BufferView b(second.data(), second.size());

	DataHeaderView view(a, 0, 32);
	view.SessionId(1).StreamId(2).TermId(3).TermOffset(4);
	view.Header().FrameLength(40).HeaderType(HeaderView::HDR_TYPE_DATA);

	view.Wrap(a, 32, 32);
	CHECK_EQ(view.SessionId(), 0);
	CHECK_EQ(view.Header().FrameLength(), 0);
	view.SessionId(11).StreamId(12).TermId(13);
	view.Header().FrameLength(24);

	view.Wrap(b);
	CHECK_EQ(view.SessionId(), 0);
	CHECK_EQ(view.StreamId(), 0);
	CHECK_EQ(view.TermId(), 0);
	CHECK_EQ(view.Header().FrameLength(), 0);
	CHECK_EQ(view.Header().HeaderType(), HeaderView::HDR_TYPE_PAD);
	view.SessionId(21);

	view.Wrap(a, 0, 32);
	CHECK_EQ(view.SessionId(), 1);
	CHECK_EQ(view.StreamId(), 2);
	CHECK_EQ(view.TermId(), 3);
	CHECK_EQ(view.TermOffset(), 4);
	CHECK_EQ(view.Header().FrameLength(), 40);

	view.Wrap(a, 32, 32);
	CHECK_EQ(view.SessionId(), 11);
	CHECK_EQ(view.Header().FrameLength(), 24);

	CHECK_EQ(DataHeaderView::SessionId(b, 0), 21);
	CHECK_EQ(DataHeaderView::SessionId(a, 32), 11);
	CHECK_EQ(DataHeaderView::StreamId(a, 32), 12);
	CHECK_EQ(DataHeaderView::TermId(a, 32), 13);
	CHECK_EQ(DataHeaderView::TermOffset(a, 0), 4);
	CHECK_EQ(DataHeaderView::ReservedValue(a, 0), 0);
	CHECK_THROWS(DataHeaderView::TermId(a, 48), BoundsViolation);
	CHECK_EQ(DataHeaderView::SessionId(a, 48), 0);

	// frame offsets close to 2^32 must not wrap onto the start of the term
	first[4] = first[5] = first[6] = first[7] = 0x11;
	CHECK_THROWS(DataHeaderView::TermOffset(a, 0xFFFFFFFCu), BoundsViolation);
	CHECK_THROWS(DataHeaderView::SessionId(a, 0xFFFFFFF8u), BoundsViolation);
	CHECK_THROWS(DataHeaderView::StreamId(a, 0xFFFFFFF4u), BoundsViolation);
	CHECK_THROWS(DataHeaderView::TermId(a, 0xFFFFFFF0u), BoundsViolation);
	CHECK_THROWS(DataHeaderView::ReservedValue(a, 0xFFFFFFE0u),
				 BoundsViolation);
	CHECK_THROWS(DataHeaderView::TermOffset(a, 0xFFFFFFFFu), BoundsViolation);

	// the underlying bytes moved with the view, nothing was copied
	CHECK_EQ(first[32 + DataHeaderView::SESSION_ID_FIELD_OFFSET], 11);
	CHECK_EQ(second[DataHeaderView::SESSION_ID_FIELD_OFFSET], 21);
}

void TestHeaderFollowsView()
{
	std::vector<uint8_t> first(32, 0), second(32, 0);
	BufferView a(first.data(), first.size());
	BufferView b(second.data(), second.size());

	DataHeaderView view(a);
	view.Header().FrameLength(40);

	// rebinding Header() alone does not detach it from the data fields
	view.Header().Wrap(b);
	CHECK_EQ(view.Header().FrameLength(), 40);
	view.Header().FrameLength(48);
	CHECK_EQ(BufferView(a).GetInt32(HeaderView::FRAME_LENGTH_FIELD_OFFSET), 48);
	CHECK_EQ(BufferView(b).GetInt32(HeaderView::FRAME_LENGTH_FIELD_OFFSET), 0);

	view.Header().Wrap(b);
	const DataHeaderView &constView = view;
	CHECK_EQ(constView.Header().FrameLength(), 48);
	CHECK(constView.ToString().find("frame_length=48") != std::string::npos);
}

void TestBoundsViolation()
{
	std::vector<uint8_t> bytes(64, 0);
	BufferView term(bytes.data(), bytes.size());

	DataHeaderView view(term, 0, 16);
	view.TermOffset(1).SessionId(2);
	CHECK_THROWS(view.StreamId(), BoundsViolation);
	CHECK_THROWS(view.ReservedValue(5), BoundsViolation);
	CHECK_THROWS(view.Wrap(term, 48, 32), BoundsViolation);
	CHECK_THROWS(DataHeaderView(term, 33, 32), BoundsViolation);
	CHECK_THROWS(view.ToString(), BoundsViolation);
}

void TestFormatting()
{
	ByteBuffer buffer = DataHeaderView::CreateDefaultHeader(7, 3, 99);
	DataHeaderView view(buffer);
	view.Header().FrameLength(160);
	view.TermOffset(4096);

	const std::string expected =
		"Data Header{frame_length=160 version=0 flags=11000000 type=1 "
		"term_offset=4096 session_id=7 stream_id=3 term_id=99 "
		"reserved_value=0}";

	std::vector<uint8_t> before(buffer.data(), buffer.data() + buffer.size());
	CHECK_EQ(view.ToString(), expected);
	CHECK_EQ(view.ToString(), expected);
	CHECK(memcmp(before.data(), buffer.data(), buffer.size()) == 0);

	view.ReservedValue(-1).SessionId(-5);
	view.Header().Flags(DataHeaderView::END_FLAG);
	CHECK_EQ(view.ToString(),
			 std::string("Data Header{frame_length=160 version=0 "
						 "flags=01000000 type=1 term_offset=4096 "
						 "session_id=-5 stream_id=3 term_id=99 "
						 "reserved_value=-1}"));
}

int main(int argc, char **argv)
{
	ArgsParser args(argc, argv);
	args.ApplyLogLevel();

	TestDefaultHeaderRoundTrip();
	TestDefaultHeader();
	TestDefaultHeaderAllocatesOnce();
	TestFieldIsolation();
	TestReservedValueSignExtension();
	TestDataOffset();
	TestWrapZeroedBuffer();
	TestRebinding();
	TestHeaderFollowsView();
	TestBoundsViolation();
	TestFormatting();

	return test::Summary("data_header_view_test");
}
