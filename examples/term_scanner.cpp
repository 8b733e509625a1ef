#include <cstdio>
#include <cstdint>
#include <cstring>

#include <algorithm>
#include <string>

#include "../include/termwire/BufferView.hpp"
#include "../include/termwire/ByteBuffer.hpp"
#include "../include/termwire/DataHeaderView.hpp"
#include "../include/termwire/HeaderView.hpp"
#include "../include/termwire/MemoryPool.hpp"
#include "../include/termwire/Time.hpp"
#include "../include/termwire/Debug.hpp"

#include "../tests/utility.hpp"

using namespace termwire;

static constexpr uint32_t FRAME_ALIGNMENT = 32;

static uint32_t Align(uint32_t value)
{
	return (value + FRAME_ALIGNMENT - 1) & ~(FRAME_ALIGNMENT - 1);
}

/*
 * Appends frames of growing payload to the term by copying the default
 * header and patching it through a single rebound view. The tail of the
 * term is filled with a padding frame.
 */
static uint32_t WriteTerm(BufferView &term, int32_t sessionId,
						  int32_t streamId, int32_t termId, uint32_t frames)
{
	ByteBuffer defaultHeader =
		DataHeaderView::CreateDefaultHeader(sessionId, streamId, termId);

	DataHeaderView view;
	uint32_t termOffset = 0;
	uint32_t written = 0;
	for (uint32_t i = 0; i < frames; ++i) {
		const uint32_t payloadLength = 1 + (i * 13) % 200;
		const uint32_t frameLength =
			DataHeaderView::HEADER_LENGTH + payloadLength;
		if (termOffset + Align(frameLength) > term.capacity()) {
			LOG_WARN("Term full after %u frames", written);
			break;
		}

		term.PutBytes(termOffset, defaultHeader.data(),
					  DataHeaderView::HEADER_LENGTH);
		view.Wrap(term, termOffset, DataHeaderView::HEADER_LENGTH);
		view.TermOffset(termOffset).ReservedValue((int32_t)i);
		term.SetMemory(termOffset + view.DataOffset(), payloadLength,
					   'a' + (i % 26));
		view.Header().FrameLength(frameLength);

		LOG_DEBUG("%s", view.ToString().c_str());
		termOffset += Align(frameLength);
		++written;
	}

	if (termOffset + DataHeaderView::HEADER_LENGTH <= term.capacity()) {
		view.Wrap(term, termOffset, DataHeaderView::HEADER_LENGTH);
		view.Header()
			.FrameLength(term.capacity() - termOffset)
			.Version(HeaderView::CURRENT_VERSION)
			.Flags(DataHeaderView::BEGIN_AND_END_FLAGS)
			.HeaderType(HeaderView::HDR_TYPE_PAD);
		view.TermOffset(termOffset)
			.SessionId(sessionId)
			.StreamId(streamId)
			.TermId(termId);
	}
	return written;
}

/*
 * Walks the term frame by frame. Returns number of data frames seen or -1
 * when a frame does not match what WriteTerm produced.
 */
static int64_t ScanTerm(const BufferView &term, int32_t sessionId)
{
	DataHeaderView view;
	int64_t frames = 0;
	uint32_t termOffset = 0;
	while (termOffset + DataHeaderView::HEADER_LENGTH <= term.capacity()) {
		view.Wrap(term, termOffset, DataHeaderView::HEADER_LENGTH);
		const int32_t frameLength = view.Header().FrameLength();
		if (frameLength <= 0) {
			break;
		}

		if (view.Header().HeaderType() == HeaderView::HDR_TYPE_PAD) {
			LOG_DEBUG("Padding of %i bytes at %u", frameLength, termOffset);
			break;
		}

		if (view.Header().HeaderType() != HeaderView::HDR_TYPE_DATA ||
			view.SessionId() != sessionId ||
			view.TermOffset() != (int32_t)termOffset ||
			view.ReservedValue() != frames) {
			LOG_ERROR("Unexpected frame at %u: %s", termOffset,
					  view.ToString().c_str());
			return -1;
		}
		LOG_TRACE("%s", view.ToString().c_str());

		++frames;
		termOffset += Align(frameLength);
	}
	return frames;
}

int main(int argc, char **argv)
{
	ArgsParser args(argc, argv);
	log::SetGlobalLogLevel(log::INFO);
	args.ApplyLogLevel();

	const uint32_t termLength =
		args.GetInt({"-term_length"}, 64 * 1024, 64, 16 * 1024 * 1024);
	const uint32_t frames = args.GetInt({"-frames"}, 100, 0, 1000000);
	const int32_t sessionId = args.GetInt({"-session"}, 7, INT32_MIN, INT32_MAX);
	const int32_t streamId = args.GetInt({"-stream"}, 3, INT32_MIN, INT32_MAX);
	const int32_t termId = args.GetInt({"-term"}, 99, INT32_MIN, INT32_MAX);

	ByteBuffer storage(termLength);
	storage.resize(termLength);
	BufferView term(storage);
	term.SetMemory(0, termLength, 0);

	const uint32_t written =
		WriteTerm(term, sessionId, streamId, termId, frames);

	if (args.IsPresent({"-dump"})) {
		log::HexDump(term.data(), std::min<uint32_t>(termLength, 256));
	}

	const time::Point begin = time::GetTemporaryTimestamp();
	const int64_t scanned = ScanTerm(term, sessionId);
	const time::Point end = time::GetTemporaryTimestamp();

	LOG_INFO("Term of %u bytes: written %u frames, scanned %li frames in "
			 "%.3f ms",
			 termLength, written, (long)scanned,
			 time::DeltaMSecBetweenTimepoints(begin, end));

	const MemoryStats &stats = MemoryPool::Stats();
	LOG_INFO("Memory: %li allocations (%li small), %li bytes in use, %li at "
			 "peak",
			 (long)stats.allocations.load(), (long)stats.smallAllocations.load(),
			 (long)stats.InUseBytes(), (long)stats.maxInUseAtOnce.load());

	if (scanned != written) {
		LOG_ERROR("Scanned frames do not match written frames");
		return 1;
	}
	return 0;
}
