#include <ByteCursor/buffer/stream_source.hxx>

#include <algorithm>

using namespace ByteCursor;
using namespace ByteCursor::Buffer;

namespace {
	// Largest single read; a huge hint grows the chunk only as bytes arrive
	constexpr std::size_t kReadStep = 64 * 1024;
}

Expected<RefillOutcome, DecodeError> StreamSource::Refill(const std::size_t& hint, const std::size_t& request) noexcept {
	std::istream& stream = m_stream.get();
	if (stream.bad())
		return StormByte::Unexpected(SourceError("Stream is in a bad state"));
	if (stream.eof())
		return RefillOutcome::EndOfInput();
	if (stream.fail())
		return StormByte::Unexpected(SourceError("Stream is in a failed state"));

	const std::size_t wanted = std::max<std::size_t>(hint, 1);
	const std::size_t limit = std::max(wanted, request);
	DataType chunk;
	std::size_t got = 0;

	// Block only for the bytes the decode needs
	while (got < wanted) {
		const std::size_t step = std::min(wanted - got, kReadStep);
		chunk.resize(got + step);
		stream.read(reinterpret_cast<char*>(chunk.data() + got), static_cast<std::streamsize>(step));
		const std::size_t read = static_cast<std::size_t>(stream.gcount());
		got += read;
		if (read < step)
			break;
	}

	if (stream.bad() || (stream.fail() && !stream.eof()))
		return StormByte::Unexpected(SourceError("Stream read of {} bytes failed after {} bytes", wanted, got));

	// Then take whatever is already buffered, without blocking
	while (stream.good() && got < limit) {
		const std::size_t step = std::min(limit - got, kReadStep);
		chunk.resize(got + step);
		const std::streamsize read = stream.readsome(reinterpret_cast<char*>(chunk.data() + got), static_cast<std::streamsize>(step));
		if (read <= 0)
			break;
		got += static_cast<std::size_t>(read);
	}

	if (got == 0)
		return stream.eof() ? RefillOutcome::EndOfInput() : RefillOutcome::Appended(0);

	chunk.resize(got);
	auto written = FIFO::Write(std::move(chunk));
	if (!written)
		return StormByte::Unexpected(SourceError("Could not buffer {} stream bytes", got));

	return RefillOutcome::Appended(got);
}
