#include <ByteCursor/buffer/forwarder.hxx>

#include <memory>

using namespace ByteCursor;
using namespace ByteCursor::Buffer;

Forwarder::Forwarder(const ExternalReadFunction& readFunc) noexcept:
FIFO(), m_readFunction(readFunc ? readFunc : ErrorReadFunction()) {}

Expected<RefillOutcome, DecodeError> Forwarder::Refill(const std::size_t&, const std::size_t& request) noexcept {
	auto chunk = m_readFunction(request);
	if (!chunk) {
		if (auto decode_error = std::dynamic_pointer_cast<DecodeError>(chunk.error()))
			return std::unexpected(decode_error);
		return StormByte::Unexpected(SourceError("Forwarder refill failed: {}", chunk.error()->what()));
	}

	if (!chunk->has_value())
		return RefillOutcome::EndOfInput();

	const std::size_t appended = (*chunk)->size();
	auto written = FIFO::Write(std::move(**chunk));
	if (!written)
		return StormByte::Unexpected(SourceError("Forwarder could not buffer {} bytes: {}", appended, written.error()->what()));

	return RefillOutcome::Appended(appended);
}

ExternalReadFunction Forwarder::ErrorReadFunction() noexcept {
	return [](const std::size_t&) -> Expected<std::optional<DataType>, Error> {
		return StormByte::Unexpected(Error("Forwarder", "No read function defined"));
	};
}
