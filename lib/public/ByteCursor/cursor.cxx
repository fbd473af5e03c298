#include <ByteCursor/buffer/fifo.hxx>
#include <ByteCursor/cursor.hxx>

#include <algorithm>
#include <format>
#include <ostream>

using namespace ByteCursor;

namespace {
	// Bytes of the offending view shown in a format error dump
	constexpr std::size_t kDumpLimit = 64;
}

Cursor::Cursor(Buffer::Source& source, const Settings& settings, std::shared_ptr<StormByte::Logger::Log> log) noexcept:
m_source(source), m_settings(settings), m_log(std::move(log)) {}

Expected<DataType, DecodeError> Cursor::ReadUntil(const std::byte& delimiter, const std::size_t& budget) noexcept {
	return Run<ByteView>("ReadUntil",
		[&delimiter, &budget](ByteView view, bool) { return Decoder::Until(view, delimiter, budget); },
		[](const ByteView& value, const std::size_t&) { return DataType(value.begin(), value.end()); });
}

Expected<DataType, DecodeError> Cursor::ReadExact(const std::size_t& count) noexcept {
	return Run<ByteView>("ReadExact",
		[&count](ByteView view, bool) { return Decoder::Exact(view, count); },
		[](const ByteView& value, const std::size_t&) { return DataType(value.begin(), value.end()); });
}

Expected<DataType, DecodeError> Cursor::ReadWhile(const Predicate& predicate, const std::size_t& budget) noexcept {
	return Run<ByteView>("ReadWhile",
		[&predicate, &budget](ByteView view, bool end_of_input) { return Decoder::While(view, predicate, budget, end_of_input); },
		[](const ByteView& value, const std::size_t&) { return DataType(value.begin(), value.end()); });
}

ExpectedVoid<DecodeError> Cursor::Skip(const std::size_t& count) noexcept {
	auto skipped = Run<ByteView>("Skip",
		[&count](ByteView view, bool) { return Decoder::Exact(view, count); },
		[](const ByteView&, const std::size_t& consumed) { return consumed; });
	if (!skipped)
		return std::unexpected(skipped.error());
	return {};
}

Expected<std::size_t, DecodeError> Cursor::SkipUntil(const std::byte& delimiter, const std::size_t& budget) noexcept {
	return Run<ByteView>("SkipUntil",
		[&delimiter, &budget](ByteView view, bool) { return Decoder::Until(view, delimiter, budget); },
		[](const ByteView&, const std::size_t& consumed) { return consumed; });
}

Expected<std::size_t, DecodeError> Cursor::SkipWhile(const Predicate& predicate, const std::size_t& budget) noexcept {
	return Run<ByteView>("SkipWhile",
		[&predicate, &budget](ByteView view, bool end_of_input) { return Decoder::While(view, predicate, budget, end_of_input); },
		[](const ByteView&, const std::size_t& consumed) { return consumed; });
}

ExpectedVoid<DecodeError> Cursor::AwaitRefill(const char* operation, const std::size_t& hint, std::size_t& refills, std::size_t& stalls, bool& end_of_input) noexcept {
	if (m_settings.max_refills > 0 && refills >= m_settings.max_refills) {
		Log(StormByte::Logger::Level::Warning, std::format("{}: refill budget of {} exhausted", operation, m_settings.max_refills));
		return StormByte::Unexpected(BudgetExceeded("{} gave up after {} refills", operation, refills));
	}

	const std::size_t request = m_settings.RequestSize(hint);
	Log(StormByte::Logger::Level::Debug, std::format("{}: needs {} more bytes, requesting {}", operation, hint, request));

	auto refilled = m_source.get().Refill(hint, request);
	++refills;
	if (!refilled) {
		Log(StormByte::Logger::Level::Warning, std::format("{}: refill failed: {}", operation, refilled.error()->what()));
		return std::unexpected(refilled.error());
	}

	if (refilled->IsEndOfInput()) {
		Log(StormByte::Logger::Level::Debug, std::format("{}: upstream reached end of input", operation));
		end_of_input = true;
		return {};
	}

	if (refilled->Count() > 0) {
		stalls = 0;
		return {};
	}

	++stalls;
	Log(StormByte::Logger::Level::Debug, std::format("{}: refill appended nothing ({} in a row)", operation, stalls));
	if (stalls > m_settings.max_stalls) {
		Log(StormByte::Logger::Level::Warning, std::format("{}: upstream stalled {} times in a row", operation, stalls));
		return StormByte::Unexpected(BudgetExceeded("{} stalled after {} consecutive empty refills", operation, stalls));
	}
	return {};
}

std::shared_ptr<DecodeError> Cursor::ContractViolation(const char* operation, const std::shared_ptr<RangeError>& error) const noexcept {
	Log(StormByte::Logger::Level::Error, std::format("{}: {}", operation, error->what()));
	return error;
}

std::shared_ptr<DecodeError> Cursor::Reject(const char* operation, const ErrorCode& code, const std::string& reason, ByteView view) const noexcept {
	if (m_log) {
		const ByteView shown = view.first(std::min(view.size(), kDumpLimit));
		Log(StormByte::Logger::Level::Error, std::format("{}: {}\n{}", operation, reason, Buffer::FIFO::FormatHexLines(shown, 0, 16)));
	}

	switch (code) {
		case ErrorCode::UnexpectedEof:
			return std::make_shared<UnexpectedEof>(UnexpectedEof("{}: {}", operation, reason));
		case ErrorCode::BudgetExceeded:
			return std::make_shared<BudgetExceeded>(BudgetExceeded("{}: {}", operation, reason));
		case ErrorCode::DelimiterNotFound:
			return std::make_shared<DelimiterNotFound>(DelimiterNotFound("{}: {}", operation, reason));
		case ErrorCode::Range:
			return std::make_shared<RangeError>(RangeError("{}: {}", operation, reason));
		case ErrorCode::Source:
		default:
			return std::make_shared<SourceError>(SourceError("{}: {}", operation, reason));
	}
}

std::shared_ptr<DecodeError> Cursor::Truncated(const char* operation, const std::size_t& hint) const noexcept {
	const std::size_t pending = m_source.get().View().size();
	Log(StormByte::Logger::Level::Warning, std::format("{}: end of input with {} bytes pending, {} more needed", operation, pending, hint));
	return std::make_shared<UnexpectedEof>(UnexpectedEof("{} reached end of input with {} bytes pending, needing at least {} more", operation, pending, hint));
}

void Cursor::Log(const StormByte::Logger::Level& level, const std::string& message) const noexcept {
	if (m_log)
		*m_log << level << message << std::endl;
}
