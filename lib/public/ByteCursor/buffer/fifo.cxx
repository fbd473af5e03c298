#include <ByteCursor/buffer/fifo.hxx>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iterator>

using namespace ByteCursor;
using namespace ByteCursor::Buffer;

namespace {
	// Capacity below which Clean never releases memory
	constexpr std::size_t kCompactCapacity = 4096;
}

FIFO::FIFO(std::string_view data): Source() {
	m_buffer.reserve(data.size());
	std::transform(data.begin(), data.end(), std::back_inserter(m_buffer), [] (char e) noexcept { return static_cast<std::byte>(e); });
}

FIFO::FIFO(FIFO&& other) noexcept: Source(std::move(other)), m_buffer(std::move(other.m_buffer)), m_position_offset(other.m_position_offset) {
	other.m_buffer.clear();
	other.m_position_offset = 0;
}

FIFO& FIFO::operator=(FIFO&& other) noexcept {
	if (this != &other) {
		Source::operator=(std::move(other));
		m_buffer = std::move(other.m_buffer);
		m_position_offset = other.m_position_offset;
		other.m_buffer.clear();
		other.m_position_offset = 0;
	}
	return *this;
}

void FIFO::Clean() noexcept {
	// A read position past the tail counts as everything consumed
	const std::size_t consumed = std::min(m_position_offset, m_buffer.size());
	m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
	m_position_offset = 0;

	if (m_buffer.capacity() > kCompactCapacity && m_buffer.capacity() / 4 > m_buffer.size())
		m_buffer.shrink_to_fit();
}

ExpectedVoid<RangeError> FIFO::Consume(const std::size_t& count) noexcept {
	const std::size_t available = FIFO::AvailableBytes();
	if (count > available)
		return StormByte::Unexpected(RangeError("Cannot consume {} bytes, only {} available", count, available));

	m_position_offset += count;
	// Once everything is consumed the storage can be reused from the start
	if (m_position_offset == m_buffer.size()) {
		m_buffer.clear();
		m_position_offset = 0;
	}
	return {};
}

std::string FIFO::HexDump(const std::size_t& columns, const std::size_t& byte_limit) const noexcept {
	const std::size_t cols = (columns == 0) ? 16 : columns;
	const std::size_t end = (byte_limit > 0) ? std::min(m_buffer.size(), m_position_offset + byte_limit) : m_buffer.size();

	std::ostringstream oss = HexDumpHeader();

	if (end > m_position_offset) {
		oss << '\n';
		ByteView view(m_buffer.data() + m_position_offset, end - m_position_offset);
		oss << FormatHexLines(view, m_position_offset, cols);
	}

	return oss.str();
}

std::string FIFO::FormatHexLines(ByteView data, std::size_t start_offset, std::size_t columns) noexcept {
	const std::size_t cols = (columns == 0) ? 16 : columns;
	std::ostringstream out;
	out << std::uppercase << std::setfill('0');

	for (std::size_t row = 0; row < data.size(); row += cols) {
		const ByteView line = data.subspan(row, std::min(cols, data.size() - row));
		if (row > 0)
			out << '\n';

		out << std::hex << std::setw(8) << (start_offset + row) << ": ";
		for (const std::byte& b : line)
			out << std::setw(2) << std::to_integer<unsigned int>(b) << ' ';
		out << std::string((cols - line.size()) * 3 + 2, ' ');

		for (const std::byte& b : line) {
			const unsigned char c = std::to_integer<unsigned char>(b);
			out << (std::isprint(c) ? static_cast<char>(c) : '.');
		}
	}

	return out.str();
}

Expected<RefillOutcome, DecodeError> FIFO::Refill(const std::size_t&, const std::size_t&) noexcept {
	return RefillOutcome::EndOfInput();
}

ByteView FIFO::View() const noexcept {
	if (m_position_offset >= m_buffer.size())
		return {};
	return ByteView(m_buffer.data() + m_position_offset, m_buffer.size() - m_position_offset);
}

std::ostringstream FIFO::HexDumpHeader() const noexcept {
	std::ostringstream oss;
	oss << "Size: " << m_buffer.size() << " bytes\n";
	oss << "Read Position: " << m_position_offset;
	return oss;
}

ExpectedVoid<WriteError> FIFO::WriteInternal(ByteView src) noexcept {
	if (src.empty())
		return {};

	if (m_position_offset > 0)
		FIFO::Clean();

	// Reserve target space to avoid repeated reallocations
	m_buffer.reserve(m_buffer.size() + src.size());
	m_buffer.insert(m_buffer.end(), src.begin(), src.end());
	return {};
}

ExpectedVoid<WriteError> FIFO::WriteInternal(DataType&& src) noexcept {
	if (src.empty())
		return {};

	if (m_position_offset > 0)
		FIFO::Clean();

	if (m_buffer.empty()) {
		// Adopt the incoming storage instead of copying it
		m_buffer = std::move(src);
		return {};
	}

	m_buffer.reserve(m_buffer.size() + src.size());
	m_buffer.insert(m_buffer.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
	src.clear();
	return {};
}
