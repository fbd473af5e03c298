#include <ByteCursor/buffer/shared_fifo.hxx>

#include <algorithm>
#include <iterator>

using namespace ByteCursor;
using namespace ByteCursor::Buffer;

void SharedFIFO::Close() noexcept {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		m_closed = true;
	}
	m_cv.notify_all();
}

bool SharedFIFO::IsClosed() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return m_closed;
}

bool SharedFIFO::HasError() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return m_error;
}

bool SharedFIFO::IsWritable() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return !m_closed && !m_error;
}

std::size_t SharedFIFO::PendingBytes() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return m_inbox.size();
}

Expected<RefillOutcome, DecodeError> SharedFIFO::Refill(const std::size_t& hint, const std::size_t&) noexcept {
	const std::size_t wanted = std::max<std::size_t>(hint, 1);
	DataType staged;
	{
		std::unique_lock<std::mutex> lock(m_mutex);
		auto ready = [&] {
			return m_error || m_closed || m_inbox.size() >= wanted;
		};

		if (m_timeout.count() > 0) {
			if (!m_cv.wait_for(lock, m_timeout, ready) && m_inbox.empty())
				return StormByte::Unexpected(BudgetExceeded("Refill timed out after {} ms waiting for {} bytes", m_timeout.count(), wanted));
		}
		else {
			m_cv.wait(lock, ready);
		}

		if (m_error)
			return StormByte::Unexpected(SourceError("Shared buffer is in error state"));
		if (m_inbox.empty())
			return RefillOutcome::EndOfInput();

		staged = std::move(m_inbox);
		m_inbox.clear();
	}

	const std::size_t appended = staged.size();
	// Qualified call: the consumer buffer itself is not staged
	auto written = FIFO::WriteInternal(std::move(staged));
	if (!written)
		return StormByte::Unexpected(SourceError("Could not buffer {} staged bytes", appended));

	return RefillOutcome::Appended(appended);
}

void SharedFIFO::SetError() noexcept {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		m_error = true;
	}
	m_cv.notify_all();
}

void SharedFIFO::SetTimeout(const std::chrono::milliseconds& timeout) noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	m_timeout = timeout;
}

std::ostringstream SharedFIFO::HexDumpHeader() const noexcept {
	std::ostringstream oss = FIFO::HexDumpHeader();
	std::scoped_lock<std::mutex> lock(m_mutex);
	oss << "\nPending: " << m_inbox.size() << " bytes";
	oss << "\nStatus: " << (m_closed ? "closed" : "opened") << " and " << (m_error ? "error" : "ready");
	return oss;
}

ExpectedVoid<WriteError> SharedFIFO::WriteInternal(ByteView src) noexcept {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		if (m_closed)
			return StormByte::Unexpected(WriteError("Buffer is closed"));
		if (m_error)
			return StormByte::Unexpected(WriteError("Buffer in error state"));
		m_inbox.insert(m_inbox.end(), src.begin(), src.end());
	}
	m_cv.notify_all();
	return {};
}

ExpectedVoid<WriteError> SharedFIFO::WriteInternal(DataType&& src) noexcept {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		if (m_closed)
			return StormByte::Unexpected(WriteError("Buffer is closed"));
		if (m_error)
			return StormByte::Unexpected(WriteError("Buffer in error state"));
		if (m_inbox.empty())
			m_inbox = std::move(src);
		else
			m_inbox.insert(m_inbox.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
	}
	m_cv.notify_all();
	return {};
}
