#pragma once

#include <ByteCursor/buffer/source.hxx>

#include <algorithm>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

/**
 * @namespace Buffer
 * @brief Namespace for byte sources in the ByteCursor library.
 *
 * The Buffer namespace provides the source contract consumed by the cursor
 * together with in-memory, callable, stream and thread-safe implementations.
 */
namespace ByteCursor::Buffer {
	/**
	* @class FIFO
	* @brief Byte-oriented FIFO buffer with grow-on-demand.
	*
	* @par Overview
	*  A contiguous growable buffer implemented atop @c DataType that tracks
	*  a logical read position. Writes append at the tail, @ref Consume() advances
	*  the read position, and @ref View() exposes the unread bytes without copying.
	*
	* @par As a source
	*  A plain FIFO has no upstream: every byte it will ever hold is written
	*  by its owner, so @ref Refill() always reports end-of-input. Derived
	*  classes attach an upstream by overriding @ref Refill().
	*
	* @par Thread safety
	*  This class is **not thread-safe**. For concurrent access, use @ref SharedFIFO.
	*
	* @par View invalidation
	*  Any write may reallocate or compact the storage, so it invalidates
	*  outstanding views just like @ref Consume() does.
	*/
	class BYTECURSOR_PUBLIC FIFO: public Source {
		public:
			/**
			 * 	@brief Construct FIFO.
			 */
			FIFO() noexcept 										= default;

			/**
			 * 	@brief Construct FIFO with initial data.
			 *  @param data Initial byte vector to populate the FIFO.
			 */
			inline FIFO(const DataType& data): Source(), m_buffer(data), m_position_offset(0) {}

			/**
			 * 	@brief Construct FIFO with initial data using move semantics.
			 *  @param data Initial byte vector to move into the FIFO.
			 */
			inline FIFO(DataType&& data) noexcept: Source(), m_buffer(std::move(data)), m_position_offset(0) {}

			/**
			 * 	@brief Construct FIFO from the characters of a string (no terminating NUL).
			 *  @param data Initial contents.
			 */
			FIFO(std::string_view data);

			FIFO(const FIFO& other)									= default;
			FIFO(FIFO&& other) noexcept;
			virtual ~FIFO() noexcept 								= default;
			FIFO& operator=(const FIFO& other)						= default;
			FIFO& operator=(FIFO&& other) noexcept;

			/**
			 * @brief Equality comparison.
			 *
			 * Two FIFOs are equal when their unread bytes are equal.
			 */
			inline bool operator==(const FIFO& other) const noexcept {
				const ByteView mine = FIFO::View(), theirs = other.FIFO::View();
				return std::ranges::equal(mine, theirs);
			}

			/**
			 * @brief Get the number of bytes available for reading.
			 * @return The number of bytes from the current read position to the tail.
			 */
			inline virtual std::size_t 								AvailableBytes() const noexcept {
				const std::size_t current_size = m_buffer.size();
				return (m_position_offset <= current_size) ? (current_size - m_position_offset) : 0;
			}

			/**
			 * @brief Discard already consumed bytes, moving the unread ones to the front.
			 */
			virtual void 											Clean() noexcept;

			/**
			 * @brief Clear all buffer contents and reset the read position.
			 */
			inline virtual void 									Clear() noexcept {
				m_buffer.clear();
				m_position_offset = 0;
			}

			/**
			 * @brief Drop bytes from the front of the unread data.
			 * @param count Number of bytes to drop.
			 * @return `RangeError` when fewer than `count` bytes are available.
			 */
			ExpectedVoid<RangeError> 								Consume(const std::size_t& count) noexcept override;

			/**
			 * @brief Check if the buffer holds no unread data.
			 */
			inline virtual bool 									Empty() const noexcept {
				return AvailableBytes() == 0;
			}

			/**
			 * @brief Produce a hexdump of the unread contents starting at the current read position.
			 * @param columns Number of bytes per line (0 -> default 16).
			 * @param byte_limit Maximum number of bytes to include (0 -> no limit).
			 * @return A formatted string that begins with the size and read position
			 *         followed by the hex/ASCII lines, without a trailing newline.
			 * Example output:
			 * @code{.text}
			 * Size: 13 bytes
			 * Read Position: 0
			 * 00000000: 48 65 6C 6C 6F 2C 20 77 6F 72 6C 64 21            Hello, world!
			 * @endcode
			 */
			virtual std::string										HexDump(const std::size_t& columns = 16, const std::size_t& byte_limit = 0) const noexcept;

			/**
			 * @brief Produce a hexdump of an arbitrary view.
			 * @param data Bytes to format.
			 * @param start_offset Offset printed for the first byte.
			 * @param columns Number of bytes per line (0 -> default 16).
			 * @return The hex/ASCII lines without a trailing newline.
			 */
			static std::string 										FormatHexLines(ByteView data, std::size_t start_offset, std::size_t columns) noexcept;

			/**
			 * @brief A plain FIFO has no upstream.
			 * @return Always `RefillOutcome::EndOfInput()`.
			 */
			Expected<RefillOutcome, DecodeError> 					Refill(const std::size_t& hint, const std::size_t& request) noexcept override;

			/**
			 * @brief Total number of bytes stored, consumed ones included.
			 */
			inline virtual std::size_t 								Size() const noexcept {
				return m_buffer.size();
			}

			/**
			 * @brief Unread bytes as a zero-copy view.
			 */
			ByteView 												View() const noexcept override;

			/**
			 * @brief Append bytes to the buffer.
			 * @param data Bytes to append.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			inline ExpectedVoid<WriteError> 						Write(const DataType& data) noexcept {
				return WriteInternal(ByteView(data.data(), data.size()));
			}

			/**
			 * @brief Append bytes to the buffer, adopting the storage when the buffer is empty.
			 * @param data Bytes to append.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			inline ExpectedVoid<WriteError> 						Write(DataType&& data) noexcept {
				return WriteInternal(std::move(data));
			}

			/**
			 * @brief Append a view of bytes to the buffer.
			 * @param data Bytes to append; must not alias this buffer.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			inline ExpectedVoid<WriteError> 						Write(ByteView data) noexcept {
				return WriteInternal(data);
			}

			/**
			 * @brief Append the characters of a string (does not include terminating NUL).
			 * @param data Characters to append.
			 * @return ExpectedVoid<WriteError> indicating success or failure.
			 */
			inline ExpectedVoid<WriteError> 						Write(std::string_view data) noexcept {
				return WriteInternal(ByteView(reinterpret_cast<const std::byte*>(data.data()), data.size()));
			}

		protected:
			/**
			 * @brief Internal vector storing the buffer data.
			 */
			DataType m_buffer;

			/**
			 * @brief Current read position.
			 *
			 * Offset from the start of @ref m_buffer of the first unread byte.
			 */
			std::size_t m_position_offset {0};

			/**
			 * @brief Produce a hexdump header with size and read position.
			 * @return ostringstream containing the hexdump header.
			 */
			virtual std::ostringstream 								HexDumpHeader() const noexcept;

			/**
			 * @brief Internal helper for copying writes.
			 * @param src Bytes to append.
			 * @return `ExpectedVoid<WriteError>` indicating success or failure.
			 */
			virtual ExpectedVoid<WriteError> 						WriteInternal(ByteView src) noexcept;

			/**
			 * @brief Internal helper for moving writes.
			 * @param src Bytes to append.
			 * @return `ExpectedVoid<WriteError>` indicating success or failure.
			 */
			virtual ExpectedVoid<WriteError> 						WriteInternal(DataType&& src) noexcept;
	};
}
