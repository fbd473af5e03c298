#pragma once

#include <ByteCursor/buffer/fifo.hxx>

#include <functional>
#include <istream>

/**
 * @namespace Buffer
 * @brief Namespace for byte sources in the ByteCursor library.
 *
 * The Buffer namespace provides the source contract consumed by the cursor
 * together with in-memory, callable, stream and thread-safe implementations.
 */
namespace ByteCursor::Buffer {
	/**
	 * @class StreamSource
	 * @brief FIFO refilled from a `std::istream`.
	 *
	 * @details Lets a cursor decode files, pipes or string streams that are read
	 *          incrementally. Each refill blocks only for the `hint` bytes the
	 *          decode needs, then takes up to `request` bytes more with
	 *          `readsome()` when the stream already holds them. A short read at
	 *          end of stream appends what was available and the following refill
	 *          reports `EndOfInput`. A stream that failed for any other reason
	 *          is reported as a @ref SourceError.
	 *
	 * @note The `StreamSource` does NOT take ownership of the stream. The caller
	 *       is responsible for ensuring that the stream outlives this instance.
	 */
	class BYTECURSOR_PUBLIC StreamSource final: public FIFO {
		public:
			/**
			 * @brief Construct a StreamSource reading from `stream`.
			 * @param stream Input stream; should be opened in binary mode for files.
			 */
			inline StreamSource(std::istream& stream) noexcept:
				FIFO(), m_stream(stream) {}

			StreamSource(const StreamSource& other)					= delete;
			StreamSource(StreamSource&& other) noexcept				= delete;
			~StreamSource() noexcept								= default;
			StreamSource& operator=(const StreamSource& other)		= delete;
			StreamSource& operator=(StreamSource&& other) noexcept	= delete;

			/**
			 * @brief Read `hint` bytes (at least one) from the stream, plus what is
			 *        immediately available up to `request`.
			 * @param hint Bytes to block for.
			 * @param request Upper bound of the refill.
			 * @return `Appended(n)`, `EndOfInput` once the stream is exhausted, or a
			 *         @ref SourceError when the stream is in a failed state.
			 */
			Expected<RefillOutcome, DecodeError> 					Refill(const std::size_t& hint, const std::size_t& request) noexcept override;

		private:
			std::reference_wrapper<std::istream> m_stream;			///< Upstream stream reference.
	};
}
