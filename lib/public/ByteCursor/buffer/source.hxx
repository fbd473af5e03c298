#pragma once

#include <ByteCursor/typedefs.hxx>

/**
 * @namespace Buffer
 * @brief Namespace for byte sources in the ByteCursor library.
 *
 * The Buffer namespace provides the source contract consumed by the cursor
 * together with in-memory, callable, stream and thread-safe implementations.
 */
namespace ByteCursor::Buffer {
	/**
	 * @class RefillOutcome
	 * @brief Result of asking a source for more bytes.
	 *
	 * @details Either `Appended(count)`, where `count` may be smaller, equal to or
	 *          greater than the requested hint (including zero), or `EndOfInput`
	 *          when upstream will never deliver more bytes.
	 */
	class BYTECURSOR_PUBLIC RefillOutcome {
		public:
			/**
			 * @brief Outcome for a refill that appended `count` bytes.
			 */
			static constexpr RefillOutcome 								Appended(const std::size_t& count) noexcept {
				return RefillOutcome(false, count);
			}

			/**
			 * @brief Outcome for an upstream that has no more data.
			 */
			static constexpr RefillOutcome 								EndOfInput() noexcept {
				return RefillOutcome(true, 0);
			}

			/**
			 * @brief Number of bytes appended; always 0 for end-of-input.
			 */
			constexpr const std::size_t& 								Count() const noexcept {
				return m_count;
			}

			constexpr bool 												IsEndOfInput() const noexcept {
				return m_end_of_input;
			}

			constexpr bool operator==(const RefillOutcome& other) const noexcept = default;

		private:
			bool m_end_of_input;
			std::size_t m_count;

			constexpr RefillOutcome(bool end_of_input, const std::size_t& count) noexcept:
			m_end_of_input(end_of_input), m_count(count) {}
	};

	/**
	 * @class Source
	 * @brief Peekable, consumable and refillable byte buffer.
	 *
	 * @par Overview
	 *  The only contract the cursor depends on. A source exposes its unconsumed
	 *  bytes as one contiguous @ref ByteView, drops a prefix of them on request,
	 *  and can be asked to pull more bytes from its upstream.
	 *
	 * @par View lifetime
	 *  A view returned by @ref View() stays valid until the next @ref Consume()
	 *  or @ref Refill() on the same source. Calling @ref View() twice without an
	 *  intervening mutation returns the same bytes.
	 *
	 * @par Thread safety
	 *  A source is driven by a single consumer. Implementations that accept
	 *  producer threads document it (see @ref SharedFIFO).
	 */
	class BYTECURSOR_PUBLIC Source {
		public:
			Source() noexcept 											= default;
			Source(const Source&) noexcept 								= default;
			Source(Source&&) noexcept 									= default;
			virtual ~Source() noexcept 									= default;
			Source& operator=(const Source&) noexcept 					= default;
			Source& operator=(Source&&) noexcept 						= default;

			/**
			 * @brief All currently buffered, unconsumed bytes.
			 * @return Zero-copy view over the bytes.
			 */
			virtual ByteView 											View() const noexcept = 0;

			/**
			 * @brief Drop bytes from the front of the view.
			 * @param count Number of bytes to drop.
			 * @return `RangeError` if `count` exceeds the current view length.
			 */
			virtual ExpectedVoid<RangeError> 							Consume(const std::size_t& count) noexcept = 0;

			/**
			 * @brief Pull more bytes from upstream into the buffer.
			 * @param hint Bytes the pending decode still needs. A blocking source
			 *             never waits for more than this.
			 * @param request Bytes the caller would accept in one go (at least `hint`).
			 *                Sources may use it to batch, but must not block on it.
			 * @return The refill outcome, or a @ref DecodeError when upstream failed.
			 */
			virtual Expected<RefillOutcome, DecodeError> 				Refill(const std::size_t& hint, const std::size_t& request) noexcept = 0;
	};
}
