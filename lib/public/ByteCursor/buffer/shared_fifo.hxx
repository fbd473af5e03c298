#pragma once

#include <ByteCursor/buffer/fifo.hxx>

#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @namespace Buffer
 * @brief Namespace for byte sources in the ByteCursor library.
 *
 * The Buffer namespace provides the source contract consumed by the cursor
 * together with in-memory, callable, stream and thread-safe implementations.
 */
namespace ByteCursor::Buffer {
	/**
	 * @class SharedFIFO
	 * @brief Thread-safe producer/consumer source built on top of @ref FIFO.
	 *
	 * @par Overview
	 *  Producer threads append bytes with @ref Write(), then signal the end of
	 *  the data with @ref Close() or a failure with @ref SetError(). A single
	 *  consumer thread decodes the bytes through a cursor.
	 *
	 * @par Staging
	 *  Written bytes land in an inbox guarded by a mutex. They only become part
	 *  of the consumer-visible buffer inside @ref Refill(), which runs on the
	 *  consumer thread. Producers therefore never touch the storage behind a
	 *  view, and a view stays valid until the consumer's next
	 *  @ref Consume() or @ref Refill().
	 *
	 * @par Blocking semantics
	 *  @ref Refill() blocks until at least `hint` bytes are staged, the buffer is
	 *  closed or failed, or the wait timeout elapses. A timeout that leaves some
	 *  bytes staged appends them; a timeout with nothing staged fails with
	 *  @ref BudgetExceeded. A zero timeout waits without limit.
	 *
	 * @par Thread safety
	 *  @ref Write(), @ref Close(), @ref SetError(), @ref PendingBytes(),
	 *  @ref IsClosed(), @ref HasError() and @ref IsWritable() may be called from
	 *  any thread. @ref View(), @ref Consume() and @ref Refill() belong to the
	 *  single consumer thread.
	 */
	class BYTECURSOR_PUBLIC SharedFIFO: public FIFO {
		public:
			/**
			 * @brief Construct a SharedFIFO that waits without limit on refills.
			 */
			SharedFIFO() noexcept 										= default;

			/**
			 * @brief Construct a SharedFIFO with a refill wait timeout.
			 * @param timeout Maximum time a refill waits for producers; zero waits forever.
			 */
			inline explicit SharedFIFO(const std::chrono::milliseconds& timeout) noexcept:
				FIFO(), m_timeout(timeout) {}

			/**
			 * @brief Copy and move operations are deleted.
			 * @details `SharedFIFO` contains synchronization primitives that
			 *          cannot be copied or moved.
			 */
			SharedFIFO(const SharedFIFO&) 								= delete;
			SharedFIFO(SharedFIFO&&) noexcept 							= delete;
			virtual ~SharedFIFO() noexcept 								= default;
			SharedFIFO& operator=(const SharedFIFO&) 					= delete;
			SharedFIFO& operator=(SharedFIFO&&) noexcept 				= delete;

			/**
			 * @brief Thread-safe close for further writes.
			 * @details Marks the buffer as closed and wakes a waiting refill. Bytes
			 *          already staged are still delivered before end-of-input.
			 */
			void 														Close() noexcept;

			/**
			 * @brief Check if the buffer was closed.
			 */
			bool 														IsClosed() const noexcept;

			/**
			 * @brief Check if a producer flagged an error.
			 */
			bool 														HasError() const noexcept;

			/**
			 * @brief Check if the buffer still accepts writes.
			 * @return false once closed or failed.
			 */
			bool 														IsWritable() const noexcept;

			/**
			 * @brief Number of bytes written by producers but not yet refilled.
			 */
			std::size_t 												PendingBytes() const noexcept;

			/**
			 * @brief Move staged bytes into the consumer buffer, waiting for producers if needed.
			 * @param hint Number of staged bytes to wait for.
			 * @param request Unused; everything staged is moved over.
			 * @return `Appended(n)`, `EndOfInput` once closed and drained,
			 *         @ref BudgetExceeded on timeout or @ref SourceError when failed.
			 */
			Expected<RefillOutcome, DecodeError> 						Refill(const std::size_t& hint, const std::size_t& request) noexcept override;

			/**
			 * @brief Mark the buffer as failed and wake a waiting refill.
			 * @details Subsequent writes are rejected and refills report a @ref SourceError.
			 */
			void 														SetError() noexcept;

			/**
			 * @brief Change the refill wait timeout.
			 * @param timeout Maximum wait; zero waits forever.
			 */
			void 														SetTimeout(const std::chrono::milliseconds& timeout) noexcept;

		protected:
			mutable std::mutex m_mutex;									///< Guards inbox and state flags
			std::condition_variable m_cv;								///< Signaled on write, close and error
			DataType m_inbox;											///< Bytes written but not yet refilled
			bool m_closed {false};										///< No more writes will arrive
			bool m_error {false};										///< A producer failed
			std::chrono::milliseconds m_timeout {0};					///< Refill wait limit, zero is unlimited

			/**
			 * @brief Header including close and error status.
			 */
			std::ostringstream 											HexDumpHeader() const noexcept override;

			/**
			 * @brief Stage a copy of the bytes for the consumer.
			 */
			ExpectedVoid<WriteError> 									WriteInternal(ByteView src) noexcept override;

			/**
			 * @brief Stage the bytes for the consumer.
			 */
			ExpectedVoid<WriteError> 									WriteInternal(DataType&& src) noexcept override;
	};
}
