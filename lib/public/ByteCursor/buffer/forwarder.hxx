#pragma once

#include <ByteCursor/buffer/fifo.hxx>

#include <functional>
#include <optional>

/**
 * @namespace Buffer
 * @brief Namespace for byte sources in the ByteCursor library.
 *
 * The Buffer namespace provides the source contract consumed by the cursor
 * together with in-memory, callable, stream and thread-safe implementations.
 */
namespace ByteCursor::Buffer {
	/**
	 * @brief Callable that pulls bytes from an upstream.
	 *
	 * @details Invoked with the number of bytes the cursor would like. It may
	 *          return fewer, more or zero bytes. Returning `std::nullopt`
	 *          signals end-of-input; returning an error aborts the refill.
	 */
	using ExternalReadFunction = std::function<Expected<std::optional<DataType>, Error>(const std::size_t&)>;

	/**
 	 * @class Forwarder
 	 * @brief FIFO whose refills are delegated to a user-provided callable.
 	 *
 	 * @details `Forwarder` keeps an internal buffer and only calls the external
 	 *          function when the cursor asks for a refill. Everything the
 	 *          function returns is appended to the buffer and becomes part of
 	 *          the view.
 	 *
	 *          Key behaviours:
	 *          - An empty chunk is reported as `Appended(0)` so the cursor can
	 *            count stalls against its budget.
	 *          - `std::nullopt` is reported as `EndOfInput`.
	 *          - An error derived from @ref DecodeError (a timeout reported as
	 *            @ref BudgetExceeded for instance) is forwarded unchanged; any
	 *            other error is wrapped in a @ref SourceError.
 	 *
 	 * @note Copy and move operations are deleted to avoid accidental sharing
 	 *       of handler state.
	 */
	class BYTECURSOR_PUBLIC Forwarder: public FIFO {
		public:
			/**
			 * @brief Construct a Forwarder.
			 * @param readFunc Callable used to service refills. An empty function is
			 *                 replaced by @ref ErrorReadFunction().
			 */
			Forwarder(const ExternalReadFunction& readFunc) noexcept;
			Forwarder(const Forwarder& other)					= delete;
			Forwarder(Forwarder&& other) noexcept				= delete;
			virtual ~Forwarder() noexcept						= default;
			Forwarder& operator=(const Forwarder& other)		= delete;
			Forwarder& operator=(Forwarder&& other) noexcept	= delete;

			/**
			 * @brief Pull bytes from the external function into the buffer.
			 * @param hint Bytes the pending decode still needs.
			 * @param request Size passed to the external function.
			 * @return `Appended(n)` with the number of bytes buffered, `EndOfInput`,
			 *         or the forwarded error.
			 */
			Expected<RefillOutcome, DecodeError> 				Refill(const std::size_t& hint, const std::size_t& request) noexcept override;

			/**
			 * @brief Return an `ExternalReadFunction` that always yields an `Error`.
			 * @return Callable suitable for use as a read handler that returns an error.
			 */
			static ExternalReadFunction 						ErrorReadFunction() noexcept;

		private:
			/**
			 * @brief Callable used to satisfy `Refill()` requests.
			 */
			ExternalReadFunction m_readFunction;
	};
}
