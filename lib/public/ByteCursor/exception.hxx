#pragma once

#include <ByteCursor/visibility.h>
#include <StormByte/exception.hxx>

#include <format>
#include <string>
#include <utility>

/**
 * @namespace ByteCursor
 * @brief Namespace for the ByteCursor resumable decoding library.
 *
 * The ByteCursor namespace provides typed decoders, byte sources and the
 * resumable cursor that drives decoders across partial buffer refills.
 */
namespace ByteCursor {
	/**
	 * @enum ErrorCode
	 * @brief Identifies the kind of a @ref DecodeError.
	 */
	enum class BYTECURSOR_PUBLIC ErrorCode {
		UnexpectedEof,													///< Upstream ended while a decode still needed bytes
		BudgetExceeded,													///< Refill budget exhausted or refill timed out
		DelimiterNotFound,												///< Delimiter absent within the allowed budget
		Range,															///< Buffer contract violation (consume past the view)
		Source															///< Upstream source failure other than end-of-input
	};

	// Generic ByteCursor exceptions
	class BYTECURSOR_PUBLIC Exception: public StormByte::Exception {
		public:
			template <typename... Args>
			Exception(const std::string& component, std::format_string<Args...> fmt, Args&&... args):
			StormByte::Exception("ByteCursor::" + component, fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class Error
	 * @brief General exception class for ByteCursor errors.
	 */
	class BYTECURSOR_PUBLIC Error: public Exception {
		public:
			using Exception::Exception;
	};

	/**
	 * @class DecodeError
	 * @brief Base class for every failure a decode operation can surface.
	 *
	 * @details Carries an @ref ErrorCode so callers can branch on the failure kind
	 *          without casting the error pointer held by `Expected`.
	 */
	class BYTECURSOR_PUBLIC DecodeError: public Error {
		public:
			template <typename... Args>
			DecodeError(const ErrorCode& code, const std::string& component, std::format_string<Args...> fmt, Args&&... args):
			Error(component, fmt, std::forward<Args>(args)...), m_code(code) {}

			/**
			 * @brief Kind of this error.
			 */
			inline const ErrorCode& 										Code() const noexcept {
				return m_code;
			}

		private:
			ErrorCode m_code;
	};

	/**
	 * @class UnexpectedEof
	 * @brief Upstream signaled end-of-input while a decode still needed more bytes.
	 */
	class BYTECURSOR_PUBLIC UnexpectedEof: public DecodeError {
		public:
			template <typename... Args>
			UnexpectedEof(std::format_string<Args...> fmt, Args&&... args):
			DecodeError(ErrorCode::UnexpectedEof, "UnexpectedEof", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class BudgetExceeded
	 * @brief The refill budget ran out, or an upstream refill timed out.
	 */
	class BYTECURSOR_PUBLIC BudgetExceeded: public DecodeError {
		public:
			template <typename... Args>
			BudgetExceeded(std::format_string<Args...> fmt, Args&&... args):
			DecodeError(ErrorCode::BudgetExceeded, "BudgetExceeded", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class DelimiterNotFound
	 * @brief Format error: no delimiter within the bytes a delimited decode may scan.
	 */
	class BYTECURSOR_PUBLIC DelimiterNotFound: public DecodeError {
		public:
			template <typename... Args>
			DelimiterNotFound(std::format_string<Args...> fmt, Args&&... args):
			DecodeError(ErrorCode::DelimiterNotFound, "DelimiterNotFound", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class RangeError
	 * @brief Buffer contract violation, such as consuming more bytes than are viewable.
	 * @note Never produced by a correctly used cursor.
	 */
	class BYTECURSOR_PUBLIC RangeError: public DecodeError {
		public:
			template <typename... Args>
			RangeError(std::format_string<Args...> fmt, Args&&... args):
			DecodeError(ErrorCode::Range, "RangeError", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class SourceError
	 * @brief The upstream byte source failed for a reason other than end-of-input.
	 */
	class BYTECURSOR_PUBLIC SourceError: public DecodeError {
		public:
			template <typename... Args>
			SourceError(std::format_string<Args...> fmt, Args&&... args):
			DecodeError(ErrorCode::Source, "SourceError", fmt, std::forward<Args>(args)...) {}
	};

	/**
	 * @class WriteError
	 * @brief Exception class for write errors to buffers.
	 *
	 * @details Returned when a producer writes to a closed or failed buffer.
	 */
	class BYTECURSOR_PUBLIC WriteError: public Error {
		public:
			template <typename... Args>
			WriteError(std::format_string<Args...> fmt, Args&&... args):
			Error("WriteError", fmt, std::forward<Args>(args)...) {}
	};
}
