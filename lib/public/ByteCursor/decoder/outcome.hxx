#pragma once

#include <ByteCursor/typedefs.hxx>

#include <string>
#include <utility>
#include <variant>

/**
 * @namespace Decoder
 * @brief Namespace for the typed decoders and encoders of the ByteCursor library.
 *
 * Decoders are pure functions over a @ref ByteCursor::ByteView; they never
 * perform I/O and never consume bytes themselves.
 */
namespace ByteCursor::Decoder {
	/**
	 * @class Outcome
	 * @brief Result of a single decode attempt.
	 *
	 * @par Overview
	 *  An outcome holds exactly one of three states:
	 *  - **Value**: the decode succeeded, producing a value and the number of
	 *    leading bytes of the view it used.
	 *  - **NeedMore**: the view is too short; `hint` is the minimum number of
	 *    additional bytes that could let the next attempt progress.
	 *  - **Invalid**: the bytes can never decode; carries the error kind and
	 *    a human readable reason.
	 *
	 *  Only a Value reports consumed bytes. An outcome is produced once per
	 *  attempt and inspected immediately by the caller, it is never stored.
	 *
	 * @tparam T Decoded value type.
	 */
	template<typename T>
	class Outcome {
		public:
			struct Value {
				T value;
				std::size_t consumed;
			};

			struct NeedMore {
				std::size_t hint;
			};

			struct Invalid {
				ErrorCode code;
				std::string reason;
			};

			/**
			 * @brief Build a successful outcome.
			 * @param value Decoded value.
			 * @param consumed Number of leading view bytes used, never above the view length.
			 */
			static Outcome 												Decoded(T value, const std::size_t& consumed) {
				return Outcome(Value { std::move(value), consumed });
			}

			/**
			 * @brief Build an insufficient-data outcome.
			 * @param hint Minimum number of additional bytes requested.
			 */
			static Outcome 												Insufficient(const std::size_t& hint) noexcept {
				return Outcome(NeedMore { hint });
			}

			/**
			 * @brief Build a format error outcome.
			 * @param code Kind of error the cursor will surface.
			 * @param reason Description of the failure.
			 */
			static Outcome 												Malformed(const ErrorCode& code, std::string reason) {
				return Outcome(Invalid { code, std::move(reason) });
			}

			inline bool 												IsValue() const noexcept {
				return std::holds_alternative<Value>(m_state);
			}

			inline bool 												IsNeedMore() const noexcept {
				return std::holds_alternative<NeedMore>(m_state);
			}

			inline bool 												IsInvalid() const noexcept {
				return std::holds_alternative<Invalid>(m_state);
			}

			/**
			 * @brief Access the Value state.
			 * @warning Only valid when @ref IsValue() is true.
			 */
			inline const Value& 										GetValue() const {
				return std::get<Value>(m_state);
			}

			/**
			 * @brief Access the NeedMore state.
			 * @warning Only valid when @ref IsNeedMore() is true.
			 */
			inline const NeedMore& 										GetNeedMore() const {
				return std::get<NeedMore>(m_state);
			}

			/**
			 * @brief Access the Invalid state.
			 * @warning Only valid when @ref IsInvalid() is true.
			 */
			inline const Invalid& 										GetInvalid() const {
				return std::get<Invalid>(m_state);
			}

			/**
			 * @brief Number of bytes the attempt consumed.
			 * @return The consumed count for a Value, 0 for any other state.
			 */
			inline std::size_t 											Consumed() const noexcept {
				const Value* value = std::get_if<Value>(&m_state);
				return value ? value->consumed : 0;
			}

		private:
			std::variant<Value, NeedMore, Invalid> m_state;

			explicit Outcome(Value&& value): m_state(std::move(value)) {}
			explicit Outcome(NeedMore&& need) noexcept: m_state(std::move(need)) {}
			explicit Outcome(Invalid&& invalid): m_state(std::move(invalid)) {}
	};
}
