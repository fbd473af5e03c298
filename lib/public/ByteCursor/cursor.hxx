#pragma once

#include <ByteCursor/buffer/source.hxx>
#include <ByteCursor/decoder/decoder.hxx>
#include <ByteCursor/settings.hxx>
#include <StormByte/logger/log.hxx>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

/**
 * @namespace ByteCursor
 * @brief Namespace for the ByteCursor resumable decoding library.
 *
 * The ByteCursor namespace provides typed decoders, byte sources and the
 * resumable cursor that drives decoders across partial buffer refills.
 */
namespace ByteCursor {
	/**
	 * @class Cursor
	 * @brief Resumable decoding adapter over a @ref Buffer::Source.
	 *
	 * @par Overview
	 *  Every operation runs the same loop: take the source's current view, run
	 *  the matching typed decoder on it, and then
	 *  - on a value, copy it out, consume the bytes the decoder used and return it;
	 *  - on a format error, return it without consuming anything;
	 *  - on insufficient data, ask the source for more bytes and try again.
	 *
	 * @par Refill budget
	 *  The @ref Settings bound each call: exceeding `max_refills` refill attempts
	 *  or `max_stalls` consecutive empty refills fails with @ref BudgetExceeded.
	 *  End-of-input while bytes are still missing fails with @ref UnexpectedEof.
	 *  No error path consumes bytes, and the cursor is reusable right after
	 *  any outcome.
	 *
	 * @par Thread safety
	 *  A cursor and its source are used by one thread at a time. The only point
	 *  where a call may block is @ref Buffer::Source::Refill().
	 *
	 * @note The cursor does NOT take ownership of the source. The caller is
	 *       responsible for keeping the source alive while the cursor is used.
	 */
	class BYTECURSOR_PUBLIC Cursor {
		public:
			/**
			 * @brief Construct a cursor over a source.
			 * @param source Source to decode from.
			 * @param settings Refill budget and policy.
			 * @param log Optional logger receiving refill and failure diagnostics.
			 */
			Cursor(Buffer::Source& source, const Settings& settings = {}, std::shared_ptr<StormByte::Logger::Log> log = nullptr) noexcept;
			Cursor(const Cursor& other)								= default;
			Cursor(Cursor&& other) noexcept							= default;
			~Cursor() noexcept										= default;
			Cursor& operator=(const Cursor& other)					= default;
			Cursor& operator=(Cursor&& other) noexcept				= default;

			/**
			 * @brief Read a fixed-width integer.
			 * @tparam T One of the 8, 16, 32 or 64 bit signed or unsigned integers.
			 * @param endianness Byte order of the encoded value.
			 * @return The decoded integer or the error that stopped the read.
			 */
			template<Decoder::FixedWidth T>
			Expected<T, DecodeError> 								Read(const Endianness& endianness = Endianness::Big) noexcept {
				return Run<T>("Read",
					[&endianness](ByteView view, bool) { return Decoder::Integer<T>(view, endianness); },
					[](const T& value, const std::size_t&) { return value; });
			}

			inline Expected<std::uint8_t, DecodeError> 				ReadU8(const Endianness& endianness = Endianness::Big) noexcept {
				return Read<std::uint8_t>(endianness);
			}

			inline Expected<std::uint16_t, DecodeError> 			ReadU16(const Endianness& endianness = Endianness::Big) noexcept {
				return Read<std::uint16_t>(endianness);
			}

			inline Expected<std::uint32_t, DecodeError> 			ReadU32(const Endianness& endianness = Endianness::Big) noexcept {
				return Read<std::uint32_t>(endianness);
			}

			inline Expected<std::uint64_t, DecodeError> 			ReadU64(const Endianness& endianness = Endianness::Big) noexcept {
				return Read<std::uint64_t>(endianness);
			}

			inline Expected<std::int8_t, DecodeError> 				ReadI8(const Endianness& endianness = Endianness::Big) noexcept {
				return Read<std::int8_t>(endianness);
			}

			inline Expected<std::int16_t, DecodeError> 				ReadI16(const Endianness& endianness = Endianness::Big) noexcept {
				return Read<std::int16_t>(endianness);
			}

			inline Expected<std::int32_t, DecodeError> 				ReadI32(const Endianness& endianness = Endianness::Big) noexcept {
				return Read<std::int32_t>(endianness);
			}

			inline Expected<std::int64_t, DecodeError> 				ReadI64(const Endianness& endianness = Endianness::Big) noexcept {
				return Read<std::int64_t>(endianness);
			}

			/**
			 * @brief Read bytes up to a delimiter.
			 * @param delimiter Terminating byte; consumed but not returned.
			 * @param budget Maximum bytes, delimiter included, the run may span.
			 * @return The bytes before the delimiter, @ref DelimiterNotFound when
			 *         `budget` bytes hold no delimiter, or the refill error.
			 */
			Expected<DataType, DecodeError> 						ReadUntil(const std::byte& delimiter, const std::size_t& budget) noexcept;

			/**
			 * @brief Read exactly `count` bytes.
			 */
			Expected<DataType, DecodeError> 						ReadExact(const std::size_t& count) noexcept;

			/**
			 * @brief Read the leading bytes accepted by `predicate`.
			 * @param predicate Byte filter; the first rejected byte stays unread.
			 * @param budget Maximum run length.
			 * @return The run, which ends early at end-of-input instead of failing.
			 */
			Expected<DataType, DecodeError> 						ReadWhile(const Predicate& predicate, const std::size_t& budget) noexcept;

			/**
			 * @brief Discard exactly `count` bytes.
			 */
			ExpectedVoid<DecodeError> 								Skip(const std::size_t& count) noexcept;

			/**
			 * @brief Discard bytes up to and including a delimiter.
			 * @return Number of bytes discarded, delimiter included.
			 */
			Expected<std::size_t, DecodeError> 						SkipUntil(const std::byte& delimiter, const std::size_t& budget) noexcept;

			/**
			 * @brief Discard the leading bytes accepted by `predicate`.
			 * @return Number of bytes discarded.
			 */
			Expected<std::size_t, DecodeError> 						SkipWhile(const Predicate& predicate, const std::size_t& budget) noexcept;

			inline const Settings& 									GetSettings() const noexcept {
				return m_settings;
			}

			inline void 											SetSettings(const Settings& settings) noexcept {
				m_settings = settings;
			}

			inline Buffer::Source& 									GetSource() const noexcept {
				return m_source.get();
			}

		private:
			std::reference_wrapper<Buffer::Source> m_source;
			Settings m_settings;
			std::shared_ptr<StormByte::Logger::Log> m_log;

			/**
			 * @brief Decode loop shared by every operation.
			 * @tparam Decoded Value type produced by the decoder.
			 * @param operation Operation name used in errors and logs.
			 * @param decode Callable `(ByteView, bool end_of_input) -> Decoder::Outcome<Decoded>`.
			 * @param finish Callable `(const Decoded&, consumed) -> R` run before the
			 *               bytes are consumed, so borrowed values can be copied out.
			 */
			template<typename Decoded, typename Decode, typename Finish>
			auto 													Run(const char* operation, Decode&& decode, Finish&& finish) noexcept
				-> Expected<std::invoke_result_t<Finish&, const Decoded&, const std::size_t&>, DecodeError> {
				std::size_t refills = 0, stalls = 0;
				bool end_of_input = false;

				while (true) {
					const ByteView view = m_source.get().View();
					const Decoder::Outcome<Decoded> outcome = decode(view, end_of_input);

					if (outcome.IsValue()) {
						const auto& decoded = outcome.GetValue();
						auto result = finish(decoded.value, decoded.consumed);
						auto consumed = m_source.get().Consume(decoded.consumed);
						if (!consumed)
							return std::unexpected(ContractViolation(operation, consumed.error()));
						return result;
					}

					if (outcome.IsInvalid())
						return std::unexpected(Reject(operation, outcome.GetInvalid().code, outcome.GetInvalid().reason, view));

					if (end_of_input)
						return std::unexpected(Truncated(operation, outcome.GetNeedMore().hint));

					auto refilled = AwaitRefill(operation, outcome.GetNeedMore().hint, refills, stalls, end_of_input);
					if (!refilled)
						return std::unexpected(refilled.error());
				}
			}

			/**
			 * @brief Ask the source for more bytes within the refill budget.
			 * @param end_of_input Set when upstream reports end-of-input.
			 */
			ExpectedVoid<DecodeError> 								AwaitRefill(const char* operation, const std::size_t& hint, std::size_t& refills, std::size_t& stalls, bool& end_of_input) noexcept;

			std::shared_ptr<DecodeError> 							ContractViolation(const char* operation, const std::shared_ptr<RangeError>& error) const noexcept;
			std::shared_ptr<DecodeError> 							Reject(const char* operation, const ErrorCode& code, const std::string& reason, ByteView view) const noexcept;
			std::shared_ptr<DecodeError> 							Truncated(const char* operation, const std::size_t& hint) const noexcept;

			void 													Log(const StormByte::Logger::Level& level, const std::string& message) const noexcept;
	};
}
