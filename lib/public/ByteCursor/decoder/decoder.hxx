#pragma once

#include <ByteCursor/decoder/outcome.hxx>

#include <concepts>
#include <type_traits>

/**
 * @namespace Decoder
 * @brief Namespace for the typed decoders and encoders of the ByteCursor library.
 *
 * Decoders are pure functions over a @ref ByteCursor::ByteView; they never
 * perform I/O and never consume bytes themselves.
 */
namespace ByteCursor::Decoder {
	/**
	 * @brief Integer types with a fixed width of 1, 2, 4 or 8 bytes.
	 */
	template<typename T>
	concept FixedWidth = std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool> &&
		(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);

	/**
	 * @brief Decode a fixed-width integer from the front of a view.
	 * @tparam T Target integer type; signed types are sign extended.
	 * @param view Bytes currently available.
	 * @param endianness Byte order of the encoded integer.
	 * @return `Value(v, sizeof(T))`, or `NeedMore(sizeof(T) - view.size())` when
	 *         the view is short. Any byte pattern is a valid integer, so this
	 *         decoder never reports Invalid.
	 */
	template<FixedWidth T>
	Outcome<T> Integer(ByteView view, const Endianness& endianness) {
		using Unsigned = std::make_unsigned_t<T>;
		constexpr std::size_t width = sizeof(T);

		if (view.size() < width)
			return Outcome<T>::Insufficient(width - view.size());

		Unsigned raw = 0;
		if (Resolve(endianness) == Endianness::Big) {
			for (std::size_t i = 0; i < width; ++i)
				raw = static_cast<Unsigned>((raw << 8) | std::to_integer<Unsigned>(view[i]));
		}
		else {
			for (std::size_t i = width; i > 0; --i)
				raw = static_cast<Unsigned>((raw << 8) | std::to_integer<Unsigned>(view[i - 1]));
		}

		// Unsigned to signed conversion is modular, which sign extends for us
		return Outcome<T>::Decoded(static_cast<T>(raw), width);
	}

	/**
	 * @brief Decode a delimiter-terminated byte run.
	 * @param view Bytes currently available.
	 * @param delimiter Terminating byte.
	 * @param budget Maximum number of bytes (delimiter included) the run may span.
	 * @return
	 *  - `Value(view[0, i), i + 1)` when the first delimiter sits at offset `i`;
	 *    the delimiter is consumed but excluded from the value.
	 *  - `NeedMore(1)` when no delimiter was seen and the view is shorter than the budget.
	 *  - `Invalid(DelimiterNotFound)` when `budget` bytes were scanned without a delimiter.
	 * @note Scanning is a byte-level first match with no lookahead.
	 */
	BYTECURSOR_PUBLIC Outcome<ByteView> Until(ByteView view, const std::byte& delimiter, const std::size_t& budget);

	/**
	 * @brief Decode exactly `count` bytes.
	 * @param view Bytes currently available.
	 * @param count Number of bytes required.
	 * @return `Value(view[0, count), count)` or `NeedMore(count - view.size())`.
	 */
	BYTECURSOR_PUBLIC Outcome<ByteView> Exact(ByteView view, const std::size_t& count);

	/**
	 * @brief Decode the leading run of bytes accepted by a predicate.
	 * @param view Bytes currently available.
	 * @param predicate Byte filter; the first rejected byte ends the run and is not consumed.
	 * @param budget Maximum run length; reaching it ends the run.
	 * @param end_of_input True when upstream has no more bytes, so the run may end at the view end.
	 * @return `Value(run, run.size())`, or `NeedMore(1)` while every viewed byte matched.
	 */
	BYTECURSOR_PUBLIC Outcome<ByteView> While(ByteView view, const Predicate& predicate, const std::size_t& budget, bool end_of_input);
}
