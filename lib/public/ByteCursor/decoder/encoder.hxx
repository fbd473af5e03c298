#pragma once

#include <ByteCursor/decoder/decoder.hxx>

#include <array>

/**
 * @namespace Encoder
 * @brief Inverse of the fixed-width integer decoders.
 *
 * Producers use these helpers to lay integers out in the byte order the
 * consuming cursor expects.
 */
namespace ByteCursor::Encoder {
	/**
	 * @brief Encode an integer into its `sizeof(T)` bytes.
	 * @param value Integer to encode.
	 * @param endianness Byte order of the output.
	 * @return The encoded bytes, most significant first for @ref Endianness::Big.
	 */
	template<Decoder::FixedWidth T>
	constexpr std::array<std::byte, sizeof(T)> Integer(const T& value, const Endianness& endianness) noexcept {
		using Unsigned = std::make_unsigned_t<T>;
		constexpr std::size_t width = sizeof(T);

		std::array<std::byte, width> bytes {};
		Unsigned raw = static_cast<Unsigned>(value);
		for (std::size_t i = 0; i < width; ++i) {
			const std::size_t index = Resolve(endianness) == Endianness::Big ? width - 1 - i : i;
			bytes[index] = static_cast<std::byte>(raw & 0xFF);
			if constexpr (width > 1)
				raw = static_cast<Unsigned>(raw >> 8);
		}
		return bytes;
	}

	/**
	 * @brief Append an encoded integer to a byte vector.
	 * @param out Destination; grows by `sizeof(T)` bytes.
	 * @param value Integer to encode.
	 * @param endianness Byte order of the output.
	 * @return Number of bytes appended.
	 */
	template<Decoder::FixedWidth T>
	std::size_t Append(DataType& out, const T& value, const Endianness& endianness) {
		const auto bytes = Integer<T>(value, endianness);
		out.insert(out.end(), bytes.begin(), bytes.end());
		return bytes.size();
	}
}
