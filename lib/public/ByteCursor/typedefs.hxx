#pragma once

#include <ByteCursor/exception.hxx>
#include <StormByte/expected.hxx>

#include <bit>
#include <cstddef>
#include <functional>
#include <span>
#include <vector>

/**
 * @namespace ByteCursor
 * @brief Namespace for the ByteCursor resumable decoding library.
 *
 * The ByteCursor namespace provides typed decoders, byte sources and the
 * resumable cursor that drives decoders across partial buffer refills.
 */
namespace ByteCursor {
	/**
	 * @brief Owned byte sequence.
	 */
	using DataType = std::vector<std::byte>;

	/**
	 * @brief Borrowed read-only window over the unconsumed bytes of a source.
	 *
	 * @details A view is valid only until the next `Consume()` or `Refill()`
	 *          on the source that produced it.
	 */
	using ByteView = std::span<const std::byte>;

	/**
	 * @brief Byte predicate used by run and skip operations.
	 */
	using Predicate = std::function<bool(std::byte)>;

	template<typename T, class Exception>
	using Expected = StormByte::Expected<T, Exception>;

	template<class Exception>
	using ExpectedVoid = StormByte::Expected<void, Exception>;

	/**
	 * @enum Endianness
	 * @brief Byte order of a fixed-width integer.
	 */
	enum class BYTECURSOR_PUBLIC Endianness {
		Big,															///< Most significant byte first
		Little,															///< Least significant byte first
		Native															///< Byte order of the host
	};

	/**
	 * @brief Resolve @ref Endianness::Native to the concrete host byte order.
	 * @param endianness Requested byte order.
	 * @return Either @ref Endianness::Big or @ref Endianness::Little.
	 */
	constexpr Endianness Resolve(const Endianness& endianness) noexcept {
		if (endianness != Endianness::Native)
			return endianness;
		return std::endian::native == std::endian::big ? Endianness::Big : Endianness::Little;
	}
}
