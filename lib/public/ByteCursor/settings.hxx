#pragma once

#include <ByteCursor/visibility.h>

#include <cstddef>

/**
 * @namespace ByteCursor
 * @brief Namespace for the ByteCursor resumable decoding library.
 *
 * The ByteCursor namespace provides typed decoders, byte sources and the
 * resumable cursor that drives decoders across partial buffer refills.
 */
namespace ByteCursor {
	/**
	 * @enum RefillPolicy
	 * @brief How much a cursor asks upstream for when a decoder needs more bytes.
	 */
	enum class BYTECURSOR_PUBLIC RefillPolicy {
		Minimum,														///< Request exactly the decoder's hint
		Greedy															///< Request at least Settings::chunk_size bytes
	};

	/**
	 * @struct Settings
	 * @brief Refill budget and policy applied to every call of a cursor.
	 *
	 * @details The budget bounds how long a single decode call may keep asking
	 *          upstream for bytes before it surfaces @ref BudgetExceeded:
	 *          - `max_refills` caps refill attempts per call (0 means no cap).
	 *          - `max_stalls` caps consecutive refills that appended nothing, so
	 *            an upstream that keeps answering `Appended(0)` cannot spin forever.
	 */
	struct BYTECURSOR_PUBLIC Settings {
		std::size_t max_refills {0};
		std::size_t max_stalls {16};
		RefillPolicy policy {RefillPolicy::Minimum};
		std::size_t chunk_size {4096};

		/**
		 * @brief Size of the refill request for a decoder hint.
		 * @param hint Minimum additional bytes the decoder asked for.
		 * @return The hint for @ref RefillPolicy::Minimum, otherwise the larger of hint and chunk size.
		 */
		constexpr std::size_t RequestSize(const std::size_t& hint) const noexcept {
			if (policy == RefillPolicy::Greedy && chunk_size > hint)
				return chunk_size;
			return hint;
		}
	};
}
