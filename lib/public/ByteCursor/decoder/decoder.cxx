#include <ByteCursor/decoder/decoder.hxx>

#include <algorithm>
#include <format>
#include <iterator>

using namespace ByteCursor;
using namespace ByteCursor::Decoder;

Outcome<ByteView> ByteCursor::Decoder::Until(ByteView view, const std::byte& delimiter, const std::size_t& budget) {
	const ByteView window = view.first(std::min(view.size(), budget));
	const auto found = std::ranges::find(window, delimiter);

	if (found != window.end()) {
		const std::size_t index = static_cast<std::size_t>(std::distance(window.begin(), found));
		return Outcome<ByteView>::Decoded(view.first(index), index + 1);
	}

	if (view.size() < budget)
		return Outcome<ByteView>::Insufficient(1);

	return Outcome<ByteView>::Malformed(ErrorCode::DelimiterNotFound,
		std::format("Delimiter 0x{:02X} not found within {} bytes", std::to_integer<unsigned int>(delimiter), budget));
}

Outcome<ByteView> ByteCursor::Decoder::Exact(ByteView view, const std::size_t& count) {
	if (view.size() < count)
		return Outcome<ByteView>::Insufficient(count - view.size());

	return Outcome<ByteView>::Decoded(view.first(count), count);
}

Outcome<ByteView> ByteCursor::Decoder::While(ByteView view, const Predicate& predicate, const std::size_t& budget, bool end_of_input) {
	const std::size_t scan = std::min(view.size(), budget);

	for (std::size_t i = 0; i < scan; ++i) {
		if (!predicate(view[i]))
			return Outcome<ByteView>::Decoded(view.first(i), i);
	}

	if (scan == budget || end_of_input)
		return Outcome<ByteView>::Decoded(view.first(scan), scan);

	return Outcome<ByteView>::Insufficient(1);
}
