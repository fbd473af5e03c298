#include <ByteCursor/buffer/fifo.hxx>
#include <StormByte/string.hxx>
#include <StormByte/test_handlers.h>

#include <iostream>
#include <random>
#include <string>
#include <vector>

using ByteCursor::ByteView;
using ByteCursor::DataType;
using ByteCursor::ErrorCode;
using ByteCursor::Buffer::FIFO;

static std::string toString(ByteView v) {
	return std::string(reinterpret_cast<const char*>(v.data()), v.size());
}

static std::string makePattern(std::size_t n) {
	std::string s; s.reserve(n);
	for (std::size_t i = 0; i < n; ++i) s.push_back(static_cast<char>('A' + (i % 26)));
	return s;
}

int test_fifo_default_ctor() {
	FIFO fifo;
	ASSERT_TRUE("test_fifo_default_ctor empty", fifo.Empty());
	ASSERT_EQUAL("test_fifo_default_ctor size", fifo.Size(), static_cast<std::size_t>(0));
	ASSERT_TRUE("test_fifo_default_ctor view", fifo.View().empty());
	RETURN_TEST("test_fifo_default_ctor", 0);
}

int test_fifo_write_then_view() {
	FIFO fifo;
	(void)fifo.Write(std::string_view("Hello"));
	(void)fifo.Write(StormByte::String::ToByteVector(", world"));
	ASSERT_EQUAL("test_fifo_write_then_view content", toString(fifo.View()), std::string("Hello, world"));
	ASSERT_EQUAL("test_fifo_write_then_view available", fifo.AvailableBytes(), static_cast<std::size_t>(12));
	RETURN_TEST("test_fifo_write_then_view", 0);
}

int test_fifo_view_is_idempotent() {
	FIFO fifo(std::string_view("ABCDE"));
	const ByteView first = fifo.View();
	const ByteView second = fifo.View();
	ASSERT_TRUE("test_fifo_view_is_idempotent data", first.data() == second.data());
	ASSERT_EQUAL("test_fifo_view_is_idempotent size", first.size(), second.size());
	RETURN_TEST("test_fifo_view_is_idempotent", 0);
}

int test_fifo_consume() {
	FIFO fifo(std::string_view("ABCDE"));
	auto res = fifo.Consume(2);
	ASSERT_TRUE("test_fifo_consume ok", res.has_value());
	ASSERT_EQUAL("test_fifo_consume rest", toString(fifo.View()), std::string("CDE"));

	auto zero = fifo.Consume(0);
	ASSERT_TRUE("test_fifo_consume zero", zero.has_value());
	ASSERT_EQUAL("test_fifo_consume zero rest", toString(fifo.View()), std::string("CDE"));

	auto all = fifo.Consume(3);
	ASSERT_TRUE("test_fifo_consume all", all.has_value());
	ASSERT_TRUE("test_fifo_consume empty", fifo.Empty());
	// Fully consumed storage is released
	ASSERT_EQUAL("test_fifo_consume size reset", fifo.Size(), static_cast<std::size_t>(0));
	RETURN_TEST("test_fifo_consume", 0);
}

int test_fifo_consume_past_view() {
	FIFO fifo(std::string_view("ABC"));
	auto res = fifo.Consume(4);
	ASSERT_FALSE("test_fifo_consume_past_view fails", res.has_value());
	ASSERT_TRUE("test_fifo_consume_past_view code", res.error()->Code() == ErrorCode::Range);
	ASSERT_EQUAL("test_fifo_consume_past_view untouched", toString(fifo.View()), std::string("ABC"));
	RETURN_TEST("test_fifo_consume_past_view", 0);
}

int test_fifo_write_after_consume() {
	FIFO fifo(std::string_view("ABCDE"));
	(void)fifo.Consume(2);
	(void)fifo.Write(std::string_view("1234"));
	ASSERT_EQUAL("test_fifo_write_after_consume content", toString(fifo.View()), std::string("CDE1234"));
	// Writing compacts the consumed prefix away
	ASSERT_EQUAL("test_fifo_write_after_consume size", fifo.Size(), static_cast<std::size_t>(7));
	RETURN_TEST("test_fifo_write_after_consume", 0);
}

int test_fifo_adopt_storage_move_write() {
	FIFO fifo;
	DataType payload = StormByte::String::ToByteVector("adopted");
	const std::byte* storage = payload.data();
	auto res = fifo.Write(std::move(payload));
	ASSERT_TRUE("test_fifo_adopt_storage_move_write ok", res.has_value());
	ASSERT_TRUE("test_fifo_adopt_storage_move_write same storage", fifo.View().data() == storage);
	ASSERT_EQUAL("test_fifo_adopt_storage_move_write content", toString(fifo.View()), std::string("adopted"));
	RETURN_TEST("test_fifo_adopt_storage_move_write", 0);
}

int test_fifo_refill_is_end_of_input() {
	FIFO fifo(std::string_view("AB"));
	auto res = fifo.Refill(16, 16);
	ASSERT_TRUE("test_fifo_refill_is_end_of_input ok", res.has_value());
	ASSERT_TRUE("test_fifo_refill_is_end_of_input eoi", res->IsEndOfInput());
	ASSERT_EQUAL("test_fifo_refill_is_end_of_input untouched", fifo.AvailableBytes(), static_cast<std::size_t>(2));
	RETURN_TEST("test_fifo_refill_is_end_of_input", 0);
}

int test_fifo_copy_ctor_assign() {
	FIFO a(std::string_view("XYZ"));
	(void)a.Consume(1);
	FIFO b(a);
	ASSERT_TRUE("test_fifo_copy_ctor_assign equal", a == b);
	ASSERT_EQUAL("test_fifo_copy_ctor_assign content", toString(b.View()), std::string("YZ"));
	FIFO c;
	c = a;
	ASSERT_EQUAL("test_fifo_copy_ctor_assign assign", toString(c.View()), std::string("YZ"));
	RETURN_TEST("test_fifo_copy_ctor_assign", 0);
}

int test_fifo_move_ctor_assign() {
	FIFO a(std::string_view("MOVE"));
	FIFO b(std::move(a));
	ASSERT_EQUAL("test_fifo_move_ctor_assign moved", toString(b.View()), std::string("MOVE"));
	ASSERT_TRUE("test_fifo_move_ctor_assign source empty", a.Empty());
	FIFO c;
	c = std::move(b);
	ASSERT_EQUAL("test_fifo_move_ctor_assign assigned", toString(c.View()), std::string("MOVE"));
	ASSERT_TRUE("test_fifo_move_ctor_assign b empty", b.Empty());
	RETURN_TEST("test_fifo_move_ctor_assign", 0);
}

int test_fifo_clear() {
	FIFO fifo(std::string_view("data"));
	(void)fifo.Consume(1);
	fifo.Clear();
	ASSERT_TRUE("test_fifo_clear empty", fifo.Empty());
	ASSERT_EQUAL("test_fifo_clear size", fifo.Size(), static_cast<std::size_t>(0));
	RETURN_TEST("test_fifo_clear", 0);
}

int test_fifo_clean() {
	FIFO fifo(std::string_view("0123456789"));
	(void)fifo.Consume(6);
	fifo.Clean();
	ASSERT_EQUAL("test_fifo_clean size", fifo.Size(), static_cast<std::size_t>(4));
	ASSERT_EQUAL("test_fifo_clean content", toString(fifo.View()), std::string("6789"));
	RETURN_TEST("test_fifo_clean", 0);
}

int test_fifo_hexdump() {
	FIFO fifo(std::string_view("Hello, world!"));
	const std::string dump = fifo.HexDump();
	const std::string expected =
		"Size: 13 bytes\n"
		"Read Position: 0\n"
		"00000000: 48 65 6C 6C 6F 2C 20 77 6F 72 6C 64 21            Hello, world!";
	ASSERT_EQUAL("test_fifo_hexdump", dump, expected);
	RETURN_TEST("test_fifo_hexdump", 0);
}

int test_fifo_hexdump_limit() {
	FIFO fifo(std::string_view("ABCDEFGH"));
	(void)fifo.Consume(2);
	const std::string dump = fifo.HexDump(4, 3);
	const std::string expected =
		"Size: 8 bytes\n"
		"Read Position: 2\n"
		"00000002: 43 44 45      CDE";
	ASSERT_EQUAL("test_fifo_hexdump_limit", dump, expected);
	RETURN_TEST("test_fifo_hexdump_limit", 0);
}

int test_fifo_hex_lines() {
	const DataType data { std::byte{'A'}, std::byte{'B'}, std::byte{'C'}, std::byte{'D'}, std::byte{'E'}, std::byte{0x01} };
	const std::string lines = FIFO::FormatHexLines(ByteView(data), 16, 4);
	const std::string expected =
		"00000010: 41 42 43 44   ABCD\n"
		"00000014: 45 01         E.";
	ASSERT_EQUAL("test_fifo_hex_lines", lines, expected);
	RETURN_TEST("test_fifo_hex_lines", 0);
}

int test_fifo_buffer_stress() {
	FIFO fifo;
	std::mt19937_64 rng(12345);
	std::uniform_int_distribution<int> sizes(1, 512);
	std::string expected;

	for (int i = 0; i < 1000; ++i) {
		const std::string chunk = makePattern(static_cast<std::size_t>(sizes(rng)));
		(void)fifo.Write(std::string_view(chunk));
		expected.append(chunk);
		if (i % 3 == 0) {
			const std::size_t take = std::min(expected.size(), static_cast<std::size_t>(sizes(rng)));
			ASSERT_EQUAL("stress prefix", toString(fifo.View().first(take)), expected.substr(0, take));
			auto res = fifo.Consume(take);
			ASSERT_TRUE("stress consume", res.has_value());
			expected.erase(0, take);
		}
	}
	ASSERT_EQUAL("stress remaining", toString(fifo.View()), expected);
	RETURN_TEST("test_fifo_buffer_stress", 0);
}

int main() {
	int result = 0;
	result += test_fifo_default_ctor();
	result += test_fifo_write_then_view();
	result += test_fifo_view_is_idempotent();
	result += test_fifo_consume();
	result += test_fifo_consume_past_view();
	result += test_fifo_write_after_consume();
	result += test_fifo_adopt_storage_move_write();
	result += test_fifo_refill_is_end_of_input();
	result += test_fifo_copy_ctor_assign();
	result += test_fifo_move_ctor_assign();
	result += test_fifo_clear();
	result += test_fifo_clean();
	result += test_fifo_hexdump();
	result += test_fifo_hexdump_limit();
	result += test_fifo_hex_lines();
	result += test_fifo_buffer_stress();

	if (result == 0) {
		std::cout << "FIFO tests passed!" << std::endl;
	} else {
		std::cout << result << " FIFO tests failed." << std::endl;
	}
	return result;
}
