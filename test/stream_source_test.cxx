#include <ByteCursor/buffer/stream_source.hxx>
#include <ByteCursor/cursor.hxx>
#include <StormByte/string.hxx>
#include <StormByte/test_handlers.h>

#include <iostream>
#include <sstream>
#include <string>

using ByteCursor::Cursor;
using ByteCursor::DataType;
using ByteCursor::ErrorCode;
using ByteCursor::Buffer::StreamSource;

int test_stream_source_refill() {
	std::istringstream in("abcdef");
	StreamSource source(in);

	auto first = source.Refill(4, 4);
	ASSERT_TRUE("test_stream_source_refill first", first.has_value());
	ASSERT_EQUAL("test_stream_source_refill first count", first->Count(), static_cast<std::size_t>(4));

	// Short read at end of stream appends what is left
	auto second = source.Refill(4, 4);
	ASSERT_TRUE("test_stream_source_refill second", second.has_value());
	ASSERT_EQUAL("test_stream_source_refill second count", second->Count(), static_cast<std::size_t>(2));
	ASSERT_EQUAL("test_stream_source_refill available", source.AvailableBytes(), static_cast<std::size_t>(6));

	auto third = source.Refill(4, 4);
	ASSERT_TRUE("test_stream_source_refill third", third.has_value());
	ASSERT_TRUE("test_stream_source_refill eoi", third->IsEndOfInput());
	RETURN_TEST("test_stream_source_refill", 0);
}

int test_stream_source_zero_hint() {
	std::istringstream in("xy");
	StreamSource source(in);
	auto res = source.Refill(0, 0);
	ASSERT_TRUE("test_stream_source_zero_hint ok", res.has_value());
	ASSERT_EQUAL("test_stream_source_zero_hint count", res->Count(), static_cast<std::size_t>(1));
	RETURN_TEST("test_stream_source_zero_hint", 0);
}

int test_stream_source_with_cursor() {
	std::string payload("\x00\x03" "GET\n" "tail", 10);
	std::istringstream in(payload);
	StreamSource source(in);
	Cursor cursor(source);

	auto length = cursor.ReadU16();
	ASSERT_TRUE("test_stream_source_with_cursor length", length.has_value());
	ASSERT_EQUAL("test_stream_source_with_cursor length value", *length, static_cast<std::uint16_t>(3));

	auto verb = cursor.ReadExact(*length);
	ASSERT_TRUE("test_stream_source_with_cursor verb", verb.has_value());
	ASSERT_EQUAL("test_stream_source_with_cursor verb value", StormByte::String::FromByteVector(*verb), std::string("GET"));

	auto skipped = cursor.SkipUntil(std::byte{'\n'}, 8);
	ASSERT_EQUAL("test_stream_source_with_cursor newline", *skipped, static_cast<std::size_t>(1));

	auto tail = cursor.ReadUntil(std::byte{'\n'}, 64);
	ASSERT_FALSE("test_stream_source_with_cursor tail fails", tail.has_value());
	ASSERT_TRUE("test_stream_source_with_cursor tail eof", tail.error()->Code() == ErrorCode::UnexpectedEof);
	ASSERT_EQUAL("test_stream_source_with_cursor tail pending", source.AvailableBytes(), static_cast<std::size_t>(4));
	RETURN_TEST("test_stream_source_with_cursor", 0);
}

int test_stream_source_failed_stream() {
	std::istringstream in("abcdef");
	in.setstate(std::ios::failbit);
	StreamSource source(in);

	auto res = source.Refill(4, 4);
	ASSERT_FALSE("test_stream_source_failed_stream refill fails", res.has_value());
	ASSERT_TRUE("test_stream_source_failed_stream refill code", res.error()->Code() == ErrorCode::Source);

	// A cursor reports the failure instead of stalling into the budget
	Cursor cursor(source);
	auto value = cursor.ReadU8();
	ASSERT_FALSE("test_stream_source_failed_stream read fails", value.has_value());
	ASSERT_TRUE("test_stream_source_failed_stream read code", value.error()->Code() == ErrorCode::Source);
	RETURN_TEST("test_stream_source_failed_stream", 0);
}

int test_stream_source_greedy_request() {
	std::istringstream in("abcdefgh");
	StreamSource source(in);

	// Blocks for two bytes, then takes what is already buffered up to the request
	auto res = source.Refill(2, 4096);
	ASSERT_TRUE("test_stream_source_greedy_request ok", res.has_value());
	ASSERT_EQUAL("test_stream_source_greedy_request count", res->Count(), static_cast<std::size_t>(8));
	ASSERT_EQUAL("test_stream_source_greedy_request view", StormByte::String::FromByteVector(DataType(source.View().begin(), source.View().end())), std::string("abcdefgh"));
	RETURN_TEST("test_stream_source_greedy_request", 0);
}

int test_stream_source_huge_count() {
	std::istringstream in("short");
	StreamSource source(in);
	Cursor cursor(source);

	auto res = cursor.ReadExact(std::size_t(1) << 40);
	ASSERT_FALSE("test_stream_source_huge_count fails", res.has_value());
	ASSERT_TRUE("test_stream_source_huge_count code", res.error()->Code() == ErrorCode::UnexpectedEof);
	ASSERT_EQUAL("test_stream_source_huge_count pending", source.View().size(), static_cast<std::size_t>(5));
	RETURN_TEST("test_stream_source_huge_count", 0);
}

int main() {
	int result = 0;
	result += test_stream_source_refill();
	result += test_stream_source_zero_hint();
	result += test_stream_source_with_cursor();
	result += test_stream_source_failed_stream();
	result += test_stream_source_greedy_request();
	result += test_stream_source_huge_count();

	if (result == 0) {
		std::cout << "StreamSource tests passed!" << std::endl;
	} else {
		std::cout << result << " StreamSource tests failed." << std::endl;
	}
	return result;
}
