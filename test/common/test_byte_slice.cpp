#include "catch.hpp"
#include "colwire/common/byte_slice.hpp"
#include "colwire/common/exception.hpp"

using namespace colwire;
using namespace std;

TEST_CASE("Byte slice access", "[byte_slice]") {
	vector<uint8_t> data {1, 2, 3, 4, 5};
	ByteBuffer bytes(data.data(), data.size());

	REQUIRE(ByteSlice::Get(bytes, 0) == 1);
	REQUIRE(ByteSlice::Get(bytes, 4) == 5);
	REQUIRE_THROWS_AS(ByteSlice::Get(bytes, 5), OutOfRangeException);

	auto slice = ByteSlice::Slice(bytes, 1, 4);
	REQUIRE(slice.len == 3);
	REQUIRE(slice.ptr[0] == 2);
	REQUIRE(slice.ptr[2] == 4);

	// empty ranges are fine, also at the very end
	REQUIRE(ByteSlice::Slice(bytes, 5, 5).len == 0);
	REQUIRE(ByteSlice::Slice(bytes, 0, 0).len == 0);

	REQUIRE_THROWS_AS(ByteSlice::Slice(bytes, 3, 6), OutOfRangeException);
	REQUIRE_THROWS_AS(ByteSlice::Slice(bytes, 4, 2), OutOfRangeException);
}

TEST_CASE("Byte slice at offset", "[byte_slice]") {
	vector<uint8_t> data {10, 11, 12, 13, 14, 15};
	ByteBuffer bytes(data.data(), data.size());

	auto slice = ByteSlice::SliceAtOffset(bytes, 2, 1, 3);
	REQUIRE(slice.len == 2);
	REQUIRE(slice.ptr[0] == 13);
	REQUIRE(slice.ptr[1] == 14);

	REQUIRE_THROWS_AS(ByteSlice::SliceAtOffset(bytes, 4, 0, 3), OutOfRangeException);

	auto max = NumericLimits<idx_t>::Maximum();
	REQUIRE_THROWS_AS(ByteSlice::SliceAtOffset(bytes, max, 1, 2), OverflowException);
	REQUIRE_THROWS_AS(ByteSlice::SliceAtOffset(bytes, max, 0, 1), OverflowException);
	// no overflow, but far out of range
	REQUIRE_THROWS_AS(ByteSlice::SliceAtOffset(bytes, max, 0, 0), OutOfRangeException);

	auto arr = ByteSlice::ArrayFromSlice<4>(bytes, 1);
	REQUIRE(arr[0] == 11);
	REQUIRE(arr[3] == 14);
	REQUIRE_THROWS_AS(ByteSlice::ArrayFromSlice<4>(bytes, 3), OutOfRangeException);
}

TEST_CASE("String from byte slice", "[byte_slice][utf8]") {
	string text = "xxhello\xF0\x9F\xA6\x86";
	ByteBuffer bytes(const_data_ptr_cast(text.c_str()), text.size());

	REQUIRE(ByteSlice::StringFromSlice(bytes, 2, 0, 5) == "hello");
	REQUIRE(ByteSlice::StringFromSlice(bytes, 2, 5, 9) == "\xF0\x9F\xA6\x86");
	REQUIRE(ByteSlice::StringFromSlice(bytes, 0, 3, 3) == "");

	// cutting the duck in half
	REQUIRE_THROWS_AS(ByteSlice::StringFromSlice(bytes, 2, 5, 7), InvalidInputException);
	REQUIRE_THROWS_AS(ByteSlice::StringFromSlice(bytes, 2, 5, 10), OutOfRangeException);

	vector<uint8_t> invalid {'a', 0xC3, 0x28};
	ByteBuffer invalid_bytes(invalid.data(), invalid.size());
	REQUIRE_THROWS_WITH(ByteSlice::StringFromSlice(invalid_bytes, 0, 0, 3),
	                    Catch::Contains("encountered non UTF-8 data at byte 1"));
}

TEST_CASE("First byte", "[byte_slice]") {
	vector<uint8_t> data {42, 1};
	REQUIRE(ByteSlice::FirstByte(ByteBuffer(data.data(), data.size())) == 42);
	REQUIRE_THROWS_AS(ByteSlice::FirstByte(ByteBuffer()), InvalidInputException);
	REQUIRE_THROWS_WITH(ByteSlice::FirstByte(ByteBuffer(data.data(), 0)), Catch::Contains("Received empty bytes"));
}

TEST_CASE("Byte buffer views", "[byte_slice]") {
	vector<uint8_t> data {1, 2, 3};
	ByteBuffer view(data.data(), data.size());
	uint8_t target[3] {0, 0, 0};
	view.CopyTo(target, 2);
	REQUIRE(target[0] == 1);
	REQUIRE(target[1] == 2);
	REQUIRE(target[2] == 0);
	REQUIRE_THROWS_AS(view.CopyTo(target, 4), OutOfRangeException);
	REQUIRE(view.ToVector() == data);
	REQUIRE(ByteBuffer().ToVector().empty());

	uint32_t word = 0x0A0B0C0D;
	auto word_view = ByteBuffer::FromValue(word);
	REQUIRE(word_view.len == sizeof(uint32_t));
	REQUIRE((word_view.ptr == const_data_ptr_cast(&word)));

	auto array = ByteSlice::ArrayFromSlice<2>(view, 1);
	REQUIRE(array[0] == 2);
	REQUIRE(array[1] == 3);
	REQUIRE_THROWS_AS(ByteSlice::ArrayFromSlice<2>(view, 2), OutOfRangeException);
}
