#include "catch.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/types/byte_array.hpp"

using namespace colwire;
using namespace std;

TEST_CASE("Byte array construction", "[byte_array]") {
	ByteArray unset;
	REQUIRE(!unset.IsSet());
	REQUIRE(unset.HeapSize() == 0);
	REQUIRE(unset.ToString() == "NULL");
	REQUIRE_THROWS_AS(unset.Length(), InternalException);
	REQUIRE_THROWS_AS(unset.IsEmpty(), InternalException);
	REQUIRE_THROWS_AS(unset.GetData(), InternalException);
	REQUIRE_THROWS_AS(unset.Slice(0, 0), InternalException);
	REQUIRE_THROWS_AS(unset.GetString(), InvalidInputException);

	ByteArray empty("");
	REQUIRE(empty.IsSet());
	REQUIRE(empty.IsEmpty());
	REQUIRE(empty.Length() == 0);
	REQUIRE(empty.GetString() == "");

	ByteArray text("parquet");
	REQUIRE(text.Length() == 7);
	REQUIRE(text.GetString() == "parquet");
	REQUIRE(text.HeapSize() == 7);
	REQUIRE(text.ToString() == "parquet");

	ByteArray bytes(vector<uint8_t> {1, 2, 3});
	REQUIRE(bytes.Length() == 3);
	REQUIRE(bytes.GetData()[2] == 3);

	unset.SetData(SharedBuffer(string("abc")));
	REQUIRE(unset.IsSet());
	REQUIRE(unset == ByteArray("abc"));
}

TEST_CASE("Byte array strings", "[byte_array][utf8]") {
	ByteArray duck("\xF0\x9F\xA6\x86");
	REQUIRE(duck.GetString() == "\xF0\x9F\xA6\x86");

	ByteArray invalid(vector<uint8_t> {0xFF, 0x00, 0x7F});
	REQUIRE_THROWS_AS(invalid.GetString(), InvalidInputException);
	REQUIRE(invalid.ToString() == "[255, 0, 127]");
}

TEST_CASE("Byte array slices share the buffer", "[byte_array]") {
	ByteArray value("hello world");
	auto slice = value.Slice(6, 5);
	REQUIRE(slice.GetString() == "world");
	REQUIRE(slice.GetData() == value.GetData() + 6);
	REQUIRE(value.GetBuffer().UseCount() == 2);
	REQUIRE_THROWS_AS(value.Slice(6, 6), OutOfRangeException);

	auto copy = value;
	REQUIRE(copy.GetData() == value.GetData());
}

TEST_CASE("Byte array ordering", "[byte_array]") {
	ByteArray unset;
	ByteArray empty("");
	ByteArray a("a");
	ByteArray ab("ab");
	ByteArray b("b");
	ByteArray high(vector<uint8_t> {0xFF});

	// unset sorts before everything else, including the empty value
	REQUIRE(unset < empty);
	REQUIRE(unset != empty);
	REQUIRE(unset == ByteArray());
	REQUIRE(empty < a);
	// a prefix sorts first
	REQUIRE(a < ab);
	REQUIRE(ab < b);
	// bytes compare unsigned
	REQUIRE(b < high);

	REQUIRE(b > a);
	REQUIRE(a <= a);
	REQUIRE(a >= a);
	REQUIRE(!(ab < a));
	REQUIRE(ByteArray::Compare(ab, ab) == 0);
	REQUIRE(ByteArray::Compare(a, b) < 0);
	REQUIRE(ByteArray::Compare(b, a) > 0);
	// equality is by content, not by buffer
	REQUIRE(ByteArray("xyz") == ByteArray(vector<uint8_t> {'x', 'y', 'z'}));
}

TEST_CASE("Fixed length byte array", "[byte_array]") {
	FixedLenByteArray unset;
	REQUIRE(!unset.IsSet());
	REQUIRE_THROWS_AS(unset.Length(), InternalException);

	FixedLenByteArray value(vector<uint8_t> {1, 2, 3, 4});
	REQUIRE(value.Length() == 4);
	REQUIRE(value.HeapSize() == 4);
	REQUIRE(value.Slice(2, 2).GetData()[0] == 3);

	ByteArray same(vector<uint8_t> {1, 2, 3, 4});
	ByteArray other(vector<uint8_t> {1, 2, 3, 5});
	REQUIRE(value == same);
	REQUIRE(same == value);
	REQUIRE(value != other);
	REQUIRE(other != value);
	REQUIRE(value < other);
	REQUIRE(!(other < value));
	REQUIRE(value.AsByteArray() == same);

	FixedLenByteArray wrapped(other);
	REQUIRE(value < wrapped);
	REQUIRE(wrapped > value);
	REQUIRE(wrapped == FixedLenByteArray(vector<uint8_t> {1, 2, 3, 5}));
}
