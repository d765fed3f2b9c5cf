#include "catch.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/helper.hpp"
#include "colwire/common/shared_buffer.hpp"

using namespace colwire;
using namespace std;

TEST_CASE("Shared buffer construction", "[shared_buffer]") {
	SharedBuffer unset;
	REQUIRE(!unset.IsSet());
	REQUIRE(unset.size() == 0);
	REQUIRE(unset.data() == nullptr);

	vector<uint8_t> no_bytes;
	SharedBuffer empty(no_bytes);
	REQUIRE(empty.IsSet());
	REQUIRE(empty.empty());

	SharedBuffer from_string(string("hello"));
	REQUIRE(from_string.size() == 5);
	REQUIRE(from_string.data()[0] == 'h');

	// the bytes are copied
	vector<uint8_t> bytes {1, 2, 3};
	SharedBuffer buffer(bytes);
	bytes[0] = 42;
	REQUIRE(buffer.data()[0] == 1);

	auto allocated = SharedBuffer::Allocate(16);
	REQUIRE(allocated.size() == 16);
	REQUIRE(allocated.UseCount() == 1);
}

TEST_CASE("Shared buffer slicing", "[shared_buffer]") {
	SharedBuffer buffer(vector<uint8_t> {0, 1, 2, 3, 4, 5, 6, 7});

	auto slice = buffer.Slice(2, 4);
	REQUIRE(slice.size() == 4);
	REQUIRE(slice.data()[0] == 2);
	REQUIRE(slice.data() == buffer.data() + 2);
	// slices share the allocation
	REQUIRE(buffer.UseCount() == 2);

	// slicing is relative to the view
	auto nested = slice.Slice(1, 2);
	REQUIRE(nested.data()[0] == 3);
	REQUIRE(nested.data()[1] == 4);
	REQUIRE(buffer.UseCount() == 3);

	auto tail = buffer.Slice(6);
	REQUIRE(tail.size() == 2);
	REQUIRE(tail.data()[1] == 7);
	REQUIRE(buffer.Slice(8).empty());

	REQUIRE_THROWS_AS(buffer.Slice(6, 3), OutOfRangeException);
	REQUIRE_THROWS_AS(slice.Slice(3, 2), OutOfRangeException);
	REQUIRE_THROWS_AS(buffer.Slice(9), OutOfRangeException);
	REQUIRE_THROWS_AS(SharedBuffer().Slice(0, 0), InternalException);

	auto view = slice.GetView();
	REQUIRE(view.len == 4);
	REQUIRE(view.ptr[3] == 5);
}

TEST_CASE("Shared buffer outlives its creator", "[shared_buffer]") {
	SharedBuffer slice;
	{
		SharedBuffer buffer(string("abcdef"));
		slice = buffer.Slice(3, 3);
	}
	REQUIRE(slice.UseCount() == 1);
	REQUIRE(string(reinterpret_cast<const char *>(slice.data()), slice.size()) == "def");
}

TEST_CASE("Array allocation helpers", "[shared_buffer]") {
	auto zeroed = make_unsafe_uniq_array<int64_t>(4);
	for (idx_t i = 0; i < 4; i++) {
		REQUIRE(zeroed[i] == 0);
	}
	auto flags = make_unsafe_uniq_array_uninitialized<bool>(3);
	flags[2] = true;
	REQUIRE(flags[2]);

	// buffers own a private copy of their bytes, even when they are empty
	string text = "duck";
	SharedBuffer buffer(text);
	text[0] = 'l';
	REQUIRE(buffer.size() == 4);
	REQUIRE(buffer.data()[0] == 'd');
	SharedBuffer empty(const_data_ptr_cast(text.c_str()), 0);
	REQUIRE(empty.IsSet());
	REQUIRE((empty.data() != nullptr));
}
