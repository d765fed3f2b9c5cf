#include "catch.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/serializer/memory_stream.hpp"

#include <cstring>

using namespace colwire;
using namespace std;

TEST_CASE("Memory stream grows when it owns its buffer", "[serializer]") {
	MemoryStream stream(4);
	stream.Write<int32_t>(33);
	REQUIRE(stream.GetCapacity() == 4);
	stream.Write<uint64_t>(42);
	REQUIRE(stream.GetPosition() == 12);
	REQUIRE(stream.GetCapacity() == 16);

	int32_t first;
	uint64_t second;
	memcpy(&first, stream.GetData(), sizeof(int32_t));
	memcpy(&second, stream.GetData() + sizeof(int32_t), sizeof(uint64_t));
	REQUIRE(first == 33);
	REQUIRE(second == 42);

	stream.Rewind();
	REQUIRE(stream.GetPosition() == 0);
	REQUIRE(stream.GetCapacity() == 16);

	MemoryStream moved(std::move(stream));
	REQUIRE(moved.GetCapacity() == 16);
	REQUIRE(stream.GetData() == nullptr);
}

TEST_CASE("Memory stream over a fixed buffer", "[serializer]") {
	data_t buffer[8];
	MemoryStream stream(buffer, sizeof(buffer));
	stream.Write<uint32_t>(1);
	stream.Write<uint32_t>(2);
	REQUIRE(stream.GetPosition() == 8);
	REQUIRE_THROWS_AS(stream.Write<uint8_t>(3), SerializationException);
	REQUIRE(stream.GetPosition() == 8);
	REQUIRE(stream.GetData() == buffer);
}

TEST_CASE("Memory stream capacity must be a power of two", "[serializer]") {
	REQUIRE_THROWS_AS(MemoryStream(0), InternalException);
	REQUIRE_THROWS_AS(MemoryStream(100), InternalException);
	REQUIRE_NOTHROW(MemoryStream(1));
}

TEST_CASE("Memory stream rejects sizes that overflow", "[serializer]") {
	data_t byte = 7;

	MemoryStream stream(4);
	stream.WriteData(&byte, 1);
	REQUIRE_THROWS_AS(stream.WriteData(&byte, NumericLimits<idx_t>::Maximum()), SerializationException);
	// growing past 2^63 bytes is refused before anything is allocated
	REQUIRE_THROWS_AS(stream.WriteData(&byte, (idx_t(1) << 63) + 1), SerializationException);
	REQUIRE(stream.GetPosition() == 1);
	REQUIRE(stream.GetCapacity() == 4);

	// the stream is still usable afterwards
	stream.WriteData(&byte, 1);
	REQUIRE(stream.GetPosition() == 2);
	REQUIRE(stream.GetData()[1] == 7);

	data_t buffer[2];
	MemoryStream fixed(buffer, sizeof(buffer));
	fixed.WriteData(&byte, 1);
	REQUIRE_THROWS_AS(fixed.WriteData(&byte, NumericLimits<idx_t>::Maximum()), SerializationException);
	REQUIRE(fixed.GetPosition() == 1);
}
