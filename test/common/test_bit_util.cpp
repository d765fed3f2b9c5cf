#include "catch.hpp"
#include "colwire/common/bit_util.hpp"
#include "colwire/common/exception.hpp"

using namespace colwire;
using namespace std;

TEST_CASE("Bit writer packs least significant bit first", "[bit_util]") {
	BitWriter writer;
	// 1, 0, 1, 1, 0, 0, 0, 0, 1
	writer.PutValue(1, 1);
	writer.PutValue(0, 1);
	writer.PutValue(1, 1);
	writer.PutValue(1, 1);
	writer.PutValue(0, 4);
	REQUIRE(writer.BytesWritten() == 1);
	writer.PutValue(1, 1);
	REQUIRE(writer.BytesWritten() == 2);
	REQUIRE(writer.GetBuffer().size() == 1);

	writer.Flush();
	auto &buffer = writer.GetBuffer();
	REQUIRE(buffer.size() == 2);
	REQUIRE(buffer[0] == 0x0D);
	REQUIRE(buffer[1] == 0x01);

	writer.Clear();
	REQUIRE(writer.BytesWritten() == 0);
	writer.PutValue(0xABCD, 16);
	writer.Flush();
	REQUIRE(writer.GetBuffer().size() == 2);
	REQUIRE(writer.GetBuffer()[0] == 0xCD);
	REQUIRE(writer.GetBuffer()[1] == 0xAB);
}

TEST_CASE("Bit reader", "[bit_util]") {
	BitReader reader(SharedBuffer(vector<uint8_t> {0x0D, 0x01}));
	REQUIRE(reader.BitsLeft() == 16);

	bool values[4];
	REQUIRE(reader.GetBatch(values, 4) == 4);
	REQUIRE(values[0]);
	REQUIRE(!values[1]);
	REQUIRE(values[2]);
	REQUIRE(values[3]);
	REQUIRE(reader.BitsLeft() == 12);

	REQUIRE(reader.Skip(4) == 4);
	REQUIRE(reader.GetBatch(values, 1) == 1);
	REQUIRE(values[0]);
	REQUIRE(reader.BitsLeft() == 7);

	// nothing is consumed when there are not enough bits
	REQUIRE_THROWS_AS(reader.GetBatch(values, 8), EOFException);
	REQUIRE_THROWS_AS(reader.Skip(8), EOFException);
	REQUIRE(reader.BitsLeft() == 7);

	REQUIRE(reader.Skip(7) == 7);
	REQUIRE(reader.BitsLeft() == 0);
	REQUIRE(reader.GetBatch(values, 0) == 0);
}
