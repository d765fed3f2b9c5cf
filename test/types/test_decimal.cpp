#include "catch.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/types/decimal.hpp"

using namespace colwire;
using namespace std;

TEST_CASE("Decimal storage", "[decimal]") {
	auto value = Decimal::FromInt32(0x01020304, 9, 2);
	REQUIRE(value.GetStorageType() == DecimalStorageType::INT32);
	REQUIRE(value.GetPrecision() == 9);
	REQUIRE(value.GetScale() == 2);
	REQUIRE(value.GetSize() == 4);
	// the unscaled value is stored big-endian
	REQUIRE(value.GetData()[0] == 0x01);
	REQUIRE(value.GetData()[3] == 0x04);

	auto negative = Decimal::FromInt64(-2, 18, 4);
	REQUIRE(negative.GetStorageType() == DecimalStorageType::INT64);
	REQUIRE(negative.GetSize() == 8);
	REQUIRE(negative.GetData()[0] == 0xFF);
	REQUIRE(negative.GetData()[7] == 0xFE);

	auto bytes = Decimal::FromBytes(ByteArray(vector<uint8_t> {0, 1, 2, 3, 4}), 10, 3);
	REQUIRE(bytes.GetStorageType() == DecimalStorageType::BYTES);
	REQUIRE(bytes.GetSize() == 5);
	REQUIRE(bytes.GetData()[4] == 4);

	REQUIRE_THROWS_AS(Decimal::FromBytes(ByteArray(), 10, 3), InvalidInputException);

	Decimal zero;
	REQUIRE(zero == Decimal::FromInt32(0, 0, 0));
	REQUIRE(zero.GetStorageType() == DecimalStorageType::INT32);
}

TEST_CASE("Decimal equality compares the raw bytes", "[decimal]") {
	REQUIRE(Decimal::FromInt32(3, 5, 2) == Decimal::FromBytes(ByteArray(vector<uint8_t> {0, 0, 0, 3}), 5, 2));
	REQUIRE(Decimal::FromInt64(3, 5, 2) == Decimal::FromBytes(ByteArray(vector<uint8_t> {0, 0, 0, 0, 0, 0, 0, 3}), 5, 2));

	// different widths are different values even if numerically equal
	REQUIRE(Decimal::FromInt64(222, 5, 2) != Decimal::FromInt32(222, 5, 2));
	// precision and scale are part of the value
	REQUIRE(Decimal::FromInt32(3, 5, 2) != Decimal::FromInt32(3, 6, 2));
	REQUIRE(Decimal::FromInt32(3, 5, 2) != Decimal::FromInt32(3, 5, 1));
	REQUIRE(Decimal::FromInt32(3, 5, 2) != Decimal::FromInt32(4, 5, 2));
}

TEST_CASE("Decimal to string", "[decimal]") {
	REQUIRE(Decimal::FromInt32(258, 5, 2).ToString() == "Decimal(precision=5, scale=2, bytes=[0, 0, 1, 2])");
}
