#include "catch.hpp"
#include "colwire/codec/physical_type.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/string_util.hpp"

using namespace colwire;
using namespace std;

TEST_CASE("Physical type names", "[physical_type]") {
	vector<PhysicalType> types {PhysicalType::BOOLEAN,   PhysicalType::INT32,
	                            PhysicalType::INT64,     PhysicalType::INT96,
	                            PhysicalType::FLOAT,     PhysicalType::DOUBLE,
	                            PhysicalType::BYTE_ARRAY, PhysicalType::FIXED_LEN_BYTE_ARRAY};
	for (idx_t i = 0; i < types.size(); i++) {
		// thrift numbering
		REQUIRE(static_cast<idx_t>(types[i]) == i);
		auto name = PhysicalTypeToString(types[i]);
		REQUIRE(PhysicalTypeFromString(name) == types[i]);
		REQUIRE(PhysicalTypeFromString(StringUtil::Lower(name)) == types[i]);
	}
	REQUIRE(PhysicalTypeToString(PhysicalType::FIXED_LEN_BYTE_ARRAY) == "FIXED_LEN_BYTE_ARRAY");
	REQUIRE(PhysicalTypeFromString("Int96") == PhysicalType::INT96);

	REQUIRE_THROWS_AS(PhysicalTypeFromString("VARCHAR"), InvalidInputException);
	REQUIRE_THROWS_WITH(PhysicalTypeFromString("INT16"), Catch::Contains("expected one of: BOOLEAN, INT32"));
}

TEST_CASE("Physical type widths", "[physical_type]") {
	REQUIRE(IsFixedWidth(PhysicalType::BOOLEAN));
	REQUIRE(IsFixedWidth(PhysicalType::INT96));
	REQUIRE(IsFixedWidth(PhysicalType::FIXED_LEN_BYTE_ARRAY));
	REQUIRE(!IsFixedWidth(PhysicalType::BYTE_ARRAY));
}
