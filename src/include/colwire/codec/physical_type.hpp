//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/codec/physical_type.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"

namespace colwire {

//! Wire-level storage types, numbered as in the Parquet thrift definition
enum class PhysicalType : uint8_t {
	BOOLEAN = 0,
	INT32 = 1,
	INT64 = 2,
	INT96 = 3,
	FLOAT = 4,
	DOUBLE = 5,
	BYTE_ARRAY = 6,
	FIXED_LEN_BYTE_ARRAY = 7
};

string PhysicalTypeToString(PhysicalType type);
//! Case-insensitive, throws an InvalidInputException for unknown names
PhysicalType PhysicalTypeFromString(const string &str);
//! Whether every value of the type occupies the same number of bytes on the wire
bool IsFixedWidth(PhysicalType type);

} // namespace colwire
