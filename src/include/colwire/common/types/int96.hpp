//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/types/int96.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"

namespace colwire {

//! Legacy (Impala) 96-bit timestamp. The first two words hold the nanoseconds since midnight as a
//! little-endian 64-bit quantity, the last word holds the Julian day number.
struct Int96 {
	uint32_t value[3];

	Int96() : value {0, 0, 0} {
	}
	Int96(uint32_t elem0, uint32_t elem1, uint32_t elem2) : value {elem0, elem1, elem2} {
	}

	vector<uint32_t> Data() const {
		return vector<uint32_t> {value[0], value[1], value[2]};
	}
	void SetData(uint32_t elem0, uint32_t elem1, uint32_t elem2) {
		value[0] = elem0;
		value[1] = elem1;
		value[2] = elem2;
	}

	int32_t GetDays() const;
	int64_t GetNanos() const;

	//! The conversions to the Unix epoch wrap around on overflow
	int64_t ToSeconds() const;
	int64_t ToMillis() const;
	int64_t ToMicros() const;
	int64_t ToNanos() const;

	string ToString() const;

	//! Throws an InvalidInputException unless exactly three words are given
	static Int96 FromData(const vector<uint32_t> &data);
	static Int96 FromEpochNanos(int64_t nanos);

	bool operator==(const Int96 &rhs) const {
		return value[0] == rhs.value[0] && value[1] == rhs.value[1] && value[2] == rhs.value[2];
	}
	bool operator!=(const Int96 &rhs) const {
		return !(*this == rhs);
	}
	bool operator<(const Int96 &rhs) const;
	bool operator>(const Int96 &rhs) const {
		return rhs < *this;
	}
	bool operator<=(const Int96 &rhs) const {
		return !(rhs < *this);
	}
	bool operator>=(const Int96 &rhs) const {
		return !(*this < rhs);
	}
};

static_assert(sizeof(Int96) == 12, "Int96 must be exactly 12 bytes without padding");

} // namespace colwire
