//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/types/decimal.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"
#include "colwire/common/types/byte_array.hpp"

namespace colwire {

enum class DecimalStorageType : uint8_t { INT32 = 0, INT64 = 1, BYTES = 2 };

//! Storage container for a decimal: the unscaled value in big-endian two's complement together with its
//! precision and scale. No arithmetic or precision validation is performed.
class Decimal {
public:
	//! Equivalent to Decimal::FromInt32(0, 0, 0)
	Decimal();

	static Decimal FromInt32(int32_t value, int32_t precision, int32_t scale);
	static Decimal FromInt64(int64_t value, int32_t precision, int32_t scale);
	static Decimal FromBytes(ByteArray value, int32_t precision, int32_t scale);

public:
	DecimalStorageType GetStorageType() const {
		return storage_type;
	}
	//! The raw big-endian bytes of the unscaled value
	const_data_ptr_t GetData() const;
	idx_t GetSize() const;
	ByteBuffer AsBytes() const {
		return ByteBuffer(GetData(), GetSize());
	}
	int32_t GetPrecision() const {
		return precision;
	}
	int32_t GetScale() const {
		return scale;
	}

	string ToString() const;

	//! Equal when precision, scale and the raw unscaled bytes match, regardless of storage type
	bool operator==(const Decimal &rhs) const;
	bool operator!=(const Decimal &rhs) const {
		return !(*this == rhs);
	}

private:
	Decimal(DecimalStorageType storage_type, int32_t precision, int32_t scale);

private:
	DecimalStorageType storage_type;
	int32_t precision;
	int32_t scale;
	//! INT32 and INT64 storage
	data_t inline_bytes[sizeof(int64_t)];
	//! BYTES storage
	ByteArray bytes;
};

} // namespace colwire
