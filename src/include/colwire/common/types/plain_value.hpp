//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/types/plain_value.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/codec/physical_type.hpp"
#include "colwire/common/constants.hpp"
#include "colwire/common/types/byte_array.hpp"
#include "colwire/common/types/int96.hpp"

namespace colwire {

//! A single value of any physical type together with its type tag
class PlainValue {
public:
	//! A BOOLEAN false
	PlainValue();

	static PlainValue BOOLEAN(bool value);
	static PlainValue INT32(int32_t value);
	static PlainValue INT64(int64_t value);
	static PlainValue INT96(const Int96 &value);
	static PlainValue FLOAT(float value);
	static PlainValue DOUBLE(double value);
	static PlainValue BYTE_ARRAY(ByteArray value);
	static PlainValue FIXED_LEN_BYTE_ARRAY(FixedLenByteArray value);

	//! Creates a value from the in-memory type of a physical type
	template <class T>
	static PlainValue Create(T value);

public:
	PhysicalType GetType() const {
		return type;
	}
	//! Returns the value as T, throws a TypeMismatchException if T is not the in-memory type of GetType()
	template <class T>
	T GetValue() const;

	//! Only supported for BOOLEAN, INT32 and INT64, throws a TypeMismatchException otherwise
	int64_t AsInt64() const;
	uint64_t AsUInt64() const;
	idx_t HeapSize() const;
	pair<idx_t, idx_t> DictEncodingSize() const;
	string ToString() const;

	bool operator==(const PlainValue &rhs) const;
	bool operator!=(const PlainValue &rhs) const {
		return !(*this == rhs);
	}
	//! Only values of the same type can be ordered, throws a TypeMismatchException otherwise
	bool operator<(const PlainValue &rhs) const;

private:
	explicit PlainValue(PhysicalType type);
	void VerifyType(PhysicalType expected) const;

private:
	PhysicalType type;
	union Val {
		bool boolean;
		int32_t int32;
		int64_t int64;
		uint32_t int96[3];
		float float_;
		double double_;
	} value_;
	//! BYTE_ARRAY and FIXED_LEN_BYTE_ARRAY storage
	ByteArray bytes;
};

template <>
PlainValue PlainValue::Create(bool value);
template <>
PlainValue PlainValue::Create(int32_t value);
template <>
PlainValue PlainValue::Create(int64_t value);
template <>
PlainValue PlainValue::Create(Int96 value);
template <>
PlainValue PlainValue::Create(float value);
template <>
PlainValue PlainValue::Create(double value);
template <>
PlainValue PlainValue::Create(ByteArray value);
template <>
PlainValue PlainValue::Create(FixedLenByteArray value);

template <>
bool PlainValue::GetValue() const;
template <>
int32_t PlainValue::GetValue() const;
template <>
int64_t PlainValue::GetValue() const;
template <>
Int96 PlainValue::GetValue() const;
template <>
float PlainValue::GetValue() const;
template <>
double PlainValue::GetValue() const;
template <>
ByteArray PlainValue::GetValue() const;
template <>
FixedLenByteArray PlainValue::GetValue() const;

} // namespace colwire
