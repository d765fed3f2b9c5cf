#include "colwire/common/types/plain_value.hpp"
#include "colwire/codec/physical_type_traits.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/string_util.hpp"

#include <cstring>

namespace colwire {

PlainValue::PlainValue(PhysicalType type_p) : type(type_p) {
	memset(&value_, 0, sizeof(value_));
}

PlainValue::PlainValue() : PlainValue(PhysicalType::BOOLEAN) {
}

PlainValue PlainValue::BOOLEAN(bool value) {
	PlainValue result(PhysicalType::BOOLEAN);
	result.value_.boolean = value;
	return result;
}

PlainValue PlainValue::INT32(int32_t value) {
	PlainValue result(PhysicalType::INT32);
	result.value_.int32 = value;
	return result;
}

PlainValue PlainValue::INT64(int64_t value) {
	PlainValue result(PhysicalType::INT64);
	result.value_.int64 = value;
	return result;
}

PlainValue PlainValue::INT96(const Int96 &value) {
	PlainValue result(PhysicalType::INT96);
	memcpy(result.value_.int96, value.value, sizeof(value.value));
	return result;
}

PlainValue PlainValue::FLOAT(float value) {
	PlainValue result(PhysicalType::FLOAT);
	result.value_.float_ = value;
	return result;
}

PlainValue PlainValue::DOUBLE(double value) {
	PlainValue result(PhysicalType::DOUBLE);
	result.value_.double_ = value;
	return result;
}

PlainValue PlainValue::BYTE_ARRAY(ByteArray value) {
	PlainValue result(PhysicalType::BYTE_ARRAY);
	result.bytes = std::move(value);
	return result;
}

PlainValue PlainValue::FIXED_LEN_BYTE_ARRAY(FixedLenByteArray value) {
	PlainValue result(PhysicalType::FIXED_LEN_BYTE_ARRAY);
	result.bytes = std::move(value.AsByteArray());
	return result;
}

template <>
PlainValue PlainValue::Create(bool value) {
	return PlainValue::BOOLEAN(value);
}
template <>
PlainValue PlainValue::Create(int32_t value) {
	return PlainValue::INT32(value);
}
template <>
PlainValue PlainValue::Create(int64_t value) {
	return PlainValue::INT64(value);
}
template <>
PlainValue PlainValue::Create(Int96 value) {
	return PlainValue::INT96(value);
}
template <>
PlainValue PlainValue::Create(float value) {
	return PlainValue::FLOAT(value);
}
template <>
PlainValue PlainValue::Create(double value) {
	return PlainValue::DOUBLE(value);
}
template <>
PlainValue PlainValue::Create(ByteArray value) {
	return PlainValue::BYTE_ARRAY(std::move(value));
}
template <>
PlainValue PlainValue::Create(FixedLenByteArray value) {
	return PlainValue::FIXED_LEN_BYTE_ARRAY(std::move(value));
}

void PlainValue::VerifyType(PhysicalType expected) const {
	if (type != expected) {
		throw TypeMismatchException("Cannot get %s value from a PlainValue of type %s", PhysicalTypeToString(expected),
		                            PhysicalTypeToString(type));
	}
}

template <>
bool PlainValue::GetValue() const {
	VerifyType(PhysicalType::BOOLEAN);
	return value_.boolean;
}
template <>
int32_t PlainValue::GetValue() const {
	VerifyType(PhysicalType::INT32);
	return value_.int32;
}
template <>
int64_t PlainValue::GetValue() const {
	VerifyType(PhysicalType::INT64);
	return value_.int64;
}
template <>
Int96 PlainValue::GetValue() const {
	VerifyType(PhysicalType::INT96);
	return Int96(value_.int96[0], value_.int96[1], value_.int96[2]);
}
template <>
float PlainValue::GetValue() const {
	VerifyType(PhysicalType::FLOAT);
	return value_.float_;
}
template <>
double PlainValue::GetValue() const {
	VerifyType(PhysicalType::DOUBLE);
	return value_.double_;
}
template <>
ByteArray PlainValue::GetValue() const {
	VerifyType(PhysicalType::BYTE_ARRAY);
	return bytes;
}
template <>
FixedLenByteArray PlainValue::GetValue() const {
	VerifyType(PhysicalType::FIXED_LEN_BYTE_ARRAY);
	return FixedLenByteArray(bytes);
}

int64_t PlainValue::AsInt64() const {
	switch (type) {
	case PhysicalType::BOOLEAN:
		return PhysicalTypeTraits<bool>::AsInt64(value_.boolean);
	case PhysicalType::INT32:
		return PhysicalTypeTraits<int32_t>::AsInt64(value_.int32);
	case PhysicalType::INT64:
		return PhysicalTypeTraits<int64_t>::AsInt64(value_.int64);
	case PhysicalType::INT96:
		return PhysicalTypeTraits<Int96>::AsInt64(GetValue<Int96>());
	case PhysicalType::FLOAT:
		return PhysicalTypeTraits<float>::AsInt64(value_.float_);
	case PhysicalType::DOUBLE:
		return PhysicalTypeTraits<double>::AsInt64(value_.double_);
	case PhysicalType::BYTE_ARRAY:
		return PhysicalTypeTraits<ByteArray>::AsInt64(bytes);
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		return PhysicalTypeTraits<FixedLenByteArray>::AsInt64(GetValue<FixedLenByteArray>());
	default:
		throw InternalException("Unrecognized physical type in PlainValue::AsInt64");
	}
}

uint64_t PlainValue::AsUInt64() const {
	switch (type) {
	case PhysicalType::BOOLEAN:
		return PhysicalTypeTraits<bool>::AsUInt64(value_.boolean);
	case PhysicalType::INT32:
		return PhysicalTypeTraits<int32_t>::AsUInt64(value_.int32);
	case PhysicalType::INT64:
		return PhysicalTypeTraits<int64_t>::AsUInt64(value_.int64);
	case PhysicalType::INT96:
		return PhysicalTypeTraits<Int96>::AsUInt64(GetValue<Int96>());
	case PhysicalType::FLOAT:
		return PhysicalTypeTraits<float>::AsUInt64(value_.float_);
	case PhysicalType::DOUBLE:
		return PhysicalTypeTraits<double>::AsUInt64(value_.double_);
	case PhysicalType::BYTE_ARRAY:
		return PhysicalTypeTraits<ByteArray>::AsUInt64(bytes);
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		return PhysicalTypeTraits<FixedLenByteArray>::AsUInt64(GetValue<FixedLenByteArray>());
	default:
		throw InternalException("Unrecognized physical type in PlainValue::AsUInt64");
	}
}

idx_t PlainValue::HeapSize() const {
	switch (type) {
	case PhysicalType::BYTE_ARRAY:
		return PhysicalTypeTraits<ByteArray>::HeapSize(bytes);
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		return PhysicalTypeTraits<FixedLenByteArray>::HeapSize(GetValue<FixedLenByteArray>());
	default:
		return 0;
	}
}

pair<idx_t, idx_t> PlainValue::DictEncodingSize() const {
	switch (type) {
	case PhysicalType::BOOLEAN:
		return PhysicalTypeTraits<bool>::DictEncodingSize(value_.boolean);
	case PhysicalType::INT32:
		return PhysicalTypeTraits<int32_t>::DictEncodingSize(value_.int32);
	case PhysicalType::INT64:
		return PhysicalTypeTraits<int64_t>::DictEncodingSize(value_.int64);
	case PhysicalType::INT96:
		return PhysicalTypeTraits<Int96>::DictEncodingSize(GetValue<Int96>());
	case PhysicalType::FLOAT:
		return PhysicalTypeTraits<float>::DictEncodingSize(value_.float_);
	case PhysicalType::DOUBLE:
		return PhysicalTypeTraits<double>::DictEncodingSize(value_.double_);
	case PhysicalType::BYTE_ARRAY:
		return PhysicalTypeTraits<ByteArray>::DictEncodingSize(bytes);
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		return PhysicalTypeTraits<FixedLenByteArray>::DictEncodingSize(GetValue<FixedLenByteArray>());
	default:
		throw InternalException("Unrecognized physical type in PlainValue::DictEncodingSize");
	}
}

string PlainValue::ToString() const {
	switch (type) {
	case PhysicalType::BOOLEAN:
		return value_.boolean ? "true" : "false";
	case PhysicalType::INT32:
		return std::to_string(value_.int32);
	case PhysicalType::INT64:
		return std::to_string(value_.int64);
	case PhysicalType::INT96:
		return GetValue<Int96>().ToString();
	case PhysicalType::FLOAT:
		return StringUtil::Format("%.9g", static_cast<double>(value_.float_));
	case PhysicalType::DOUBLE:
		return StringUtil::Format("%.17g", value_.double_);
	case PhysicalType::BYTE_ARRAY:
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		return bytes.ToString();
	default:
		throw InternalException("Unrecognized physical type in PlainValue::ToString");
	}
}

bool PlainValue::operator==(const PlainValue &rhs) const {
	if (type != rhs.type) {
		return false;
	}
	switch (type) {
	case PhysicalType::BOOLEAN:
		return value_.boolean == rhs.value_.boolean;
	case PhysicalType::INT32:
		return value_.int32 == rhs.value_.int32;
	case PhysicalType::INT64:
		return value_.int64 == rhs.value_.int64;
	case PhysicalType::INT96:
		return GetValue<Int96>() == rhs.GetValue<Int96>();
	case PhysicalType::FLOAT:
		return value_.float_ == rhs.value_.float_;
	case PhysicalType::DOUBLE:
		return value_.double_ == rhs.value_.double_;
	case PhysicalType::BYTE_ARRAY:
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		return bytes == rhs.bytes;
	default:
		throw InternalException("Unrecognized physical type in PlainValue::operator==");
	}
}

bool PlainValue::operator<(const PlainValue &rhs) const {
	if (type != rhs.type) {
		throw TypeMismatchException("Cannot compare PlainValue of type %s with PlainValue of type %s",
		                            PhysicalTypeToString(type), PhysicalTypeToString(rhs.type));
	}
	switch (type) {
	case PhysicalType::BOOLEAN:
		return value_.boolean < rhs.value_.boolean;
	case PhysicalType::INT32:
		return value_.int32 < rhs.value_.int32;
	case PhysicalType::INT64:
		return value_.int64 < rhs.value_.int64;
	case PhysicalType::INT96:
		return GetValue<Int96>() < rhs.GetValue<Int96>();
	case PhysicalType::FLOAT:
		return value_.float_ < rhs.value_.float_;
	case PhysicalType::DOUBLE:
		return value_.double_ < rhs.value_.double_;
	case PhysicalType::BYTE_ARRAY:
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		return bytes < rhs.bytes;
	default:
		throw InternalException("Unrecognized physical type in PlainValue::operator<");
	}
}

} // namespace colwire
