#include "colwire/common/types/decimal.hpp"
#include "colwire/common/exception.hpp"

#include <cstring>
#include <type_traits>

namespace colwire {

template <class T>
static void StoreBigEndian(T input, data_ptr_t result) {
	auto value = static_cast<uint64_t>(static_cast<typename std::make_unsigned<T>::type>(input));
	for (idx_t i = 0; i < sizeof(T); i++) {
		auto shift_count = (sizeof(T) - i - 1) * 8;
		result[i] = (value >> shift_count) & 0xFF;
	}
}

Decimal::Decimal(DecimalStorageType storage_type_p, int32_t precision_p, int32_t scale_p)
    : storage_type(storage_type_p), precision(precision_p), scale(scale_p), inline_bytes {0} {
}

Decimal::Decimal() : Decimal(DecimalStorageType::INT32, 0, 0) {
}

Decimal Decimal::FromInt32(int32_t value, int32_t precision, int32_t scale) {
	Decimal result(DecimalStorageType::INT32, precision, scale);
	StoreBigEndian<int32_t>(value, result.inline_bytes);
	return result;
}

Decimal Decimal::FromInt64(int64_t value, int32_t precision, int32_t scale) {
	Decimal result(DecimalStorageType::INT64, precision, scale);
	StoreBigEndian<int64_t>(value, result.inline_bytes);
	return result;
}

Decimal Decimal::FromBytes(ByteArray value, int32_t precision, int32_t scale) {
	if (!value.IsSet()) {
		throw InvalidInputException("Decimal bytes must be set");
	}
	Decimal result(DecimalStorageType::BYTES, precision, scale);
	result.bytes = std::move(value);
	return result;
}

const_data_ptr_t Decimal::GetData() const {
	switch (storage_type) {
	case DecimalStorageType::INT32:
	case DecimalStorageType::INT64:
		return inline_bytes;
	case DecimalStorageType::BYTES:
		return bytes.GetData();
	default:
		throw InternalException("Unrecognized decimal storage type");
	}
}

idx_t Decimal::GetSize() const {
	switch (storage_type) {
	case DecimalStorageType::INT32:
		return sizeof(int32_t);
	case DecimalStorageType::INT64:
		return sizeof(int64_t);
	case DecimalStorageType::BYTES:
		return bytes.Length();
	default:
		throw InternalException("Unrecognized decimal storage type");
	}
}

string Decimal::ToString() const {
	return StringUtil::Format("Decimal(precision=%d, scale=%d, bytes=%s)", precision, scale,
	                          StringUtil::BytesToString(GetData(), GetSize()));
}

bool Decimal::operator==(const Decimal &rhs) const {
	if (precision != rhs.precision || scale != rhs.scale) {
		return false;
	}
	auto size = GetSize();
	if (size != rhs.GetSize()) {
		return false;
	}
	return size == 0 || memcmp(GetData(), rhs.GetData(), size) == 0;
}

} // namespace colwire
