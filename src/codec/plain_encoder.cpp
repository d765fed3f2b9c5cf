#include "colwire/codec/plain_encoder.hpp"
#include "colwire/common/helper.hpp"

namespace colwire {

PlainEncoder::PlainEncoder(PhysicalType type_p, Logger &logger_p) : type(type_p), logger(logger_p) {
}

PlainEncoder::~PlainEncoder() {
}

unique_ptr<PlainEncoder> PlainEncoder::Create(PhysicalType type, Logger &logger, idx_t initial_capacity) {
	switch (type) {
	case PhysicalType::BOOLEAN:
		return make_uniq<TypedPlainEncoder<bool>>(logger, initial_capacity);
	case PhysicalType::INT32:
		return make_uniq<TypedPlainEncoder<int32_t>>(logger, initial_capacity);
	case PhysicalType::INT64:
		return make_uniq<TypedPlainEncoder<int64_t>>(logger, initial_capacity);
	case PhysicalType::INT96:
		return make_uniq<TypedPlainEncoder<Int96>>(logger, initial_capacity);
	case PhysicalType::FLOAT:
		return make_uniq<TypedPlainEncoder<float>>(logger, initial_capacity);
	case PhysicalType::DOUBLE:
		return make_uniq<TypedPlainEncoder<double>>(logger, initial_capacity);
	case PhysicalType::BYTE_ARRAY:
		return make_uniq<TypedPlainEncoder<ByteArray>>(logger, initial_capacity);
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		return make_uniq<TypedPlainEncoder<FixedLenByteArray>>(logger, initial_capacity);
	default:
		throw NotImplementedException("No PLAIN encoder for physical type %s", PhysicalTypeToString(type));
	}
}

} // namespace colwire
