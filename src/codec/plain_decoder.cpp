#include "colwire/codec/plain_decoder.hpp"
#include "colwire/common/helper.hpp"

namespace colwire {

PlainDecoder::PlainDecoder(PhysicalType type_p, Logger &logger_p) : type(type_p), logger(logger_p) {
}

PlainDecoder::~PlainDecoder() {
}

template <>
idx_t TypedPlainDecoder<bool>::DecodeValues(vector<PlainValue> &result, idx_t count) {
	auto num_values = MinValue<idx_t>(count, state.num_values);
	auto values = make_unsafe_uniq_array_uninitialized<bool>(MaxValue<idx_t>(num_values, 1));
	auto decoded = Decode(values.get(), num_values);
	for (idx_t i = 0; i < decoded; i++) {
		result.push_back(PlainValue::BOOLEAN(values[i]));
	}
	return decoded;
}

unique_ptr<PlainDecoder> PlainDecoder::Create(PhysicalType type, Logger &logger, idx_t type_length) {
	switch (type) {
	case PhysicalType::BOOLEAN:
		return make_uniq<TypedPlainDecoder<bool>>(logger);
	case PhysicalType::INT32:
		return make_uniq<TypedPlainDecoder<int32_t>>(logger);
	case PhysicalType::INT64:
		return make_uniq<TypedPlainDecoder<int64_t>>(logger);
	case PhysicalType::INT96:
		return make_uniq<TypedPlainDecoder<Int96>>(logger);
	case PhysicalType::FLOAT:
		return make_uniq<TypedPlainDecoder<float>>(logger);
	case PhysicalType::DOUBLE:
		return make_uniq<TypedPlainDecoder<double>>(logger);
	case PhysicalType::BYTE_ARRAY:
		return make_uniq<TypedPlainDecoder<ByteArray>>(logger);
	case PhysicalType::FIXED_LEN_BYTE_ARRAY:
		if (type_length == 0) {
			throw InvalidInputException("FIXED_LEN_BYTE_ARRAY decoder requires a type length greater than zero");
		}
		return make_uniq<TypedPlainDecoder<FixedLenByteArray>>(logger, type_length);
	default:
		throw NotImplementedException("No PLAIN decoder for physical type %s", PhysicalTypeToString(type));
	}
}

} // namespace colwire
