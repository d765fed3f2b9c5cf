#include "colwire/codec/physical_type_traits.hpp"
#include "colwire/common/assert.hpp"
#include "colwire/common/helper.hpp"
#include "colwire/common/operator/checked_arithmetic.hpp"

namespace colwire {

constexpr const PhysicalType PhysicalTypeTraits<bool>::TYPE;
constexpr const bool PhysicalTypeTraits<bool>::IS_FIXED_WIDTH;
constexpr const PhysicalType PhysicalTypeTraits<Int96>::TYPE;
constexpr const bool PhysicalTypeTraits<Int96>::IS_FIXED_WIDTH;
constexpr const idx_t PhysicalTypeTraits<Int96>::ENCODED_SIZE;
constexpr const PhysicalType PhysicalTypeTraits<ByteArray>::TYPE;
constexpr const bool PhysicalTypeTraits<ByteArray>::IS_FIXED_WIDTH;
constexpr const PhysicalType PhysicalTypeTraits<FixedLenByteArray>::TYPE;
constexpr const bool PhysicalTypeTraits<FixedLenByteArray>::IS_FIXED_WIDTH;

//===--------------------------------------------------------------------===//
// PlainDecoderUtil
//===--------------------------------------------------------------------===//
void PlainDecoderUtil::VerifyData(const PlainDecoderState &state) {
	if (!state.data.IsSet()) {
		throw InternalException("SetData must be called before decoding");
	}
}

void PlainDecoderUtil::SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values) {
	state.data = std::move(data);
	state.start = 0;
	state.num_values = num_values;
}

idx_t PlainDecoderUtil::RequireBytes(const PlainDecoderState &state, idx_t num_values, idx_t width,
                                     const char *operation) {
	idx_t byte_count;
	if (!TryMultiplyOperator::Operation(num_values, width, byte_count) || byte_count > state.BytesLeft()) {
		throw EOFException("Not enough bytes to %s: %llu values of %llu bytes requested but only %llu bytes are left",
		                   operation, num_values, width, state.BytesLeft());
	}
	return byte_count;
}

void PlainDecoderUtil::Advance(PlainDecoderState &state, idx_t num_values, idx_t byte_count) {
	D_ASSERT(byte_count <= state.BytesLeft());
	D_ASSERT(num_values <= state.num_values);
	state.start += byte_count;
	state.num_values -= num_values;
}

//===--------------------------------------------------------------------===//
// BOOLEAN
//===--------------------------------------------------------------------===//
void PhysicalTypeTraits<bool>::Encode(const bool *values, idx_t count, WriteStream &, BitWriter &bit_writer) {
	for (idx_t i = 0; i < count; i++) {
		bit_writer.PutValue(values[i] ? 1 : 0, 1);
	}
}

void PhysicalTypeTraits<bool>::SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values) {
	state.bit_reader = make_uniq<BitReader>(std::move(data));
	state.num_values = num_values;
}

static BitReader &GetBitReader(PlainDecoderState &state) {
	if (!state.bit_reader) {
		throw InternalException("SetData must be called before decoding");
	}
	return *state.bit_reader;
}

idx_t PhysicalTypeTraits<bool>::Decode(bool *values, idx_t count, PlainDecoderState &state) {
	auto &bit_reader = GetBitReader(state);
	auto num_values = MinValue<idx_t>(count, state.num_values);
	auto values_read = bit_reader.GetBatch(values, num_values);
	state.num_values -= values_read;
	return values_read;
}

idx_t PhysicalTypeTraits<bool>::Skip(PlainDecoderState &state, idx_t count) {
	auto &bit_reader = GetBitReader(state);
	auto num_values = MinValue<idx_t>(count, state.num_values);
	auto values_skipped = bit_reader.Skip(num_values);
	state.num_values -= values_skipped;
	return values_skipped;
}

//===--------------------------------------------------------------------===//
// INT96
//===--------------------------------------------------------------------===//
static void StoreLittleEndian(uint32_t value, data_ptr_t target) {
	target[0] = value & 0xFF;
	target[1] = (value >> 8) & 0xFF;
	target[2] = (value >> 16) & 0xFF;
	target[3] = (value >> 24) & 0xFF;
}

static uint32_t LoadLittleEndian(const_data_ptr_t source) {
	return uint32_t(source[0]) | (uint32_t(source[1]) << 8) | (uint32_t(source[2]) << 16) |
	       (uint32_t(source[3]) << 24);
}

void PhysicalTypeTraits<Int96>::Encode(const Int96 *values, idx_t count, WriteStream &writer, BitWriter &) {
	data_t buffer[ENCODED_SIZE];
	for (idx_t i = 0; i < count; i++) {
		StoreLittleEndian(values[i].value[0], buffer);
		StoreLittleEndian(values[i].value[1], buffer + sizeof(uint32_t));
		StoreLittleEndian(values[i].value[2], buffer + 2 * sizeof(uint32_t));
		writer.WriteData(buffer, ENCODED_SIZE);
	}
}

void PhysicalTypeTraits<Int96>::SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values) {
	PlainDecoderUtil::SetData(state, std::move(data), num_values);
}

idx_t PhysicalTypeTraits<Int96>::Decode(Int96 *values, idx_t count, PlainDecoderState &state) {
	PlainDecoderUtil::VerifyData(state);
	auto num_values = MinValue<idx_t>(count, state.num_values);
	auto byte_count = PlainDecoderUtil::RequireBytes(state, num_values, ENCODED_SIZE, "decode");
	auto ptr = state.data.data() + state.start;
	for (idx_t i = 0; i < num_values; i++) {
		values[i].SetData(LoadLittleEndian(ptr), LoadLittleEndian(ptr + sizeof(uint32_t)),
		                  LoadLittleEndian(ptr + 2 * sizeof(uint32_t)));
		ptr += ENCODED_SIZE;
	}
	PlainDecoderUtil::Advance(state, num_values, byte_count);
	return num_values;
}

idx_t PhysicalTypeTraits<Int96>::Skip(PlainDecoderState &state, idx_t count) {
	PlainDecoderUtil::VerifyData(state);
	auto num_values = MinValue<idx_t>(count, state.num_values);
	auto byte_count = PlainDecoderUtil::RequireBytes(state, num_values, ENCODED_SIZE, "skip");
	PlainDecoderUtil::Advance(state, num_values, byte_count);
	return num_values;
}

//===--------------------------------------------------------------------===//
// BYTE_ARRAY
//===--------------------------------------------------------------------===//
void PhysicalTypeTraits<ByteArray>::Encode(const ByteArray *values, idx_t count, WriteStream &writer, BitWriter &) {
	for (idx_t i = 0; i < count; i++) {
		auto len = values[i].Length();
		if (len > NumericLimits<uint32_t>::Maximum()) {
			throw InvalidInputException("ByteArray of %llu bytes is too large for a 4-byte length prefix", len);
		}
		writer.Write<uint32_t>(static_cast<uint32_t>(len));
		writer.WriteData(values[i].GetData(), len);
	}
}

void PhysicalTypeTraits<ByteArray>::SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values) {
	PlainDecoderUtil::SetData(state, std::move(data), num_values);
}

//! Walks count length-prefixed values from the cursor, assigning them to values unless it is null.
//! The cursor is only moved once every value has been found to be complete.
static idx_t ScanByteArrays(PlainDecoderState &state, idx_t count, ByteArray *values, const char *operation) {
	PlainDecoderUtil::VerifyData(state);
	auto num_values = MinValue<idx_t>(count, state.num_values);
	auto &data = state.data;
	auto position = state.start;
	for (idx_t i = 0; i < num_values; i++) {
		if (data.size() - position < sizeof(uint32_t)) {
			throw EOFException("Not enough bytes to %s: length prefix of value %llu is truncated", operation, i);
		}
		auto len = Load<uint32_t>(data.data() + position);
		position += sizeof(uint32_t);
		if (data.size() - position < len) {
			throw EOFException("Not enough bytes to %s: value %llu needs %llu bytes but only %llu are left", operation,
			                   i, static_cast<idx_t>(len), data.size() - position);
		}
		if (values) {
			values[i].SetData(data.Slice(position, len));
		}
		position += len;
	}
	PlainDecoderUtil::Advance(state, num_values, position - state.start);
	return num_values;
}

idx_t PhysicalTypeTraits<ByteArray>::Decode(ByteArray *values, idx_t count, PlainDecoderState &state) {
	return ScanByteArrays(state, count, values, "decode");
}

idx_t PhysicalTypeTraits<ByteArray>::Skip(PlainDecoderState &state, idx_t count) {
	return ScanByteArrays(state, count, nullptr, "skip");
}

bool PhysicalTypeTraits<ByteArray>::VariableLengthBytes(const ByteArray *values, idx_t count, int64_t &result) {
	result = 0;
	for (idx_t i = 0; i < count; i++) {
		result += static_cast<int64_t>(values[i].Length());
	}
	return true;
}

//===--------------------------------------------------------------------===//
// FIXED_LEN_BYTE_ARRAY
//===--------------------------------------------------------------------===//
void PhysicalTypeTraits<FixedLenByteArray>::Encode(const FixedLenByteArray *values, idx_t count, WriteStream &writer,
                                                   BitWriter &) {
	for (idx_t i = 0; i < count; i++) {
		writer.WriteData(values[i].GetData(), values[i].Length());
	}
}

void PhysicalTypeTraits<FixedLenByteArray>::SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values) {
	PlainDecoderUtil::SetData(state, std::move(data), num_values);
}

static void VerifyTypeLength(const PlainDecoderState &state) {
	if (state.type_length == 0) {
		throw InternalException("FIXED_LEN_BYTE_ARRAY requires a type length greater than zero");
	}
}

idx_t PhysicalTypeTraits<FixedLenByteArray>::Decode(FixedLenByteArray *values, idx_t count, PlainDecoderState &state) {
	VerifyTypeLength(state);
	PlainDecoderUtil::VerifyData(state);
	auto num_values = MinValue<idx_t>(count, state.num_values);
	auto byte_count = PlainDecoderUtil::RequireBytes(state, num_values, state.type_length, "decode");
	auto position = state.start;
	for (idx_t i = 0; i < num_values; i++) {
		values[i].SetData(state.data.Slice(position, state.type_length));
		position += state.type_length;
	}
	PlainDecoderUtil::Advance(state, num_values, byte_count);
	return num_values;
}

idx_t PhysicalTypeTraits<FixedLenByteArray>::Skip(PlainDecoderState &state, idx_t count) {
	VerifyTypeLength(state);
	PlainDecoderUtil::VerifyData(state);
	auto num_values = MinValue<idx_t>(count, state.num_values);
	auto byte_count = PlainDecoderUtil::RequireBytes(state, num_values, state.type_length, "skip");
	PlainDecoderUtil::Advance(state, num_values, byte_count);
	return num_values;
}

} // namespace colwire
