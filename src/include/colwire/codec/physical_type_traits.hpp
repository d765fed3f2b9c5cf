//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/codec/physical_type_traits.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/codec/physical_type.hpp"
#include "colwire/codec/plain_decoder_state.hpp"
#include "colwire/common/bit_util.hpp"
#include "colwire/common/byte_buffer.hpp"
#include "colwire/common/constants.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/serializer/write_stream.hpp"
#include "colwire/common/types/byte_array.hpp"
#include "colwire/common/types/int96.hpp"

#include <cstring>
#include <type_traits>

namespace colwire {

//! The PLAIN codec and value accounting of one physical type. Only the specializations below exist:
//! bool, int32_t, int64_t, Int96, float, double, ByteArray and FixedLenByteArray. Every specialization
//! provides
//!   TYPE, IS_FIXED_WIDTH
//!   TypeSize() -> in-memory size of one value
//!   AsBytes(const T &value) -> view over the raw bytes of the value, valid while the value is alive
//!   Encode(const T *values, idx_t count, WriteStream &writer, BitWriter &bit_writer)
//!   SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values)
//!   Decode(T *values, idx_t count, PlainDecoderState &state) -> values decoded
//!   Skip(PlainDecoderState &state, idx_t count) -> values skipped
//!   AsInt64(const T &), AsUInt64(const T &)
//!   HeapSize(const T &), DictEncodingSize(const T &)
//!   VariableLengthBytes(const T *values, idx_t count, int64_t &result)
//! Decode and Skip handle min(count, state.num_values) values, and either process all of them or throw an
//! EOFException without moving the cursor.
template <class T>
struct PhysicalTypeTraits;

//===--------------------------------------------------------------------===//
// Shared decoder helpers
//===--------------------------------------------------------------------===//
struct PlainDecoderUtil {
	//! Throws an InternalException if SetData has not been called on the state
	static void VerifyData(const PlainDecoderState &state);
	//! Resets the byte cursor to the start of data
	static void SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values);
	//! Returns num_values * width, throws an EOFException if that many bytes are not left after the cursor
	static idx_t RequireBytes(const PlainDecoderState &state, idx_t num_values, idx_t width, const char *operation);
	//! Moves the cursor forward past num_values values occupying byte_count bytes
	static void Advance(PlainDecoderState &state, idx_t num_values, idx_t byte_count);
};

//===--------------------------------------------------------------------===//
// Defaults
//===--------------------------------------------------------------------===//
template <class T>
struct PhysicalTypeTraitsBase {
	static int64_t AsInt64(const T &) {
		throw TypeMismatchException("Type cannot be converted to i64");
	}
	static uint64_t AsUInt64(const T &) {
		throw TypeMismatchException("Type cannot be converted to u64");
	}
	static idx_t HeapSize(const T &) {
		return 0;
	}
	static pair<idx_t, idx_t> DictEncodingSize(const T &) {
		return pair<idx_t, idx_t>(sizeof(T), 1);
	}
	static bool VariableLengthBytes(const T *, idx_t, int64_t &) {
		return false;
	}
};

//===--------------------------------------------------------------------===//
// Fixed-width arithmetic types
//===--------------------------------------------------------------------===//
template <class T, PhysicalType PHYSICAL_TYPE>
struct FixedWidthPhysicalTypeTraits : public PhysicalTypeTraitsBase<T> {
	static constexpr const PhysicalType TYPE = PHYSICAL_TYPE;
	static constexpr const bool IS_FIXED_WIDTH = true;

	static constexpr idx_t TypeSize() {
		return sizeof(T);
	}
	//! Native byte order, identical to the PLAIN encoding of the value
	static ByteBuffer AsBytes(const T &value) {
		return ByteBuffer::FromValue(value);
	}

	static void Encode(const T *values, idx_t count, WriteStream &writer, BitWriter &) {
		writer.WriteData(const_data_ptr_cast(values), count * sizeof(T));
	}

	static void SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values) {
		PlainDecoderUtil::SetData(state, std::move(data), num_values);
	}

	static idx_t Decode(T *values, idx_t count, PlainDecoderState &state) {
		PlainDecoderUtil::VerifyData(state);
		auto num_values = MinValue<idx_t>(count, state.num_values);
		auto byte_count = PlainDecoderUtil::RequireBytes(state, num_values, sizeof(T), "decode");
		BulkCopy(state.data.data() + state.start, values, num_values);
		PlainDecoderUtil::Advance(state, num_values, byte_count);
		return num_values;
	}

	static idx_t Skip(PlainDecoderState &state, idx_t count) {
		PlainDecoderUtil::VerifyData(state);
		auto num_values = MinValue<idx_t>(count, state.num_values);
		auto byte_count = PlainDecoderUtil::RequireBytes(state, num_values, sizeof(T), "skip");
		PlainDecoderUtil::Advance(state, num_values, byte_count);
		return num_values;
	}

private:
	//! Reads count values straight from their wire bytes. Only valid because the PLAIN encoding of an
	//! arithmetic type is its native in-memory representation: fixed width, native byte order, no padding.
	//! The caller has verified that count * sizeof(T) bytes are readable.
	static void BulkCopy(const_data_ptr_t source, T *target, idx_t count) {
		static_assert(std::is_arithmetic<T>::value && !std::is_same<T, bool>::value,
		              "bulk copy is only valid for non-boolean arithmetic types");
		if (count > 0) {
			memcpy(target, source, count * sizeof(T));
		}
	}
};

template <class T, PhysicalType PHYSICAL_TYPE>
constexpr const PhysicalType FixedWidthPhysicalTypeTraits<T, PHYSICAL_TYPE>::TYPE;
template <class T, PhysicalType PHYSICAL_TYPE>
constexpr const bool FixedWidthPhysicalTypeTraits<T, PHYSICAL_TYPE>::IS_FIXED_WIDTH;

template <>
struct PhysicalTypeTraits<int32_t> : public FixedWidthPhysicalTypeTraits<int32_t, PhysicalType::INT32> {
	static int64_t AsInt64(const int32_t &value) {
		return value;
	}
	static uint64_t AsUInt64(const int32_t &value) {
		return static_cast<uint64_t>(static_cast<int64_t>(value));
	}
};

template <>
struct PhysicalTypeTraits<int64_t> : public FixedWidthPhysicalTypeTraits<int64_t, PhysicalType::INT64> {
	static int64_t AsInt64(const int64_t &value) {
		return value;
	}
	static uint64_t AsUInt64(const int64_t &value) {
		return static_cast<uint64_t>(value);
	}
};

template <>
struct PhysicalTypeTraits<float> : public FixedWidthPhysicalTypeTraits<float, PhysicalType::FLOAT> {};

template <>
struct PhysicalTypeTraits<double> : public FixedWidthPhysicalTypeTraits<double, PhysicalType::DOUBLE> {};

//===--------------------------------------------------------------------===//
// BOOLEAN
//===--------------------------------------------------------------------===//
template <>
struct PhysicalTypeTraits<bool> : public PhysicalTypeTraitsBase<bool> {
	static constexpr const PhysicalType TYPE = PhysicalType::BOOLEAN;
	static constexpr const bool IS_FIXED_WIDTH = true;

	static constexpr idx_t TypeSize() {
		return 1;
	}
	//! A single byte holding 0 or 1. The PLAIN encoding bit-packs booleans instead.
	static ByteBuffer AsBytes(const bool &value) {
		static_assert(sizeof(bool) == 1, "bool must occupy a single byte");
		return ByteBuffer::FromValue(value);
	}

	static void Encode(const bool *values, idx_t count, WriteStream &writer, BitWriter &bit_writer);
	static void SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values);
	static idx_t Decode(bool *values, idx_t count, PlainDecoderState &state);
	static idx_t Skip(PlainDecoderState &state, idx_t count);

	static int64_t AsInt64(const bool &value) {
		return value ? 1 : 0;
	}
	static uint64_t AsUInt64(const bool &value) {
		return value ? 1 : 0;
	}
};

//===--------------------------------------------------------------------===//
// INT96
//===--------------------------------------------------------------------===//
template <>
struct PhysicalTypeTraits<Int96> : public PhysicalTypeTraitsBase<Int96> {
	static constexpr const PhysicalType TYPE = PhysicalType::INT96;
	static constexpr const bool IS_FIXED_WIDTH = true;
	static constexpr const idx_t ENCODED_SIZE = 12;

	static constexpr idx_t TypeSize() {
		return sizeof(Int96);
	}
	//! The three words in native byte order
	static ByteBuffer AsBytes(const Int96 &value) {
		return ByteBuffer::FromValue(value);
	}

	static void Encode(const Int96 *values, idx_t count, WriteStream &writer, BitWriter &bit_writer);
	static void SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values);
	static idx_t Decode(Int96 *values, idx_t count, PlainDecoderState &state);
	static idx_t Skip(PlainDecoderState &state, idx_t count);
};

//===--------------------------------------------------------------------===//
// BYTE_ARRAY
//===--------------------------------------------------------------------===//
template <>
struct PhysicalTypeTraits<ByteArray> : public PhysicalTypeTraitsBase<ByteArray> {
	static constexpr const PhysicalType TYPE = PhysicalType::BYTE_ARRAY;
	static constexpr const bool IS_FIXED_WIDTH = false;

	static constexpr idx_t TypeSize() {
		return sizeof(ByteArray);
	}
	//! The payload without the length prefix, throws an InternalException if the value is unset
	static ByteBuffer AsBytes(const ByteArray &value) {
		return ByteBuffer(value.GetData(), value.Length());
	}

	static void Encode(const ByteArray *values, idx_t count, WriteStream &writer, BitWriter &bit_writer);
	static void SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values);
	static idx_t Decode(ByteArray *values, idx_t count, PlainDecoderState &state);
	static idx_t Skip(PlainDecoderState &state, idx_t count);

	static idx_t HeapSize(const ByteArray &value) {
		return value.HeapSize();
	}
	static pair<idx_t, idx_t> DictEncodingSize(const ByteArray &value) {
		return pair<idx_t, idx_t>(sizeof(uint32_t), value.Length());
	}
	static bool VariableLengthBytes(const ByteArray *values, idx_t count, int64_t &result);
};

//===--------------------------------------------------------------------===//
// FIXED_LEN_BYTE_ARRAY
//===--------------------------------------------------------------------===//
template <>
struct PhysicalTypeTraits<FixedLenByteArray> : public PhysicalTypeTraitsBase<FixedLenByteArray> {
	static constexpr const PhysicalType TYPE = PhysicalType::FIXED_LEN_BYTE_ARRAY;
	static constexpr const bool IS_FIXED_WIDTH = true;

	static constexpr idx_t TypeSize() {
		return sizeof(FixedLenByteArray);
	}
	static ByteBuffer AsBytes(const FixedLenByteArray &value) {
		return ByteBuffer(value.GetData(), value.Length());
	}

	static void Encode(const FixedLenByteArray *values, idx_t count, WriteStream &writer, BitWriter &bit_writer);
	static void SetData(PlainDecoderState &state, SharedBuffer data, idx_t num_values);
	static idx_t Decode(FixedLenByteArray *values, idx_t count, PlainDecoderState &state);
	static idx_t Skip(PlainDecoderState &state, idx_t count);

	static idx_t HeapSize(const FixedLenByteArray &value) {
		return value.HeapSize();
	}
	static pair<idx_t, idx_t> DictEncodingSize(const FixedLenByteArray &value) {
		return pair<idx_t, idx_t>(sizeof(uint32_t), value.Length());
	}
};

} // namespace colwire
