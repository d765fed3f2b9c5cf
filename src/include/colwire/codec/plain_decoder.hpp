//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/codec/plain_decoder.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/codec/physical_type_traits.hpp"
#include "colwire/codec/plain_decoder_state.hpp"
#include "colwire/common/types/plain_value.hpp"
#include "colwire/logging/logger.hpp"

namespace colwire {

//! Type-erased PLAIN decoder for one column. Obtain the typed interface with Cast<TypedPlainDecoder<T>>().
class PlainDecoder {
public:
	PlainDecoder(PhysicalType type, Logger &logger);
	virtual ~PlainDecoder();

	//! Creates the decoder for the given physical type. type_length is required for FIXED_LEN_BYTE_ARRAY.
	static unique_ptr<PlainDecoder> Create(PhysicalType type, Logger &logger, idx_t type_length = 0);

public:
	PhysicalType GetType() const {
		return type;
	}
	//! Arms the decoder with a new page holding num_values values
	virtual void SetData(SharedBuffer data, idx_t num_values) = 0;
	//! Skips up to count values, returns the number skipped
	virtual idx_t Skip(idx_t count) = 0;
	//! Decodes up to count values into PlainValues, returns the number decoded
	virtual idx_t DecodeValues(vector<PlainValue> &result, idx_t count) = 0;
	idx_t ValuesLeft() const {
		return state.num_values;
	}
	const PlainDecoderState &GetState() const {
		return state;
	}

	template <class TARGET>
	TARGET &Cast() {
		if (type != TARGET::TYPE) {
			throw TypeMismatchException("Failed to cast %s decoder to %s decoder", PhysicalTypeToString(type),
			                            PhysicalTypeToString(TARGET::TYPE));
		}
		return static_cast<TARGET &>(*this);
	}
	template <class TARGET>
	const TARGET &Cast() const {
		if (type != TARGET::TYPE) {
			throw TypeMismatchException("Failed to cast %s decoder to %s decoder", PhysicalTypeToString(type),
			                            PhysicalTypeToString(TARGET::TYPE));
		}
		return static_cast<const TARGET &>(*this);
	}
	//! Returns nullptr instead of throwing on a type mismatch
	template <class TARGET>
	TARGET *TryCast() {
		if (type != TARGET::TYPE) {
			return nullptr;
		}
		return static_cast<TARGET *>(this);
	}

protected:
	PhysicalType type;
	Logger &logger;
	PlainDecoderState state;
};

template <class T>
class TypedPlainDecoder : public PlainDecoder {
public:
	static constexpr const PhysicalType TYPE = PhysicalTypeTraits<T>::TYPE;

public:
	explicit TypedPlainDecoder(Logger &logger, idx_t type_length = 0) : PlainDecoder(TYPE, logger) {
		state.type_length = type_length;
	}

	void SetData(SharedBuffer data, idx_t num_values) override {
		COLWIRE_LOG_TRACE(logger, LogType::PLAIN_DECODER, "%s decoder armed with %llu values in %llu bytes",
		                  PhysicalTypeToString(TYPE), num_values, data.size());
		PhysicalTypeTraits<T>::SetData(state, std::move(data), num_values);
	}

	//! Decodes up to count values into values, returns the number decoded
	idx_t Decode(T *values, idx_t count) {
		return PhysicalTypeTraits<T>::Decode(values, count, state);
	}

	idx_t Skip(idx_t count) override {
		return PhysicalTypeTraits<T>::Skip(state, count);
	}

	idx_t DecodeValues(vector<PlainValue> &result, idx_t count) override {
		vector<T> values(MinValue<idx_t>(count, state.num_values));
		auto decoded = Decode(values.data(), values.size());
		for (idx_t i = 0; i < decoded; i++) {
			result.push_back(PlainValue::Create<T>(values[i]));
		}
		return decoded;
	}
};

template <class T>
constexpr const PhysicalType TypedPlainDecoder<T>::TYPE;

//! vector<bool> has no contiguous storage
template <>
idx_t TypedPlainDecoder<bool>::DecodeValues(vector<PlainValue> &result, idx_t count);

} // namespace colwire
