//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/codec/plain_encoder.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/codec/physical_type_traits.hpp"
#include "colwire/common/bit_util.hpp"
#include "colwire/common/serializer/memory_stream.hpp"
#include "colwire/common/types/plain_value.hpp"
#include "colwire/logging/logger.hpp"

namespace colwire {

//! Type-erased PLAIN encoder for one column. Obtain the typed interface with Cast<TypedPlainEncoder<T>>().
class PlainEncoder {
public:
	PlainEncoder(PhysicalType type, Logger &logger);
	virtual ~PlainEncoder();

	static unique_ptr<PlainEncoder> Create(PhysicalType type, Logger &logger,
	                                       idx_t initial_capacity = MemoryStream::DEFAULT_INITIAL_CAPACITY);

public:
	PhysicalType GetType() const {
		return type;
	}
	//! Appends values, which must all be of the encoder's type
	virtual void PutValues(const vector<PlainValue> &values) = 0;
	//! Bytes that FlushBuffer would currently return
	virtual idx_t EstimatedDataEncodedSize() const = 0;
	//! Returns the encoded page and resets the encoder
	virtual SharedBuffer FlushBuffer() = 0;

	template <class TARGET>
	TARGET &Cast() {
		if (type != TARGET::TYPE) {
			throw TypeMismatchException("Failed to cast %s encoder to %s encoder", PhysicalTypeToString(type),
			                            PhysicalTypeToString(TARGET::TYPE));
		}
		return static_cast<TARGET &>(*this);
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
};

template <class T>
class TypedPlainEncoder : public PlainEncoder {
public:
	static constexpr const PhysicalType TYPE = PhysicalTypeTraits<T>::TYPE;

public:
	explicit TypedPlainEncoder(Logger &logger, idx_t initial_capacity = MemoryStream::DEFAULT_INITIAL_CAPACITY)
	    : PlainEncoder(TYPE, logger), stream(initial_capacity) {
	}

	void Put(const T *values, idx_t count) {
		PhysicalTypeTraits<T>::Encode(values, count, stream, bit_writer);
	}

	void PutValues(const vector<PlainValue> &values) override {
		for (auto &value : values) {
			auto typed_value = value.GetValue<T>();
			Put(&typed_value, 1);
		}
	}

	idx_t EstimatedDataEncodedSize() const override {
		return stream.GetPosition() + bit_writer.BytesWritten();
	}

	SharedBuffer FlushBuffer() override {
		bit_writer.Flush();
		auto &bits = bit_writer.GetBuffer();
		if (!bits.empty()) {
			stream.WriteData(bits.data(), bits.size());
		}
		SharedBuffer result(stream.GetData(), stream.GetPosition());
		COLWIRE_LOG_DEBUG(logger, LogType::PLAIN_ENCODER, "%s encoder flushed %llu bytes", PhysicalTypeToString(TYPE),
		                  result.size());
		stream.Rewind();
		bit_writer.Clear();
		return result;
	}

private:
	MemoryStream stream;
	BitWriter bit_writer;
};

template <class T>
constexpr const PhysicalType TypedPlainEncoder<T>::TYPE;

} // namespace colwire
