#include "colwire/common/serializer/memory_stream.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/operator/checked_arithmetic.hpp"

#include <cstdlib>
#include <cstring>

namespace colwire {

constexpr idx_t MemoryStream::DEFAULT_INITIAL_CAPACITY;

MemoryStream::MemoryStream(idx_t capacity) : owns_data(true), position(0), capacity(capacity) {
	if (capacity == 0 || !IsPowerOfTwo(capacity)) {
		throw InternalException("MemoryStream capacity must be a power of two, got %llu", capacity);
	}
	data = static_cast<data_ptr_t>(malloc(capacity));
	if (!data) {
		throw SerializationException("Failed to allocate %llu bytes for MemoryStream", capacity);
	}
}

MemoryStream::MemoryStream(data_ptr_t buffer, idx_t capacity)
    : owns_data(false), position(0), capacity(capacity), data(buffer) {
}

MemoryStream::~MemoryStream() {
	if (owns_data && data) {
		free(data);
	}
}

MemoryStream::MemoryStream(MemoryStream &&other) noexcept
    : owns_data(other.owns_data), position(other.position), capacity(other.capacity), data(other.data) {
	// the moved-from stream is left empty and non-owning
	other.owns_data = false;
	other.position = 0;
	other.capacity = 0;
	other.data = nullptr;
}

void MemoryStream::WriteData(const_data_ptr_t source, idx_t write_size) {
	idx_t required;
	if (!TryAddOperator::Operation(position, write_size, required)) {
		throw SerializationException("Failed to serialize: writing %llu bytes at position %llu overflows", write_size,
		                             position);
	}
	if (required > capacity) {
		if (!owns_data) {
			throw SerializationException("Failed to serialize: not enough space in buffer to fulfill write request");
		}
		auto new_capacity = capacity;
		while (new_capacity < required) {
			if (new_capacity > NumericLimits<idx_t>::Maximum() / 2) {
				throw SerializationException("Failed to grow MemoryStream to hold %llu bytes", required);
			}
			new_capacity *= 2;
		}
		auto new_data = static_cast<data_ptr_t>(realloc(data, new_capacity));
		if (!new_data) {
			throw SerializationException("Failed to grow MemoryStream to %llu bytes", new_capacity);
		}
		data = new_data;
		capacity = new_capacity;
	}
	if (write_size > 0) {
		memcpy(data + position, source, write_size);
	}
	position = required;
}

void MemoryStream::Rewind() {
	position = 0;
}

data_ptr_t MemoryStream::GetData() const {
	return data;
}

idx_t MemoryStream::GetPosition() const {
	return position;
}

idx_t MemoryStream::GetCapacity() const {
	return capacity;
}

} // namespace colwire
