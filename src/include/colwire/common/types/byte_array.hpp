//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/types/byte_array.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"
#include "colwire/common/shared_buffer.hpp"

namespace colwire {

//! A variable length byte value referencing a (possibly shared) immutable buffer. A ByteArray without
//! a buffer is unset, which is a different state from an empty ByteArray. Copies share the buffer.
class ByteArray {
public:
	ByteArray() {
	}
	explicit ByteArray(SharedBuffer data);
	explicit ByteArray(const vector<uint8_t> &bytes);
	explicit ByteArray(const string &str);
	explicit ByteArray(const char *str);
	ByteArray(const_data_ptr_t data, idx_t len);

public:
	bool IsSet() const {
		return data.IsSet();
	}
	//! Only valid once data has been set
	idx_t Length() const;
	//! Only valid once data has been set
	bool IsEmpty() const;
	//! Pointer to the bytes. Only valid once data has been set.
	const_data_ptr_t GetData() const;
	const SharedBuffer &GetBuffer() const {
		return data;
	}

	void SetData(SharedBuffer data_p) {
		data = std::move(data_p);
	}
	//! Zero-copy sub range of this value
	ByteArray Slice(idx_t start, idx_t len) const;

	//! The value as a string, throws an InvalidInputException if it is unset or not valid UTF-8
	string GetString() const;
	//! Bytes held by this value, ignoring any sharing of the underlying buffer
	idx_t HeapSize() const {
		return data.IsSet() ? data.size() : 0;
	}
	string ToString() const;

	//! Three-way comparison: unset sorts before set, set values compare by bytes
	static int Compare(const ByteArray &left, const ByteArray &right);

	bool operator==(const ByteArray &rhs) const;
	bool operator!=(const ByteArray &rhs) const {
		return !(*this == rhs);
	}
	bool operator<(const ByteArray &rhs) const {
		return Compare(*this, rhs) < 0;
	}
	bool operator>(const ByteArray &rhs) const {
		return Compare(*this, rhs) > 0;
	}
	bool operator<=(const ByteArray &rhs) const {
		return Compare(*this, rhs) <= 0;
	}
	bool operator>=(const ByteArray &rhs) const {
		return Compare(*this, rhs) >= 0;
	}

private:
	SharedBuffer data;
};

//! A byte value whose length is fixed by the column schema. Stored exactly like a ByteArray, but a
//! distinct type so that encoders and decoders are instantiated separately for it.
class FixedLenByteArray {
public:
	FixedLenByteArray() {
	}
	explicit FixedLenByteArray(ByteArray value_p) : value(std::move(value_p)) {
	}
	explicit FixedLenByteArray(const vector<uint8_t> &bytes) : value(bytes) {
	}
	FixedLenByteArray(const_data_ptr_t data, idx_t len) : value(data, len) {
	}

public:
	bool IsSet() const {
		return value.IsSet();
	}
	idx_t Length() const {
		return value.Length();
	}
	bool IsEmpty() const {
		return value.IsEmpty();
	}
	const_data_ptr_t GetData() const {
		return value.GetData();
	}
	const SharedBuffer &GetBuffer() const {
		return value.GetBuffer();
	}
	void SetData(SharedBuffer data) {
		value.SetData(std::move(data));
	}
	FixedLenByteArray Slice(idx_t start, idx_t len) const {
		return FixedLenByteArray(value.Slice(start, len));
	}
	string GetString() const {
		return value.GetString();
	}
	idx_t HeapSize() const {
		return value.HeapSize();
	}
	string ToString() const {
		return value.ToString();
	}

	const ByteArray &AsByteArray() const {
		return value;
	}
	ByteArray &AsByteArray() {
		return value;
	}

	bool operator==(const FixedLenByteArray &rhs) const {
		return value == rhs.value;
	}
	bool operator!=(const FixedLenByteArray &rhs) const {
		return value != rhs.value;
	}
	bool operator<(const FixedLenByteArray &rhs) const {
		return value < rhs.value;
	}
	bool operator>(const FixedLenByteArray &rhs) const {
		return value > rhs.value;
	}
	bool operator<=(const FixedLenByteArray &rhs) const {
		return value <= rhs.value;
	}
	bool operator>=(const FixedLenByteArray &rhs) const {
		return value >= rhs.value;
	}

private:
	ByteArray value;
};

inline bool operator==(const ByteArray &left, const FixedLenByteArray &right) {
	return left == right.AsByteArray();
}
inline bool operator==(const FixedLenByteArray &left, const ByteArray &right) {
	return left.AsByteArray() == right;
}
inline bool operator!=(const ByteArray &left, const FixedLenByteArray &right) {
	return left != right.AsByteArray();
}
inline bool operator!=(const FixedLenByteArray &left, const ByteArray &right) {
	return left.AsByteArray() != right;
}
inline bool operator<(const ByteArray &left, const FixedLenByteArray &right) {
	return left < right.AsByteArray();
}
inline bool operator<(const FixedLenByteArray &left, const ByteArray &right) {
	return left.AsByteArray() < right;
}

} // namespace colwire
