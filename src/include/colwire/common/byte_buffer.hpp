//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/byte_buffer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/helper.hpp"

#include <type_traits>

namespace colwire {

//! Non-owning view over immutable bytes. The viewed memory must outlive the view.
struct ByteBuffer {
	ByteBuffer() : ptr(nullptr), len(0) {
	}
	ByteBuffer(const_data_ptr_t ptr, idx_t len) : ptr(ptr), len(len) {
	}

	const_data_ptr_t ptr;
	idx_t len;

public:
	//! The in-memory bytes of a trivially copyable value
	template <class T>
	static ByteBuffer FromValue(const T &value) {
		static_assert(std::is_trivially_copyable<T>::value, "FromValue requires a trivially copyable type");
		return ByteBuffer(const_data_ptr_cast(&value), sizeof(T));
	}

	//! Copies the first count bytes to target, throws an OutOfRangeException if the view is shorter
	void CopyTo(data_ptr_t target, idx_t count) const {
		if (count > len) {
			throw OutOfRangeException("Tried to copy %llu bytes from %llu-byte buffer", count, len);
		}
		if (count > 0) {
			memcpy(target, ptr, count);
		}
	}

	vector<uint8_t> ToVector() const {
		return vector<uint8_t>(ptr, ptr + len);
	}
};

} // namespace colwire
