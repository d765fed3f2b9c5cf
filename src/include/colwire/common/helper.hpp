//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/helper.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"

#include <cstring>
#include <limits>
#include <type_traits>

namespace colwire {

template <class T, class... ARGS>
unique_ptr<T> make_uniq(ARGS &&...args) { // NOLINT: mimic std style
	return unique_ptr<T>(new T(std::forward<ARGS>(args)...));
}

template <class T>
using unsafe_unique_array = unique_ptr<T[]>;

//! Value-initialized array of n elements
template <class T>
unsafe_unique_array<T> make_unsafe_uniq_array(idx_t n) { // NOLINT: mimic std style
	return unsafe_unique_array<T>(new T[n]());
}

template <class T>
unsafe_unique_array<T> make_unsafe_uniq_array_uninitialized(idx_t n) { // NOLINT: mimic std style
	return unsafe_unique_array<T>(new T[n]);
}

template <class T>
T MaxValue(T a, T b) {
	return a > b ? a : b;
}

template <class T>
T MinValue(T a, T b) {
	return a < b ? a : b;
}

template <class T>
struct NumericLimits {
	static constexpr T Minimum() {
		return std::numeric_limits<T>::lowest();
	}
	static constexpr T Maximum() {
		return std::numeric_limits<T>::max();
	}
};

template <class SRC>
data_ptr_t data_ptr_cast(SRC *src) { // NOLINT: naming
	return reinterpret_cast<data_ptr_t>(src);
}

template <class SRC>
const_data_ptr_t const_data_ptr_cast(const SRC *src) { // NOLINT: naming
	return reinterpret_cast<const_data_ptr_t>(src);
}

template <class SRC>
const char *const_char_ptr_cast(const SRC *src) { // NOLINT: naming
	return reinterpret_cast<const char *>(src);
}

//! Unaligned load of a trivially copyable value in native byte order
template <class T>
T Load(const_data_ptr_t ptr) {
	T ret;
	memcpy(&ret, ptr, sizeof(ret)); // NOLINT
	return ret;
}

//! Unaligned store of a trivially copyable value in native byte order
template <class T>
void Store(const T &val, data_ptr_t ptr) {
	memcpy(ptr, (void *)&val, sizeof(val)); // NOLINT
}

static inline bool IsPowerOfTwo(uint64_t v) {
	return (v & (v - 1)) == 0;
}

} // namespace colwire
