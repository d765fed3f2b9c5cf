//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/operator/checked_arithmetic.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"
#include "colwire/common/helper.hpp"

namespace colwire {

struct TryAddOperator {
	//! Returns false (leaving result untouched) if left + right does not fit in an idx_t
	static inline bool Operation(idx_t left, idx_t right, idx_t &result) {
#if (__GNUC__ >= 5) || defined(__clang__)
		idx_t sum;
		if (__builtin_add_overflow(left, right, &sum)) {
			return false;
		}
		result = sum;
		return true;
#else
		if (NumericLimits<idx_t>::Maximum() - left < right) {
			return false;
		}
		result = left + right;
		return true;
#endif
	}
};

struct TryMultiplyOperator {
	//! Returns false (leaving result untouched) if left * right does not fit in an idx_t
	static inline bool Operation(idx_t left, idx_t right, idx_t &result) {
#if (__GNUC__ >= 5) || defined(__clang__)
		idx_t product;
		if (__builtin_mul_overflow(left, right, &product)) {
			return false;
		}
		result = product;
		return true;
#else
		if (left != 0 && right > NumericLimits<idx_t>::Maximum() / left) {
			return false;
		}
		result = left * right;
		return true;
#endif
	}
};

} // namespace colwire
