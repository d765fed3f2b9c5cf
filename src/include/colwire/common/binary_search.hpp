//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/binary_search.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"

namespace colwire {

struct RangeSearchResult {
	//! Whether an entry equal to the target was found
	bool found = false;
	//! The matching index if found, otherwise the position the target would be inserted at
	idx_t index = 0;
};

//! Binary search over the index range [start, end) where the key of each index is produced by
//! try_get_key(idx, key), which may fail by returning false. A failed key extraction aborts the
//! search and TryBinarySearchRange returns false; otherwise the outcome is written to result.
//! The keys must be sorted ascending. With duplicate keys any one of the matching indexes is returned.
template <class KEY, class FUNC>
bool TryBinarySearchRange(idx_t start, idx_t end, const KEY &target, FUNC &&try_get_key, RangeSearchResult &result) {
	while (start < end) {
		auto mid = start + (end - start) / 2;
		KEY key;
		if (!try_get_key(mid, key)) {
			return false;
		}
		if (key == target) {
			result.found = true;
			result.index = mid;
			return true;
		}
		if (target < key) {
			end = mid;
		} else {
			start = mid + 1;
		}
	}
	result.found = false;
	result.index = start;
	return true;
}

} // namespace colwire
