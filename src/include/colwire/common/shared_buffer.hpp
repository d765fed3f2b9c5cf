//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/shared_buffer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/byte_buffer.hpp"
#include "colwire/common/constants.hpp"

namespace colwire {

//! An immutable, reference counted byte allocation together with an (offset, length) view into it.
//! Copies and slices share the allocation and never copy bytes. A default constructed SharedBuffer
//! is unset, which is different from a set buffer of length zero.
class SharedBuffer {
public:
	SharedBuffer() : offset(0), length(0) {
	}

	//! Copies [data, data + len) into a fresh allocation
	SharedBuffer(const_data_ptr_t data, idx_t len);
	explicit SharedBuffer(const vector<uint8_t> &bytes);
	explicit SharedBuffer(const string &str);

	//! Wraps an allocation of the given size without copying
	SharedBuffer(shared_ptr<data_t> allocation, idx_t len);

public:
	bool IsSet() const {
		return allocation.get() != nullptr;
	}
	idx_t size() const { // NOLINT: match stl case
		return length;
	}
	bool empty() const { // NOLINT: match stl case
		return length == 0;
	}
	const_data_ptr_t data() const { // NOLINT: match stl case
		return allocation ? allocation.get() + offset : nullptr;
	}
	ByteBuffer GetView() const {
		return ByteBuffer(data(), length);
	}
	//! Number of SharedBuffer instances referencing the same allocation
	long UseCount() const {
		return allocation.use_count();
	}

	//! Zero-copy view of [offset, offset + len) relative to this view
	SharedBuffer Slice(idx_t offset, idx_t len) const;
	//! Zero-copy view of [offset, size())
	SharedBuffer Slice(idx_t offset) const;

	static SharedBuffer Allocate(idx_t len);

private:
	shared_ptr<data_t> allocation;
	idx_t offset;
	idx_t length;
};

} // namespace colwire
