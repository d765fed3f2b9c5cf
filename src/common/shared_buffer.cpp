#include "colwire/common/shared_buffer.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/helper.hpp"
#include "colwire/common/operator/checked_arithmetic.hpp"

namespace colwire {

static shared_ptr<data_t> AllocateBytes(idx_t len) {
	// always allocate at least one byte so that a zero-length buffer is still set
	auto bytes = make_unsafe_uniq_array_uninitialized<data_t>(MaxValue<idx_t>(len, 1));
	return shared_ptr<data_t>(bytes.release(), std::default_delete<data_t[]>());
}

SharedBuffer::SharedBuffer(const_data_ptr_t data, idx_t len) : allocation(AllocateBytes(len)), offset(0), length(len) {
	if (len > 0) {
		memcpy(allocation.get(), data, len);
	}
}

SharedBuffer::SharedBuffer(const vector<uint8_t> &bytes) : SharedBuffer(bytes.data(), bytes.size()) {
}

SharedBuffer::SharedBuffer(const string &str) : SharedBuffer(const_data_ptr_cast(str.c_str()), str.size()) {
}

SharedBuffer::SharedBuffer(shared_ptr<data_t> allocation_p, idx_t len)
    : allocation(std::move(allocation_p)), offset(0), length(len) {
	if (!allocation) {
		throw InternalException("SharedBuffer created from a null allocation");
	}
}

SharedBuffer SharedBuffer::Allocate(idx_t len) {
	return SharedBuffer(AllocateBytes(len), len);
}

SharedBuffer SharedBuffer::Slice(idx_t slice_offset, idx_t len) const {
	if (!IsSet()) {
		throw InternalException("Attempted to slice an unset SharedBuffer");
	}
	idx_t end;
	if (!TryAddOperator::Operation(slice_offset, len, end) || end > length) {
		throw OutOfRangeException("Tried to extract byte(s) %llu..%llu from %llu-byte buffer", slice_offset,
		                          slice_offset + len, length);
	}
	SharedBuffer result;
	result.allocation = allocation;
	result.offset = offset + slice_offset;
	result.length = len;
	return result;
}

SharedBuffer SharedBuffer::Slice(idx_t slice_offset) const {
	if (slice_offset > length) {
		throw OutOfRangeException("Tried to extract byte(s) %llu.. from %llu-byte buffer", slice_offset, length);
	}
	return Slice(slice_offset, length - slice_offset);
}

} // namespace colwire
