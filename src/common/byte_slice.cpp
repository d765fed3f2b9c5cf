#include "colwire/common/byte_slice.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/operator/checked_arithmetic.hpp"
#include "colwire/common/utf8.hpp"

namespace colwire {

uint8_t ByteSlice::Get(const ByteBuffer &bytes, idx_t index) {
	if (index >= bytes.len) {
		throw OutOfRangeException("Tried to extract byte %llu from %llu-byte buffer", index, bytes.len);
	}
	return bytes.ptr[index];
}

ByteBuffer ByteSlice::Slice(const ByteBuffer &bytes, idx_t start, idx_t end) {
	if (start > end || end > bytes.len) {
		throw OutOfRangeException("Tried to extract byte(s) %llu..%llu from %llu-byte buffer", start, end, bytes.len);
	}
	return ByteBuffer(bytes.ptr + start, end - start);
}

ByteBuffer ByteSlice::SliceAtOffset(const ByteBuffer &bytes, idx_t base_offset, idx_t start, idx_t end) {
	idx_t start_byte;
	if (!TryAddOperator::Operation(base_offset, start, start_byte)) {
		throw OverflowException("Integer overflow computing slice start");
	}
	idx_t end_byte;
	if (!TryAddOperator::Operation(base_offset, end, end_byte)) {
		throw OverflowException("Integer overflow computing slice end");
	}
	return Slice(bytes, start_byte, end_byte);
}

string ByteSlice::StringFromSlice(const ByteBuffer &bytes, idx_t offset, idx_t start, idx_t end) {
	auto slice = SliceAtOffset(bytes, offset, start, end);
	auto str = const_char_ptr_cast(slice.ptr);
	if (!Utf8Util::IsValid(str, slice.len)) {
		idx_t invalid_pos;
		string error_message;
		if (!Utf8Util::Verify(str, slice.len, invalid_pos, error_message)) {
			throw InvalidInputException("encountered non UTF-8 data at byte %llu: %s", invalid_pos, error_message);
		}
		throw InvalidInputException("invalid UTF-8 string");
	}
	return string(str, slice.len);
}

uint8_t ByteSlice::FirstByte(const ByteBuffer &bytes) {
	if (bytes.len == 0) {
		throw InvalidInputException("Received empty bytes");
	}
	return bytes.ptr[0];
}

} // namespace colwire
