//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/byte_slice.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/byte_buffer.hpp"
#include "colwire/common/constants.hpp"

#include <array>

namespace colwire {

//! Bounds- and overflow-checked access into a flat byte buffer
class ByteSlice {
public:
	//! Returns bytes[index], throws OutOfRangeException if index is past the end
	static uint8_t Get(const ByteBuffer &bytes, idx_t index);
	//! Returns the view [start, end), throws OutOfRangeException if the range does not fit
	static ByteBuffer Slice(const ByteBuffer &bytes, idx_t start, idx_t end);
	//! Returns the view [base_offset + start, base_offset + end). Throws OverflowException if either
	//! bound cannot be computed without wrapping around, OutOfRangeException if it does not fit.
	static ByteBuffer SliceAtOffset(const ByteBuffer &bytes, idx_t base_offset, idx_t start, idx_t end);
	//! Slices like SliceAtOffset and copies out the result, which must be valid UTF-8
	static string StringFromSlice(const ByteBuffer &bytes, idx_t offset, idx_t start, idx_t end);
	//! Returns the first byte, throws InvalidInputException for an empty buffer
	static uint8_t FirstByte(const ByteBuffer &bytes);

	template <idx_t N>
	static std::array<uint8_t, N> ArrayFromSlice(const ByteBuffer &bytes, idx_t offset) {
		auto slice = SliceAtOffset(bytes, offset, 0, N);
		std::array<uint8_t, N> result;
		slice.CopyTo(result.data(), N);
		return result;
	}
};

} // namespace colwire
