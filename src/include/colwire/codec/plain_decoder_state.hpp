//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/codec/plain_decoder_state.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/bit_util.hpp"
#include "colwire/common/constants.hpp"
#include "colwire/common/shared_buffer.hpp"

namespace colwire {

//! Decode progress of one PLAIN page, owned by the caller and threaded through the Decode and Skip calls
//! of PhysicalTypeTraits. Armed by SetData and only moved forward afterwards.
struct PlainDecoderState {
	//! The page data (unused for BOOLEAN, which reads through bit_reader)
	SharedBuffer data;
	//! Byte offset of the next value in data
	idx_t start = 0;
	//! Values that have not been decoded or skipped yet
	idx_t num_values = 0;
	//! Byte width of a FIXED_LEN_BYTE_ARRAY value, supplied by the column schema
	idx_t type_length = 0;
	//! Bit cursor for BOOLEAN data
	unique_ptr<BitReader> bit_reader;

	//! Bytes of data after the cursor
	idx_t BytesLeft() const {
		return data.size() - start;
	}
};

} // namespace colwire
