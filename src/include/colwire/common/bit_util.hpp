//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/bit_util.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"
#include "colwire/common/shared_buffer.hpp"

namespace colwire {

//! Packs values of up to 64 bits into bytes, least significant bit first
class BitWriter {
public:
	BitWriter() : byte(0), byte_pos(0) {
	}

	//! Appends the low num_bits bits of value
	void PutValue(uint64_t value, uint8_t num_bits);
	//! Pads the trailing partial byte with zeros and appends it
	void Flush();
	//! Number of bytes written, counting a trailing partial byte
	idx_t BytesWritten() const {
		return buffer.size() + (byte_pos > 0 ? 1 : 0);
	}
	//! The completed bytes. Call Flush() first to include a trailing partial byte.
	const vector<uint8_t> &GetBuffer() const {
		return buffer;
	}
	void Clear();

private:
	vector<uint8_t> buffer;
	uint8_t byte;
	uint8_t byte_pos;
};

//! Reads single bits from a shared buffer, least significant bit first
class BitReader {
public:
	explicit BitReader(SharedBuffer data);

	//! Reads count bits as booleans. Throws an EOFException without consuming anything if fewer remain.
	idx_t GetBatch(bool *values, idx_t count);
	//! Skips count bits. Throws an EOFException without consuming anything if fewer remain.
	idx_t Skip(idx_t count);
	idx_t BitsLeft() const;

private:
	void CheckAvailable(idx_t count) const;

private:
	SharedBuffer data;
	idx_t byte_offset;
	uint8_t bit_offset;
};

} // namespace colwire
