#include "colwire/common/bit_util.hpp"
#include "colwire/common/assert.hpp"
#include "colwire/common/exception.hpp"

namespace colwire {

void BitWriter::PutValue(uint64_t value, uint8_t num_bits) {
	D_ASSERT(num_bits <= 64);
	for (uint8_t i = 0; i < num_bits; i++) {
		byte |= static_cast<uint8_t>((value >> i) & 1) << byte_pos;
		if (++byte_pos == 8) {
			buffer.push_back(byte);
			byte = 0;
			byte_pos = 0;
		}
	}
}

void BitWriter::Flush() {
	if (byte_pos > 0) {
		buffer.push_back(byte);
		byte = 0;
		byte_pos = 0;
	}
}

void BitWriter::Clear() {
	buffer.clear();
	byte = 0;
	byte_pos = 0;
}

BitReader::BitReader(SharedBuffer data_p) : data(std::move(data_p)), byte_offset(0), bit_offset(0) {
}

idx_t BitReader::BitsLeft() const {
	return (data.size() - byte_offset) * 8 - bit_offset;
}

void BitReader::CheckAvailable(idx_t count) const {
	if (count > BitsLeft()) {
		throw EOFException("Not enough bits to decode: requested %llu but only %llu are left", count, BitsLeft());
	}
}

idx_t BitReader::GetBatch(bool *values, idx_t count) {
	CheckAvailable(count);
	auto ptr = data.data();
	for (idx_t i = 0; i < count; i++) {
		values[i] = (ptr[byte_offset] >> bit_offset) & 1;
		if (++bit_offset == 8) {
			bit_offset = 0;
			byte_offset++;
		}
	}
	return count;
}

idx_t BitReader::Skip(idx_t count) {
	CheckAvailable(count);
	auto bits = bit_offset + count;
	byte_offset += bits / 8;
	bit_offset = static_cast<uint8_t>(bits % 8);
	return count;
}

} // namespace colwire
