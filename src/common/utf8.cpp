#include "colwire/common/utf8.hpp"
#include "colwire/common/helper.hpp"

#include <utf8proc.h>

namespace colwire {

// Well-formed byte sequences (Unicode 15, table 3-7):
//
// 	code points			byte 1	byte 2	byte 3	byte 4
//	U+0000..U+007F		00..7F
//	U+0080..U+07FF		C2..DF	80..BF
//	U+0800..U+0FFF		E0		A0..BF	80..BF
//	U+1000..U+CFFF		E1..EC	80..BF	80..BF
//	U+D000..U+D7FF		ED		80..9F	80..BF
//	U+E000..U+FFFF		EE..EF	80..BF	80..BF
//	U+10000..U+3FFFF	F0		90..BF	80..BF	80..BF
//	U+40000..U+FFFFF	F1..F3	80..BF	80..BF	80..BF
//	U+100000..U+10FFFF	F4		80..8F	80..BF	80..BF

static inline bool IsContinuation(uint8_t c) {
	return (c & 0xC0) == 0x80;
}

//! Returns the length of the sequence starting at s[i], or 0 if it is malformed
static inline idx_t ValidateSequence(const uint8_t *s, idx_t i, idx_t len) {
	const uint8_t c = s[i];
	const idx_t left = len - i;
	if (c >= 0xC2 && c <= 0xDF) {
		if (left < 2 || !IsContinuation(s[i + 1])) {
			return 0;
		}
		return 2;
	}
	if (c >= 0xE0 && c <= 0xEF) {
		if (left < 3 || !IsContinuation(s[i + 1]) || !IsContinuation(s[i + 2])) {
			return 0;
		}
		if (c == 0xE0 && s[i + 1] < 0xA0) {
			// overlong
			return 0;
		}
		if (c == 0xED && s[i + 1] > 0x9F) {
			// UTF-16 surrogate half
			return 0;
		}
		return 3;
	}
	if (c >= 0xF0 && c <= 0xF4) {
		if (left < 4 || !IsContinuation(s[i + 1]) || !IsContinuation(s[i + 2]) || !IsContinuation(s[i + 3])) {
			return 0;
		}
		if (c == 0xF0 && s[i + 1] < 0x90) {
			// overlong
			return 0;
		}
		if (c == 0xF4 && s[i + 1] > 0x8F) {
			// beyond U+10FFFF
			return 0;
		}
		return 4;
	}
	// stray continuation byte, overlong C0/C1 lead or F5..FF
	return 0;
}

UnicodeType Utf8Util::Analyze(const char *str, idx_t len) {
	auto s = reinterpret_cast<const uint8_t *>(str);
	UnicodeType type = UnicodeType::ASCII;

	static constexpr uint64_t MASK = 0x8080808080808080U;
	idx_t i = 0;
	while (i < len) {
		// check 8 bytes at a time until we hit non-ASCII
		for (; i + sizeof(uint64_t) <= len; i += sizeof(uint64_t)) {
			if (Load<uint64_t>(s + i) & MASK) {
				break;
			}
		}
		const auto end = MinValue<idx_t>(i + sizeof(uint64_t), len);
		while (i < end) {
			if ((s[i] & 0x80) == 0) {
				i++;
				continue;
			}
			auto sequence_length = ValidateSequence(s, i, len);
			if (sequence_length == 0) {
				return UnicodeType::INVALID;
			}
			type = UnicodeType::UTF8;
			i += sequence_length;
		}
	}
	return type;
}

bool Utf8Util::Verify(const char *s, idx_t len, idx_t &invalid_pos, string &error_message) {
	auto str = reinterpret_cast<const utf8proc_uint8_t *>(s);
	idx_t pos = 0;
	while (pos < len) {
		utf8proc_int32_t codepoint;
		auto remaining = static_cast<utf8proc_ssize_t>(len - pos);
		auto consumed = utf8proc_iterate(str + pos, remaining, &codepoint);
		if (consumed < 0) {
			invalid_pos = pos;
			error_message = utf8proc_errmsg(consumed);
			return false;
		}
		pos += static_cast<idx_t>(consumed);
	}
	return true;
}

} // namespace colwire
