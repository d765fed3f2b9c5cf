//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/utf8.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"

namespace colwire {

enum class UnicodeType { INVALID, ASCII, UTF8 };

class Utf8Util {
public:
	//! Classifies a buffer as ASCII, UTF8 or INVALID. Skips eight ASCII bytes at a time.
	static UnicodeType Analyze(const char *s, idx_t len);

	//! Fast check that the buffer is valid UTF-8
	static bool IsValid(const char *s, idx_t len) {
		return Analyze(s, len) != UnicodeType::INVALID;
	}

	//! Walks the buffer with utf8proc. On invalid data returns false and fills in the
	//! byte offset of the offending sequence and a description of the error.
	static bool Verify(const char *s, idx_t len, idx_t &invalid_pos, string &error_message);
};

} // namespace colwire
