//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/string_util.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"

#include <fmt/printf.h>

namespace colwire {

//! String Utility Functions
//! Note that these are not the most efficient implementations (i.e., they copy
//! memory) and therefore they should only be used for debug messages and other
//! such things.
class StringUtil {
public:
	//! Returns true if the needle string exists in the haystack
	static bool Contains(const string &haystack, const string &needle);

	//! Returns true if the target string starts with the given prefix
	static bool StartsWith(const string &str, const string &prefix);

	//! Join multiple strings into one string. Components are concatenated by the given separator
	static string Join(const vector<string> &input, const string &separator);

	//! Convert a string to lowercase
	static string Lower(const string &str);

	//! Case insensitive equals
	static bool CIEquals(const string &l1, const string &l2);

	//! Parses a base-10 unsigned integer that spans the whole string. Returns false for empty input, signs,
	//! trailing characters and values that do not fit in an idx_t.
	static bool TryParseUnsigned(const string &input, idx_t &result);

	//! Renders a byte sequence as "[1, 2, 3]"
	static string BytesToString(const_data_ptr_t data, idx_t size);

	//! Format a string using printf semantics
	template <typename... ARGS>
	static string Format(const string &fmt_str, ARGS... params) {
		return fmt::sprintf(fmt_str, params...);
	}
};

} // namespace colwire
