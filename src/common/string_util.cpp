#include "colwire/common/string_util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>

namespace colwire {

static char CharacterToLower(char c) {
	if (c >= 'A' && c <= 'Z') {
		return static_cast<char>(c - ('A' - 'a'));
	}
	return c;
}

bool StringUtil::Contains(const string &haystack, const string &needle) {
	return (haystack.find(needle) != string::npos);
}

bool StringUtil::StartsWith(const string &str, const string &prefix) {
	if (prefix.size() > str.size()) {
		return false;
	}
	return std::equal(prefix.begin(), prefix.end(), str.begin());
}

string StringUtil::Join(const vector<string> &input, const string &separator) {
	string result;
	for (idx_t i = 0; i < input.size(); i++) {
		if (i > 0) {
			result += separator;
		}
		result += input[i];
	}
	return result;
}

string StringUtil::Lower(const string &str) {
	string copy(str);
	std::transform(copy.begin(), copy.end(), copy.begin(),
	               [](unsigned char c) { return CharacterToLower(static_cast<char>(c)); });
	return (copy);
}

bool StringUtil::CIEquals(const string &l1, const string &l2) {
	if (l1.size() != l2.size()) {
		return false;
	}
	for (idx_t c = 0; c < l1.size(); c++) {
		if (CharacterToLower(l1[c]) != CharacterToLower(l2[c])) {
			return false;
		}
	}
	return true;
}

bool StringUtil::TryParseUnsigned(const string &input, idx_t &result) {
	// strtoull accepts leading whitespace and a sign, neither of which is a valid count
	if (input.empty() || input[0] < '0' || input[0] > '9') {
		return false;
	}
	char *end = nullptr;
	errno = 0;
	auto value = strtoull(input.c_str(), &end, 10);
	if (errno == ERANGE || *end != '\0') {
		return false;
	}
	result = static_cast<idx_t>(value);
	return true;
}

string StringUtil::BytesToString(const_data_ptr_t data, idx_t size) {
	string result = "[";
	for (idx_t i = 0; i < size; i++) {
		if (i > 0) {
			result += ", ";
		}
		result += std::to_string(static_cast<unsigned>(data[i]));
	}
	result += "]";
	return result;
}

} // namespace colwire
