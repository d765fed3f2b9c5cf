#include "colwire/common/types/byte_array.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/string_util.hpp"
#include "colwire/common/utf8.hpp"

#include <cstring>

namespace colwire {

ByteArray::ByteArray(SharedBuffer data_p) : data(std::move(data_p)) {
}

ByteArray::ByteArray(const vector<uint8_t> &bytes) : data(bytes) {
}

ByteArray::ByteArray(const string &str) : data(str) {
}

ByteArray::ByteArray(const char *str) : data(const_data_ptr_cast(str), strlen(str)) {
}

ByteArray::ByteArray(const_data_ptr_t data_p, idx_t len) : data(data_p, len) {
}

idx_t ByteArray::Length() const {
	if (!data.IsSet()) {
		throw InternalException("Length() called on a ByteArray whose data has not been set");
	}
	return data.size();
}

bool ByteArray::IsEmpty() const {
	if (!data.IsSet()) {
		throw InternalException("IsEmpty() called on a ByteArray whose data has not been set");
	}
	return data.empty();
}

const_data_ptr_t ByteArray::GetData() const {
	if (!data.IsSet()) {
		throw InternalException("Can't access data of a ByteArray whose data has not been set");
	}
	return data.data();
}

ByteArray ByteArray::Slice(idx_t start, idx_t len) const {
	if (!data.IsSet()) {
		throw InternalException("Can't slice a ByteArray whose data has not been set");
	}
	return ByteArray(data.Slice(start, len));
}

string ByteArray::GetString() const {
	if (!data.IsSet()) {
		throw InvalidInputException("Can't convert an unset ByteArray to a string");
	}
	auto str = const_char_ptr_cast(data.data());
	if (!Utf8Util::IsValid(str, data.size())) {
		throw InvalidInputException("ByteArray is not valid UTF-8");
	}
	return string(str, data.size());
}

string ByteArray::ToString() const {
	if (!data.IsSet()) {
		return "NULL";
	}
	auto str = const_char_ptr_cast(data.data());
	if (Utf8Util::IsValid(str, data.size())) {
		return string(str, data.size());
	}
	return StringUtil::BytesToString(data.data(), data.size());
}

int ByteArray::Compare(const ByteArray &left, const ByteArray &right) {
	if (!left.IsSet() || !right.IsSet()) {
		// unset sorts before set
		return int(left.IsSet()) - int(right.IsSet());
	}
	auto left_len = left.data.size();
	auto right_len = right.data.size();
	auto min_len = MinValue<idx_t>(left_len, right_len);
	if (min_len > 0) {
		auto cmp = memcmp(left.data.data(), right.data.data(), min_len);
		if (cmp != 0) {
			return cmp < 0 ? -1 : 1;
		}
	}
	if (left_len == right_len) {
		return 0;
	}
	return left_len < right_len ? -1 : 1;
}

bool ByteArray::operator==(const ByteArray &rhs) const {
	return Compare(*this, rhs) == 0;
}

} // namespace colwire
