#include "colwire/codec/physical_type.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/string_util.hpp"

namespace colwire {

struct PhysicalTypeEntry {
	PhysicalType type;
	const char *name;
};

static constexpr PhysicalTypeEntry PHYSICAL_TYPE_MAP[] = {{PhysicalType::BOOLEAN, "BOOLEAN"},
                                                          {PhysicalType::INT32, "INT32"},
                                                          {PhysicalType::INT64, "INT64"},
                                                          {PhysicalType::INT96, "INT96"},
                                                          {PhysicalType::FLOAT, "FLOAT"},
                                                          {PhysicalType::DOUBLE, "DOUBLE"},
                                                          {PhysicalType::BYTE_ARRAY, "BYTE_ARRAY"},
                                                          {PhysicalType::FIXED_LEN_BYTE_ARRAY, "FIXED_LEN_BYTE_ARRAY"}};

string PhysicalTypeToString(PhysicalType type) {
	for (auto &entry : PHYSICAL_TYPE_MAP) {
		if (entry.type == type) {
			return entry.name;
		}
	}
	return "INVALID";
}

PhysicalType PhysicalTypeFromString(const string &str) {
	vector<string> candidates;
	for (auto &entry : PHYSICAL_TYPE_MAP) {
		if (StringUtil::CIEquals(str, entry.name)) {
			return entry.type;
		}
		candidates.push_back(entry.name);
	}
	throw InvalidInputException("Unrecognized physical type \"%s\", expected one of: %s", str,
	                            StringUtil::Join(candidates, ", "));
}

bool IsFixedWidth(PhysicalType type) {
	switch (type) {
	case PhysicalType::BYTE_ARRAY:
		return false;
	default:
		return true;
	}
}

} // namespace colwire
