#include "colwire/main/config.hpp"

#include "colwire/common/assert.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/string_util.hpp"
#include "colwire/main/settings.hpp"

namespace colwire {

#define COLWIRE_GLOBAL(_PARAM)                                                                                         \
	{ _PARAM::Name, _PARAM::Description, _PARAM::InputType, _PARAM::SetGlobal, _PARAM::ResetGlobal, _PARAM::GetSetting }
#define FINAL_SETTING                                                                                                  \
	{ nullptr, nullptr, nullptr, nullptr, nullptr, nullptr }

static const ConfigurationOption internal_options[] = {
    COLWIRE_GLOBAL(EnableLoggingSetting),
    COLWIRE_GLOBAL(EncoderInitialCapacitySetting),
    COLWIRE_GLOBAL(LoggingLevelSetting),
    COLWIRE_GLOBAL(LoggingStorageSetting),
    FINAL_SETTING};

CodecConfig::CodecConfig() {
}

idx_t CodecConfig::GetOptionCount() {
	idx_t count = 0;
	for (idx_t index = 0; internal_options[index].name; index++) {
		count++;
	}
	return count;
}

vector<string> CodecConfig::GetOptionNames() {
	vector<string> names;
	for (idx_t i = 0, option_count = GetOptionCount(); i < option_count; i++) {
		names.emplace_back(GetOptionByIndex(i)->name);
	}
	return names;
}

const ConfigurationOption *CodecConfig::GetOptionByIndex(idx_t target_index) {
	for (idx_t index = 0; internal_options[index].name; index++) {
		if (index == target_index) {
			return internal_options + index;
		}
	}
	return nullptr;
}

const ConfigurationOption *CodecConfig::GetOptionByName(const string &name) {
	auto lname = StringUtil::Lower(name);
	for (idx_t index = 0; internal_options[index].name; index++) {
		D_ASSERT(StringUtil::Lower(internal_options[index].name) == string(internal_options[index].name));
		if (internal_options[index].name == lname) {
			return internal_options + index;
		}
	}
	return nullptr;
}

const ConfigurationOption &CodecConfig::GetOptionOrThrow(const string &name) const {
	auto option = GetOptionByName(name);
	if (!option) {
		throw InvalidInputException("Unrecognized configuration option \"%s\", expected one of: %s", name,
		                            StringUtil::Join(GetOptionNames(), ", "));
	}
	return *option;
}

void CodecConfig::SetOptionByName(const string &name, const string &value, CodecContext *context) {
	auto &option = GetOptionOrThrow(name);
	std::lock_guard<std::mutex> l(config_lock);
	option.set_option(context, *this, value);
}

void CodecConfig::ResetOption(const string &name, CodecContext *context) {
	auto &option = GetOptionOrThrow(name);
	std::lock_guard<std::mutex> l(config_lock);
	option.reset_option(context, *this);
}

string CodecConfig::GetOptionValue(const string &name) const {
	auto &option = GetOptionOrThrow(name);
	std::lock_guard<std::mutex> l(config_lock);
	return option.get_setting(*this);
}

LogConfig CodecConfig::GetLogConfig() const {
	std::lock_guard<std::mutex> l(config_lock);
	LogConfig result;
	result.enabled = options.enable_logging;
	result.level = options.logging_level;
	result.storage = options.logging_storage;
	return result;
}

} // namespace colwire
