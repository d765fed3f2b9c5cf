#include "colwire/main/settings.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/helper.hpp"
#include "colwire/common/string_util.hpp"
#include "colwire/main/codec_context.hpp"

namespace colwire {

constexpr const char *EnableLoggingSetting::Name;
constexpr const char *LoggingLevelSetting::Name;
constexpr const char *LoggingStorageSetting::Name;
constexpr const char *EncoderInitialCapacitySetting::Name;

static bool ParseBoolean(const char *option, const string &input) {
	auto lower = StringUtil::Lower(input);
	if (lower == "true" || lower == "1" || lower == "on") {
		return true;
	}
	if (lower == "false" || lower == "0" || lower == "off") {
		return false;
	}
	throw InvalidConfigurationException("Invalid value \"%s\" for option \"%s\": expected a BOOLEAN", input, option);
}

static idx_t ParseUnsigned(const char *option, const string &input) {
	idx_t result;
	if (!StringUtil::TryParseUnsigned(input, result)) {
		throw InvalidConfigurationException("Invalid value \"%s\" for option \"%s\": expected a UBIGINT", input,
		                                    option);
	}
	return result;
}

//===----------------------------------------------------------------------===//
// Enable Logging
//===----------------------------------------------------------------------===//
void EnableLoggingSetting::SetGlobal(CodecContext *context, CodecConfig &config, const string &input) {
	auto enable = ParseBoolean(Name, input);
	config.options.enable_logging = enable;
	if (context) {
		context->GetLogManager().SetEnableLogging(enable);
	}
}

void EnableLoggingSetting::ResetGlobal(CodecContext *context, CodecConfig &config) {
	config.options.enable_logging = CodecConfigOptions().enable_logging;
	if (context) {
		context->GetLogManager().SetEnableLogging(config.options.enable_logging);
	}
}

string EnableLoggingSetting::GetSetting(const CodecConfig &config) {
	return config.options.enable_logging ? "true" : "false";
}

//===----------------------------------------------------------------------===//
// Logging Level
//===----------------------------------------------------------------------===//
void LoggingLevelSetting::SetGlobal(CodecContext *context, CodecConfig &config, const string &input) {
	LogLevel level;
	try {
		level = LogLevelFromString(input);
	} catch (InvalidInputException &ex) {
		throw InvalidConfigurationException("Invalid value for option \"%s\": %s", Name, ex.RawMessage());
	}
	config.options.logging_level = level;
	if (context) {
		context->GetLogManager().SetLogLevel(level);
	}
}

void LoggingLevelSetting::ResetGlobal(CodecContext *context, CodecConfig &config) {
	config.options.logging_level = CodecConfigOptions().logging_level;
	if (context) {
		context->GetLogManager().SetLogLevel(config.options.logging_level);
	}
}

string LoggingLevelSetting::GetSetting(const CodecConfig &config) {
	return LogLevelToString(config.options.logging_level);
}

//===----------------------------------------------------------------------===//
// Logging Storage
//===----------------------------------------------------------------------===//
void LoggingStorageSetting::SetGlobal(CodecContext *context, CodecConfig &config, const string &input) {
	auto storage = StringUtil::Lower(input);
	if (storage != LogConfig::IN_MEMORY_STORAGE_NAME && storage != LogConfig::STDOUT_STORAGE_NAME) {
		throw InvalidConfigurationException("Invalid value \"%s\" for option \"%s\": expected memory or stdout", input,
		                                    Name);
	}
	config.options.logging_storage = storage;
	if (context) {
		context->GetLogManager().SetLogStorage(storage);
	}
}

void LoggingStorageSetting::ResetGlobal(CodecContext *context, CodecConfig &config) {
	config.options.logging_storage = CodecConfigOptions().logging_storage;
	if (context) {
		context->GetLogManager().SetLogStorage(config.options.logging_storage);
	}
}

string LoggingStorageSetting::GetSetting(const CodecConfig &config) {
	return config.options.logging_storage;
}

//===----------------------------------------------------------------------===//
// Encoder Initial Capacity
//===----------------------------------------------------------------------===//
void EncoderInitialCapacitySetting::SetGlobal(CodecContext *context, CodecConfig &config, const string &input) {
	auto capacity = ParseUnsigned(Name, input);
	if (capacity == 0 || !IsPowerOfTwo(capacity)) {
		throw InvalidConfigurationException("Invalid value \"%s\" for option \"%s\": must be a power of two", input,
		                                    Name);
	}
	config.options.encoder_initial_capacity = capacity;
}

void EncoderInitialCapacitySetting::ResetGlobal(CodecContext *context, CodecConfig &config) {
	config.options.encoder_initial_capacity = CodecConfigOptions().encoder_initial_capacity;
}

string EncoderInitialCapacitySetting::GetSetting(const CodecConfig &config) {
	return std::to_string(config.options.encoder_initial_capacity);
}

} // namespace colwire
