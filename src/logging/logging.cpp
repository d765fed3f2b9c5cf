#include "colwire/logging/logging.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/string_util.hpp"

namespace colwire {

constexpr const char *LogConfig::IN_MEMORY_STORAGE_NAME;
constexpr const char *LogConfig::STDOUT_STORAGE_NAME;
constexpr LogLevel LogConfig::DEFAULT_LOG_LEVEL;
constexpr const char *LogConfig::DEFAULT_LOG_STORAGE;

LogConfig::LogConfig() : enabled(false), level(DEFAULT_LOG_LEVEL), storage(DEFAULT_LOG_STORAGE) {
}

LogConfig LogConfig::Create(bool enabled, LogLevel level) {
	LogConfig result;
	result.enabled = enabled;
	result.level = level;
	return result;
}

struct LogLevelEntry {
	LogLevel level;
	const char *name;
};

static constexpr LogLevelEntry LOG_LEVEL_MAP[] = {{LogLevel::LOG_TRACE, "TRACE"}, {LogLevel::LOG_DEBUG, "DEBUG"},
                                                  {LogLevel::LOG_INFO, "INFO"},   {LogLevel::LOG_WARN, "WARN"},
                                                  {LogLevel::LOG_ERROR, "ERROR"}, {LogLevel::LOG_FATAL, "FATAL"}};

const char *LogLevelToString(LogLevel level) {
	for (auto &entry : LOG_LEVEL_MAP) {
		if (entry.level == level) {
			return entry.name;
		}
	}
	throw InternalException("Unrecognized log level %d", static_cast<int>(level));
}

LogLevel LogLevelFromString(const string &str) {
	auto name = StringUtil::Lower(str);
	if (StringUtil::StartsWith(name, "log_")) {
		name = name.substr(4);
	}
	for (auto &entry : LOG_LEVEL_MAP) {
		if (StringUtil::CIEquals(name, entry.name)) {
			return entry.level;
		}
	}
	throw InvalidInputException("Unrecognized log level \"%s\", expected one of TRACE, DEBUG, INFO, WARN, ERROR, FATAL",
	                            str);
}

} // namespace colwire
