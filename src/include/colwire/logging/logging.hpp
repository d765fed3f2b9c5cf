//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/logging/logging.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"

namespace colwire {

//! Logging levels, which can be used to filter logs
enum class LogLevel : uint8_t {
	LOG_TRACE = 10,
	LOG_DEBUG = 20,
	LOG_INFO = 30,
	LOG_WARN = 40,
	LOG_ERROR = 50,
	LOG_FATAL = 60
};

const char *LogLevelToString(LogLevel level);
//! Accepts the level names case-insensitively, with or without the "LOG_" prefix
LogLevel LogLevelFromString(const string &str);

struct LogConfig {
	constexpr static const char *IN_MEMORY_STORAGE_NAME = "memory";
	constexpr static const char *STDOUT_STORAGE_NAME = "stdout";

	constexpr static LogLevel DEFAULT_LOG_LEVEL = LogLevel::LOG_INFO;
	constexpr static const char *DEFAULT_LOG_STORAGE = IN_MEMORY_STORAGE_NAME;

	LogConfig();
	static LogConfig Create(bool enabled, LogLevel level);

	bool enabled;
	LogLevel level;
	string storage;
};

} // namespace colwire
