//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/logging/logger.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/string_util.hpp"
#include "colwire/logging/logging.hpp"

#include <atomic>
#include <mutex>

namespace colwire {

class LogManager;

//! Main logging interface
class Logger {
public:
	explicit Logger(LogManager &manager) : manager(manager) {
	}
	virtual ~Logger() {
	}

	virtual bool ShouldLog(const char *log_type, LogLevel log_level) = 0;
	virtual void WriteLog(const char *log_type, LogLevel log_level, const char *message) = 0;
	void WriteLog(const char *log_type, LogLevel log_level, const string &message);
	virtual void Flush() = 0;

	//! Formats the message printf-style and writes it if the logger accepts the type and level
	template <typename... ARGS>
	void Log(const char *log_type, LogLevel log_level, const char *format_string, ARGS... params) {
		if (!ShouldLog(log_type, log_level)) {
			return;
		}
		auto message = StringUtil::Format(format_string, params...);
		WriteLog(log_type, log_level, message);
	}

protected:
	LogManager &manager;
};

//! Logger whose settings follow the LogManager configuration
class MutableLogger : public Logger {
public:
	MutableLogger(const LogConfig &config, LogManager &manager);

	//! Apply a new configuration
	void UpdateConfig(const LogConfig &new_config);

	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override;
	using Logger::WriteLog;
	void Flush() override;

protected:
	std::mutex lock;
	LogConfig config;

	//! Copies of the settings for lock-free checks
	std::atomic<bool> enabled;
	std::atomic<LogLevel> level;
};

//! Logger that drops everything
class NopLogger : public Logger {
public:
	explicit NopLogger(LogManager &manager) : Logger(manager) {
	}
	bool ShouldLog(const char *log_type, LogLevel log_level) override {
		return false;
	}
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override {};
	using Logger::WriteLog;
	void Flush() override {
	}
};

// Log types of the codec layer
struct LogType {
	constexpr static const char *PLAIN_DECODER = "colwire.PlainDecoder";
	constexpr static const char *PLAIN_ENCODER = "colwire.PlainEncoder";
	constexpr static const char *CONFIG = "colwire.Config";
};

//! The message is only formatted if the logger accepts the type and level
#define COLWIRE_LOG_INTERNAL(LOGGER, TYPE, LEVEL, ...)                                                                 \
	{ (LOGGER).Log(TYPE, LEVEL, __VA_ARGS__); }

#define COLWIRE_LOG_TRACE(LOGGER, TYPE, ...) COLWIRE_LOG_INTERNAL(LOGGER, TYPE, colwire::LogLevel::LOG_TRACE, __VA_ARGS__)
#define COLWIRE_LOG_DEBUG(LOGGER, TYPE, ...) COLWIRE_LOG_INTERNAL(LOGGER, TYPE, colwire::LogLevel::LOG_DEBUG, __VA_ARGS__)
#define COLWIRE_LOG_INFO(LOGGER, TYPE, ...)  COLWIRE_LOG_INTERNAL(LOGGER, TYPE, colwire::LogLevel::LOG_INFO, __VA_ARGS__)
#define COLWIRE_LOG_WARN(LOGGER, TYPE, ...)  COLWIRE_LOG_INTERNAL(LOGGER, TYPE, colwire::LogLevel::LOG_WARN, __VA_ARGS__)
#define COLWIRE_LOG_ERROR(LOGGER, TYPE, ...) COLWIRE_LOG_INTERNAL(LOGGER, TYPE, colwire::LogLevel::LOG_ERROR, __VA_ARGS__)

} // namespace colwire
