//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/logging/log_manager.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/logging/log_storage.hpp"
#include "colwire/logging/logger.hpp"

#include <mutex>

namespace colwire {

//! Owns the log storage and the global logger, and applies configuration changes to both
class LogManager {
public:
	explicit LogManager(LogConfig config = LogConfig());
	~LogManager();

	Logger &GlobalLogger();

	//! Called by the loggers
	void WriteLogEntry(const char *log_type, LogLevel log_level, const char *log_message);
	void Flush();

	shared_ptr<LogStorage> GetLogStorage();

	void SetEnableLogging(bool enable);
	void SetLogLevel(LogLevel level);
	//! Switches to the "memory" or "stdout" storage
	void SetLogStorage(const string &storage_name);
	void TruncateLogStorage();

	LogConfig GetConfig();

private:
	std::mutex lock;
	LogConfig config;
	shared_ptr<LogStorage> log_storage;
	unique_ptr<MutableLogger> global_logger;
};

} // namespace colwire
