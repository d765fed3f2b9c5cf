#include "colwire/logging/logger.hpp"
#include "colwire/logging/log_manager.hpp"

namespace colwire {

constexpr const char *LogType::PLAIN_DECODER;
constexpr const char *LogType::PLAIN_ENCODER;
constexpr const char *LogType::CONFIG;

void Logger::WriteLog(const char *log_type, LogLevel log_level, const string &message) {
	WriteLog(log_type, log_level, message.c_str());
}

MutableLogger::MutableLogger(const LogConfig &config_p, LogManager &manager) : Logger(manager), config(config_p) {
	enabled = config.enabled;
	level = config.level;
}

void MutableLogger::UpdateConfig(const LogConfig &new_config) {
	std::unique_lock<std::mutex> lck(lock);
	config = new_config;

	// Update atomics for lock-free access
	enabled = config.enabled;
	level = config.level;
}

bool MutableLogger::ShouldLog(const char *log_type, LogLevel log_level) {
	if (!enabled) {
		return false;
	}
	// check atomic level to early out if level too low
	if (level > log_level) {
		return false;
	}
	return true;
}

void MutableLogger::WriteLog(const char *log_type, LogLevel log_level, const char *log_message) {
	manager.WriteLogEntry(log_type, log_level, log_message);
}

void MutableLogger::Flush() {
	manager.Flush();
}

} // namespace colwire
