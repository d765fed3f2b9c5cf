#include "colwire/logging/log_manager.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/helper.hpp"
#include "colwire/common/string_util.hpp"

#include <chrono>

namespace colwire {

static shared_ptr<LogStorage> CreateLogStorage(const string &storage_name) {
	if (storage_name == LogConfig::IN_MEMORY_STORAGE_NAME) {
		return std::make_shared<InMemoryLogStorage>();
	}
	if (storage_name == LogConfig::STDOUT_STORAGE_NAME) {
		return std::make_shared<StdOutLogStorage>();
	}
	throw InvalidInputException("Log storage '%s' is not registered", storage_name);
}

static int64_t GetCurrentTimestamp() {
	auto now = std::chrono::system_clock::now().time_since_epoch();
	return std::chrono::duration_cast<std::chrono::microseconds>(now).count();
}

LogManager::LogManager(LogConfig config_p) : config(std::move(config_p)) {
	config.storage = StringUtil::Lower(config.storage);
	log_storage = CreateLogStorage(config.storage);
	global_logger = make_uniq<MutableLogger>(config, *this);
}

LogManager::~LogManager() {
}

Logger &LogManager::GlobalLogger() {
	return *global_logger;
}

void LogManager::WriteLogEntry(const char *log_type, LogLevel log_level, const char *log_message) {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->WriteLogEntry(GetCurrentTimestamp(), log_level, log_type, log_message);
}

void LogManager::Flush() {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->Flush();
}

shared_ptr<LogStorage> LogManager::GetLogStorage() {
	std::unique_lock<std::mutex> lck(lock);
	return log_storage;
}

void LogManager::SetEnableLogging(bool enable) {
	std::unique_lock<std::mutex> lck(lock);
	config.enabled = enable;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogLevel(LogLevel level) {
	std::unique_lock<std::mutex> lck(lock);
	config.level = level;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogStorage(const string &storage_name) {
	std::unique_lock<std::mutex> lck(lock);
	auto storage_name_to_lower = StringUtil::Lower(storage_name);

	if (config.storage == storage_name_to_lower) {
		return;
	}
	auto new_storage = CreateLogStorage(storage_name_to_lower);

	// Flush the old storage, we are going to replace it.
	log_storage->Flush();
	log_storage = std::move(new_storage);
	config.storage = storage_name_to_lower;
	global_logger->UpdateConfig(config);
}

void LogManager::TruncateLogStorage() {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->Truncate();
}

LogConfig LogManager::GetConfig() {
	std::unique_lock<std::mutex> lck(lock);
	return config;
}

} // namespace colwire
