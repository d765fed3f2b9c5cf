#include "colwire/logging/log_storage.hpp"
#include "colwire/common/string_util.hpp"

#include <cstdio>

namespace colwire {

void StdOutLogStorage::StdOutWriteStream::WriteData(const_data_ptr_t buffer, idx_t write_size) {
	fwrite(buffer, 1, write_size, stdout);
}

StdOutLogStorage::StdOutLogStorage() {
}

StdOutLogStorage::~StdOutLogStorage() {
}

void StdOutLogStorage::WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type,
                                     const string &log_message) {
	auto line = StringUtil::Format("%lld\t%s\t%s\t%s\n", static_cast<long long>(timestamp), LogLevelToString(level),
	                               log_type, log_message);
	stream.WriteData(const_data_ptr_cast(line.c_str()), line.size());
}

void StdOutLogStorage::Flush() {
	fflush(stdout);
}

InMemoryLogStorage::InMemoryLogStorage() {
}

InMemoryLogStorage::~InMemoryLogStorage() {
}

void InMemoryLogStorage::WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type,
                                       const string &log_message) {
	std::lock_guard<std::mutex> guard(lock);
	LogEntry entry;
	entry.timestamp = timestamp;
	entry.level = level;
	entry.log_type = log_type;
	entry.message = log_message;
	entries.push_back(std::move(entry));
}

void InMemoryLogStorage::Flush() {
	// NOP
}

void InMemoryLogStorage::Truncate() {
	std::lock_guard<std::mutex> guard(lock);
	entries.clear();
}

vector<LogEntry> InMemoryLogStorage::GetEntries() const {
	std::lock_guard<std::mutex> guard(lock);
	return entries;
}

} // namespace colwire
