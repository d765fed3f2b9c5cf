//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/logging/log_storage.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/serializer/write_stream.hpp"
#include "colwire/logging/logging.hpp"

#include <mutex>

namespace colwire {

struct LogEntry {
	//! Microseconds since the Unix epoch
	int64_t timestamp;
	LogLevel level;
	string log_type;
	string message;
};

//! Interface for writing log entries
class LogStorage {
public:
	virtual ~LogStorage() {
	}

	//! WRITING
	virtual void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &log_message) = 0;
	virtual void Flush() = 0;
	//! Removes all stored entries
	virtual void Truncate() {
	}
};

//! Prints every entry as a tab separated line
class StdOutLogStorage : public LogStorage {
public:
	StdOutLogStorage();
	~StdOutLogStorage() override;

	void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &log_message) override;
	void Flush() override;

private:
	class StdOutWriteStream : public WriteStream {
	public:
		void WriteData(const_data_ptr_t buffer, idx_t write_size) override;
	};

	StdOutWriteStream stream;
};

//! Keeps every entry in memory, mainly to allow inspecting them in tests
class InMemoryLogStorage : public LogStorage {
public:
	InMemoryLogStorage();
	~InMemoryLogStorage() override;

	void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &log_message) override;
	void Flush() override;
	void Truncate() override;

	//! A copy of the entries written so far
	vector<LogEntry> GetEntries() const;

private:
	mutable std::mutex lock;
	vector<LogEntry> entries;
};

} // namespace colwire
