//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/main/config.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"
#include "colwire/common/serializer/memory_stream.hpp"
#include "colwire/logging/logging.hpp"

#include <mutex>

namespace colwire {

class CodecContext;
class CodecConfig;

typedef void (*set_option_function_t)(CodecContext *context, CodecConfig &config, const string &input);
typedef void (*reset_option_function_t)(CodecContext *context, CodecConfig &config);
typedef string (*get_option_function_t)(const CodecConfig &config);

struct ConfigurationOption {
	const char *name;
	const char *description;
	const char *parameter_type;
	set_option_function_t set_option;
	reset_option_function_t reset_option;
	get_option_function_t get_setting;
};

struct CodecConfigOptions {
	//! Whether the global logger writes anything
	bool enable_logging = false;
	//! Minimum level of logged entries
	LogLevel logging_level = LogConfig::DEFAULT_LOG_LEVEL;
	//! "memory" or "stdout"
	string logging_storage = LogConfig::DEFAULT_LOG_STORAGE;
	//! Initial buffer size of new encoders, a power of two
	idx_t encoder_initial_capacity = MemoryStream::DEFAULT_INITIAL_CAPACITY;
};

class CodecConfig {
public:
	CodecConfig();

	CodecConfigOptions options;

public:
	static idx_t GetOptionCount();
	static vector<string> GetOptionNames();
	static const ConfigurationOption *GetOptionByIndex(idx_t index);
	//! Case-insensitive lookup, returns nullptr for unknown options
	static const ConfigurationOption *GetOptionByName(const string &name);

	//! Parses and applies value. Throws an InvalidInputException for unknown options and an
	//! InvalidConfigurationException for values the option does not accept.
	void SetOptionByName(const string &name, const string &value, CodecContext *context = nullptr);
	void ResetOption(const string &name, CodecContext *context = nullptr);
	string GetOptionValue(const string &name) const;

	//! The logging part of the options
	LogConfig GetLogConfig() const;

private:
	const ConfigurationOption &GetOptionOrThrow(const string &name) const;

private:
	mutable std::mutex config_lock;
};

} // namespace colwire
