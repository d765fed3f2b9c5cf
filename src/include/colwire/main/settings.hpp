//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/main/settings.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/main/config.hpp"

namespace colwire {

//===----------------------------------------------------------------------===//
// Enable Logging
//===----------------------------------------------------------------------===//

struct EnableLoggingSetting {
	static constexpr const char *Name = "enable_logging";
	static constexpr const char *Description = "Enables the logger";
	static constexpr const char *InputType = "BOOLEAN";
	static void SetGlobal(CodecContext *context, CodecConfig &config, const string &input);
	static void ResetGlobal(CodecContext *context, CodecConfig &config);
	static string GetSetting(const CodecConfig &config);
};

//===----------------------------------------------------------------------===//
// Logging Level
//===----------------------------------------------------------------------===//

struct LoggingLevelSetting {
	static constexpr const char *Name = "logging_level";
	static constexpr const char *Description = "The log level which will be recorded in the log";
	static constexpr const char *InputType = "VARCHAR";
	static void SetGlobal(CodecContext *context, CodecConfig &config, const string &input);
	static void ResetGlobal(CodecContext *context, CodecConfig &config);
	static string GetSetting(const CodecConfig &config);
};

//===----------------------------------------------------------------------===//
// Logging Storage
//===----------------------------------------------------------------------===//

struct LoggingStorageSetting {
	static constexpr const char *Name = "logging_storage";
	static constexpr const char *Description = "Set the logging storage (memory/stdout)";
	static constexpr const char *InputType = "VARCHAR";
	static void SetGlobal(CodecContext *context, CodecConfig &config, const string &input);
	static void ResetGlobal(CodecContext *context, CodecConfig &config);
	static string GetSetting(const CodecConfig &config);
};

//===----------------------------------------------------------------------===//
// Encoder Initial Capacity
//===----------------------------------------------------------------------===//

struct EncoderInitialCapacitySetting {
	static constexpr const char *Name = "encoder_initial_capacity";
	static constexpr const char *Description =
	    "The initial buffer size in bytes of new PLAIN encoders, must be a power of two";
	static constexpr const char *InputType = "UBIGINT";
	static void SetGlobal(CodecContext *context, CodecConfig &config, const string &input);
	static void ResetGlobal(CodecContext *context, CodecConfig &config);
	static string GetSetting(const CodecConfig &config);
};

} // namespace colwire
