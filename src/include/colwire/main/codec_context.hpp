//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/main/codec_context.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/codec/plain_decoder.hpp"
#include "colwire/codec/plain_encoder.hpp"
#include "colwire/logging/log_manager.hpp"
#include "colwire/main/config.hpp"

namespace colwire {

//! The CodecContext owns the configuration and the log manager shared by the decoders and encoders it creates.
//! Created codecs hold a reference to the context's logger, so they must not outlive the context.
class CodecContext {
public:
	CodecContext();
	explicit CodecContext(const CodecConfig &config);
	~CodecContext();

public:
	//! Sets a configuration option and applies it to the running log manager
	void SetOption(const string &name, const string &value);
	void ResetOption(const string &name);
	string GetOption(const string &name) const;

	unique_ptr<PlainDecoder> CreateDecoder(PhysicalType type, idx_t type_length = 0);
	unique_ptr<PlainEncoder> CreateEncoder(PhysicalType type);

	CodecConfig &GetConfig() {
		return config;
	}
	LogManager &GetLogManager() {
		return *log_manager;
	}
	Logger &GetLogger() {
		return log_manager->GlobalLogger();
	}

private:
	CodecConfig config;
	unique_ptr<LogManager> log_manager;
};

} // namespace colwire
