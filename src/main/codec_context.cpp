#include "colwire/main/codec_context.hpp"
#include "colwire/common/helper.hpp"

namespace colwire {

CodecContext::CodecContext() {
	log_manager = make_uniq<LogManager>(config.GetLogConfig());
}

CodecContext::CodecContext(const CodecConfig &config_p) {
	config.options = config_p.options;
	log_manager = make_uniq<LogManager>(config.GetLogConfig());
}

CodecContext::~CodecContext() {
}

void CodecContext::SetOption(const string &name, const string &value) {
	config.SetOptionByName(name, value, this);
	COLWIRE_LOG_DEBUG(GetLogger(), LogType::CONFIG, "Set option %s to %s", name, value);
}

void CodecContext::ResetOption(const string &name) {
	config.ResetOption(name, this);
}

string CodecContext::GetOption(const string &name) const {
	return config.GetOptionValue(name);
}

unique_ptr<PlainDecoder> CodecContext::CreateDecoder(PhysicalType type, idx_t type_length) {
	return PlainDecoder::Create(type, GetLogger(), type_length);
}

unique_ptr<PlainEncoder> CodecContext::CreateEncoder(PhysicalType type) {
	return PlainEncoder::Create(type, GetLogger(), config.options.encoder_initial_capacity);
}

} // namespace colwire
