#include "colwire.hpp"

#include <cstdio>
#include <cstdlib>

/* USAGE:
colwire_plaindump data/page.bin INT32 100
colwire_plaindump data/uuids.bin FIXED_LEN_BYTE_ARRAY 16 16 --log-level=trace
*/

using namespace colwire;

static constexpr idx_t DUMP_BATCH_SIZE = 2048;

static void PrintUsage() {
	printf("Usage: colwire_plaindump [page.bin] [physical_type] [num_values] ([type_length]) "
	       "([--log-level=level])\n");
	exit(1);
}

static idx_t ParseCount(const char *name, const string &input) {
	idx_t result;
	if (!StringUtil::TryParseUnsigned(input, result)) {
		throw InvalidInputException("Invalid %s \"%s\": expected a non-negative integer below 2^64", name, input);
	}
	return result;
}

static SharedBuffer ReadFile(const string &filename) {
	auto handle = fopen(filename.c_str(), "rb");
	if (!handle) {
		throw InvalidInputException("Could not open file \"%s\"", filename);
	}
	vector<data_t> contents;
	data_t chunk[4096];
	while (true) {
		auto read = fread(chunk, 1, sizeof(chunk), handle);
		contents.insert(contents.end(), chunk, chunk + read);
		if (read < sizeof(chunk)) {
			break;
		}
	}
	bool failed = ferror(handle) != 0;
	fclose(handle);
	if (failed) {
		throw InvalidInputException("Could not read file \"%s\"", filename);
	}
	return SharedBuffer(contents);
}

int main(int argc, const char **argv) {
	vector<string> positional;
	string log_level;
	for (int i = 1; i < argc; i++) {
		string arg(argv[i]);
		if (StringUtil::StartsWith(arg, "--log-level=")) {
			log_level = arg.substr(12);
		} else if (StringUtil::StartsWith(arg, "--")) {
			printf("Unknown option %s\n", arg.c_str());
			PrintUsage();
		} else {
			positional.push_back(arg);
		}
	}
	if (positional.size() < 3 || positional.size() > 4) {
		PrintUsage();
	}

	try {
		CodecContext context;
		if (!log_level.empty()) {
			context.SetOption("logging_storage", "stdout");
			context.SetOption("logging_level", log_level);
			context.SetOption("enable_logging", "true");
		}

		auto type = PhysicalTypeFromString(positional[1]);
		auto num_values = ParseCount("value count", positional[2]);
		idx_t type_length = 0;
		if (positional.size() == 4) {
			type_length = ParseCount("type length", positional[3]);
		}

		auto decoder = context.CreateDecoder(type, type_length);
		decoder->SetData(ReadFile(positional[0]), num_values);

		vector<PlainValue> values;
		while (decoder->ValuesLeft() > 0) {
			values.clear();
			auto decoded = decoder->DecodeValues(values, DUMP_BATCH_SIZE);
			if (decoded == 0) {
				break;
			}
			for (auto &value : values) {
				printf("%s\n", value.ToString().c_str());
			}
		}
		context.GetLogManager().Flush();
	} catch (std::exception &ex) {
		fprintf(stderr, "%s\n", ex.what());
		return 1;
	}
	return 0;
}
