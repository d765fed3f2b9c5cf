#include "colwire/common/exception.hpp"

#ifdef COLWIRE_CRASH_ON_ASSERT
#include <stdio.h>
#include <stdlib.h>
#endif

namespace colwire {

Exception::Exception(ExceptionType exception_type, const string &message)
    : std::runtime_error(ExceptionTypeToString(exception_type) + " Error: " + message), type(exception_type),
      raw_message(message) {
}

struct ExceptionEntry {
	ExceptionType type;
	char text[48];
};

static constexpr ExceptionEntry EXCEPTION_MAP[] = {{ExceptionType::INVALID, "Invalid"},
                                                   {ExceptionType::OUT_OF_RANGE, "Out of Range"},
                                                   {ExceptionType::ARITHMETIC_OVERFLOW, "Overflow"},
                                                   {ExceptionType::INVALID_INPUT, "Invalid Input"},
                                                   {ExceptionType::UNEXPECTED_EOF, "Unexpected EOF"},
                                                   {ExceptionType::MISMATCH_TYPE, "Mismatch Type"},
                                                   {ExceptionType::SERIALIZATION, "Serialization"},
                                                   {ExceptionType::NOT_IMPLEMENTED, "Not implemented"},
                                                   {ExceptionType::INVALID_CONFIGURATION, "Invalid Configuration"},
                                                   {ExceptionType::INTERNAL, "INTERNAL"}};

string Exception::ExceptionTypeToString(ExceptionType type) {
	for (auto &e : EXCEPTION_MAP) {
		if (e.type == type) {
			return e.text;
		}
	}
	return "Unknown";
}

OutOfRangeException::OutOfRangeException(const string &msg) : Exception(ExceptionType::OUT_OF_RANGE, msg) {
}

OverflowException::OverflowException(const string &msg) : Exception(ExceptionType::ARITHMETIC_OVERFLOW, msg) {
}

InvalidInputException::InvalidInputException(const string &msg) : Exception(ExceptionType::INVALID_INPUT, msg) {
}

EOFException::EOFException(const string &msg) : Exception(ExceptionType::UNEXPECTED_EOF, msg) {
}

TypeMismatchException::TypeMismatchException(const string &msg) : Exception(ExceptionType::MISMATCH_TYPE, msg) {
}

SerializationException::SerializationException(const string &msg) : Exception(ExceptionType::SERIALIZATION, msg) {
}

NotImplementedException::NotImplementedException(const string &msg) : Exception(ExceptionType::NOT_IMPLEMENTED, msg) {
}

InvalidConfigurationException::InvalidConfigurationException(const string &msg)
    : Exception(ExceptionType::INVALID_CONFIGURATION, msg) {
}

InternalException::InternalException(const string &msg) : Exception(ExceptionType::INTERNAL, msg) {
#ifdef COLWIRE_CRASH_ON_ASSERT
	fprintf(stderr, "ABORT THROWN BY INTERNAL EXCEPTION: %s\n", msg.c_str());
	abort();
#endif
}

} // namespace colwire
