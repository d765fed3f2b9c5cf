//===----------------------------------------------------------------------===//
//                         ColWire
//
// colwire/common/exception.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "colwire/common/constants.hpp"
#include "colwire/common/string_util.hpp"

#include <stdexcept>

namespace colwire {

//===--------------------------------------------------------------------===//
// Exception Types
//===--------------------------------------------------------------------===//

enum class ExceptionType : uint8_t {
	INVALID = 0,                // invalid type
	OUT_OF_RANGE = 1,           // index or range outside of a buffer
	ARITHMETIC_OVERFLOW = 2,    // offset arithmetic wrapped around
	INVALID_INPUT = 3,          // malformed input or bad constructor argument
	UNEXPECTED_EOF = 4,         // fewer bytes or values than requested
	MISMATCH_TYPE = 5,          // unsupported conversion or wrong downcast
	SERIALIZATION = 6,          // sink failed to accept written data
	NOT_IMPLEMENTED = 7,        // method not implemented
	INVALID_CONFIGURATION = 8,  // bad configuration option or value
	INTERNAL = 9                // contract violation inside the library
};

class Exception : public std::runtime_error {
public:
	Exception(ExceptionType exception_type, const string &message);

	ExceptionType type;
	string raw_message;

public:
	ExceptionType GetType() const {
		return type;
	}
	const string &RawMessage() const {
		return raw_message;
	}

	static string ExceptionTypeToString(ExceptionType type);

	template <typename... ARGS>
	static string ConstructMessage(const string &msg, ARGS... params) {
		const std::size_t num_args = sizeof...(ARGS);
		if (num_args == 0) {
			return msg;
		}
		return StringUtil::Format(msg, params...);
	}
};

//===--------------------------------------------------------------------===//
// Exception derived classes
//===--------------------------------------------------------------------===//

class OutOfRangeException : public Exception {
public:
	explicit OutOfRangeException(const string &msg);

	template <typename... ARGS>
	explicit OutOfRangeException(const string &msg, ARGS... params)
	    : OutOfRangeException(ConstructMessage(msg, params...)) {
	}
};

class OverflowException : public Exception {
public:
	explicit OverflowException(const string &msg);

	template <typename... ARGS>
	explicit OverflowException(const string &msg, ARGS... params)
	    : OverflowException(ConstructMessage(msg, params...)) {
	}
};

class InvalidInputException : public Exception {
public:
	explicit InvalidInputException(const string &msg);

	template <typename... ARGS>
	explicit InvalidInputException(const string &msg, ARGS... params)
	    : InvalidInputException(ConstructMessage(msg, params...)) {
	}
};

class EOFException : public Exception {
public:
	explicit EOFException(const string &msg);

	template <typename... ARGS>
	explicit EOFException(const string &msg, ARGS... params) : EOFException(ConstructMessage(msg, params...)) {
	}
};

class TypeMismatchException : public Exception {
public:
	explicit TypeMismatchException(const string &msg);

	template <typename... ARGS>
	explicit TypeMismatchException(const string &msg, ARGS... params)
	    : TypeMismatchException(ConstructMessage(msg, params...)) {
	}
};

class SerializationException : public Exception {
public:
	explicit SerializationException(const string &msg);

	template <typename... ARGS>
	explicit SerializationException(const string &msg, ARGS... params)
	    : SerializationException(ConstructMessage(msg, params...)) {
	}
};

class NotImplementedException : public Exception {
public:
	explicit NotImplementedException(const string &msg);

	template <typename... ARGS>
	explicit NotImplementedException(const string &msg, ARGS... params)
	    : NotImplementedException(ConstructMessage(msg, params...)) {
	}
};

class InvalidConfigurationException : public Exception {
public:
	explicit InvalidConfigurationException(const string &msg);

	template <typename... ARGS>
	explicit InvalidConfigurationException(const string &msg, ARGS... params)
	    : InvalidConfigurationException(ConstructMessage(msg, params...)) {
	}
};

class InternalException : public Exception {
public:
	explicit InternalException(const string &msg);

	template <typename... ARGS>
	explicit InternalException(const string &msg, ARGS... params)
	    : InternalException(ConstructMessage(msg, params...)) {
	}
};

} // namespace colwire
