#include "catch.hpp"
#include "colwire/common/utf8.hpp"

#include <cstring>

using namespace colwire;
using namespace std;

static UnicodeType Analyze(const char *str) {
	return Utf8Util::Analyze(str, strlen(str));
}

static void TestValidString(const char *str) {
	REQUIRE(Utf8Util::IsValid(str, strlen(str)));
	idx_t invalid_pos = 0;
	string error;
	REQUIRE(Utf8Util::Verify(str, strlen(str), invalid_pos, error));
}

static void TestInvalidString(const char *str) {
	REQUIRE(!Utf8Util::IsValid(str, strlen(str)));
	idx_t invalid_pos = 0;
	string error;
	REQUIRE(!Utf8Util::Verify(str, strlen(str), invalid_pos, error));
	REQUIRE(!error.empty());
}

TEST_CASE("UTF8 error checking", "[utf8]") {
	TestValidString("a");
	TestValidString("\xc3\xb1");
	TestValidString("\xE2\x82\xA1");
	TestValidString("\xF0\x9F\xA6\x86"); // a duck!
	TestValidString("\xf0\x90\x8c\xbc");

	TestInvalidString("\xc3\x28");
	TestInvalidString("\xa0\xa1");
	TestInvalidString("\xe2\x28\xa1");
	TestInvalidString("\xe2\x82\x28");
	TestInvalidString("\xf0\x28\x8c\xbc");
	TestInvalidString("\xf0\x90\x28\xbc");
	TestInvalidString("\xf0\x28\x8c\x28");
	TestInvalidString("\xf8\xa1\xa1\xa1\xa1");
	TestInvalidString("\xfc\xa1\xa1\xa1\xa1\xa1");
	// overlong encodings and surrogate halves
	TestInvalidString("\xc0\xaf");
	TestInvalidString("\xe0\x80\xaf");
	TestInvalidString("\xed\xa0\x80");
	TestInvalidString("\xf4\x90\x80\x80");
}

TEST_CASE("UTF8 analysis", "[utf8]") {
	REQUIRE(Analyze("") == UnicodeType::ASCII);
	REQUIRE(Analyze("hello world, this is longer than eight bytes") == UnicodeType::ASCII);
	REQUIRE(Analyze("hello w\xc3\xb6rld") == UnicodeType::UTF8);
	// non-ASCII byte after the first eight-byte block
	REQUIRE(Analyze("0123456789\xF0\x9F\xA6\x86") == UnicodeType::UTF8);
	REQUIRE(Analyze("0123456789abcdef\xc3") == UnicodeType::INVALID);
}

TEST_CASE("UTF8 error position", "[utf8]") {
	string str = "abc\xe2\x82\xa1xyz\xff";
	idx_t invalid_pos = 0;
	string error;
	REQUIRE(!Utf8Util::Verify(str.c_str(), str.size(), invalid_pos, error));
	REQUIRE(invalid_pos == 9);

	// a sequence truncated by the end of the buffer
	str = "abc\xe2\x82";
	REQUIRE(!Utf8Util::Verify(str.c_str(), str.size(), invalid_pos, error));
	REQUIRE(invalid_pos == 3);
}
