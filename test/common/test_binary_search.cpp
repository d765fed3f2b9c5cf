#include "catch.hpp"
#include "colwire/common/binary_search.hpp"

using namespace colwire;
using namespace std;

static RangeSearchResult SearchSorted(const vector<int64_t> &keys, int64_t target) {
	RangeSearchResult result;
	auto success = TryBinarySearchRange<int64_t>(0, keys.size(), target,
	                                             [&](idx_t idx, int64_t &key) {
		                                             key = keys[idx];
		                                             return true;
	                                             },
	                                             result);
	REQUIRE(success);
	return result;
}

TEST_CASE("Binary search over a sorted range", "[binary_search]") {
	vector<int64_t> keys {1, 3, 5, 7, 9, 11};

	for (idx_t i = 0; i < keys.size(); i++) {
		auto result = SearchSorted(keys, keys[i]);
		REQUIRE(result.found);
		REQUIRE(result.index == i);
	}

	// insertion points
	auto result = SearchSorted(keys, 0);
	REQUIRE(!result.found);
	REQUIRE(result.index == 0);

	result = SearchSorted(keys, 4);
	REQUIRE(!result.found);
	REQUIRE(result.index == 2);

	result = SearchSorted(keys, 10);
	REQUIRE(!result.found);
	REQUIRE(result.index == 5);

	result = SearchSorted(keys, 12);
	REQUIRE(!result.found);
	REQUIRE(result.index == 6);
}

TEST_CASE("Binary search over an empty range", "[binary_search]") {
	RangeSearchResult result;
	result.found = true;
	result.index = 42;
	idx_t calls = 0;
	auto success = TryBinarySearchRange<int64_t>(0, 0, 7,
	                                             [&](idx_t, int64_t &key) {
		                                             calls++;
		                                             key = 0;
		                                             return true;
	                                             },
	                                             result);
	REQUIRE(success);
	REQUIRE(!result.found);
	REQUIRE(result.index == 0);
	REQUIRE(calls == 0);

	// a non-zero start is returned as the insertion point
	success = TryBinarySearchRange<int64_t>(
	    5, 5, 7, [](idx_t, int64_t &) { return false; }, result);
	REQUIRE(success);
	REQUIRE(!result.found);
	REQUIRE(result.index == 5);
}

TEST_CASE("Binary search with duplicate keys", "[binary_search]") {
	vector<int64_t> keys {1, 2, 2, 2, 2, 3};
	auto result = SearchSorted(keys, 2);
	REQUIRE(result.found);
	REQUIRE(keys[result.index] == 2);
}

TEST_CASE("Binary search aborts when a key cannot be produced", "[binary_search]") {
	vector<int64_t> keys {1, 3, 5, 7, 9, 11};
	RangeSearchResult result;

	// the very first probe fails
	vector<idx_t> probes;
	auto success = TryBinarySearchRange<int64_t>(0, keys.size(), 5,
	                                             [&](idx_t idx, int64_t &) {
		                                             probes.push_back(idx);
		                                             return false;
	                                             },
	                                             result);
	REQUIRE(!success);
	REQUIRE(probes.size() == 1);
	REQUIRE(probes[0] == 3);

	// a later probe fails
	probes.clear();
	success = TryBinarySearchRange<int64_t>(0, keys.size(), 1,
	                                        [&](idx_t idx, int64_t &key) {
		                                        probes.push_back(idx);
		                                        if (probes.size() > 1) {
			                                        return false;
		                                        }
		                                        key = keys[idx];
		                                        return true;
	                                        },
	                                        result);
	REQUIRE(!success);
	REQUIRE(probes.size() == 2);
}

TEST_CASE("Binary search over string keys", "[binary_search]") {
	vector<string> keys {"apple", "banana", "cherry", "date"};
	RangeSearchResult result;
	auto success = TryBinarySearchRange<string>(0, keys.size(), string("cherry"),
	                                            [&](idx_t idx, string &key) {
		                                            key = keys[idx];
		                                            return true;
	                                            },
	                                            result);
	REQUIRE(success);
	REQUIRE(result.found);
	REQUIRE(result.index == 2);

	success = TryBinarySearchRange<string>(0, keys.size(), string("blueberry"),
	                                       [&](idx_t idx, string &key) {
		                                       key = keys[idx];
		                                       return true;
	                                       },
	                                       result);
	REQUIRE(success);
	REQUIRE(!result.found);
	REQUIRE(result.index == 2);
}
