#include "catch.hpp"
#include "colwire/common/exception.hpp"
#include "colwire/common/helper.hpp"
#include "colwire/common/types/int96.hpp"

using namespace colwire;
using namespace std;

static constexpr uint32_t UNIX_EPOCH_JULIAN_DAY = 2440588;

TEST_CASE("Int96 accessors", "[int96]") {
	Int96 value(1, 2, 3);
	REQUIRE((value.Data() == vector<uint32_t> {1, 2, 3}));
	REQUIRE(value.GetDays() == 3);
	REQUIRE(value.GetNanos() == ((int64_t(2) << 32) + 1));
	REQUIRE(value.ToString() == "[1, 2, 3]");

	value.SetData(4, 5, 6);
	REQUIRE(value == Int96(4, 5, 6));
	REQUIRE(value != Int96(4, 5, 7));

	REQUIRE(Int96::FromData({7, 8, 9}) == Int96(7, 8, 9));
	REQUIRE_THROWS_AS(Int96::FromData({1, 2}), InvalidInputException);
	REQUIRE_THROWS_AS(Int96::FromData({1, 2, 3, 4}), InvalidInputException);

	REQUIRE(Int96() == Int96(0, 0, 0));
}

TEST_CASE("Int96 epoch conversions", "[int96]") {
	Int96 epoch(0, 0, UNIX_EPOCH_JULIAN_DAY);
	REQUIRE(epoch.ToSeconds() == 0);
	REQUIRE(epoch.ToMillis() == 0);
	REQUIRE(epoch.ToMicros() == 0);
	REQUIRE(epoch.ToNanos() == 0);

	// one day and 1.5 seconds after the epoch
	Int96 later(1500000000, 0, UNIX_EPOCH_JULIAN_DAY + 1);
	REQUIRE(later.ToSeconds() == 86401);
	REQUIRE(later.ToMillis() == 86401500);
	REQUIRE(later.ToMicros() == 86401500000LL);
	REQUIRE(later.ToNanos() == 86401500000000LL);

	// the day before the epoch
	Int96 before(0, 0, UNIX_EPOCH_JULIAN_DAY - 1);
	REQUIRE(before.ToSeconds() == -86400);

	// 12:00:00 on the first day
	auto noon_nanos = int64_t(12) * 3600 * 1000000000LL;
	Int96 noon(uint32_t(noon_nanos), uint32_t(noon_nanos >> 32), UNIX_EPOCH_JULIAN_DAY);
	REQUIRE(noon.ToNanos() == noon_nanos);
	REQUIRE(noon.ToSeconds() == 43200);
}

TEST_CASE("Int96 conversions wrap around instead of throwing", "[int96]") {
	Int96 max_day(0, 0, uint32_t(NumericLimits<int32_t>::Maximum()));
	REQUIRE(max_day.GetDays() == NumericLimits<int32_t>::Maximum());
	REQUIRE_NOTHROW(max_day.ToNanos());
	REQUIRE_NOTHROW(max_day.ToMicros());
	REQUIRE_NOTHROW(max_day.ToMillis());
	REQUIRE_NOTHROW(max_day.ToSeconds());

	// seconds do not overflow, nanoseconds do
	auto days = int64_t(NumericLimits<int32_t>::Maximum()) - UNIX_EPOCH_JULIAN_DAY;
	REQUIRE(max_day.ToSeconds() == days * 86400);
	auto wrapped = static_cast<int64_t>(static_cast<uint64_t>(days) * 86400000000000ULL);
	REQUIRE(max_day.ToNanos() == wrapped);

	Int96 min_day(0xFFFFFFFF, 0xFFFFFFFF, 0x80000000);
	REQUIRE(min_day.GetDays() == NumericLimits<int32_t>::Minimum());
	REQUIRE_NOTHROW(min_day.ToNanos());
}

TEST_CASE("Int96 from epoch nanoseconds", "[int96]") {
	REQUIRE(Int96::FromEpochNanos(0) == Int96(0, 0, UNIX_EPOCH_JULIAN_DAY));

	auto value = Int96::FromEpochNanos(86401500000000LL);
	REQUIRE(value == Int96(1500000000, 0, UNIX_EPOCH_JULIAN_DAY + 1));
	REQUIRE(value.ToNanos() == 86401500000000LL);

	// negative values floor to the previous day
	value = Int96::FromEpochNanos(-1);
	REQUIRE(value.GetDays() == int32_t(UNIX_EPOCH_JULIAN_DAY - 1));
	REQUIRE(value.GetNanos() == 86399999999999LL);
	REQUIRE(value.ToNanos() == -1);
}

TEST_CASE("Int96 ordering", "[int96]") {
	Int96 a(0, 0, 10);
	Int96 b(5, 0, 10);
	Int96 c(0, 0, 11);
	Int96 d(0, 1, 10);

	REQUIRE(a < b);
	REQUIRE(b < d);
	REQUIRE(d < c);
	REQUIRE(c > a);
	REQUIRE(a <= a);
	REQUIRE(a >= a);
	REQUIRE(!(b < a));
	// days compare as signed
	REQUIRE(Int96(0, 0, 0x80000000) < Int96(0, 0, 0));
}
