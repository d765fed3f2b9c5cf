#include "colwire/common/types/int96.hpp"
#include "colwire/common/exception.hpp"

namespace colwire {

// surely they are joking
static constexpr int64_t JULIAN_TO_UNIX_EPOCH_DAYS = 2440588LL;
static constexpr int64_t SECONDS_PER_DAY = 86400LL;
static constexpr int64_t MILLISECONDS_PER_DAY = SECONDS_PER_DAY * 1000LL;
static constexpr int64_t MICROSECONDS_PER_DAY = MILLISECONDS_PER_DAY * 1000LL;
static constexpr int64_t NANOSECONDS_PER_DAY = MICROSECONDS_PER_DAY * 1000LL;

//! (days - JULIAN_TO_UNIX_EPOCH_DAYS) * units_per_day + nanos / nanos_per_unit, in two's complement
//! arithmetic that wraps around instead of overflowing
static int64_t WrappingEpochConversion(const Int96 &ts, int64_t units_per_day, int64_t nanos_per_unit) {
	auto days_since_epoch = static_cast<int64_t>(ts.GetDays()) - JULIAN_TO_UNIX_EPOCH_DAYS;
	auto units = static_cast<uint64_t>(days_since_epoch) * static_cast<uint64_t>(units_per_day);
	units += static_cast<uint64_t>(ts.GetNanos() / nanos_per_unit);
	return static_cast<int64_t>(units);
}

int32_t Int96::GetDays() const {
	return static_cast<int32_t>(value[2]);
}

int64_t Int96::GetNanos() const {
	return static_cast<int64_t>((static_cast<uint64_t>(value[1]) << 32) + value[0]);
}

int64_t Int96::ToSeconds() const {
	return WrappingEpochConversion(*this, SECONDS_PER_DAY, 1000000000LL);
}

int64_t Int96::ToMillis() const {
	return WrappingEpochConversion(*this, MILLISECONDS_PER_DAY, 1000000LL);
}

int64_t Int96::ToMicros() const {
	return WrappingEpochConversion(*this, MICROSECONDS_PER_DAY, 1000LL);
}

int64_t Int96::ToNanos() const {
	return WrappingEpochConversion(*this, NANOSECONDS_PER_DAY, 1LL);
}

string Int96::ToString() const {
	return StringUtil::Format("[%u, %u, %u]", value[0], value[1], value[2]);
}

Int96 Int96::FromData(const vector<uint32_t> &data) {
	if (data.size() != 3) {
		throw InvalidInputException("Int96 requires exactly 3 words, got %llu", static_cast<idx_t>(data.size()));
	}
	return Int96(data[0], data[1], data[2]);
}

Int96 Int96::FromEpochNanos(int64_t nanos) {
	auto days = nanos / NANOSECONDS_PER_DAY;
	auto nanos_of_day = nanos % NANOSECONDS_PER_DAY;
	if (nanos_of_day < 0) {
		days--;
		nanos_of_day += NANOSECONDS_PER_DAY;
	}
	// first two uint32 in Int96 are nanoseconds since midnights
	// last uint32 is number of days since year 4713 BC ("Julian date")
	auto bits = static_cast<uint64_t>(nanos_of_day);
	return Int96(static_cast<uint32_t>(bits), static_cast<uint32_t>(bits >> 32),
	             static_cast<uint32_t>(days + JULIAN_TO_UNIX_EPOCH_DAYS));
}

bool Int96::operator<(const Int96 &rhs) const {
	auto ldays = GetDays();
	auto rdays = rhs.GetDays();
	if (ldays != rdays) {
		return ldays < rdays;
	}
	return GetNanos() < rhs.GetNanos();
}

} // namespace colwire
