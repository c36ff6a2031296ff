#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace gb {

using Clock = std::chrono::system_clock;

enum class QuotaDecision { Allow, DailyLimitReached };

// Reject once today's stored count has reached the ceiling.
QuotaDecision checkQuota(int64_t countToday, int dailyLimit);

// "YYYY-MM-DD" of the given instant in UTC.
std::string utcDate(Clock::time_point t);

// ISO-8601 UTC with microseconds, e.g. 2026-10-19T08:15:02.123456+00:00.
// The first ten characters are always utcDate(t).
std::string isoTimestamp(Clock::time_point t);

} // namespace gb
