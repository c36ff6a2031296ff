#include "QuotaGuard.hpp"

#include <cstdio>
#include <ctime>

namespace gb {

namespace {

std::tm to_utc_tm(std::time_t secs) {
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif
  return tm;
}

} // namespace

QuotaDecision checkQuota(int64_t countToday, int dailyLimit) {
  return countToday >= dailyLimit ? QuotaDecision::DailyLimitReached : QuotaDecision::Allow;
}

std::string utcDate(Clock::time_point t) {
  return isoTimestamp(t).substr(0, 10);
}

std::string isoTimestamp(Clock::time_point t) {
  using namespace std::chrono;
  const auto since = t.time_since_epoch();
  auto secs = duration_cast<seconds>(since);
  auto micros = duration_cast<microseconds>(since - secs).count();
  if (micros < 0) { micros += 1000000; secs -= seconds(1); }

  const std::tm tm = to_utc_tm(static_cast<std::time_t>(secs.count()));
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<long long>(micros));
  return buf;
}

} // namespace gb
