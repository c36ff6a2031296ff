#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "core/quota/QuotaGuard.hpp"

class MessageStore;

namespace gb {

class RateLimiter;
class PrinterClient;

enum class SubmissionOutcome {
  Accepted,
  PayloadTooLarge,     // over maxLength code points before sanitizing
  EmptyContent,        // nothing printable left after sanitize + trim
  RateLimited,         // per-address short window exceeded
  DailyLimitReached,   // global ceiling for the UTC day
  PrinterUnavailable,  // stored, but the printer did not take it
  StoreUnavailable     // nothing stored
};

const char* to_string(SubmissionOutcome o);

struct SubmissionResult {
  SubmissionOutcome      outcome = SubmissionOutcome::Accepted;
  std::optional<int64_t> id;       // set once the message is durable
  std::string            detail;

  bool accepted() const { return outcome == SubmissionOutcome::Accepted; }
};

struct SubmissionLimits {
  int dailyLimit = 30;
  int maxLength  = 10000;
};

// Runs one submission through sanitize -> rate check -> quota + persist ->
// print. Every path ends in a SubmissionResult; nothing is retried here.
// Persisting is the point of no return: a printer failure afterwards is
// reported but the row stays.
class SubmissionService {
public:
  SubmissionService(MessageStore& store,
                    RateLimiter& limiter,
                    PrinterClient& printer,
                    SubmissionLimits limits)
    : store_(store), limiter_(limiter), printer_(printer), limits_(limits) {}

  SubmissionResult submit(const std::string& rawText,
                          const std::string& remoteAddress,
                          Clock::time_point now = Clock::now());

  const SubmissionLimits& limits() const { return limits_; }

private:
  MessageStore&    store_;
  RateLimiter&     limiter_;
  PrinterClient&   printer_;
  SubmissionLimits limits_;
};

} // namespace gb
