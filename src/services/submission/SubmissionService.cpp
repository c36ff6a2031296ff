#include "SubmissionService.hpp"

#include <spdlog/spdlog.h>
#include <utility>

#include "core/metadata/MessageStore.hpp"
#include "core/printer/PrinterClient.hpp"
#include "core/quota/RateLimiter.hpp"
#include "core/text/Sanitizer.hpp"
#include "core/util/Fingerprint.hpp"

namespace gb {

const char* to_string(SubmissionOutcome o) {
  switch (o) {
    case SubmissionOutcome::Accepted:           return "Accepted";
    case SubmissionOutcome::PayloadTooLarge:    return "PayloadTooLarge";
    case SubmissionOutcome::EmptyContent:       return "EmptyContent";
    case SubmissionOutcome::RateLimited:        return "RateLimited";
    case SubmissionOutcome::DailyLimitReached:  return "DailyLimitReached";
    case SubmissionOutcome::PrinterUnavailable: return "PrinterUnavailable";
    case SubmissionOutcome::StoreUnavailable:   return "StoreUnavailable";
  }
  return "Unknown";
}

static SubmissionResult reject(SubmissionOutcome o, std::string detail) {
  spdlog::warn("submission rejected: {} ({})", to_string(o), detail);
  return SubmissionResult{o, std::nullopt, std::move(detail)};
}

SubmissionResult SubmissionService::submit(const std::string& rawText,
                                           const std::string& remoteAddress,
                                           Clock::time_point now) {
  if (codePointCount(rawText) > static_cast<size_t>(limits_.maxLength)) {
    return reject(SubmissionOutcome::PayloadTooLarge,
                  "Message exceeds " + std::to_string(limits_.maxLength) + " characters");
  }

  // Sanitize before any emptiness check: control-only input collapses to "".
  const std::string clean = trimWhitespace(sanitize(rawText));
  if (clean.empty()) {
    return reject(SubmissionOutcome::EmptyContent, "Message contains no printable content");
  }

  if (!limiter_.allow(remoteAddress, now)) {
    return reject(SubmissionOutcome::RateLimited, "Rate limit exceeded. Try again later.");
  }

  const std::string fp = fingerprint(remoteAddress);
  std::optional<int64_t> id;
  try {
    id = store_.insertWithinDailyLimit(clean, isoTimestamp(now), fp, limits_.dailyLimit);
  } catch (const StoreError& e) {
    spdlog::error("store failure for {}: {}", fp, e.what());
    return SubmissionResult{SubmissionOutcome::StoreUnavailable, std::nullopt,
                            "Message store unavailable"};
  }
  if (!id) {
    return reject(SubmissionOutcome::DailyLimitReached,
                  "Daily message limit reached. Try again tomorrow.");
  }
  spdlog::info("stored message {} ({} bytes) from {}", *id, clean.size(), fp);

  try {
    printer_.print(clean);
  } catch (const std::exception& e) {
    spdlog::warn("message {} stored but not printed: {}", *id, e.what());
    return SubmissionResult{SubmissionOutcome::PrinterUnavailable, id,
                            std::string("Printer unavailable: ") + e.what()};
  }

  return SubmissionResult{SubmissionOutcome::Accepted, id, "ok"};
}

} // namespace gb
