#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace gb {

// Per-submitter short-window admission. Swappable so the orchestrator does
// not care whether hits are counted in memory or elsewhere.
class RateLimiter {
public:
  virtual ~RateLimiter() = default;
  // Records the hit when admitted.
  virtual bool allow(const std::string& key, std::chrono::system_clock::time_point now) = 0;
};

// In-process sliding-window log: at most `limit` admitted hits per key in
// any `window`.
class SlidingWindowRateLimiter : public RateLimiter {
public:
  SlidingWindowRateLimiter(int limit, std::chrono::seconds window)
    : limit_(limit), window_(window) {}

  bool allow(const std::string& key, std::chrono::system_clock::time_point now) override;

  size_t trackedKeys() const;

private:
  void pruneIdle(std::chrono::system_clock::time_point now);

  int limit_;
  std::chrono::seconds window_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::deque<std::chrono::system_clock::time_point>> hits_;
  std::chrono::system_clock::time_point lastPrune_{};
};

} // namespace gb
