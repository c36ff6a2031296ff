#include "RateLimiter.hpp"

namespace gb {

bool SlidingWindowRateLimiter::allow(const std::string& key,
                                     std::chrono::system_clock::time_point now) {
  std::lock_guard<std::mutex> lk(mu_);
  if (now - lastPrune_ >= window_) pruneIdle(now);

  auto& q = hits_[key];
  while (!q.empty() && now - q.front() >= window_) q.pop_front();
  if (static_cast<int>(q.size()) >= limit_) return false;
  q.push_back(now);
  return true;
}

size_t SlidingWindowRateLimiter::trackedKeys() const {
  std::lock_guard<std::mutex> lk(mu_);
  return hits_.size();
}

// Drops keys whose newest hit has left the window. Caller holds mu_.
void SlidingWindowRateLimiter::pruneIdle(std::chrono::system_clock::time_point now) {
  for (auto it = hits_.begin(); it != hits_.end();) {
    if (it->second.empty() || now - it->second.back() >= window_) it = hits_.erase(it);
    else ++it;
  }
  lastPrune_ = now;
}

} // namespace gb
