#include "auth/lockout_tracker.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace bxfer {
namespace auth {

LockoutTracker::LockoutTracker(LockoutPolicy policy, TimeSource time_source)
  : policy_(policy)
  , now_(time_source ? std::move(time_source) : TimeSource([] { return Clock::now(); })) {
}

bool LockoutTracker::is_locked(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = attempts_.find(client_id);
  if (it == attempts_.end()) {
    return false;
  }

  const auto now = now_();
  prune(it->second, now);
  if (it->second.locked_until) {
    return true;
  }
  if (it->second.failures.empty()) {
    attempts_.erase(it);
  }
  return false;
}

bool LockoutTracker::record_failure(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = now_();
  if (attempts_.size() >= next_purge_size_) {
    purge_expired(now);
  }
  auto& attempts = attempts_[client_id];
  prune(attempts, now);

  // Attempts rejected while locked do not extend the lockout
  if (attempts.locked_until) {
    return false;
  }

  attempts.failures.push_back(now);
  if (static_cast<int>(attempts.failures.size()) >= policy_.max_failures) {
    attempts.locked_until = now + policy_.lockout_duration;
    attempts.failures.clear();
    BOOST_LOG_TRIVIAL(warning) << "Lockout: Client " << client_id << " locked for "
                               << policy_.lockout_duration.count() << "s after "
                               << policy_.max_failures << " failed attempts";
    return true;
  }
  return false;
}

void LockoutTracker::record_success(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  attempts_.erase(client_id);
}

int LockoutTracker::failure_count(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = attempts_.find(client_id);
  if (it == attempts_.end()) {
    return 0;
  }
  prune(it->second, now_());
  return static_cast<int>(it->second.failures.size());
}

std::chrono::seconds LockoutTracker::remaining_lockout(const std::string& client_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = attempts_.find(client_id);
  if (it == attempts_.end()) {
    return std::chrono::seconds(0);
  }
  const auto now = now_();
  prune(it->second, now);
  if (!it->second.locked_until) {
    return std::chrono::seconds(0);
  }
  return std::chrono::ceil<std::chrono::seconds>(*it->second.locked_until - now);
}

std::size_t LockoutTracker::tracked_clients() {
  std::lock_guard<std::mutex> lock(mutex_);
  purge_expired(now_());
  return attempts_.size();
}

void LockoutTracker::purge_expired(Clock::time_point now) {
  const auto before = attempts_.size();
  for (auto it = attempts_.begin(); it != attempts_.end();) {
    prune(it->second, now);
    if (!it->second.locked_until && it->second.failures.empty()) {
      it = attempts_.erase(it);
    } else {
      ++it;
    }
  }
  next_purge_size_ = std::max(MIN_PURGE_SIZE, attempts_.size() * 2);
  if (attempts_.size() < before) {
    BOOST_LOG_TRIVIAL(debug) << "Lockout: Forgot " << before - attempts_.size() << " idle client(s)";
  }
}

void LockoutTracker::prune(Attempts& attempts, Clock::time_point now) const {
  if (attempts.locked_until && now >= *attempts.locked_until) {
    attempts.locked_until.reset();
  }
  while (!attempts.failures.empty() && now - attempts.failures.front() > policy_.failure_window) {
    attempts.failures.pop_front();
  }
}

} // namespace auth
} // namespace bxfer
