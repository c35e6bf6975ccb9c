#ifndef BXFER_AUTH_LOCKOUT_TRACKER_HPP
#define BXFER_AUTH_LOCKOUT_TRACKER_HPP

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace bxfer {
namespace auth {

struct LockoutPolicy {
  int max_failures = 5;
  std::chrono::seconds failure_window = std::chrono::minutes(15);
  std::chrono::seconds lockout_duration = std::chrono::minutes(15);
};

// Counts consecutive authentication failures per client inside a rolling window
class LockoutTracker {
public:
  using Clock = std::chrono::steady_clock;
  using TimeSource = std::function<Clock::time_point()>;

  // time_source defaults to steady_clock::now
  explicit LockoutTracker(LockoutPolicy policy = {}, TimeSource time_source = {});

  // True while the client is inside its cooldown
  bool is_locked(const std::string& client_id);
  // Records a failure, returns true if this failure locked the client
  bool record_failure(const std::string& client_id);
  // Clears the failure history of the client
  void record_success(const std::string& client_id);

  // Failures currently counted inside the window
  int failure_count(const std::string& client_id);
  std::chrono::seconds remaining_lockout(const std::string& client_id);
  // Clients with failures or a lockout still on record
  std::size_t tracked_clients();

  const LockoutPolicy& policy() const { return policy_; }

private:
  struct Attempts {
    std::deque<Clock::time_point> failures;
    std::optional<Clock::time_point> locked_until;
  };

  // Caller holds mutex_
  void prune(Attempts& attempts, Clock::time_point now) const;
  // Drops every client with nothing left after pruning. Caller holds mutex_
  void purge_expired(Clock::time_point now);

  static constexpr std::size_t MIN_PURGE_SIZE = 64;

  LockoutPolicy policy_;
  TimeSource now_;
  std::mutex mutex_;
  std::unordered_map<std::string, Attempts> attempts_;
  std::size_t next_purge_size_ = MIN_PURGE_SIZE;
};

} // namespace auth
} // namespace bxfer

#endif // BXFER_AUTH_LOCKOUT_TRACKER_HPP
