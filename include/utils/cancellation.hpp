#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace bxfer {
namespace utils {

// Raised when a CancellationToken fires during a blocking operation
class OperationCancelled : public std::runtime_error {
public:
  explicit OperationCancelled(const std::string& message) : std::runtime_error(message) {}
};

// Cancellation signal shared between an orchestrator and a running transfer
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

  CancellationToken() = default;
  // Linked token: also fires when parent fires or the deadline passes
  CancellationToken(const CancellationToken* parent, std::optional<Clock::time_point> deadline);
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  // Idempotent, wakes every waiter
  void cancel();
  bool is_cancelled() const;
  bool deadline_expired() const;

  // Sleeps for delay, returns true if cancelled before it elapsed
  bool wait_for(std::chrono::milliseconds delay) const;

  // Throws OperationCancelled if cancelled
  void throw_if_cancelled(const std::string& context) const;

private:
  static constexpr std::chrono::milliseconds LINK_POLL_INTERVAL{50};

  const CancellationToken* parent_ = nullptr;
  std::optional<Clock::time_point> deadline_;
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

} // namespace utils
} // namespace bxfer
