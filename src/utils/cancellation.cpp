#include "utils/cancellation.hpp"
#include <algorithm>

namespace bxfer {
namespace utils {

CancellationToken::CancellationToken(const CancellationToken* parent, std::optional<Clock::time_point> deadline)
  : parent_(parent)
  , deadline_(deadline) {}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

bool CancellationToken::is_cancelled() const {
  return cancelled_.load() || (parent_ && parent_->is_cancelled()) || deadline_expired();
}

bool CancellationToken::deadline_expired() const {
  return deadline_ && Clock::now() >= *deadline_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds delay) const {
  const auto until = Clock::now() + delay;
  std::unique_lock<std::mutex> lock(mutex_);
  if (!parent_ && !deadline_) {
    return cv_.wait_until(lock, until, [this] { return cancelled_.load(); });
  }

  // Linked tokens are not notified by their parent, poll in short slices
  while (!is_cancelled()) {
    const auto now = Clock::now();
    if (now >= until) {
      return false;
    }
    const auto slice = std::min<Clock::duration>(until - now, LINK_POLL_INTERVAL);
    cv_.wait_for(lock, slice, [this] { return cancelled_.load(); });
  }
  return true;
}

void CancellationToken::throw_if_cancelled(const std::string& context) const {
  if (is_cancelled()) {
    throw OperationCancelled(context + " cancelled");
  }
}

} // namespace utils
} // namespace bxfer
