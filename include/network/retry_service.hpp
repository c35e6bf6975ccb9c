#ifndef BXFER_NETWORK_RETRY_SERVICE_HPP
#define BXFER_NETWORK_RETRY_SERVICE_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <boost/log/trivial.hpp>
#include "network/network_error.hpp"
#include "utils/cancellation.hpp"

namespace bxfer {
namespace network {

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{30000};
  // Upper bound of the random jitter as a fraction of the exponential delay
  double jitter_ratio = 0.1;
};

// Emitted before each backoff wait
struct RetryEvent {
  std::string operation;
  int attempt;
  int max_attempts;
  std::chrono::milliseconds delay;
  TransportErrorCode error_code;
  std::string error;
};

class RetryExhaustedError : public std::runtime_error {
public:
  RetryExhaustedError(const std::string& operation, int attempts, TransportErrorCode last_error)
    : std::runtime_error(operation + " failed after " + std::to_string(attempts) + " attempts: " +
                         transport_error_to_string(last_error))
    , operation_(operation)
    , attempts_(attempts)
    , last_error_(last_error) {}

  const std::string& operation() const { return operation_; }
  int attempts() const { return attempts_; }
  TransportErrorCode last_error() const { return last_error_; }

private:
  std::string operation_;
  int attempts_;
  TransportErrorCode last_error_;
};

// Runs operations that may hit transient transport failures with bounded
// exponential backoff. Only transient TransportErrors are retried, every
// other exception propagates on the first occurrence.
class NetworkRetryService {
public:
  using RetryObserver = std::function<void(const RetryEvent&)>;

  // Throws std::invalid_argument for a policy with no attempts or negative delays
  explicit NetworkRetryService(RetryPolicy policy = {});

  // operation receives the 1-based attempt number
  template <typename Operation>
  auto execute_with_retry(Operation&& operation, const std::string& operation_name,
                          const utils::CancellationToken* cancellation = nullptr)
      -> decltype(operation(1));

  // Delay that follows failed attempt number `attempt` (1-based)
  std::chrono::milliseconds compute_delay(int attempt);

  void set_retry_observer(RetryObserver observer) { observer_ = std::move(observer); }
  const RetryPolicy& policy() const { return policy_; }

private:
  // Returns true if cancelled during the wait
  bool wait(std::chrono::milliseconds delay, const utils::CancellationToken* cancellation) const;

  RetryPolicy policy_;
  RetryObserver observer_;
  std::mutex random_mutex_;
  std::mt19937 random_engine_;
};

template <typename Operation>
auto NetworkRetryService::execute_with_retry(Operation&& operation, const std::string& operation_name,
                                             const utils::CancellationToken* cancellation)
    -> decltype(operation(1)) {
  for (int attempt = 1;; ++attempt) {
    if (cancellation) {
      cancellation->throw_if_cancelled(operation_name);
    }

    try {
      return operation(attempt);
    } catch (const TransportError& e) {
      if (!e.is_transient()) {
        BOOST_LOG_TRIVIAL(error) << "Retry: " << operation_name << " failed with non-retriable error: " << e.what();
        throw;
      }
      if (attempt >= policy_.max_attempts) {
        BOOST_LOG_TRIVIAL(error) << "Retry: " << operation_name << " failed after " << attempt
                                 << " attempts: " << e.what();
        throw RetryExhaustedError(operation_name, attempt, e.code());
      }

      const auto delay = compute_delay(attempt);
      BOOST_LOG_TRIVIAL(warning) << "Retry: " << operation_name << " attempt " << attempt << "/"
                                 << policy_.max_attempts << " failed (" << e.what() << "), retrying in "
                                 << delay.count() << "ms";
      if (observer_) {
        observer_(RetryEvent{operation_name, attempt, policy_.max_attempts, delay, e.code(), e.what()});
      }
      if (wait(delay, cancellation)) {
        throw utils::OperationCancelled(operation_name + " backoff");
      }
    }
  }
}

} // namespace network
} // namespace bxfer

#endif // BXFER_NETWORK_RETRY_SERVICE_HPP
