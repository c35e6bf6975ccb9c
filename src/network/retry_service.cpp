#include "network/retry_service.hpp"
#include <algorithm>
#include <cmath>

namespace bxfer {
namespace network {

NetworkRetryService::NetworkRetryService(RetryPolicy policy)
  : policy_(policy)
  , random_engine_(std::random_device{}()) {
  if (policy_.max_attempts < 1) {
    throw std::invalid_argument("Retry policy needs at least one attempt");
  }
  if (policy_.base_delay.count() < 0 || policy_.max_delay.count() < 0 || policy_.jitter_ratio < 0.0) {
    throw std::invalid_argument("Retry policy delays must not be negative");
  }
  BOOST_LOG_TRIVIAL(debug) << "Retry: Policy max_attempts=" << policy_.max_attempts
                           << " base_delay=" << policy_.base_delay.count() << "ms"
                           << " max_delay=" << policy_.max_delay.count() << "ms";
}

std::chrono::milliseconds NetworkRetryService::compute_delay(int attempt) {
  const int exponent = std::clamp(attempt - 1, 0, 30);
  const double exponential = static_cast<double>(policy_.base_delay.count()) * std::pow(2.0, exponent);

  double jitter = 0.0;
  if (policy_.jitter_ratio > 0.0 && exponential > 0.0) {
    std::uniform_real_distribution<double> distribution(0.0, exponential * policy_.jitter_ratio);
    std::lock_guard<std::mutex> lock(random_mutex_);
    jitter = distribution(random_engine_);
  }

  const double capped = std::min(exponential + jitter, static_cast<double>(policy_.max_delay.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

bool NetworkRetryService::wait(std::chrono::milliseconds delay, const utils::CancellationToken* cancellation) const {
  if (cancellation) {
    return cancellation->wait_for(delay);
  }
  std::this_thread::sleep_for(delay);
  return false;
}

} // namespace network
} // namespace bxfer
