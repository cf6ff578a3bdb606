#include "RetryPolicy.h"
#include "../util/Constants.h"
#include <algorithm>
#include <cmath>

namespace Marquee {
namespace Network {

RetryPolicy RetryPolicy::standard() {
  RetryPolicy policy;
  policy.maxRetries = Constants::Api::MAX_RETRIES;
  policy.baseDelay = juce::RelativeTime::milliseconds(Constants::Api::RETRY_DELAY_BASE_MS);
  policy.maxDelay = juce::RelativeTime::milliseconds(Constants::Api::RETRY_DELAY_MAX_MS);
  policy.jitterFactor = Constants::Api::RETRY_JITTER_FACTOR;
  return policy;
}

RetryPolicy RetryPolicy::none() {
  RetryPolicy policy = standard();
  policy.maxRetries = 0;
  return policy;
}

bool RetryPolicy::shouldRetry(const TransportError &error, int retriesSoFar) const {
  return error.isRetryable() && retriesSoFar < maxRetries;
}

juce::RelativeTime RetryPolicy::delayForRetry(int retry, double jitterUnit) const {
  const double exponential = baseDelay.inSeconds() * std::pow(2.0, static_cast<double>(std::max(0, retry)));
  const double jitter = juce::jlimit(0.0, 1.0, jitterUnit) * jitterFactor * exponential;

  return juce::RelativeTime::seconds(std::min(exponential + jitter, maxDelay.inSeconds()));
}

juce::RelativeTime RetryPolicy::delayFor(const TransportError &error, int retry, double jitterUnit) const {
  auto delay = delayForRetry(retry, jitterUnit);

  if (error.kind == TransportError::Kind::RateLimited && error.retryAfter.has_value()) {
    delay = juce::RelativeTime::seconds(
        std::min(std::max(delay.inSeconds(), error.retryAfter->inSeconds()), maxDelay.inSeconds()));
  }

  return delay;
}

} // namespace Network
} // namespace Marquee
