#pragma once

#include "TransportError.h"
#include <juce_core/juce_core.h>

namespace Marquee {
namespace Network {

// ==============================================================================
/**
 * RetryPolicy - Exponential backoff with jitter for retryable transport errors
 *
 * delay(n) = min(base * 2^n + jitter * base * 2^n, maxDelay)
 * where n is the zero-based retry number and jitter is uniform in
 * [0, jitterFactor).
 *
 * maxRetries counts retries after the first attempt, so a request is sent at
 * most maxRetries + 1 times.
 */
struct RetryPolicy {
  int maxRetries = 3;
  juce::RelativeTime baseDelay = juce::RelativeTime::seconds(1.0);
  juce::RelativeTime maxDelay = juce::RelativeTime::seconds(30.0);
  double jitterFactor = 0.5;

  static RetryPolicy standard();

  /** No retries at all */
  static RetryPolicy none();

  /** Whether another attempt is allowed after `retriesSoFar` retries failed with `error` */
  bool shouldRetry(const TransportError &error, int retriesSoFar) const;

  /**
   * Backoff before retry number `retry` (zero-based). `jitterUnit` is a
   * uniform sample in [0, 1) that gets scaled by jitterFactor.
   */
  juce::RelativeTime delayForRetry(int retry, double jitterUnit) const;

  /**
   * Delay to use for a given error: the backoff, stretched to the server's
   * Retry-After when a rate-limited response carries one, never above maxDelay.
   */
  juce::RelativeTime delayFor(const TransportError &error, int retry, double jitterUnit) const;
};

} // namespace Network
} // namespace Marquee
