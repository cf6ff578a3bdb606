#pragma once

#include <juce_core/juce_core.h>
#include <optional>
#include <stdexcept>

namespace Marquee {
namespace Network {

// ==============================================================================
/**
 * TransportError - The closed set of failures the network boundary reports
 *
 * Every failure surfaced by the catalog client is one of these kinds; callers
 * decide on fallback behavior by kind, never by parsing messages.
 *
 * Retry policy by kind:
 * - Timeout, RateLimited, ServerError: retried by the catalog client with backoff
 * - everything else: surfaced immediately
 */
struct TransportError {
  enum class Kind {
    Timeout,
    NoConnectivity,
    RateLimited,
    ServerError,
    ClientError,
    DecodingError,
    TrustFailure,
    Cancelled,
    Unknown
  };

  Kind kind = Kind::Unknown;
  int statusCode = 0;                           // ServerError / ClientError / RateLimited
  std::optional<juce::RelativeTime> retryAfter; // RateLimited only, when the server said so
  juce::String message;

  // ==========================================================================
  // Factories
  static TransportError timeout(const juce::String &message = {});
  static TransportError noConnectivity(const juce::String &message = {});
  static TransportError rateLimited(std::optional<juce::RelativeTime> retryAfter = std::nullopt);
  static TransportError serverError(int statusCode, const juce::String &message = {});
  static TransportError clientError(int statusCode, const juce::String &message = {});
  static TransportError decodingError(const juce::String &message);
  static TransportError trustFailure(const juce::String &message);
  static TransportError cancelled();
  static TransportError unknown(const juce::String &message);

  /**
   * Classify a non-success HTTP status: 429 is RateLimited, 5xx ServerError,
   * any other 4xx ClientError. Anything else is Unknown.
   */
  static TransportError fromStatusCode(int statusCode, std::optional<juce::RelativeTime> retryAfter = std::nullopt);

  // ==========================================================================
  bool isRetryable() const;

  bool is(Kind k) const {
    return kind == k;
  }

  /** Log-friendly description, e.g. "serverError(503): Service Unavailable" */
  juce::String describe() const;

  /** Message suitable for showing to the user */
  juce::String getUserFriendlyMessage() const;

  bool operator==(const TransportError &other) const {
    return kind == other.kind && statusCode == other.statusCode;
  }
  bool operator!=(const TransportError &other) const {
    return !(*this == other);
  }
};

const char *kindToString(TransportError::Kind kind);

// ==============================================================================
/**
 * TransportException - Carries a TransportError through the RxCpp on_error channel
 */
class TransportException : public std::runtime_error {
public:
  explicit TransportException(const TransportError &error)
      : std::runtime_error(error.describe().toStdString()), transportError(error) {}

  const TransportError &getError() const noexcept {
    return transportError;
  }

private:
  TransportError transportError;
};

} // namespace Network
} // namespace Marquee
