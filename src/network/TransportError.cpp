#include "TransportError.h"

namespace Marquee {
namespace Network {

namespace {
TransportError make(TransportError::Kind kind, int statusCode, const juce::String &message) {
  TransportError error;
  error.kind = kind;
  error.statusCode = statusCode;
  error.message = message;
  return error;
}
} // namespace

// ==============================================================================
TransportError TransportError::timeout(const juce::String &message) {
  return make(Kind::Timeout, 0, message.isNotEmpty() ? message : "Request timed out");
}

TransportError TransportError::noConnectivity(const juce::String &message) {
  return make(Kind::NoConnectivity, 0, message.isNotEmpty() ? message : "Failed to connect to server");
}

TransportError TransportError::rateLimited(std::optional<juce::RelativeTime> retryAfter) {
  auto error = make(Kind::RateLimited, 429, "Too many requests");
  error.retryAfter = retryAfter;
  return error;
}

TransportError TransportError::serverError(int statusCode, const juce::String &message) {
  return make(Kind::ServerError, statusCode, message);
}

TransportError TransportError::clientError(int statusCode, const juce::String &message) {
  return make(Kind::ClientError, statusCode, message);
}

TransportError TransportError::decodingError(const juce::String &message) {
  return make(Kind::DecodingError, 0, message);
}

TransportError TransportError::trustFailure(const juce::String &message) {
  return make(Kind::TrustFailure, 0, message);
}

TransportError TransportError::cancelled() {
  return make(Kind::Cancelled, 0, "Request cancelled");
}

TransportError TransportError::unknown(const juce::String &message) {
  return make(Kind::Unknown, 0, message);
}

TransportError TransportError::fromStatusCode(int statusCode, std::optional<juce::RelativeTime> retryAfter) {
  if (statusCode == 429)
    return rateLimited(retryAfter);
  if (statusCode >= 500 && statusCode < 600)
    return serverError(statusCode, "HTTP " + juce::String(statusCode));
  if (statusCode >= 400 && statusCode < 500)
    return clientError(statusCode, "HTTP " + juce::String(statusCode));

  auto error = unknown("Unexpected HTTP status " + juce::String(statusCode));
  error.statusCode = statusCode;
  return error;
}

// ==============================================================================
bool TransportError::isRetryable() const {
  switch (kind) {
  case Kind::Timeout:
  case Kind::RateLimited:
  case Kind::ServerError:
    return true;
  case Kind::NoConnectivity:
  case Kind::ClientError:
  case Kind::DecodingError:
  case Kind::TrustFailure:
  case Kind::Cancelled:
  case Kind::Unknown:
    return false;
  }
  return false;
}

juce::String TransportError::describe() const {
  juce::String text = kindToString(kind);

  if (statusCode != 0)
    text << "(" << statusCode << ")";

  if (retryAfter.has_value())
    text << " retry after " << juce::String(retryAfter->inSeconds(), 1) << "s";

  if (message.isNotEmpty())
    text << ": " << message;

  return text;
}

juce::String TransportError::getUserFriendlyMessage() const {
  switch (kind) {
  case Kind::Timeout:
    return "The request timed out. Please try again.";
  case Kind::NoConnectivity:
    return "You appear to be offline. Showing saved results where possible.";
  case Kind::RateLimited:
    return "Too many requests. Please wait a moment and try again.";
  case Kind::ServerError:
    return "The movie service is having trouble. Please try again later.";
  case Kind::ClientError:
    if (statusCode == 401)
      return "The movie service rejected our credentials.";
    if (statusCode == 404)
      return "That title could not be found.";
    return "The request could not be completed.";
  case Kind::DecodingError:
    return "We received an unexpected response from the movie service.";
  case Kind::TrustFailure:
    return "A secure connection to the movie service could not be verified.";
  case Kind::Cancelled:
    return "The request was cancelled.";
  case Kind::Unknown:
    break;
  }
  return "Something went wrong. Please try again.";
}

const char *kindToString(TransportError::Kind kind) {
  switch (kind) {
  case TransportError::Kind::Timeout:
    return "timeout";
  case TransportError::Kind::NoConnectivity:
    return "noConnectivity";
  case TransportError::Kind::RateLimited:
    return "rateLimited";
  case TransportError::Kind::ServerError:
    return "serverError";
  case TransportError::Kind::ClientError:
    return "clientError";
  case TransportError::Kind::DecodingError:
    return "decodingError";
  case TransportError::Kind::TrustFailure:
    return "trustFailure";
  case TransportError::Kind::Cancelled:
    return "cancelled";
  case TransportError::Kind::Unknown:
    return "unknown";
  }
  return "unknown";
}

} // namespace Network
} // namespace Marquee
