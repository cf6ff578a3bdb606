#pragma once

#include "TransportError.h"
#include "../util/Result.h"
#include "../util/async/CancellationToken.h"
#include <juce_core/juce_core.h>

namespace Marquee {
namespace Network {

// ==============================================================================
struct HttpRequest {
  juce::URL url;
  juce::String method = "GET";
  juce::StringPairArray headers;
  int timeoutMs = 30000;
};

struct HttpResponse {
  int statusCode = 0;
  juce::String body;
  juce::StringPairArray headers;

  bool isSuccess() const {
    return statusCode >= 200 && statusCode < 300;
  }

  /** Case-insensitive header lookup, empty if absent */
  juce::String header(const juce::String &name) const {
    return headers.getValue(name, {});
  }
};

// ==============================================================================
/**
 * Transport - The raw HTTP primitive the catalog client sits on
 *
 * send() performs exactly one attempt. Any HTTP status, including 4xx/5xx,
 * comes back as an HttpResponse; the error branch is reserved for failures
 * that never produced a status (timeout, no connectivity, trust, cancellation).
 * Retrying and status classification belong to the caller.
 */
class Transport {
public:
  virtual ~Transport() = default;

  virtual Outcome<HttpResponse, TransportError> send(const HttpRequest &request,
                                                     const Util::CancellationToken &token) = 0;
};

} // namespace Network
} // namespace Marquee
