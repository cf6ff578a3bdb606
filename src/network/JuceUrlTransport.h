#pragma once

#include "Transport.h"
#include <juce_core/juce_core.h>

namespace Marquee {
namespace Network {

// ==============================================================================
/**
 * JuceUrlTransport - Transport implementation on top of juce::WebInputStream
 *
 * Each send() opens one stream with the request's connection timeout,
 * captures status code and response headers, and reads the body in chunks.
 * Cancelling the token calls WebInputStream::cancel(), which aborts a
 * connect that is still blocked as well as a read in progress, so a
 * cancelled request frees its worker without waiting for the timeout.
 *
 * Trust policy: only https URLs whose host is on the pinned host list are
 * contacted. Anything else fails with trustFailure before a connection is
 * opened. Certificate chain validation itself is left to the platform TLS
 * stack, whose failures surface from JUCE as connection failures.
 */
class JuceUrlTransport : public Transport {
public:
  struct Config {
    juce::StringArray pinnedHosts;
    bool requireHttps = true;

    // Hosts of the metadata API and the image CDN
    static Config pinned();

    // No host restriction, https still required
    static Config unrestricted();
  };

  explicit JuceUrlTransport(const Config &config = Config::pinned());

  Outcome<HttpResponse, TransportError> send(const HttpRequest &request,
                                             const Util::CancellationToken &token) override;

  /** Check scheme and host against the trust policy without connecting */
  Outcome<void, TransportError> checkTrust(const juce::URL &url) const;

  const Config &getConfig() const {
    return config;
  }

private:
  static Outcome<HttpResponse, TransportError> exchange(juce::WebInputStream &stream, const HttpRequest &request,
                                                        const Util::CancellationToken &token);

  static int parseStatusCode(const juce::StringPairArray &headers);
  static juce::String buildHeaderString(const juce::StringPairArray &headers);

  Config config;
};

} // namespace Network
} // namespace Marquee
