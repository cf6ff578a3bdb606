#include "JuceUrlTransport.h"
#include "../util/Constants.h"
#include "../util/Log.h"
#include <memory>

namespace Marquee {
namespace Network {

// ==============================================================================
JuceUrlTransport::Config JuceUrlTransport::Config::pinned() {
  Config cfg;
  cfg.pinnedHosts.add(Constants::Endpoints::API_HOST);
  cfg.pinnedHosts.add(Constants::Endpoints::IMAGE_HOST);
  cfg.requireHttps = true;
  return cfg;
}

JuceUrlTransport::Config JuceUrlTransport::Config::unrestricted() {
  Config cfg;
  cfg.requireHttps = true;
  return cfg;
}

JuceUrlTransport::JuceUrlTransport(const Config &cfg) : config(cfg) {
  if (config.pinnedHosts.isEmpty())
    Log::warn("JuceUrlTransport: no pinned hosts configured, any https host is trusted");
}

// ==============================================================================
Outcome<void, TransportError> JuceUrlTransport::checkTrust(const juce::URL &url) const {
  auto scheme = url.getScheme();
  auto host = url.getDomain();

  if (config.requireHttps && !scheme.equalsIgnoreCase("https"))
    return Outcome<void, TransportError>::error(
        TransportError::trustFailure("Refusing insecure scheme '" + scheme + "' for " + host));

  if (!config.pinnedHosts.isEmpty() && !config.pinnedHosts.contains(host, true))
    return Outcome<void, TransportError>::error(TransportError::trustFailure("Host is not pinned: " + host));

  return Outcome<void, TransportError>::ok();
}

int JuceUrlTransport::parseStatusCode(const juce::StringPairArray &headers) {
  // Some JUCE backends only report the status line as a pseudo header
  for (auto &key : headers.getAllKeys()) {
    if (key.startsWithIgnoreCase("HTTP/")) {
      auto parts = juce::StringArray::fromTokens(headers[key], " ", "");
      if (parts.size() >= 2)
        return parts[1].getIntValue();
    }
  }
  return 0;
}

juce::String JuceUrlTransport::buildHeaderString(const juce::StringPairArray &headers) {
  juce::String result;
  for (auto &key : headers.getAllKeys())
    result += key + ": " + headers[key] + "\r\n";
  return result;
}

// ==============================================================================
Outcome<HttpResponse, TransportError> JuceUrlTransport::send(const HttpRequest &request,
                                                            const Util::CancellationToken &token) {
  if (token.isCancellationRequested())
    return Outcome<HttpResponse, TransportError>::error(TransportError::cancelled());

  auto trust = checkTrust(request.url);
  if (trust.isError()) {
    Log::error("JuceUrlTransport: " + trust.getError().describe());
    return Outcome<HttpResponse, TransportError>::error(trust.getError());
  }

  auto stream = std::make_shared<juce::WebInputStream>(request.url, false);
  stream->withExtraHeaders(buildHeaderString(request.headers))
      .withCustomRequestCommand(request.method)
      .withConnectionTimeout(request.timeoutMs);

  // The callback owns a reference: cancel() may still be running it after removeCallback()
  int callbackId = token.onCancellation([stream]() { stream->cancel(); });

  Log::debug("JuceUrlTransport: " + request.method + " " + request.url.toString(false));
  auto result = exchange(*stream, request, token);

  token.removeCallback(callbackId);
  return result;
}

Outcome<HttpResponse, TransportError> JuceUrlTransport::exchange(juce::WebInputStream &stream,
                                                                const HttpRequest &request,
                                                                const Util::CancellationToken &token) {
  using Result = Outcome<HttpResponse, TransportError>;

  const auto startMs = juce::Time::getMillisecondCounterHiRes();
  auto elapsedMs = [startMs]() { return juce::Time::getMillisecondCounterHiRes() - startMs; };

  const bool connected = stream.connect(nullptr);

  if (token.isCancellationRequested())
    return Result::error(TransportError::cancelled());

  auto responseHeaders = stream.getResponseHeaders();
  int statusCode = stream.getStatusCode();
  if (statusCode == 0)
    statusCode = parseStatusCode(responseHeaders);

  if (!connected || stream.isError()) {
    // Some backends report error statuses as a failed connection
    if (statusCode >= 400) {
      HttpResponse response;
      response.statusCode = statusCode;
      response.headers = responseHeaders;
      return Result::ok(std::move(response));
    }

    if (elapsedMs() >= request.timeoutMs)
      return Result::error(TransportError::timeout("No response within " + juce::String(request.timeoutMs) + "ms"));

    return Result::error(TransportError::noConnectivity("Failed to connect to " + request.url.getDomain()));
  }

  juce::MemoryOutputStream body;
  char buffer[8192];

  while (!stream.isExhausted()) {
    if (token.isCancellationRequested())
      return Result::error(TransportError::cancelled());

    if (elapsedMs() >= request.timeoutMs)
      return Result::error(TransportError::timeout("Response body not received within " +
                                                   juce::String(request.timeoutMs) + "ms"));

    auto bytesRead = stream.read(buffer, static_cast<int>(sizeof(buffer)));
    if (bytesRead <= 0)
      break;

    body.write(buffer, static_cast<size_t>(bytesRead));
  }

  // A cancelled read ends the loop early with a truncated body
  if (token.isCancellationRequested())
    return Result::error(TransportError::cancelled());

  HttpResponse response;
  // A stream without a parsable status line only happens on success paths
  response.statusCode = statusCode != 0 ? statusCode : 200;
  response.body = body.toUTF8();
  response.headers = responseHeaders;

  Log::debug("JuceUrlTransport: HTTP " + juce::String(response.statusCode) + " from " + request.url.getDomain() +
             " in " + juce::String(static_cast<int>(elapsedMs())) + "ms");

  return Result::ok(std::move(response));
}

} // namespace Network
} // namespace Marquee
