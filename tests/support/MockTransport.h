#pragma once

#include "network/Transport.h"
#include <condition_variable>
#include <algorithm>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace Marquee {
namespace Testing {

/**
 * MockTransport - Scripted Transport for tests
 *
 * Responses are queued in order; once the queue is down to its last entry
 * that entry is repeated for every further call. Requests are recorded.
 *
 * hold() makes send() block until release() is called, so tests can pile
 * several callers onto one in-flight request.
 *
 * respondWith() replaces the script with a function of the request, for
 * concurrent callers whose order is not known.
 */
class MockTransport : public Network::Transport {
public:
  using Result = Outcome<Network::HttpResponse, Network::TransportError>;

  // ==========================================================================
  void respond(int statusCode, const juce::String &body = {}, const juce::StringPairArray &headers = {}) {
    Network::HttpResponse response;
    response.statusCode = statusCode;
    response.body = body;
    response.headers = headers;

    std::lock_guard<std::mutex> lock(mutex);
    script.push_back(Result::ok(response));
  }

  void fail(const Network::TransportError &error) {
    std::lock_guard<std::mutex> lock(mutex);
    script.push_back(Result::error(error));
  }

  using Responder = std::function<Result(const Network::HttpRequest &)>;

  void respondWith(Responder newResponder) {
    std::lock_guard<std::mutex> lock(mutex);
    responder = std::move(newResponder);
  }

  /** Drop every scripted response, e.g. to switch a test from online to offline */
  void reset() {
    std::lock_guard<std::mutex> lock(mutex);
    script.clear();
    responder = nullptr;
  }

  void hold() {
    std::lock_guard<std::mutex> lock(mutex);
    holding = true;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      holding = false;
    }
    gate.notify_all();
  }

  /** Wait until at least `count` callers are parked inside send() */
  bool waitForBlocked(int count, int timeoutMs = 2000) {
    std::unique_lock<std::mutex> lock(mutex);
    return gate.wait_for(lock, std::chrono::milliseconds(timeoutMs), [&]() { return blocked >= count; });
  }

  // ==========================================================================
  int getCallCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return static_cast<int>(requests.size());
  }

  std::vector<Network::HttpRequest> getRequests() const {
    std::lock_guard<std::mutex> lock(mutex);
    return requests;
  }

  /** Most send() calls that were inside the transport at the same time */
  int getPeakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex);
    return peakInFlight;
  }

  Network::HttpRequest lastRequest() const {
    std::lock_guard<std::mutex> lock(mutex);
    return requests.empty() ? Network::HttpRequest{} : requests.back();
  }

  // ==========================================================================
  Result send(const Network::HttpRequest &request, const Util::CancellationToken &token) override {
    // Registered outside the lock: it runs immediately if already cancelled
    int callbackId = token.onCancellation([this]() {
      std::lock_guard<std::mutex> wake(mutex);
      gate.notify_all();
    });

    auto result = next(request, token);
    token.removeCallback(callbackId);
    return result;
  }

private:
  mutable std::mutex mutex;
  std::condition_variable gate;
  std::deque<Result> script;
  std::vector<Network::HttpRequest> requests;
  Responder responder;
  bool holding = false;
  int blocked = 0;
  int inFlight = 0;
  int peakInFlight = 0;

  Result next(const Network::HttpRequest &request, const Util::CancellationToken &token) {
    std::unique_lock<std::mutex> lock(mutex);
    requests.push_back(request);

    peakInFlight = std::max(peakInFlight, ++inFlight);
    struct Leave {
      int &count;
      ~Leave() {
        --count;
      }
    } leave{inFlight};

    if (holding) {
      blocked++;
      gate.notify_all();
      gate.wait(lock, [&]() { return !holding || token.isCancellationRequested(); });
      blocked--;
    }

    if (token.isCancellationRequested())
      return Result::error(Network::TransportError::cancelled());

    if (responder)
      return responder(request);

    if (script.empty())
      return Result::error(Network::TransportError::noConnectivity("no scripted response"));

    auto front = script.front();
    if (script.size() > 1)
      script.pop_front();
    return front;
  }
};

// ==============================================================================
/** Minimal TMDB-style listing body with the given item ids */
inline juce::String pageBody(std::initializer_list<int> ids, int page = 1, int totalPages = 1) {
  juce::String results;
  for (int id : ids) {
    if (results.isNotEmpty())
      results << ",";
    results << "{\"id\":" << id << ",\"title\":\"Movie " << id
            << "\",\"overview\":\"\",\"release_date\":\"2020-01-01\",\"vote_average\":7.0,"
               "\"vote_count\":100,\"popularity\":10.0,\"genre_ids\":[28],\"poster_path\":null}";
  }

  return "{\"page\":" + juce::String(page) + ",\"results\":[" + results + "],\"total_pages\":" +
         juce::String(totalPages) + ",\"total_results\":" + juce::String(static_cast<int>(ids.size())) + "}";
}

} // namespace Testing
} // namespace Marquee
