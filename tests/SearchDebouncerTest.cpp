#include <catch2/catch_test_macros.hpp>
#include "catalog/SearchDebouncer.h"
#include "support/ManualClock.h"
#include "support/MockTransport.h"
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <thread>

using namespace Marquee;
using namespace Marquee::Network;
using Marquee::Catalog::CatalogRepository;
using Marquee::Catalog::SearchDebouncer;
using Marquee::Cache::OfflineCatalogCache;
using Marquee::Testing::ManualClock;
using Marquee::Testing::MockTransport;
using Marquee::Testing::pageBody;

namespace {
struct DebouncerFixture {
  MockTransport transport;
  ManualClock clock;
  Util::TaskScheduler scheduler{4};
  CatalogClient client{transport, CatalogClient::Config::production("test-key")};
  OfflineCatalogCache cache{OfflineCatalogCache::Config::inMemory(), clock};
  CatalogRepository repository{client, cache, scheduler, clock};
};
} // namespace

//==============================================================================
TEST_CASE("SearchDebouncer collapses a burst into one request", "[SearchDebouncer]") {
  DebouncerFixture f;
  f.transport.respond(200, pageBody({1, 2}));
  SearchDebouncer debouncer(f.repository, f.scheduler, juce::RelativeTime::milliseconds(200));

  std::mutex mutex;
  std::map<juce::String, TransportError::Kind> failures;
  std::map<juce::String, size_t> found;

  for (auto text : {"ma", "mat", "matrix"}) {
    debouncer.submit(text, [&mutex, &failures, &found, text](const CatalogRepository::ListingOutcome &result) {
      std::lock_guard<std::mutex> lock(mutex);
      if (result.isOk())
        found[text] = result.getValue().items.size();
      else
        failures[text] = result.getError().kind;
    });
  }

  REQUIRE(f.scheduler.waitForAll(5000));

  REQUIRE(found.size() == 1);
  REQUIRE(found["matrix"] == 2);
  REQUIRE(failures.size() == 2);
  REQUIRE(failures["ma"] == TransportError::Kind::Cancelled);
  REQUIRE(failures["mat"] == TransportError::Kind::Cancelled);

  REQUIRE(f.transport.getCallCount() == 1);
  REQUIRE(f.transport.lastRequest().url.toString(true).contains("query=matrix"));
}

//==============================================================================
TEST_CASE("SearchDebouncer remembers the last first page", "[SearchDebouncer]") {
  DebouncerFixture f;
  f.transport.respond(200, pageBody({1, 2}));
  SearchDebouncer debouncer(f.repository, f.scheduler, juce::RelativeTime::milliseconds(10));

  REQUIRE(debouncer.search("matrix").isOk());
  f.repository.invalidateAll();

  SECTION("the same text is answered without a request") {
    auto again = debouncer.search("  matrix ");
    REQUIRE(again.isOk());
    REQUIRE(again.getValue().items.size() == 2);
    REQUIRE(f.transport.getCallCount() == 1);
  }

  SECTION("clearCache forgets it") {
    debouncer.clearCache();
    REQUIRE(debouncer.search("matrix").isOk());
    REQUIRE(f.transport.getCallCount() == 2);
  }

  SECTION("later pages always go to the repository") {
    REQUIRE(debouncer.search("matrix", 2).isOk());
    REQUIRE(f.transport.getCallCount() == 2);
  }

  SECTION("offline fallbacks are not remembered") {
    f.transport.reset();
    f.transport.fail(TransportError::noConnectivity());

    debouncer.clearCache();
    auto offline = debouncer.search("matrix");
    REQUIRE(offline.isOk());
    REQUIRE(offline.getValue().fromCache);

    f.transport.reset();
    f.transport.respond(200, pageBody({3}));
    f.repository.invalidateAll();

    auto online = debouncer.search("matrix");
    REQUIRE_FALSE(online.getValue().fromCache);
    REQUIRE(online.getValue().items.size() == 1);
  }
}

//==============================================================================
TEST_CASE("SearchDebouncer cancellation", "[SearchDebouncer]") {
  DebouncerFixture f;
  f.transport.respond(200, pageBody({1}));

  SECTION("cancel() ends the wait early") {
    SearchDebouncer debouncer(f.repository, f.scheduler, juce::RelativeTime::seconds(10.0));

    auto started = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&debouncer]() { return debouncer.search("slow"); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    debouncer.cancel();

    auto result = pending.get();
    REQUIRE(result.getError().kind == TransportError::Kind::Cancelled);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
    REQUIRE(f.transport.getCallCount() == 0);
  }

  SECTION("destruction waits for submitted searches") {
    std::atomic<bool> delivered{false};
    {
      SearchDebouncer debouncer(f.repository, f.scheduler, juce::RelativeTime::seconds(10.0));
      debouncer.submit("slow", [&delivered](const CatalogRepository::ListingOutcome &result) {
        delivered.store(result.isError() && result.getError().kind == TransportError::Kind::Cancelled);
      });
    }

    REQUIRE(delivered.load());
    REQUIRE(f.transport.getCallCount() == 0);
  }

  SECTION("blank text finishes with an empty listing") {
    SearchDebouncer debouncer(f.repository, f.scheduler, juce::RelativeTime::milliseconds(10));
    auto result = debouncer.search("   ");
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().items.empty());
    REQUIRE(f.transport.getCallCount() == 0);
  }
}
