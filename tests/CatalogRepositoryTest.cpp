#include <catch2/catch_test_macros.hpp>
#include "catalog/CatalogRepository.h"
#include "support/ManualClock.h"
#include "util/Constants.h"
#include "support/MockTransport.h"
#include <future>
#include <thread>
#include <vector>

using namespace Marquee;
using namespace Marquee::Network;
using Marquee::Catalog::CatalogRepository;
using Marquee::Cache::OfflineCatalogCache;
using Marquee::Testing::ManualClock;
using Marquee::Testing::MockTransport;
using Marquee::Testing::pageBody;

namespace {
struct RepositoryFixture {
  MockTransport transport;
  ManualClock clock;
  Util::TaskScheduler scheduler{4};
  CatalogClient client{transport, CatalogClient::Config::production("test-key")};
  OfflineCatalogCache cache{OfflineCatalogCache::Config::inMemory(), clock};
  CatalogRepository repository{client, cache, scheduler, clock};

  RepositoryFixture() {
    client.setSleeper([](juce::RelativeTime, const Util::CancellationToken &token) {
      return !token.isCancellationRequested();
    });
  }
};

std::vector<int> idsOf(const std::vector<CatalogItem> &items) {
  std::vector<int> ids;
  for (const auto &item : items)
    ids.push_back(item.id);
  return ids;
}
} // namespace

//==============================================================================
TEST_CASE("CatalogRepository loads and caches categories", "[CatalogRepository]") {
  RepositoryFixture f;
  f.transport.respond(200, pageBody({1, 2, 3}, 1, 3));

  auto result = f.repository.loadCategory(Category::Popular);
  REQUIRE(result.isOk());
  REQUIRE(idsOf(result.getValue().items) == std::vector<int>{1, 2, 3});
  REQUIRE_FALSE(result.getValue().fromCache);
  REQUIRE(result.getValue().hasMorePages());

  REQUIRE(idsOf(f.cache.getCategory("popular")) == std::vector<int>{1, 2, 3});

  SECTION("repeat loads inside the window are served from memory") {
    REQUIRE(f.repository.loadCategory(Category::Popular).isOk());
    REQUIRE(f.transport.getCallCount() == 1);
  }

  SECTION("invalidate forces a refetch") {
    f.repository.invalidate(CatalogQuery::listing(Category::Popular));
    REQUIRE(f.repository.loadCategory(Category::Popular).isOk());
    REQUIRE(f.transport.getCallCount() == 2);
  }

  SECTION("later pages cache items without touching the index") {
    f.transport.reset();
    f.transport.respond(200, pageBody({4, 5}, 2, 3));

    REQUIRE(f.repository.loadCategory(Category::Popular, 2).isOk());
    REQUIRE(idsOf(f.cache.getCategory("popular")) == std::vector<int>{1, 2, 3});
    REQUIRE(f.cache.get(4).has_value());
  }
}

//==============================================================================
TEST_CASE("CatalogRepository concurrent loads hit the network once", "[CatalogRepository]") {
  RepositoryFixture f;
  f.transport.hold();
  f.transport.respond(200, pageBody({7, 8}));
  const auto revisionBefore = f.cache.getStats().revision;

  std::vector<std::future<CatalogRepository::ListingOutcome>> callers;
  for (int i = 0; i < 5; ++i)
    callers.push_back(std::async(std::launch::async, [&]() { return f.repository.loadCategory(Category::Trending); }));

  REQUIRE(f.transport.waitForBlocked(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  f.transport.release();

  for (auto &caller : callers)
    REQUIRE(idsOf(caller.get().getValue().items) == std::vector<int>{7, 8});

  REQUIRE(f.transport.getCallCount() == 1);
  REQUIRE(f.cache.getStats().revision == revisionBefore + 1);
}

//==============================================================================
TEST_CASE("CatalogRepository writes the cache once per fetch", "[CatalogRepository]") {
  RepositoryFixture f;
  f.transport.respond(200, pageBody({1, 2}));
  REQUIRE(f.repository.loadCategory(Category::Popular).isOk());

  SECTION("memoized results do not repopulate a cleared cache") {
    f.cache.clear();
    const auto revisionAfterClear = f.cache.getStats().revision;

    auto result = f.repository.loadCategory(Category::Popular);
    REQUIRE(result.isOk());
    REQUIRE(idsOf(result.getValue().items) == std::vector<int>{1, 2});
    REQUIRE(f.transport.getCallCount() == 1);
    REQUIRE(f.cache.getCategory("popular").empty());
    REQUIRE(f.cache.getStats().revision == revisionAfterClear);
  }

  SECTION("item lookups write once and memo hits leave the cache alone") {
    f.transport.reset();
    f.transport.respond(200, R"({"id": 42, "title": "Answer"})");

    const auto before = f.cache.getStats().revision;
    REQUIRE(f.repository.loadItem(42).isOk());
    REQUIRE(f.repository.loadItem(42).isOk());
    REQUIRE(f.repository.loadItem(42).isOk());

    REQUIRE(f.transport.getCallCount() == 1);
    REQUIRE(f.cache.getStats().revision == before + 1);
  }
}

//==============================================================================
TEST_CASE("CatalogRepository search indices stay bounded", "[CatalogRepository]") {
  RepositoryFixture f;

  for (int i = 0; i < 120; ++i) {
    f.transport.reset();
    f.transport.respond(200, pageBody({1000 + i}));
    REQUIRE(f.repository.search("query " + juce::String(i)).isOk());
    REQUIRE(static_cast<size_t>(f.cache.getCategoryNames().size()) <= Constants::Cache::MAX_CATEGORIES);
  }

  f.transport.reset();
  f.transport.respond(200, pageBody({1, 2}));
  REQUIRE(f.repository.loadCategory(Category::Popular).isOk());

  f.clock.advance(juce::RelativeTime::minutes(31.0));
  f.cache.evictExpired();

  REQUIRE(f.cache.getCategoryNames() == juce::StringArray{"popular"});
}

//==============================================================================
TEST_CASE("CatalogRepository falls back to the offline cache", "[CatalogRepository]") {
  RepositoryFixture f;
  f.transport.respond(200, pageBody({1, 2}));
  REQUIRE(f.repository.loadCategory(Category::TopRated).isOk());

  f.transport.reset();
  f.transport.fail(TransportError::noConnectivity());
  f.clock.advance(juce::RelativeTime::hours(2.0));

  SECTION("cached items are served with the network error attached") {
    auto result = f.repository.loadCategory(Category::TopRated);
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().fromCache);
    REQUIRE(idsOf(result.getValue().items) == std::vector<int>{1, 2});
    REQUIRE(result.getValue().networkError->kind == TransportError::Kind::NoConnectivity);
    REQUIRE_FALSE(result.getValue().hasMorePages());
  }

  SECTION("nothing cached surfaces the error") {
    auto result = f.repository.loadCategory(Category::Upcoming);
    REQUIRE(result.isError());
    REQUIRE(result.getError().kind == TransportError::Kind::NoConnectivity);
  }

  SECTION("expired cache entries are not served") {
    f.clock.advance(juce::RelativeTime::days(2.0));
    REQUIRE(f.repository.loadCategory(Category::TopRated).isError());
  }

  SECTION("items fall back individually") {
    auto lookup = f.repository.loadItem(2);
    REQUIRE(lookup.isOk());
    REQUIRE(lookup.getValue().fromCache);
    REQUIRE(lookup.getValue().item.id == 2);
  }
}

//==============================================================================
TEST_CASE("CatalogRepository loads item batches", "[CatalogRepository]") {
  RepositoryFixture f;
  f.transport.respondWith([](const HttpRequest &request) {
    const int id = request.url.toString(false).fromLastOccurrenceOf("/", false, false).getIntValue();

    HttpResponse response;
    response.statusCode = 200;
    response.body = "{\"id\": " + juce::String(id) + ", \"title\": \"Movie " + juce::String(id) + "\"}";
    return MockTransport::Result::ok(response);
  });

  auto loaded = f.repository.loadItems({5, 6, 7, 8});
  REQUIRE(loaded.isOk());
  REQUIRE(idsOf(loaded.getValue().items) == std::vector<int>{5, 6, 7, 8});
  REQUIRE_FALSE(loaded.getValue().fromCache);
  REQUIRE(f.cache.get(8).has_value());

  f.transport.reset();
  f.transport.fail(TransportError::timeout());

  SECTION("a failed batch is served from the cache when every item is there") {
    auto cached = f.repository.loadItems({8, 5});
    REQUIRE(cached.isOk());
    REQUIRE(cached.getValue().fromCache);
    REQUIRE(idsOf(cached.getValue().items) == std::vector<int>{8, 5});
    REQUIRE(cached.getValue().networkError->kind == TransportError::Kind::Timeout);
  }

  SECTION("one uncached item surfaces the error") {
    auto partial = f.repository.loadItems({5, 9});
    REQUIRE(partial.isError());
    REQUIRE(partial.getError().kind == TransportError::Kind::Timeout);
  }
}

//==============================================================================
TEST_CASE("CatalogRepository cancellation is surfaced, not masked", "[CatalogRepository]") {
  RepositoryFixture f;
  f.transport.respond(200, pageBody({1, 2}));
  REQUIRE(f.repository.loadCategory(Category::Popular).isOk());
  f.repository.invalidateAll();

  Util::CancellationTokenSource source;
  source.cancel();

  auto result = f.repository.loadCategory(Category::Popular, 1, *source.token());
  REQUIRE(result.isError());
  REQUIRE(result.getError().kind == TransportError::Kind::Cancelled);
}

//==============================================================================
TEST_CASE("CatalogRepository search and related", "[CatalogRepository]") {
  RepositoryFixture f;

  SECTION("blank searches never reach the network") {
    auto result = f.repository.search("   ");
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().items.empty());
    REQUIRE(f.transport.getCallCount() == 0);
  }

  SECTION("searches are cached under their normalized text") {
    f.transport.respond(200, pageBody({42}));
    REQUIRE(f.repository.search(" Dune ").isOk());
    REQUIRE(idsOf(f.cache.getCategory("search:dune")) == std::vector<int>{42});
  }

  SECTION("related items") {
    f.transport.respond(200, pageBody({5, 6}));
    auto result = f.repository.loadRelated(CatalogQuery::similar(42));
    REQUIRE(result.isOk());
    REQUIRE(f.transport.lastRequest().url.toString(false).endsWith("/movie/42/similar"));
    REQUIRE(f.cache.getCategory("similar:42").size() == 2);
  }

  SECTION("non-related queries are rejected") {
    auto result = f.repository.loadRelated(CatalogQuery::listing(Category::Popular));
    REQUIRE(result.getError().statusCode == 400);
    REQUIRE(f.transport.getCallCount() == 0);
  }
}

//==============================================================================
TEST_CASE("CatalogRepository observeCategory", "[CatalogRepository]") {
  RepositoryFixture f;
  f.transport.respond(200, pageBody({3, 4}));

  std::vector<int> received;
  bool completed = false;
  f.repository.observeCategory(Category::NowPlaying)
      .subscribe([&](const Catalog::Listing &listing) { received = idsOf(listing.items); },
                 [](std::exception_ptr) {}, [&]() { completed = true; });

  REQUIRE(received == std::vector<int>{3, 4});
  REQUIRE(completed);
}

//==============================================================================
TEST_CASE("CatalogRepository cache index names", "[CatalogRepository]") {
  REQUIRE(CatalogRepository::cacheIndexName(CatalogQuery::listing(Category::TopRated)) == "topRated");
  REQUIRE(CatalogRepository::cacheIndexName(CatalogQuery::search(" Alien ")) == "search:alien");
  REQUIRE(CatalogRepository::cacheIndexName(CatalogQuery::recommendations(9)) == "recommendations:9");
}
