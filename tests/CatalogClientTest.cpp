#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include "network/CatalogClient.h"
#include "support/MockTransport.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace Marquee;
using namespace Marquee::Network;
using Marquee::Testing::MockTransport;
using Marquee::Testing::pageBody;
using Catch::Approx;

namespace {
CatalogClient::Config testConfig() {
  auto config = CatalogClient::Config::production("test-key");
  config.baseUrl = "https://api.themoviedb.org/3";
  return config;
}

// Records backoff delays instead of sleeping
struct RecordingSleeper {
  std::shared_ptr<std::vector<double>> delays = std::make_shared<std::vector<double>>();

  CatalogClient::Sleeper make() const {
    auto recorded = delays;
    return [recorded](juce::RelativeTime delay, const Util::CancellationToken &token) {
      recorded->push_back(delay.inSeconds());
      return !token.isCancellationRequested();
    };
  }
};
} // namespace

//==============================================================================
TEST_CASE("CatalogClient Config", "[CatalogClient]") {
  SECTION("production config points at TMDB") {
    auto config = CatalogClient::Config::production("abc");
    REQUIRE(config.baseUrl == "https://api.themoviedb.org/3");
    REQUIRE(config.apiKey == "abc");
    REQUIRE(config.retry.maxRetries == 3);
    REQUIRE(config.pageBatchDelayMs == 100);
  }
}

//==============================================================================
TEST_CASE("CatalogClient request building", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());

  auto request = client.buildRequest(CatalogQuery::listing(Category::Popular, 2));
  auto url = request.url.toString(true);

  REQUIRE(url.startsWith("https://api.themoviedb.org/3/movie/popular"));
  REQUIRE(url.contains("page=2"));
  REQUIRE(url.contains("api_key=test-key"));
  REQUIRE(request.method == "GET");
  REQUIRE(request.headers["Accept"] == "application/json");
  REQUIRE(request.timeoutMs == 30000);

  SECTION("searches use the short timeout") {
    REQUIRE(client.buildRequest(CatalogQuery::search("dune")).timeoutMs == 10000);
  }
}

//==============================================================================
TEST_CASE("CatalogClient decodes listings", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());

  transport.respond(200, pageBody({11, 12, 13}, 1, 4));

  auto result = client.fetch(CatalogQuery::listing(Category::Popular));
  REQUIRE(result.isOk());
  REQUIRE(result.getValue().itemIds() == std::vector<int>{11, 12, 13});
  REQUIRE(result.getValue().totalPages == 4);
  REQUIRE(transport.getCallCount() == 1);
}

//==============================================================================
TEST_CASE("CatalogClient blank search", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());

  for (auto text : {"", "   ", "\t \n"}) {
    auto result = client.fetch(CatalogQuery::search(text));
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().empty());
  }

  REQUIRE(transport.getCallCount() == 0);
  REQUIRE(client.getAttemptCount() == 0);
}

//==============================================================================
TEST_CASE("CatalogClient retries retryable failures", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());
  RecordingSleeper sleeper;
  client.setSleeper(sleeper.make());
  client.setJitterSource([]() { return 0.0; });

  SECTION("persistent 503 gives up after four attempts") {
    transport.respond(503);

    auto result = client.fetch(CatalogQuery::listing(Category::Popular));
    REQUIRE(result.isError());
    REQUIRE(result.getError().kind == TransportError::Kind::ServerError);
    REQUIRE(result.getError().statusCode == 503);
    REQUIRE(transport.getCallCount() == 4);

    REQUIRE(sleeper.delays->size() == 3);
    REQUIRE((*sleeper.delays)[0] == Approx(1.0));
    REQUIRE((*sleeper.delays)[1] == Approx(2.0));
    REQUIRE((*sleeper.delays)[2] == Approx(4.0));
  }

  SECTION("a transient 503 recovers") {
    transport.respond(503);
    transport.respond(200, pageBody({1}));

    auto result = client.fetch(CatalogQuery::listing(Category::Popular));
    REQUIRE(result.isOk());
    REQUIRE(transport.getCallCount() == 2);
  }

  SECTION("timeouts are retried") {
    transport.fail(TransportError::timeout());
    transport.respond(200, pageBody({1}));

    REQUIRE(client.fetch(CatalogQuery::listing(Category::Trending)).isOk());
    REQUIRE(transport.getCallCount() == 2);
  }

  SECTION("429 waits for Retry-After") {
    juce::StringPairArray headers;
    headers.set("Retry-After", "7");
    transport.respond(429, {}, headers);
    transport.respond(200, pageBody({1}));

    REQUIRE(client.fetch(CatalogQuery::listing(Category::Popular)).isOk());
    REQUIRE(transport.getCallCount() == 2);
    REQUIRE(sleeper.delays->size() == 1);
    REQUIRE((*sleeper.delays)[0] == Approx(7.0));
  }

  SECTION("jitter stays within bounds") {
    client.setJitterSource([]() { return 0.999; });
    transport.respond(503);

    REQUIRE(client.fetch(CatalogQuery::listing(Category::Popular)).isError());
    for (size_t i = 0; i < sleeper.delays->size(); ++i) {
      const double base = static_cast<double>(1 << i);
      REQUIRE((*sleeper.delays)[i] >= base);
      REQUIRE((*sleeper.delays)[i] <= base * 1.5);
    }
  }
}

//==============================================================================
TEST_CASE("CatalogClient surfaces non-retryable failures immediately", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());
  RecordingSleeper sleeper;
  client.setSleeper(sleeper.make());

  SECTION("404") {
    transport.respond(404);
    auto result = client.fetch(CatalogQuery::details(1));
    REQUIRE(result.getError().kind == TransportError::Kind::ClientError);
    REQUIRE(result.getError().statusCode == 404);
  }

  SECTION("malformed body") {
    transport.respond(200, "{\"page\": 1, \"results\": \"nope\"");
    auto result = client.fetch(CatalogQuery::listing(Category::Popular));
    REQUIRE(result.getError().kind == TransportError::Kind::DecodingError);
  }

  SECTION("body with the wrong shape") {
    transport.respond(200, "{\"page\": 1}");
    auto result = client.fetch(CatalogQuery::listing(Category::Popular));
    REQUIRE(result.getError().kind == TransportError::Kind::DecodingError);
  }

  SECTION("trust failure") {
    transport.fail(TransportError::trustFailure("certificate pin mismatch"));
    auto result = client.fetch(CatalogQuery::listing(Category::Popular));
    REQUIRE(result.getError().kind == TransportError::Kind::TrustFailure);
  }

  SECTION("no connectivity") {
    transport.fail(TransportError::noConnectivity());
    auto result = client.fetch(CatalogQuery::listing(Category::Popular));
    REQUIRE(result.getError().kind == TransportError::Kind::NoConnectivity);
  }

  REQUIRE(transport.getCallCount() == 1);
  REQUIRE(sleeper.delays->empty());
}

//==============================================================================
TEST_CASE("CatalogClient without an API key", "[CatalogClient]") {
  MockTransport transport;
  auto config = testConfig();
  config.apiKey = {};
  CatalogClient client(transport, config);

  auto result = client.fetch(CatalogQuery::listing(Category::Popular));
  REQUIRE(result.getError().kind == TransportError::Kind::ClientError);
  REQUIRE(result.getError().statusCode == 401);
  REQUIRE(transport.getCallCount() == 0);
}

//==============================================================================
TEST_CASE("CatalogClient cancellation", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());

  SECTION("an already cancelled token sends nothing") {
    Util::CancellationTokenSource source;
    source.cancel();

    auto result = client.fetch(CatalogQuery::listing(Category::Popular), *source.token());
    REQUIRE(result.getError().kind == TransportError::Kind::Cancelled);
    REQUIRE(transport.getCallCount() == 0);
  }

  SECTION("cancelling during backoff stops the retries") {
    Util::CancellationTokenSource source;
    client.setSleeper([&source](juce::RelativeTime, const Util::CancellationToken &) {
      source.cancel();
      return false;
    });
    transport.respond(503);

    auto result = client.fetch(CatalogQuery::listing(Category::Popular), *source.token());
    REQUIRE(result.getError().kind == TransportError::Kind::Cancelled);
    REQUIRE(transport.getCallCount() == 1);
  }
}

//==============================================================================
TEST_CASE("CatalogClient fetchItem", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());

  SECTION("decodes a details response") {
    transport.respond(200, R"({"id": 603, "title": "The Matrix", "vote_average": 8.2,
                               "genres": [{"id": 28, "name": "Action"}]})");

    auto result = client.fetchItem(603);
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().title == "The Matrix");
    REQUIRE(result.getValue().hasGenre(28));
    REQUIRE(transport.lastRequest().url.toString(false).endsWith("/movie/603"));
  }

  SECTION("details through fetch() yields a single item page") {
    transport.respond(200, R"({"id": 603, "title": "The Matrix"})");
    auto result = client.fetch(CatalogQuery::details(603));
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().itemIds() == std::vector<int>{603});
  }

  SECTION("invalid ids are rejected locally") {
    auto result = client.fetchItem(0);
    REQUIRE(result.getError().statusCode == 400);
    REQUIRE(transport.getCallCount() == 0);
  }
}

//==============================================================================
TEST_CASE("CatalogClient fetchPages", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());
  RecordingSleeper sleeper;
  client.setSleeper(sleeper.make());

  SECTION("concatenates pages in order") {
    transport.respond(200, pageBody({1, 2}, 1, 5));
    transport.respond(200, pageBody({3, 4}, 2, 5));
    transport.respond(200, pageBody({5}, 3, 5));

    auto result = client.fetchPages(Category::Popular, 1, 3);
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().size() == 5);
    REQUIRE(result.getValue().front().id == 1);
    REQUIRE(result.getValue().back().id == 5);
    REQUIRE(transport.getCallCount() == 3);
    REQUIRE(sleeper.delays->size() == 2);
  }

  SECTION("stops when the service runs out of pages") {
    transport.respond(200, pageBody({1, 2}, 1, 2));
    transport.respond(200, pageBody({3}, 2, 2));

    auto result = client.fetchPages(Category::Popular, 1, 5);
    REQUIRE(result.getValue().size() == 3);
    REQUIRE(transport.getCallCount() == 2);
  }

  SECTION("an error aborts the batch") {
    transport.respond(200, pageBody({1, 2}, 1, 5));
    transport.respond(404);

    auto result = client.fetchPages(Category::Popular, 1, 3);
    REQUIRE(result.isError());
    REQUIRE(result.getError().statusCode == 404);
  }
}

//==============================================================================
TEST_CASE("CatalogClient fetchItems", "[CatalogClient]") {
  MockTransport transport;
  Util::TaskScheduler scheduler(4);
  CatalogClient client(transport, testConfig());
  RecordingSleeper sleeper;
  client.setSleeper(sleeper.make());

  // Answers each details request with the id it asked for, 404 for the ids in `missing`
  auto detailsFor = [](std::vector<int> missing) {
    return [missing](const HttpRequest &request) {
      const int id = request.url.toString(false).fromLastOccurrenceOf("/", false, false).getIntValue();

      HttpResponse response;
      if (std::find(missing.begin(), missing.end(), id) != missing.end()) {
        response.statusCode = 404;
      } else {
        response.statusCode = 200;
        response.body = "{\"id\": " + juce::String(id) + ", \"title\": \"Movie " + juce::String(id) + "\"}";
      }
      return MockTransport::Result::ok(response);
    };
  };

  SECTION("batches keep the id order and pause between them") {
    transport.respondWith(detailsFor({}));

    auto result = client.fetchItems({11, 4, 27, 8, 15, 3, 42}, scheduler);
    REQUIRE(result.isOk());

    std::vector<int> ids;
    for (const auto &item : result.getValue())
      ids.push_back(item.id);
    REQUIRE(ids == std::vector<int>{11, 4, 27, 8, 15, 3, 42});

    REQUIRE(transport.getCallCount() == 7);
    REQUIRE(transport.getPeakInFlight() <= 3);
    REQUIRE(*sleeper.delays == std::vector<double>{0.1, 0.1});
  }

  SECTION("a batch runs its requests concurrently") {
    transport.respondWith(detailsFor({}));
    transport.hold();

    auto pending = std::async(std::launch::async, [&]() { return client.fetchItems({1, 2, 3, 4, 5}, scheduler); });

    REQUIRE(transport.waitForBlocked(3));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(transport.getCallCount() == 3);

    transport.release();
    auto result = pending.get();
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().size() == 5);
    REQUIRE(transport.getPeakInFlight() == 3);
  }

  SECTION("the first failure stops later batches") {
    transport.respondWith(detailsFor({5}));

    auto result = client.fetchItems({1, 2, 3, 4, 5, 6, 7, 8, 9}, scheduler);
    REQUIRE(result.isError());
    REQUIRE(result.getError().statusCode == 404);
    REQUIRE(transport.getCallCount() == 6);
    REQUIRE(sleeper.delays->size() == 1);
  }

  SECTION("cancellation during the pause between batches") {
    transport.respondWith(detailsFor({}));
    Util::CancellationTokenSource source;
    client.setSleeper([&source](juce::RelativeTime, const Util::CancellationToken &token) {
      source.cancel();
      return !token.isCancellationRequested();
    });

    auto result = client.fetchItems({1, 2, 3, 4}, scheduler, *source.token());
    REQUIRE(result.getError().kind == TransportError::Kind::Cancelled);
    REQUIRE(transport.getCallCount() == 3);
  }

  SECTION("an empty id list makes no requests") {
    auto result = client.fetchItems({}, scheduler);
    REQUIRE(result.isOk());
    REQUIRE(result.getValue().empty());
    REQUIRE(transport.getCallCount() == 0);
  }
}

//==============================================================================
TEST_CASE("CatalogClient observable", "[CatalogClient]") {
  MockTransport transport;
  CatalogClient client(transport, testConfig());

  SECTION("emits the page and completes") {
    transport.respond(200, pageBody({7, 8}));

    std::vector<int> received;
    bool completed = false;
    client.fetchObservable(CatalogQuery::listing(Category::Upcoming))
        .subscribe([&](const CatalogPage &page) { received = page.itemIds(); }, [](std::exception_ptr) {},
                   [&]() { completed = true; });

    REQUIRE(received == std::vector<int>{7, 8});
    REQUIRE(completed);
  }

  SECTION("errors carry the transport error") {
    transport.respond(404);

    std::optional<TransportError> failure;
    client.fetchObservable(CatalogQuery::details(1))
        .subscribe([](const CatalogPage &) {},
                   [&](std::exception_ptr ep) {
                     try {
                       std::rethrow_exception(ep);
                     } catch (const TransportException &e) {
                       failure = e.getError();
                     }
                   });

    REQUIRE(failure.has_value());
    REQUIRE(failure->statusCode == 404);
  }
}

//==============================================================================
TEST_CASE("CatalogClient parseRetryAfter", "[CatalogClient]") {
  REQUIRE(CatalogClient::parseRetryAfter("12")->inSeconds() == Approx(12.0));
  REQUIRE(CatalogClient::parseRetryAfter(" 3 ")->inSeconds() == Approx(3.0));
  REQUIRE_FALSE(CatalogClient::parseRetryAfter("").has_value());
  REQUIRE_FALSE(CatalogClient::parseRetryAfter("0").has_value());
  REQUIRE_FALSE(CatalogClient::parseRetryAfter("Wed, 21 Oct 2015 07:28:00 GMT").has_value());
}
