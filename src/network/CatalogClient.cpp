#include "CatalogClient.h"
#include "../util/Constants.h"
#include "../util/Log.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <future>
#include <optional>

namespace Marquee {
namespace Network {

// ==============================================================================
CatalogClient::Config CatalogClient::Config::production(const juce::String &apiKey) {
  Config cfg;
  cfg.baseUrl = Constants::Endpoints::API_BASE_URL;
  cfg.apiKey = apiKey;
  cfg.retry = RetryPolicy::standard();
  cfg.pageBatchDelayMs = Constants::Api::PAGE_BATCH_DELAY_MS;
  cfg.maxConcurrentDetails = Constants::Api::MAX_CONCURRENT_DETAILS;
  return cfg;
}

CatalogClient::Config CatalogClient::Config::fromEnvironment() {
  auto cfg = production(juce::SystemStats::getEnvironmentVariable(Constants::Endpoints::ENV_API_KEY, {}));

  auto baseUrl = juce::SystemStats::getEnvironmentVariable(Constants::Endpoints::ENV_BASE_URL, {});
  if (baseUrl.isNotEmpty())
    cfg.baseUrl = baseUrl.trimCharactersAtEnd("/");

  return cfg;
}

// ==============================================================================
CatalogClient::CatalogClient(Transport &t, const Config &cfg) : transport(t), config(cfg) {
  sleeper = [](juce::RelativeTime delay, const Util::CancellationToken &token) {
    return token.waitFor(std::chrono::milliseconds(delay.inMilliseconds()));
  };

  if (config.apiKey.isEmpty())
    Log::warn("CatalogClient: no API key configured, requests will be rejected locally");

  Log::info("CatalogClient initialized with base URL: " + config.baseUrl);
}

void CatalogClient::setJitterSource(JitterSource source) {
  jitterSource = std::move(source);
}

void CatalogClient::setSleeper(Sleeper newSleeper) {
  if (newSleeper)
    sleeper = std::move(newSleeper);
}

double CatalogClient::nextJitter() {
  if (jitterSource)
    return jitterSource();

  std::lock_guard<std::mutex> lock(randomMutex);
  return random.nextDouble();
}

// ==============================================================================
HttpRequest CatalogClient::buildRequest(const CatalogQuery &query) const {
  juce::URL url(config.baseUrl + query.path());

  auto params = query.parameters();
  for (auto &name : params.getAllKeys())
    url = url.withParameter(name, params[name]);

  url = url.withParameter("api_key", config.apiKey);

  HttpRequest request;
  request.url = url;
  request.method = "GET";
  request.headers.set("Accept", "application/json");
  request.timeoutMs = query.timeoutMs();
  return request;
}

std::optional<juce::RelativeTime> CatalogClient::parseRetryAfter(const juce::String &headerValue) {
  auto trimmed = headerValue.trim();
  if (trimmed.isEmpty() || !trimmed.containsOnly("0123456789"))
    return std::nullopt;

  // HTTP-date values fall through to the computed backoff
  auto seconds = trimmed.getIntValue();
  if (seconds <= 0)
    return std::nullopt;

  return juce::RelativeTime::seconds(seconds);
}

// ==============================================================================
Outcome<HttpResponse, TransportError> CatalogClient::sendWithRetry(const CatalogQuery &query,
                                                                  const Util::CancellationToken &token) {
  using Result = Outcome<HttpResponse, TransportError>;

  const auto request = buildRequest(query);
  int retries = 0;

  while (true) {
    if (token.isCancellationRequested())
      return Result::error(TransportError::cancelled());

    attemptCount++;
    auto sent = transport.send(request, token);

    TransportError failure;
    if (sent.isOk()) {
      if (sent.getValue().isSuccess())
        return sent;

      const auto &response = sent.getValue();
      failure = TransportError::fromStatusCode(response.statusCode, parseRetryAfter(response.header("Retry-After")));
    } else {
      failure = sent.getError();
    }

    if (failure.kind == TransportError::Kind::Cancelled)
      return Result::error(failure);

    if (!config.retry.shouldRetry(failure, retries)) {
      if (failure.kind == TransportError::Kind::TrustFailure)
        Log::error("CatalogClient: trust failure for " + query.describe() + ", not retrying - " + failure.describe());
      else if (failure.isRetryable())
        Log::warn("CatalogClient: giving up on " + query.describe() + " after " + juce::String(retries + 1) +
                  " attempts - " + failure.describe());
      else
        Log::warn("CatalogClient: " + query.describe() + " failed - " + failure.describe());

      return Result::error(failure);
    }

    auto delay = config.retry.delayFor(failure, retries, nextJitter());
    retries++;

    Log::warn("CatalogClient: " + failure.describe() + " on " + query.describe() + ", retry " +
              juce::String(retries) + "/" + juce::String(config.retry.maxRetries) + " in " +
              juce::String(static_cast<int>(delay.inMilliseconds())) + "ms");

    if (!sleeper(delay, token))
      return Result::error(TransportError::cancelled());
  }
}

// ==============================================================================
CatalogClient::PageOutcome CatalogClient::decodePage(const HttpResponse &response, const CatalogQuery &query) const {
  try {
    auto json = nlohmann::json::parse(response.body.toStdString());
    auto page = json.get<CatalogPage>();

    Log::debug("CatalogClient: decoded " + juce::String(static_cast<int>(page.items.size())) + " items for " +
               query.describe());

    return PageOutcome::ok(std::move(page));
  } catch (const std::exception &e) {
    Log::warn("CatalogClient: failed to decode " + query.describe() + " - " + juce::String(e.what()));
    return PageOutcome::error(TransportError::decodingError(e.what()));
  }
}

CatalogClient::ItemOutcome CatalogClient::decodeItem(const HttpResponse &response, const CatalogQuery &query) const {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(response.body.toStdString());
  } catch (const nlohmann::json::exception &e) {
    Log::warn("CatalogClient: malformed JSON for " + query.describe() + " - " + juce::String(e.what()));
    return ItemOutcome::error(TransportError::decodingError(e.what()));
  }

  auto decoded = CatalogItem::createFromJson(json);
  if (decoded.isError()) {
    Log::warn("CatalogClient: failed to decode " + query.describe() + " - " + decoded.getError());
    return ItemOutcome::error(TransportError::decodingError(decoded.getError()));
  }

  return ItemOutcome::ok(std::move(decoded.getValue()));
}

// ==============================================================================
CatalogClient::PageOutcome CatalogClient::fetch(const CatalogQuery &query, const Util::CancellationToken &token) {
  if (query.isBlankSearch()) {
    Log::debug("CatalogClient: blank search, returning empty page");
    return PageOutcome::ok(CatalogPage::emptyPage(query.page));
  }

  if (config.apiKey.isEmpty())
    return PageOutcome::error(TransportError::clientError(401, "No API key configured"));

  auto sent = sendWithRetry(query, token);
  if (sent.isError())
    return PageOutcome::error(sent.getError());

  if (query.returnsPage())
    return decodePage(sent.getValue(), query);

  auto item = decodeItem(sent.getValue(), query);
  if (item.isError())
    return PageOutcome::error(item.getError());

  CatalogPage page;
  page.items.push_back(item.getValue());
  page.page = 1;
  page.totalPages = 1;
  page.totalResults = 1;
  return PageOutcome::ok(std::move(page));
}

CatalogClient::ItemOutcome CatalogClient::fetchItem(int itemId, const Util::CancellationToken &token) {
  auto query = CatalogQuery::details(itemId);

  if (itemId <= 0)
    return ItemOutcome::error(TransportError::clientError(400, "Invalid item id " + juce::String(itemId)));

  if (config.apiKey.isEmpty())
    return ItemOutcome::error(TransportError::clientError(401, "No API key configured"));

  auto sent = sendWithRetry(query, token);
  if (sent.isError())
    return ItemOutcome::error(sent.getError());

  return decodeItem(sent.getValue(), query);
}

CatalogClient::ItemsOutcome CatalogClient::fetchPages(Category category, int firstPage, int lastPage,
                                                      const Util::CancellationToken &token) {
  std::vector<CatalogItem> items;

  for (int page = std::max(1, firstPage); page <= lastPage; ++page) {
    auto result = fetch(CatalogQuery::listing(category, page), token);
    if (result.isError())
      return ItemsOutcome::error(result.getError());

    const auto &fetched = result.getValue();
    items.insert(items.end(), fetched.items.begin(), fetched.items.end());

    if (!fetched.hasMorePages() || page == lastPage)
      break;

    // Spread consecutive page requests out a little
    if (config.pageBatchDelayMs > 0 &&
        !sleeper(juce::RelativeTime::milliseconds(config.pageBatchDelayMs), token))
      return ItemsOutcome::error(TransportError::cancelled());
  }

  return ItemsOutcome::ok(std::move(items));
}

CatalogClient::ItemsOutcome CatalogClient::fetchItems(const std::vector<int> &itemIds, Util::TaskScheduler &scheduler,
                                                      const Util::CancellationToken &token) {
  const size_t batchSize = std::max<size_t>(1, config.maxConcurrentDetails);

  std::vector<CatalogItem> items;
  items.reserve(itemIds.size());

  for (size_t start = 0; start < itemIds.size(); start += batchSize) {
    if (token.isCancellationRequested())
      return ItemsOutcome::error(TransportError::cancelled());

    const size_t end = std::min(itemIds.size(), start + batchSize);

    // Every future is waited on before returning, so the tasks may borrow the token
    std::vector<std::future<ItemOutcome>> batch;
    for (size_t i = start; i < end; ++i) {
      const int itemId = itemIds[i];
      batch.push_back(
          scheduler.schedule<ItemOutcome>([this, itemId, &token]() { return fetchItem(itemId, token); }));
    }

    std::optional<TransportError> firstError;
    for (auto &pending : batch) {
      try {
        auto result = pending.get();
        if (result.isOk())
          items.push_back(result.getValue());
        else if (!firstError.has_value())
          firstError = result.getError();
      } catch (const std::exception &e) {
        if (!firstError.has_value())
          firstError = TransportError::unknown(e.what());
      }
    }

    if (firstError.has_value()) {
      Log::warn("CatalogClient: batch detail fetch aborted after " + juce::String(static_cast<int>(items.size())) +
                " of " + juce::String(static_cast<int>(itemIds.size())) + " items - " + firstError->describe());
      return ItemsOutcome::error(*firstError);
    }

    if (end < itemIds.size() && config.pageBatchDelayMs > 0 &&
        !sleeper(juce::RelativeTime::milliseconds(config.pageBatchDelayMs), token))
      return ItemsOutcome::error(TransportError::cancelled());
  }

  return ItemsOutcome::ok(std::move(items));
}

// ==============================================================================
rxcpp::observable<CatalogPage> CatalogClient::fetchObservable(const CatalogQuery &query) {
  return rxcpp::sources::create<CatalogPage>([this, query](rxcpp::subscriber<CatalogPage> observer) {
           auto source = std::make_shared<Util::CancellationTokenSource>();
           observer.add(rxcpp::make_subscription([source]() { source->cancel(); }));

           auto result = fetch(query, *source->token());
           if (!observer.is_subscribed())
             return;

           if (result.isOk()) {
             observer.on_next(result.getValue());
             observer.on_completed();
           } else {
             observer.on_error(std::make_exception_ptr(TransportException(result.getError())));
           }
         })
      .as_dynamic();
}

} // namespace Network
} // namespace Marquee
