#include "CoreConfig.h"
#include "../util/Constants.h"
#include "../util/Log.h"
#include "../util/json/JsonValidation.h"

namespace Marquee {
namespace Core {

namespace {
// Counts are read signed so a negative value is rejected instead of wrapping
size_t readCount(const nlohmann::json &json, const char *key, size_t fallback) {
  const auto value = Json::optional<juce::int64>(json, key, static_cast<juce::int64>(fallback));
  if (value < 0)
    throw Json::ValidationError(key, "must not be negative");
  return static_cast<size_t>(value);
}
} // namespace

// ==============================================================================
CoreConfig CoreConfig::defaults() {
  CoreConfig cfg;
  cfg.client = Network::CatalogClient::Config::production({});
  cfg.transport = Network::JuceUrlTransport::Config::pinned();
  cfg.preferences = Ranking::PreferenceEngine::Config::standard();
  cfg.workerThreads = 4;
  cfg.logging.level = Log::getMinLevel();

  auto appDataDir = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory);
  cfg.setDataDirectory(appDataDir.getChildFile("Marquee"));

  cfg.applyEnvironment();
  return cfg;
}

void CoreConfig::setDataDirectory(const juce::File &directory) {
  dataDirectory = directory;

  auto cacheConfig = Cache::OfflineCatalogCache::Config::inDirectory(directory.getChildFile("cache"));
  cacheConfig.maxEntries = cache.maxEntries > 0 ? cache.maxEntries : cacheConfig.maxEntries;
  cacheConfig.maxCategories = cache.maxCategories;
  if (cache.maxPersistedAge > juce::RelativeTime())
    cacheConfig.maxPersistedAge = cache.maxPersistedAge;
  cache = cacheConfig;
}

void CoreConfig::Logging::apply() const {
  Log::setMinLevel(level);
  Log::setConsoleLoggingEnabled(console);
  Log::setFileLoggingEnabled(file);
}

juce::File CoreConfig::historyFile() const {
  return dataDirectory.getChildFile(Constants::Preferences::HISTORY_FILE_NAME);
}

void CoreConfig::applyEnvironment() {
  auto apiKey = juce::SystemStats::getEnvironmentVariable(Constants::Endpoints::ENV_API_KEY, {});
  if (apiKey.isNotEmpty())
    client.apiKey = apiKey;

  auto baseUrl = juce::SystemStats::getEnvironmentVariable(Constants::Endpoints::ENV_BASE_URL, {});
  if (baseUrl.isNotEmpty())
    client.baseUrl = baseUrl.trimCharactersAtEnd("/");

  auto dataDir = juce::SystemStats::getEnvironmentVariable(Constants::Endpoints::ENV_CACHE_DIR, {});
  if (dataDir.isNotEmpty())
    setDataDirectory(juce::File(dataDir));
}

// ==============================================================================
Outcome<CoreConfig> CoreConfig::fromJson(const nlohmann::json &json, CoreConfig cfg) {
  if (!json.is_object())
    return Outcome<CoreConfig>::error("Config root must be an object");

  try {
    cfg.client.apiKey = Json::toJuceString(Json::optional<std::string>(json, "api_key", cfg.client.apiKey.toStdString()));
    cfg.client.baseUrl =
        Json::toJuceString(Json::optional<std::string>(json, "base_url", cfg.client.baseUrl.toStdString()))
            .trimCharactersAtEnd("/");

    cfg.workerThreads = readCount(json, "worker_threads", cfg.workerThreads);

    if (json.contains("retry")) {
      const auto &retry = json["retry"];
      cfg.client.retry.maxRetries = Json::optional<int>(retry, "max_retries", cfg.client.retry.maxRetries);
      cfg.client.retry.baseDelay = juce::RelativeTime::milliseconds(
          Json::optional<juce::int64>(retry, "base_delay_ms", cfg.client.retry.baseDelay.inMilliseconds()));
      cfg.client.retry.maxDelay = juce::RelativeTime::milliseconds(
          Json::optional<juce::int64>(retry, "max_delay_ms", cfg.client.retry.maxDelay.inMilliseconds()));
      cfg.client.retry.jitterFactor = Json::optional<double>(retry, "jitter", cfg.client.retry.jitterFactor);
    }

    if (json.contains("requests")) {
      const auto &requests = json["requests"];
      cfg.client.maxConcurrentDetails = readCount(requests, "max_concurrent", cfg.client.maxConcurrentDetails);
      cfg.client.pageBatchDelayMs =
          static_cast<int>(readCount(requests, "batch_delay_ms", static_cast<size_t>(cfg.client.pageBatchDelayMs)));
      cfg.searchDebounce = juce::RelativeTime::milliseconds(static_cast<juce::int64>(
          readCount(requests, "search_debounce_ms", static_cast<size_t>(cfg.searchDebounce.inMilliseconds()))));
    }

    if (json.contains("cache")) {
      const auto &cacheJson = json["cache"];
      cfg.cache.maxEntries = readCount(cacheJson, "max_entries", cfg.cache.maxEntries);
      cfg.cache.maxCategories = readCount(cacheJson, "max_categories", cfg.cache.maxCategories);
      cfg.cache.maxPersistedAge =
          juce::RelativeTime::days(Json::optional<double>(cacheJson, "max_age_days", cfg.cache.maxPersistedAge.inDays()));
    }

    if (json.contains("preferences")) {
      const auto &prefs = json["preferences"];
      auto &p = cfg.preferences;
      p.retention = juce::RelativeTime::days(Json::optional<double>(prefs, "retention_days", p.retention.inDays()));
      p.maxSignals = readCount(prefs, "max_signals", p.maxSignals);
      p.ratingSmoothing = Json::optional<double>(prefs, "smoothing", p.ratingSmoothing);
      p.superLikedWeight = Json::optional<double>(prefs, "super_liked_weight", p.superLikedWeight);
      p.likedWeight = Json::optional<double>(prefs, "liked_weight", p.likedWeight);
      p.skippedWeight = Json::optional<double>(prefs, "skipped_weight", p.skippedWeight);

      if (prefs.contains("weights")) {
        const auto &weights = prefs["weights"];
        p.scoring.genre = Json::optional<double>(weights, "genre", p.scoring.genre);
        p.scoring.ratingProximity = Json::optional<double>(weights, "rating_proximity", p.scoring.ratingProximity);
        p.scoring.recency = Json::optional<double>(weights, "recency", p.scoring.recency);
        p.scoring.highRating = Json::optional<double>(weights, "high_rating", p.scoring.highRating);
      }
    }

    if (json.contains("pinned_hosts")) {
      cfg.transport.pinnedHosts.clear();
      for (const auto &host : Json::require<std::vector<std::string>>(json, "pinned_hosts"))
        cfg.transport.pinnedHosts.add(Json::toJuceString(host));
    }

    if (json.contains("logging")) {
      const auto &logJson = json["logging"];
      if (logJson.contains("level")) {
        auto levelName = Json::toJuceString(Json::require<std::string>(logJson, "level"));
        auto level = Log::levelFromString(levelName);
        if (!level.has_value())
          throw Json::ValidationError("level", "unknown log level '" + levelName.toStdString() + "'");
        cfg.logging.level = *level;
      }
      cfg.logging.console = Json::optional<bool>(logJson, "console", cfg.logging.console);
      cfg.logging.file = Json::optional<bool>(logJson, "file", cfg.logging.file);
    }

    if (json.contains("data_directory"))
      cfg.setDataDirectory(juce::File(Json::toJuceString(Json::require<std::string>(json, "data_directory"))));
  } catch (const Json::ValidationError &e) {
    return Outcome<CoreConfig>::error("Invalid config: " + juce::String(e.what()));
  }

  if (cfg.preferences.ratingSmoothing < 0.0 || cfg.preferences.ratingSmoothing > 1.0)
    return Outcome<CoreConfig>::error("Invalid config: smoothing must be within 0-1");

  if (cfg.client.retry.maxRetries < 0)
    return Outcome<CoreConfig>::error("Invalid config: max_retries must not be negative");

  return Outcome<CoreConfig>::ok(std::move(cfg));
}

Outcome<CoreConfig> CoreConfig::loadFromFile(const juce::File &file) {
  if (!file.existsAsFile())
    return Outcome<CoreConfig>::error("Config file not found: " + file.getFullPathName());

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file.loadFileAsString().toStdString());
  } catch (const nlohmann::json::exception &e) {
    return Outcome<CoreConfig>::error("Malformed config " + file.getFullPathName() + ": " + juce::String(e.what()));
  }

  // File values apply before the environment so the environment wins
  CoreConfig base = defaults();
  auto parsed = fromJson(json, base);
  if (parsed.isError())
    return parsed;

  auto cfg = parsed.getValue();
  cfg.applyEnvironment();

  Log::info("CoreConfig: loaded " + file.getFullPathName());
  return Outcome<CoreConfig>::ok(std::move(cfg));
}

} // namespace Core
} // namespace Marquee
