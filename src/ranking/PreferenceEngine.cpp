#include "PreferenceEngine.h"
#include "../models/Genre.h"
#include "../util/Constants.h"
#include "../util/Log.h"
#include "../util/json/JsonValidation.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <mutex>

namespace Marquee {
namespace Ranking {

namespace {
constexpr double daysPerYear = 365.25;
constexpr int historyFormatVersion = 1;
} // namespace

// ==============================================================================
double PreferenceProfile::genreAffinity(const std::vector<int> &genreIds) const {
  if (genreIds.empty())
    return 0.0;

  double total = 0.0;
  for (int genreId : genreIds)
    total += weightFor(genreId);

  return total / static_cast<double>(genreIds.size());
}

// ==============================================================================
PreferenceEngine::Config PreferenceEngine::Config::standard() {
  using namespace Constants::Preferences;

  Config cfg;
  cfg.superLikedWeight = SUPER_LIKED_WEIGHT;
  cfg.likedWeight = LIKED_WEIGHT;
  cfg.skippedWeight = SKIPPED_WEIGHT;
  cfg.ratingSmoothing = RATING_SMOOTHING;
  cfg.initialPreferredRating = INITIAL_PREFERRED_RATING;
  cfg.retention = juce::RelativeTime::days(RETENTION_DAYS);
  cfg.maxSignals = MAX_SIGNALS;
  cfg.dislikedGenreThreshold = DISLIKED_GENRE_THRESHOLD;
  cfg.maxDislikedGenres = MAX_DISLIKED_GENRES;

  cfg.scoring.genre = GENRE_WEIGHT;
  cfg.scoring.ratingProximity = RATING_PROXIMITY_WEIGHT;
  cfg.scoring.recency = RECENCY_WEIGHT;
  cfg.scoring.highRating = HIGH_RATING_WEIGHT;
  cfg.scoring.highRatingThreshold = HIGH_RATING_THRESHOLD;
  cfg.scoring.recencyHorizonYears = RECENCY_HORIZON_YEARS;
  return cfg;
}

double PreferenceEngine::Config::weightFor(Judgment judgment) const {
  switch (judgment) {
  case Judgment::SuperLiked:
    return superLikedWeight;
  case Judgment::Liked:
    return likedWeight;
  case Judgment::Skipped:
    return skippedWeight;
  }
  return 0.0;
}

// ==============================================================================
PreferenceEngine::PreferenceEngine(const Config &cfg, const Util::Clock &timeSource) : config(cfg), clock(timeSource) {
  profile.preferredRating = config.initialPreferredRating;
}

void PreferenceEngine::record(const SwipeSignal &signal) {
  std::unique_lock<std::shared_mutex> lock(mutex);
  const auto now = clock.now();

  if (signal.timestamp < now - config.retention) {
    Log::debug("PreferenceEngine: ignoring signal for item " + juce::String(signal.itemId) +
               " older than the retention window");
    return;
  }

  signals.push_back(signal);

  bool dropped = dropExpiredLocked(now);

  if (config.maxSignals > 0 && signals.size() > config.maxSignals) {
    std::stable_sort(signals.begin(), signals.end(),
                     [](const SwipeSignal &a, const SwipeSignal &b) { return a.timestamp < b.timestamp; });
    signals.erase(signals.begin(), signals.begin() + static_cast<long>(signals.size() - config.maxSignals));
    dropped = true;
  }

  if (dropped)
    rebuildLocked();
  else
    applyLocked(signal);

  Log::debug("PreferenceEngine: recorded " + juce::String(judgmentToString(signal.judgment)) + " for item " +
             juce::String(signal.itemId) + " (" + juce::String(static_cast<int>(signals.size())) + " retained)");
}

double PreferenceEngine::score(const CatalogItem &item) const {
  std::shared_lock<std::shared_mutex> lock(mutex);
  return scoreLocked(item, clock.now());
}

std::vector<CatalogItem> PreferenceEngine::rank(const std::vector<CatalogItem> &items) const {
  std::vector<std::pair<double, size_t>> scored;
  scored.reserve(items.size());

  {
    std::shared_lock<std::shared_mutex> lock(mutex);
    const auto now = clock.now();
    for (size_t i = 0; i < items.size(); ++i)
      scored.emplace_back(scoreLocked(items[i], now), i);
  }

  std::stable_sort(scored.begin(), scored.end(),
                   [](const std::pair<double, size_t> &a, const std::pair<double, size_t> &b) {
                     return a.first > b.first;
                   });

  std::vector<CatalogItem> ranked;
  ranked.reserve(items.size());
  for (const auto &entry : scored)
    ranked.push_back(items[entry.second]);

  return ranked;
}

std::vector<CatalogItem> PreferenceEngine::filterJudged(const std::vector<CatalogItem> &items) const {
  std::shared_lock<std::shared_mutex> lock(mutex);

  std::vector<CatalogItem> remaining;
  remaining.reserve(items.size());

  std::copy_if(items.begin(), items.end(), std::back_inserter(remaining),
               [this](const CatalogItem &item) { return judgedIds.count(item.id) == 0; });

  return remaining;
}

bool PreferenceEngine::hasJudged(int itemId) const {
  std::shared_lock<std::shared_mutex> lock(mutex);
  return judgedIds.count(itemId) > 0;
}

// ==============================================================================
PreferenceProfile PreferenceEngine::getProfile() const {
  std::shared_lock<std::shared_mutex> lock(mutex);
  return profile;
}

std::vector<SwipeSignal> PreferenceEngine::getSignals() const {
  std::shared_lock<std::shared_mutex> lock(mutex);
  return signals;
}

size_t PreferenceEngine::getSignalCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex);
  return signals.size();
}

std::vector<int> PreferenceEngine::topGenres(size_t limit) const {
  std::shared_lock<std::shared_mutex> lock(mutex);
  return topGenresLocked(limit);
}

std::vector<int> PreferenceEngine::dislikedGenres() const {
  std::shared_lock<std::shared_mutex> lock(mutex);
  return dislikedGenresLocked();
}

TasteSummary PreferenceEngine::getTasteSummary() const {
  std::shared_lock<std::shared_mutex> lock(mutex);

  TasteSummary summary;
  summary.signalCount = signals.size();
  summary.positiveCount = static_cast<size_t>(
      std::count_if(signals.begin(), signals.end(), [](const SwipeSignal &s) { return s.isPositive(); }));
  summary.likeRate =
      signals.empty() ? 0.0 : static_cast<double>(summary.positiveCount) / static_cast<double>(signals.size());
  summary.preferredRating = profile.preferredRating;
  summary.topGenres = topGenresLocked(3);
  summary.dislikedGenres = dislikedGenresLocked();

  for (int genreId : summary.topGenres)
    summary.topGenreNames.add(Genres::nameFor(genreId));

  return summary;
}

void PreferenceEngine::reset() {
  std::unique_lock<std::shared_mutex> lock(mutex);
  signals.clear();
  rebuildLocked();
  Log::info("PreferenceEngine: reset");
}

// ==============================================================================
// Persistence: {"version": 1, "signals": [...]}

Outcome<void> PreferenceEngine::saveTo(const juce::File &file) const {
  nlohmann::json blob;
  {
    std::shared_lock<std::shared_mutex> lock(mutex);
    blob["version"] = historyFormatVersion;
    blob["signals"] = signals;
  }

  auto directory = file.getParentDirectory();
  if (!directory.exists()) {
    auto created = directory.createDirectory();
    if (created.failed())
      return Outcome<void>::error("Cannot create " + directory.getFullPathName() + ": " + created.getErrorMessage());
  }

  juce::TemporaryFile temp(file);
  if (!temp.getFile().replaceWithText(juce::String(blob.dump())))
    return Outcome<void>::error("Cannot write " + temp.getFile().getFullPathName());

  if (!temp.overwriteTargetFileWithTemporary())
    return Outcome<void>::error("Cannot replace " + file.getFullPathName());

  return Outcome<void>::ok();
}

Outcome<void> PreferenceEngine::loadFrom(const juce::File &file) {
  if (!file.existsAsFile())
    return Outcome<void>::error("No history file at " + file.getFullPathName());

  std::vector<SwipeSignal> loaded;
  try {
    auto blob = nlohmann::json::parse(file.loadFileAsString().toStdString());

    const auto version = Json::optional<int>(blob, "version", 0);
    if (version != historyFormatVersion)
      return Outcome<void>::error("Unsupported history format " + juce::String(version));

    loaded = Json::require<std::vector<SwipeSignal>>(blob, "signals");
  } catch (const std::exception &e) {
    return Outcome<void>::error("Unreadable history file " + file.getFullPathName() + " - " + juce::String(e.what()));
  }

  std::unique_lock<std::shared_mutex> lock(mutex);
  signals = std::move(loaded);
  dropExpiredLocked(clock.now());

  if (config.maxSignals > 0 && signals.size() > config.maxSignals) {
    std::stable_sort(signals.begin(), signals.end(),
                     [](const SwipeSignal &a, const SwipeSignal &b) { return a.timestamp < b.timestamp; });
    signals.erase(signals.begin(), signals.begin() + static_cast<long>(signals.size() - config.maxSignals));
  }

  rebuildLocked();

  Log::info("PreferenceEngine: restored " + juce::String(static_cast<int>(signals.size())) + " signals");
  return Outcome<void>::ok();
}

// ==============================================================================
void PreferenceEngine::applyLocked(const SwipeSignal &signal) {
  const double weight = config.weightFor(signal.judgment);

  for (int genreId : signal.genreIds)
    profile.genreWeights[genreId] += weight;

  if (signal.isPositive()) {
    profile.preferredRating =
        profile.preferredRating * config.ratingSmoothing + signal.rating * (1.0 - config.ratingSmoothing);
  }

  profile.signalCount++;
  judgedIds.insert(signal.itemId);
}

void PreferenceEngine::rebuildLocked() {
  profile = PreferenceProfile();
  profile.preferredRating = config.initialPreferredRating;
  judgedIds.clear();

  for (const auto &signal : signals)
    applyLocked(signal);
}

bool PreferenceEngine::dropExpiredLocked(juce::Time now) {
  const auto cutoff = now - config.retention;
  const auto before = signals.size();

  signals.erase(std::remove_if(signals.begin(), signals.end(),
                               [cutoff](const SwipeSignal &s) { return s.timestamp < cutoff; }),
                signals.end());

  const auto dropped = before - signals.size();
  if (dropped > 0)
    Log::debug("PreferenceEngine: dropped " + juce::String(static_cast<int>(dropped)) + " expired signals");

  return dropped > 0;
}

double PreferenceEngine::scoreLocked(const CatalogItem &item, juce::Time now) const {
  const auto &weights = config.scoring;

  const double genreTerm = profile.genreAffinity(item.genreIds);

  const double ratingDistance = std::abs(item.rating - profile.preferredRating);
  const double proximityTerm = std::max(0.0, 10.0 - ratingDistance) / 10.0;

  double recencyTerm = 0.0;
  if (auto released = item.releaseTime()) {
    const double ageYears = std::max(0.0, (now - *released).inDays() / daysPerYear);
    recencyTerm = std::max(0.0, 1.0 - ageYears / weights.recencyHorizonYears);
  }

  const double headroom = 10.0 - weights.highRatingThreshold;
  const double highRatingTerm =
      headroom > 0.0 ? std::max(0.0, item.rating - weights.highRatingThreshold) / headroom : 0.0;

  return genreTerm * weights.genre + proximityTerm * weights.ratingProximity + recencyTerm * weights.recency +
         highRatingTerm * weights.highRating;
}

std::vector<int> PreferenceEngine::topGenresLocked(size_t limit) const {
  std::vector<std::pair<int, double>> positive;
  for (const auto &entry : profile.genreWeights) {
    if (entry.second > 0.0)
      positive.push_back(entry);
  }

  std::stable_sort(positive.begin(), positive.end(),
                   [](const std::pair<int, double> &a, const std::pair<int, double> &b) { return a.second > b.second; });

  std::vector<int> genres;
  for (size_t i = 0; i < positive.size() && i < limit; ++i)
    genres.push_back(positive[i].first);

  return genres;
}

std::vector<int> PreferenceEngine::dislikedGenresLocked() const {
  std::vector<std::pair<int, double>> negative;
  for (const auto &entry : profile.genreWeights) {
    if (entry.second < config.dislikedGenreThreshold)
      negative.push_back(entry);
  }

  std::stable_sort(negative.begin(), negative.end(),
                   [](const std::pair<int, double> &a, const std::pair<int, double> &b) { return a.second < b.second; });

  std::vector<int> genres;
  for (size_t i = 0; i < negative.size() && static_cast<int>(i) < config.maxDislikedGenres; ++i)
    genres.push_back(negative[i].first);

  return genres;
}

} // namespace Ranking
} // namespace Marquee
