#pragma once

#include "../models/CatalogItem.h"
#include "../models/SwipeSignal.h"
#include "../util/Clock.h"
#include "../util/Result.h"
#include <juce_core/juce_core.h>
#include <map>
#include <set>
#include <shared_mutex>
#include <vector>

namespace Marquee {
namespace Ranking {

// ==============================================================================
/**
 * PreferenceProfile - Aggregate derived from the retained swipe signals
 *
 * Never stored on its own; always rebuilt by replaying the signal window.
 */
struct PreferenceProfile {
  std::map<int, double> genreWeights;
  double preferredRating = 7.0;
  size_t signalCount = 0;

  double weightFor(int genreId) const {
    auto found = genreWeights.find(genreId);
    return found != genreWeights.end() ? found->second : 0.0;
  }

  /** Mean weight of the given genres, 0 for an empty set */
  double genreAffinity(const std::vector<int> &genreIds) const;
};

struct TasteSummary {
  size_t signalCount = 0;
  size_t positiveCount = 0;
  double likeRate = 0.0;
  double preferredRating = 7.0;
  std::vector<int> topGenres;
  juce::StringArray topGenreNames;
  std::vector<int> dislikedGenres;
};

// ==============================================================================
/**
 * PreferenceEngine - Learns genre and rating preferences from swipe judgments
 *
 * record() folds a signal into the profile:
 *   genreWeights[g] += weight(judgment) for each genre g of the item
 *   preferredRating  = preferredRating * s + rating * (1 - s), likes only
 *
 * score() is a linear blend of genre affinity, closeness to the preferred
 * rating, release recency and a boost for highly rated items. Each term is
 * monotonic: more affinity or a closer rating never lowers the score.
 *
 * Signals older than the retention window are dropped on the next record();
 * whenever signals are dropped the profile is rebuilt from the survivors.
 *
 * Thread safety: record/reset/load take an exclusive lock, all readers a
 * shared lock, so score() never sees a half-applied signal.
 */
class PreferenceEngine {
public:
  struct ScoringWeights {
    double genre = 0.4;
    double ratingProximity = 0.3;
    double recency = 0.2;
    double highRating = 0.1;

    double highRatingThreshold = 7.5;
    double recencyHorizonYears = 20.0;
  };

  struct Config {
    double superLikedWeight = 2.0;
    double likedWeight = 1.0;
    double skippedWeight = -0.5;

    double ratingSmoothing = 0.9;
    double initialPreferredRating = 7.0;

    juce::RelativeTime retention = juce::RelativeTime::days(30.0);
    size_t maxSignals = 500;

    double dislikedGenreThreshold = -1.0;
    int maxDislikedGenres = 3;

    ScoringWeights scoring;

    static Config standard();

    double weightFor(Judgment judgment) const;
  };

  PreferenceEngine(const Config &config, const Util::Clock &clock);

  // ==========================================================================
  void record(const SwipeSignal &signal);

  double score(const CatalogItem &item) const;

  /** Items by descending score; equal scores keep their input order */
  std::vector<CatalogItem> rank(const std::vector<CatalogItem> &items) const;

  /** Items whose id has no signal in the retained window, in input order */
  std::vector<CatalogItem> filterJudged(const std::vector<CatalogItem> &items) const;

  bool hasJudged(int itemId) const;

  // ==========================================================================
  PreferenceProfile getProfile() const;
  std::vector<SwipeSignal> getSignals() const;
  size_t getSignalCount() const;

  /** Genres with the highest positive weight, best first */
  std::vector<int> topGenres(size_t limit = 3) const;

  /** Genres whose weight is below the dislike threshold, most disliked first */
  std::vector<int> dislikedGenres() const;

  TasteSummary getTasteSummary() const;

  void reset();

  // ==========================================================================
  /** Write the retained signal window as JSON (the profile is not stored) */
  Outcome<void> saveTo(const juce::File &file) const;

  /** Replace the signal window from a file written by saveTo() and replay it */
  Outcome<void> loadFrom(const juce::File &file);

  const Config &getConfig() const {
    return config;
  }

private:
  void applyLocked(const SwipeSignal &signal);
  void rebuildLocked();
  bool dropExpiredLocked(juce::Time now);
  double scoreLocked(const CatalogItem &item, juce::Time now) const;
  std::vector<int> topGenresLocked(size_t limit) const;
  std::vector<int> dislikedGenresLocked() const;

  Config config;
  const Util::Clock &clock;

  std::vector<SwipeSignal> signals;
  std::set<int> judgedIds;
  PreferenceProfile profile;
  mutable std::shared_mutex mutex;
};

} // namespace Ranking
} // namespace Marquee
