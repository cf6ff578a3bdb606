#pragma once

#include "CatalogItem.h"
#include "../util/json/JsonValidation.h"
#include <juce_core/juce_core.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace Marquee {

// ==============================================================================
/**
 * Judgment the user passed on an item in the swipe deck
 */
enum class Judgment { Liked, SuperLiked, Skipped };

const char *judgmentToString(Judgment judgment);
std::optional<Judgment> judgmentFromString(const juce::String &name);

// ==============================================================================
/**
 * SwipeSignal is an immutable record of one judgment
 *
 * It snapshots the item's genres and rating at the moment of judgment, so the
 * preference profile can be rebuilt from signals alone without refetching.
 */
struct SwipeSignal {
  int itemId = 0;
  Judgment judgment = Judgment::Skipped;
  std::vector<int> genreIds;
  double rating = 0.0;
  juce::Time timestamp;

  static SwipeSignal fromItem(const CatalogItem &item, Judgment judgment, juce::Time timestamp) {
    SwipeSignal signal;
    signal.itemId = item.id;
    signal.judgment = judgment;
    signal.genreIds = item.genreIds;
    signal.rating = item.rating;
    signal.timestamp = timestamp;
    return signal;
  }

  bool isPositive() const {
    return judgment == Judgment::Liked || judgment == Judgment::SuperLiked;
  }
};

void to_json(nlohmann::json &j, const SwipeSignal &signal);
void from_json(const nlohmann::json &j, SwipeSignal &signal);

} // namespace Marquee
