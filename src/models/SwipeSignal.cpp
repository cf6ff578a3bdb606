#include "SwipeSignal.h"

namespace Marquee {

const char *judgmentToString(Judgment judgment) {
  switch (judgment) {
  case Judgment::Liked:
    return "liked";
  case Judgment::SuperLiked:
    return "superLiked";
  case Judgment::Skipped:
    return "skipped";
  }
  return "skipped";
}

std::optional<Judgment> judgmentFromString(const juce::String &name) {
  if (name == "liked")
    return Judgment::Liked;
  if (name == "superLiked")
    return Judgment::SuperLiked;
  if (name == "skipped")
    return Judgment::Skipped;
  return std::nullopt;
}

// ==============================================================================
void to_json(nlohmann::json &j, const SwipeSignal &signal) {
  j = nlohmann::json{
      {"item_id", signal.itemId},
      {"judgment", judgmentToString(signal.judgment)},
      {"genre_ids", signal.genreIds},
      {"rating", signal.rating},
      {"timestamp", Json::fromTime(signal.timestamp)},
  };
}

void from_json(const nlohmann::json &j, SwipeSignal &signal) {
  JSON_REQUIRE(j, "item_id", signal.itemId);
  JSON_OPTIONAL(j, "genre_ids", signal.genreIds, std::vector<int>{});
  JSON_OPTIONAL(j, "rating", signal.rating, 0.0);
  signal.timestamp = Json::toTime(Json::require<juce::int64>(j, "timestamp"));

  auto judgmentName = Json::toJuceString(Json::require<std::string>(j, "judgment"));
  auto judgment = judgmentFromString(judgmentName);
  if (!judgment)
    throw Json::ValidationError("judgment", "unknown judgment '" + judgmentName.toStdString() + "'");
  signal.judgment = *judgment;
}

} // namespace Marquee
