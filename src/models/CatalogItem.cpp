#include "CatalogItem.h"
#include "../util/Constants.h"
#include <algorithm>

namespace Marquee {

// ==============================================================================
int CatalogItem::releaseYear() const {
  if (releaseDate.length() < 4)
    return 0;

  return releaseDate.substring(0, 4).getIntValue();
}

std::optional<juce::Time> CatalogItem::releaseTime() const {
  auto parts = juce::StringArray::fromTokens(releaseDate, "-", "");
  if (parts.size() != 3)
    return std::nullopt;

  int year = parts[0].getIntValue();
  int month = parts[1].getIntValue();
  int day = parts[2].getIntValue();

  if (year <= 0 || month < 1 || month > 12 || day < 1 || day > 31)
    return std::nullopt;

  return juce::Time(year, month - 1, day, 0, 0, 0, 0, false);
}

static std::optional<juce::String> imageUrl(const std::optional<juce::String> &path, const juce::String &size) {
  if (!path.has_value() || path->isEmpty())
    return std::nullopt;

  return juce::String(Constants::Endpoints::IMAGE_BASE_URL) + "/" + size + *path;
}

std::optional<juce::String> CatalogItem::posterUrl(const juce::String &size) const {
  return imageUrl(posterPath, size.isEmpty() ? juce::String(Constants::Endpoints::POSTER_SIZE) : size);
}

std::optional<juce::String> CatalogItem::backdropUrl(const juce::String &size) const {
  return imageUrl(backdropPath, size.isEmpty() ? juce::String(Constants::Endpoints::BACKDROP_SIZE) : size);
}

bool CatalogItem::hasGenre(int genreId) const {
  return std::find(genreIds.begin(), genreIds.end(), genreId) != genreIds.end();
}

juce::String CatalogItem::formattedRating() const {
  return juce::String(rating, 1);
}

// ==============================================================================
void to_json(nlohmann::json &j, const CatalogItem &item) {
  j = nlohmann::json{
      {"id", item.id},
      {"title", Json::fromJuceString(item.title)},
      {"original_title", Json::fromJuceString(item.originalTitle)},
      {"overview", Json::fromJuceString(item.overview)},
      {"release_date", Json::fromJuceString(item.releaseDate)},
      {"vote_average", item.rating},
      {"vote_count", item.voteCount},
      {"popularity", item.popularity},
      {"genre_ids", item.genreIds},
      {"original_language", Json::fromJuceString(item.originalLanguage)},
      {"adult", item.adult},
  };

  j["poster_path"] = item.posterPath ? nlohmann::json(Json::fromJuceString(*item.posterPath)) : nlohmann::json();
  j["backdrop_path"] = item.backdropPath ? nlohmann::json(Json::fromJuceString(*item.backdropPath)) : nlohmann::json();
}

void from_json(const nlohmann::json &j, CatalogItem &item) {
  JSON_REQUIRE(j, "id", item.id);
  JSON_REQUIRE_STRING(j, "title", item.title);
  JSON_OPTIONAL_STRING(j, "original_title", item.originalTitle, "");
  JSON_OPTIONAL_STRING(j, "overview", item.overview, "");
  JSON_OPTIONAL_STRING(j, "release_date", item.releaseDate, "");
  JSON_OPTIONAL(j, "vote_average", item.rating, 0.0);
  JSON_OPTIONAL(j, "vote_count", item.voteCount, 0);
  JSON_OPTIONAL(j, "popularity", item.popularity, 0.0);
  JSON_OPTIONAL_STRING(j, "original_language", item.originalLanguage, "");
  JSON_OPTIONAL(j, "adult", item.adult, false);

  if (item.rating < 0.0 || item.rating > 10.0)
    throw Json::ValidationError("vote_average", "rating out of range 0-10", j.dump());

  // Listings carry genre_ids, the details endpoint carries genres: [{id, name}]
  if (j.contains("genre_ids")) {
    JSON_OPTIONAL(j, "genre_ids", item.genreIds, std::vector<int>{});
  } else if (j.contains("genres") && j["genres"].is_array()) {
    item.genreIds.clear();
    for (const auto &genre : j["genres"])
      item.genreIds.push_back(Json::require<int>(genre, "id"));
  }

  auto poster = Json::optional<std::string>(j, "poster_path", "");
  item.posterPath = poster.empty() ? std::nullopt : std::optional<juce::String>(Json::toJuceString(poster));

  auto backdrop = Json::optional<std::string>(j, "backdrop_path", "");
  item.backdropPath = backdrop.empty() ? std::nullopt : std::optional<juce::String>(Json::toJuceString(backdrop));
}

} // namespace Marquee
