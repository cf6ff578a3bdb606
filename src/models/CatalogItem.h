#pragma once

#include "../util/SerializableModel.h"
#include "../util/json/JsonValidation.h"
#include <juce_core/juce_core.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace Marquee {

// ==============================================================================
/**
 * CatalogItem is one discoverable work (a movie) as returned by the remote
 * metadata service.
 *
 * Items are values: built once by decoding a response and never mutated
 * afterwards. Identity and equality are keyed on the integer id only, so two
 * snapshots of the same movie with different vote counts compare equal.
 */
struct CatalogItem : public SerializableModel<CatalogItem> {
  // Equality comparison (by ID) - required for RxCpp distinct()
  bool operator==(const CatalogItem &other) const {
    return id == other.id;
  }
  bool operator!=(const CatalogItem &other) const {
    return id != other.id;
  }

  int id = 0;
  juce::String title;
  juce::String originalTitle;
  juce::String overview;
  juce::String releaseDate; // "YYYY-MM-DD", may be empty for unreleased titles
  double rating = 0.0;      // vote average, 0-10
  int voteCount = 0;
  double popularity = 0.0;
  std::vector<int> genreIds;
  std::optional<juce::String> posterPath;
  std::optional<juce::String> backdropPath;
  juce::String originalLanguage;
  bool adult = false;

  bool isValid() const {
    return id > 0 && title.isNotEmpty();
  }

  /** Release year, or 0 when the release date is unknown */
  int releaseYear() const;

  /** Release date as a UTC timestamp, if it parses */
  std::optional<juce::Time> releaseTime() const;

  /** Full image URLs on the image CDN, if the item has artwork */
  std::optional<juce::String> posterUrl(const juce::String &size = {}) const;
  std::optional<juce::String> backdropUrl(const juce::String &size = {}) const;

  bool hasGenre(int genreId) const;

  /** Rating rounded to one decimal, e.g. "7.4" */
  juce::String formattedRating() const;
};

// ==============================================================================
// JSON Serialization (TMDB field names, used for both decoding and the cache blob)

void to_json(nlohmann::json &j, const CatalogItem &item);
void from_json(const nlohmann::json &j, CatalogItem &item);

} // namespace Marquee
