#include "Genre.h"
#include <map>

namespace Marquee {
namespace Genres {

namespace {
const std::map<int, const char *> &genreTable() {
  static const std::map<int, const char *> table = {
      {28, "Action"},   {12, "Adventure"},     {16, "Animation"}, {35, "Comedy"},   {80, "Crime"},
      {99, "Documentary"}, {18, "Drama"},      {10751, "Family"}, {14, "Fantasy"},  {36, "History"},
      {27, "Horror"},   {10402, "Music"},      {9648, "Mystery"}, {10749, "Romance"}, {878, "Science Fiction"},
      {10770, "TV Movie"}, {53, "Thriller"},   {10752, "War"},    {37, "Western"},
  };
  return table;
}
} // namespace

juce::String nameFor(int genreId) {
  auto it = genreTable().find(genreId);
  return it != genreTable().end() ? juce::String(it->second) : juce::String("Unknown");
}

bool isKnown(int genreId) {
  return genreTable().count(genreId) > 0;
}

} // namespace Genres
} // namespace Marquee
