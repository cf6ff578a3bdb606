#pragma once

#include <juce_core/juce_core.h>

namespace Marquee {
namespace Genres {

/**
 * Display name for a TMDB movie genre id, or "Unknown"
 */
juce::String nameFor(int genreId);

/**
 * True if the id is one of the known movie genres
 */
bool isKnown(int genreId);

} // namespace Genres
} // namespace Marquee
