#pragma once

#include <juce_core/juce_core.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace Marquee {
namespace Json {

// ==============================================================================
/**
 * ValidationError - JSON validation exception with detailed error context
 *
 * Thrown when decoding fails due to missing required fields, type mismatches,
 * or out-of-range data. The network layer turns it into a decodingError.
 */
class ValidationError : public std::runtime_error {
public:
  ValidationError(const std::string &field, const std::string &reason, const std::string &context = "")
      : std::runtime_error("JSON validation failed for field '" + field + "': " + reason +
                           (context.empty() ? "" : " (context: " + truncate(context) + ")")),
        fieldName(field) {}

  const std::string &getField() const noexcept {
    return fieldName;
  }

private:
  // Whole response bodies are too noisy for a log line
  static std::string truncate(const std::string &context) {
    constexpr size_t maxContext = 200;
    return context.size() <= maxContext ? context : context.substr(0, maxContext) + "...";
  }

  std::string fieldName;
};

// ==============================================================================
// Required field validation

/**
 * Require a field to exist and have the correct type
 *
 * @throws ValidationError if field is missing, null, or has wrong type
 */
template <typename T> T require(const nlohmann::json &j, const std::string &field) {
  if (!j.is_object() || !j.contains(field) || j.at(field).is_null()) {
    throw ValidationError(field, "required field is missing", j.dump());
  }
  try {
    return j.at(field).get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw ValidationError(field, "type mismatch - " + std::string(e.what()), j.dump());
  }
}

// ==============================================================================
// Optional field with default value

/**
 * Get an optional field with a default value
 *
 * @return Value of type T, or defaultValue if the field is missing or null
 * @throws ValidationError if field exists but has wrong type
 */
template <typename T> T optional(const nlohmann::json &j, const std::string &field, const T &defaultValue) {
  if (!j.is_object() || !j.contains(field) || j.at(field).is_null()) {
    return defaultValue;
  }
  try {
    return j.at(field).get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw ValidationError(field, "type mismatch - " + std::string(e.what()), j.dump());
  }
}

// ==============================================================================
// String conversion utilities

inline juce::String toJuceString(const std::string &str) {
  return juce::String::fromUTF8(str.c_str(), static_cast<int>(str.size()));
}

inline std::string fromJuceString(const juce::String &str) {
  return str.toStdString();
}

// ==============================================================================
// Time conversion (persisted as milliseconds since the epoch)

inline juce::int64 fromTime(const juce::Time &time) {
  return time.toMilliseconds();
}

inline juce::Time toTime(juce::int64 millis) {
  return juce::Time(millis);
}

} // namespace Json
} // namespace Marquee

// ==============================================================================
// Helper macros for common patterns in from_json implementations

/**
 * JSON_REQUIRE - Require a field and assign to variable
 *
 * Usage:
 *   int id;
 *   JSON_REQUIRE(json, "id", id);
 */
#define JSON_REQUIRE(json, field, var) var = Marquee::Json::require<decltype(var)>(json, field)

/**
 * JSON_OPTIONAL - Get optional field with default and assign to variable
 *
 * Usage:
 *   int voteCount;
 *   JSON_OPTIONAL(json, "vote_count", voteCount, 0);
 */
#define JSON_OPTIONAL(json, field, var, defaultVal)                                                                    \
  var = Marquee::Json::optional<decltype(var)>(json, field, defaultVal)

/**
 * JSON_REQUIRE_STRING - Require a string field and convert to juce::String
 */
#define JSON_REQUIRE_STRING(json, field, var)                                                                          \
  var = Marquee::Json::toJuceString(Marquee::Json::require<std::string>(json, field))

/**
 * JSON_OPTIONAL_STRING - Get optional string field and convert to juce::String
 */
#define JSON_OPTIONAL_STRING(json, field, var, defaultVal)                                                             \
  var = Marquee::Json::toJuceString(Marquee::Json::optional<std::string>(json, field, defaultVal))
