#pragma once

#include "Result.h"
#include <juce_core/juce_core.h>
#include <nlohmann/json.hpp>

namespace Marquee {

/**
 * CRTP base class for serializable value models
 *
 * Models must inherit from this class and implement:
 * - isValid() const method for validation
 * - from_json(const nlohmann::json&, ModelType&) free function in their namespace
 * - to_json(nlohmann::json&, const ModelType&) free function in their namespace
 *
 * Usage:
 * struct MyModel : public SerializableModel<MyModel> {
 *   // ... fields ...
 *   bool isValid() const { ... }
 * };
 *
 * inline void from_json(const nlohmann::json& j, MyModel& m) { ... }
 * inline void to_json(nlohmann::json& j, const MyModel& m) { ... }
 */
template <typename Derived> class SerializableModel {
public:
  /**
   * Decode a model from JSON with validation
   * Uses ADL to find the derived type's from_json function
   */
  static Outcome<Derived> createFromJson(const nlohmann::json &json) {
    if (!json.is_object())
      return Outcome<Derived>::error("Invalid JSON: expected object");

    try {
      Derived model;
      from_json(json, model);

      if (!model.isValid())
        return Outcome<Derived>::error("Invalid data: missing required fields");

      return Outcome<Derived>::ok(std::move(model));
    } catch (const std::exception &e) {
      return Outcome<Derived>::error("Parse error: " + juce::String(e.what()));
    }
  }

  /**
   * Encode this model to JSON
   * Uses ADL to find the derived type's to_json function
   */
  nlohmann::json toJson() const {
    nlohmann::json j;
    to_json(j, static_cast<const Derived &>(*this));
    return j;
  }
};

} // namespace Marquee
