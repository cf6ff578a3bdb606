#pragma once

#include "Log.h"
#include <juce_core/juce_core.h>
#include <functional>
#include <optional>
#include <type_traits>

namespace Marquee {

// ==============================================================================
/**
 * Outcome<T, E> - A type-safe error handling utility
 *
 * Named "Outcome" to avoid conflict with juce::Result.
 * Carries either a value of type T or an error of type E (a message string by
 * default). Network operations use a structured error type instead, see
 * Network::TransportError.
 *
 * Usage:
 *   Outcome<CatalogItem> parseItem(const nlohmann::json &j) {
 *       if (!j.is_object())
 *           return Outcome<CatalogItem>::error("expected object");
 *       // ... decode
 *       return Outcome<CatalogItem>::ok(item);
 *   }
 *
 *   auto result = client.fetch(query);
 *   if (result.isOk())
 *       show(result.getValue());
 *   else
 *       Log::warn("Fetch failed: " + result.getError().describe());
 *
 *   // Chaining with map
 *   auto count = client.fetch(query)
 *       .map<size_t>([](const CatalogPage &p) { return p.items.size(); })
 *       .getValueOr(0);
 *
 * Error types other than juce::String must provide describe() so that
 * logIfError() and misuse diagnostics can print them.
 */
template <typename T, typename E = juce::String> class Outcome {
public:
  //==========================================================================
  // Factory methods

  /** Create a successful result with a value */
  static Outcome ok(const T &value) {
    return Outcome(value);
  }

  /** Create a successful result with a moved value */
  static Outcome ok(T &&value) {
    return Outcome(std::move(value));
  }

  /** Create a failed result */
  static Outcome error(const E &err) {
    return Outcome(err, true);
  }

  //==========================================================================
  // State checking

  bool isOk() const noexcept {
    return hasValue;
  }

  bool isError() const noexcept {
    return !hasValue;
  }

  explicit operator bool() const noexcept {
    return hasValue;
  }

  //==========================================================================
  // Value access

  /**
   * Get the value. Only call if isOk() returns true.
   * Logs an error and returns default T if called on an error result.
   */
  const T &getValue() const {
    if (!hasValue) {
      Log::error("Outcome::getValue() called on error result: " + describeError(errorValue));
      static T defaultValue{};
      return defaultValue;
    }
    return value.value();
  }

  T &getValue() {
    if (!hasValue) {
      Log::error("Outcome::getValue() called on error result: " + describeError(errorValue));
      static T defaultValue{};
      return defaultValue;
    }
    return value.value();
  }

  T getValueOr(const T &defaultValue) const {
    return hasValue ? value.value() : defaultValue;
  }

  T getValueOrElse(std::function<T()> defaultFn) const {
    return hasValue ? value.value() : defaultFn();
  }

  /** The error. Default-constructed if this is an ok result. */
  const E &getError() const noexcept {
    return errorValue;
  }

  //==========================================================================
  // Monadic operations

  template <typename U> Outcome<U, E> map(std::function<U(const T &)> fn) const {
    if (hasValue)
      return Outcome<U, E>::ok(fn(value.value()));
    return Outcome<U, E>::error(errorValue);
  }

  template <typename U> Outcome<U, E> flatMap(std::function<Outcome<U, E>(const T &)> fn) const {
    if (hasValue)
      return fn(value.value());
    return Outcome<U, E>::error(errorValue);
  }

  const Outcome &onSuccess(std::function<void(const T &)> fn) const {
    if (hasValue)
      fn(value.value());
    return *this;
  }

  const Outcome &onError(std::function<void(const E &)> fn) const {
    if (!hasValue)
      fn(errorValue);
    return *this;
  }

  const Outcome &logIfError(const juce::String &context = "") const {
    if (!hasValue) {
      if (context.isNotEmpty())
        Log::error(context + ": " + describeError(errorValue));
      else
        Log::error(describeError(errorValue));
    }
    return *this;
  }

  Outcome mapError(std::function<E(const E &)> fn) const {
    if (hasValue)
      return *this;
    return Outcome::error(fn(errorValue));
  }

  /** Provide a recovery value if this is an error. */
  Outcome recover(std::function<T(const E &)> fn) const {
    if (hasValue)
      return *this;
    return Outcome::ok(fn(errorValue));
  }

  static juce::String describeError(const E &err) {
    if constexpr (std::is_same_v<E, juce::String>)
      return err;
    else
      return err.describe();
  }

private:
  explicit Outcome(const T &val) : value(val), hasValue(true) {}

  explicit Outcome(T &&val) : value(std::move(val)), hasValue(true) {}

  Outcome(const E &err, bool) : errorValue(err), hasValue(false) {}

  std::optional<T> value;
  E errorValue{};
  bool hasValue = false;
};

//==============================================================================
/**
 * Outcome<void, E> specialization for operations that don't return a value.
 *
 * Usage:
 *   Outcome<void> saveTo(const juce::File &file) {
 *       if (!file.getParentDirectory().createDirectory())
 *           return Outcome<void>::error("Cannot create directory");
 *       // ... write
 *       return Outcome<void>::ok();
 *   }
 */
template <typename E> class Outcome<void, E> {
public:
  static Outcome ok() {
    return Outcome(true);
  }

  static Outcome error(const E &err) {
    return Outcome(err);
  }

  bool isOk() const noexcept {
    return success;
  }

  bool isError() const noexcept {
    return !success;
  }

  explicit operator bool() const noexcept {
    return success;
  }

  const E &getError() const noexcept {
    return errorValue;
  }

  const Outcome &onSuccess(std::function<void()> fn) const {
    if (success)
      fn();
    return *this;
  }

  const Outcome &onError(std::function<void(const E &)> fn) const {
    if (!success)
      fn(errorValue);
    return *this;
  }

  const Outcome &logIfError(const juce::String &context = "") const {
    if (!success) {
      if (context.isNotEmpty())
        Log::error(context + ": " + Outcome<bool, E>::describeError(errorValue));
      else
        Log::error(Outcome<bool, E>::describeError(errorValue));
    }
    return *this;
  }

  template <typename U> Outcome<U, E> then(std::function<Outcome<U, E>()> fn) const {
    if (success)
      return fn();
    return Outcome<U, E>::error(errorValue);
  }

private:
  explicit Outcome(bool ok) : success(ok) {}

  explicit Outcome(const E &err) : errorValue(err), success(false) {}

  E errorValue{};
  bool success = false;
};

} // namespace Marquee
