#pragma once

#include <juce_core/juce_core.h>

namespace Marquee {
namespace Util {

/**
 * Clock - Source of "now" for time-dependent components
 *
 * The offline cache, coalescer and preference engine never call
 * juce::Time::getCurrentTime() directly, so expiry and retention can be
 * driven deterministically from tests.
 */
class Clock {
public:
  virtual ~Clock() = default;

  virtual juce::Time now() const = 0;
};

/** Wall clock backed by juce::Time::getCurrentTime() */
class SystemClock : public Clock {
public:
  juce::Time now() const override {
    return juce::Time::getCurrentTime();
  }
};

} // namespace Util
} // namespace Marquee
