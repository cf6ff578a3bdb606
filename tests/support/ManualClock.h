#pragma once

#include "util/Clock.h"
#include <mutex>

namespace Marquee {
namespace Testing {

/**
 * ManualClock - Clock whose time only moves when a test moves it
 */
class ManualClock : public Util::Clock {
public:
  explicit ManualClock(juce::Time start = juce::Time(2024, 5, 1, 12, 0, 0, 0, false)) : current(start) {}

  juce::Time now() const override {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
  }

  void set(juce::Time time) {
    std::lock_guard<std::mutex> lock(mutex);
    current = time;
  }

  void advance(juce::RelativeTime delta) {
    std::lock_guard<std::mutex> lock(mutex);
    current = current + delta;
  }

private:
  mutable std::mutex mutex;
  juce::Time current;
};

} // namespace Testing
} // namespace Marquee
