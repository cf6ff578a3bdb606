#include "Log.h"
#include <iostream>
#include <memory>
#include <mutex>

namespace Marquee {
namespace Log {

namespace {
struct Sinks {
  std::mutex mutex;
  std::unique_ptr<juce::FileOutputStream> file;
  bool fileEnabled = true;
  bool consoleEnabled = true;
  bool fileOpenAttempted = false;

#ifdef NDEBUG
  Level minLevel = Level::Info;
#else
  Level minLevel = Level::Debug;
#endif
};

Sinks &sinks() {
  static Sinks instance;
  return instance;
}

juce::File logDirectory() {
#ifdef NDEBUG
  return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
      .getChildFile("Marquee")
      .getChildFile("logs");
#else
  return juce::File::getCurrentWorkingDirectory();
#endif
}

// Caller holds the sink mutex
void openFile(Sinks &s) {
  s.fileOpenAttempted = true;

  auto directory = logDirectory();
  if (!directory.exists() && directory.createDirectory().failed()) {
    s.fileEnabled = false;
    return;
  }

  auto stream = std::make_unique<juce::FileOutputStream>(directory.getChildFile("marquee.log"));
  if (stream->failedToOpen()) {
    s.fileEnabled = false;
    return;
  }

  stream->writeText("\n---- Marquee session " + juce::Time::getCurrentTime().toISO8601(true) + " ----\n", false,
                    false, nullptr);
  stream->flush();
  s.file = std::move(stream);
}

// Caller holds the sink mutex
void appendToFile(Sinks &s, const juce::String &line) {
  if (!s.fileEnabled)
    return;

  if (!s.fileOpenAttempted)
    openFile(s);

  if (s.file == nullptr)
    return;

  // Flushed per line so entries survive a crash
  if (!s.file->writeText(line + "\n", false, false, nullptr)) {
    s.file.reset();
    s.fileEnabled = false;
    return;
  }
  s.file->flush();
}
} // namespace

// ==============================================================================
const char *levelToString(Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO ";
  case Level::Warn:
    return "WARN ";
  case Level::Error:
    return "ERROR";
  }
  return "?????";
}

std::optional<Level> levelFromString(const juce::String &name) {
  auto lowered = name.trim().toLowerCase();
  if (lowered == "debug")
    return Level::Debug;
  if (lowered == "info")
    return Level::Info;
  if (lowered == "warn" || lowered == "warning")
    return Level::Warn;
  if (lowered == "error")
    return Level::Error;
  return std::nullopt;
}

void log(Level level, const juce::String &message) {
  auto &s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);

  if (static_cast<int>(level) < static_cast<int>(s.minLevel))
    return;

  auto line = "[" + juce::Time::getCurrentTime().formatted("%Y-%m-%d %H:%M:%S") + "] [" + levelToString(level) +
              "] " + message;

  if (s.consoleEnabled) {
    auto &stream = (level == Level::Warn || level == Level::Error) ? std::cerr : std::cout;
    stream << line.toStdString() << std::endl;
  }

  appendToFile(s, line);
}

void debug(const juce::String &message) {
  log(Level::Debug, message);
}

void info(const juce::String &message) {
  log(Level::Info, message);
}

void warn(const juce::String &message) {
  log(Level::Warn, message);
}

void error(const juce::String &message) {
  log(Level::Error, message);
}

// ==============================================================================
void setMinLevel(Level level) {
  auto &s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.minLevel = level;
}

Level getMinLevel() {
  auto &s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.minLevel;
}

void setFileLoggingEnabled(bool enabled) {
  auto &s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.fileEnabled = enabled;
  if (!enabled)
    s.file.reset();
  else if (s.file == nullptr)
    s.fileOpenAttempted = false;
}

bool isFileLoggingEnabled() {
  auto &s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.fileEnabled;
}

void setConsoleLoggingEnabled(bool enabled) {
  auto &s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.consoleEnabled = enabled;
}

bool isConsoleLoggingEnabled() {
  auto &s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.consoleEnabled;
}

void flush() {
  auto &s = sinks();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.file != nullptr)
    s.file->flush();
}

} // namespace Log
} // namespace Marquee
