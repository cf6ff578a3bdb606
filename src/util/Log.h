#pragma once

#include <juce_core/juce_core.h>
#include <optional>

namespace Marquee {

// ==============================================================================
/**
 * Log - Process-wide logging for the Marquee catalog core
 *
 * debug/info go to stdout, warn/error to stderr, and every level is appended
 * to marquee.log: in the working directory for development builds, under the
 * per-user application data directory (Marquee/logs) when NDEBUG is defined.
 *
 * The log file is opened on first use. If it cannot be created, file output
 * switches itself off and console output carries on.
 */
namespace Log {
enum class Level { Debug, Info, Warn, Error };

void debug(const juce::String &message);
void info(const juce::String &message);
void warn(const juce::String &message);
void error(const juce::String &message);

void log(Level level, const juce::String &message);

// ==========================================================================
// Messages below the minimum level are dropped
void setMinLevel(Level level);
Level getMinLevel();

void setFileLoggingEnabled(bool enabled);
bool isFileLoggingEnabled();

void setConsoleLoggingEnabled(bool enabled);
bool isConsoleLoggingEnabled();

void flush();

const char *levelToString(Level level);

/** "debug", "info", "warn" or "error", case-insensitive */
std::optional<Level> levelFromString(const juce::String &name);

} // namespace Log
} // namespace Marquee
