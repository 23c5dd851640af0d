#pragma once

#include <string>

namespace bayeskit {

// ─── Logging ───────────────────────────────────────────────────
// Tiny process-wide logger. Never throws. WARN and ERROR go to
// stderr, everything else to stdout.

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

/// Set global verbosity (default WARN).
void setLogLevel(LogLevel level) noexcept;

LogLevel getLogLevel() noexcept;

/// True if a message at this level would be emitted.
bool shouldLog(LogLevel level) noexcept;

void log(LogLevel level, const std::string& msg) noexcept;

/// Short tag for a level ("DEBUG", "INFO", ...).
const char* levelTag(LogLevel level) noexcept;

} // namespace bayeskit
