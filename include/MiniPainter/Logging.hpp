#pragma once
#include <string>
#include <plog/Severity.h>

namespace MiniPainter {

/**
 * @brief Map "none", "fatal", "error", "warning" (or "warn"), "info",
 * "debug" or "verbose" to a plog severity. Case-insensitive.
 */
bool parseLogLevel(const std::string& name, plog::Severity& out);

/**
 * @brief Initialize plog: console on stderr, plus a rolling file when
 * logFile is non-empty. Later calls only change the level.
 */
void initLogging(plog::Severity level, const std::string& logFile = std::string());

} // namespace MiniPainter
