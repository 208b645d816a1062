#pragma once
/**
 * @file log.hpp
 * @brief Line-oriented key=value logging on stderr.
 *
 * @details
 * PURPOSE
 * -------
 * One log line per event, in the same register the CLI uses for its
 * `status=error reason=...` output, so shell tools can grep and cut it:
 *
 *     level=info event=startup channel=1 prefix=! plugins=diagnostics,fun,radio
 *     level=error event=handler_failed cmd=weather what=...
 *
 * WHAT THIS DOES
 * --------------
 * - Holds one process-wide threshold (`set_log_level()`).
 * - Writes `level=<lvl> event=<name> <details>` to the sink (stderr by default).
 * - Lets tests redirect the sink to a `std::ostringstream`.
 *
 * TRADE-OFFS
 * ----------
 * - No timestamps: journald/syslog add them when the bot runs as a service.
 * - Not thread-safe; MeshBot is single-threaded.
 */

#include <ostream>
#include <string>

namespace meshbot {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// @brief Parse "debug" | "info" | "warn" | "error". Returns false on anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

/// @brief Lower-case name of a level ("warn", ...).
const char* log_level_name(LogLevel lvl);

void     set_log_level(LogLevel lvl);
LogLevel log_level();

/// @brief Redirect output. Passing nullptr restores stderr.
void set_log_sink(std::ostream* sink);

/// @brief Emit one record if @p lvl is at or above the threshold.
void log_event(LogLevel lvl, const std::string& event, const std::string& details = {});

} // namespace meshbot
