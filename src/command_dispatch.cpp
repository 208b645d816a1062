// -----------------------------------------------------------------------------
// Implementation for command_dispatch.hpp
//
// This file provides the working guts of the MeshBot command dispatcher.
// - See command_dispatch.hpp for the process flow and reply texts.
// - See tests/test_command_dispatch.cpp for runnable cases.
//
// Notes for maintainers:
// - This file is implementation-only. The header explains *what*; here we show
//   *how*.
// - The try block is the containment boundary for handler exceptions.
// -----------------------------------------------------------------------------

#include "meshbot/command_dispatch.hpp"
#include "meshbot/errors.hpp"
#include "meshbot/log.hpp"
#include "meshbot/session_state.hpp"
#include "meshbot/text_util.hpp"

namespace meshbot {

// ---------- parsing ----------
// Prefix match is exact and case-sensitive; the command name is folded to
// lower case, arguments keep the sender's spelling (names, free text).
bool parse_command_line(const std::string& text, const std::string& prefix, CommandLine& out) {
  const std::string t = trim(text);
  if (prefix.empty() || t.compare(0, prefix.size(), prefix) != 0) return false;

  const std::string line = trim(t.substr(prefix.size()));
  if (line.empty()) return false;

  std::vector<std::string> parts = split_ws(line);
  out.cmd = to_lower(parts.front());
  out.args.assign(parts.begin() + 1, parts.end());
  return true;
}

// ---------- dispatch ----------
std::optional<std::string> Dispatcher::dispatch(CommandContext& ctx,
                                                const PacketEvent& pkt,
                                                const std::string& sender_key,
                                                const std::string& text) const {
  CommandLine cl;
  if (!parse_command_line(text, prefix_, cl)) return std::nullopt;   // not for us

  const CommandSpec* spec = registry_.find(cl.cmd);
  if (!spec) {
    log_event(LogLevel::Debug, "unknown_command", "cmd=" + cl.cmd + " from=" + sender_key);
    return "Unknown command '" + cl.cmd + "'. Try " + prefix_ + "help";
  }

  ctx.state.increment(COUNTER_COMMANDS_EXECUTED);
  log_event(LogLevel::Debug, "command", "cmd=" + cl.cmd + " from=" + sender_key
                                        + " args=" + std::to_string(cl.args.size()));

  try {
    return spec->handler(ctx, pkt, sender_key, cl.args);
  } catch (const NetworkError& e) {
    log_event(LogLevel::Warn, "network_error",
              "cmd=" + cl.cmd + " category=" + e.category() + " what=\"" + e.what() + "\"");
    return "Network error: " + e.category();
  } catch (const std::exception& e) {
    log_event(LogLevel::Error, "handler_failed", "cmd=" + cl.cmd + " what=\"" + e.what() + "\"");
    return "Error: command '" + cl.cmd + "' failed";
  } catch (...) {
    log_event(LogLevel::Error, "handler_failed", "cmd=" + cl.cmd + " what=\"unknown\"");
    return "Error: command '" + cl.cmd + "' failed";
  }
}

} // namespace meshbot
