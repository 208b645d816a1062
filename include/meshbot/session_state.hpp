/**
 * @file session_state.hpp
 * @brief Process-lifetime state shared by command handlers (last-seen times, counters).
 *
 * @details
 * Lives exactly as long as the bot process. Nothing is written to disk.
 * The router marks every sender as seen and bumps `messages_seen`; the
 * dispatcher bumps `commands_executed`; handlers such as `seen` and `stats`
 * read it back.
 *
 * Keys are canonical node keys (`!a1b2c3d4`), never display names.
 *
 * @note Not thread-safe. Single-threaded event loop only.
 */
#ifndef MESHBOT_SESSION_STATE_HPP
#define MESHBOT_SESSION_STATE_HPP

#include <stdint.h>
#include <map>
#include <optional>
#include <string>

namespace meshbot {

/// Counter bumped by the router for every packet on the monitored channel.
static constexpr const char* COUNTER_MESSAGES_SEEN     = "messages_seen";
/// Counter bumped by the dispatcher for every resolved command.
static constexpr const char* COUNTER_COMMANDS_EXECUTED = "commands_executed";

class SessionState {
public:
  /// @brief Record that @p node_key was active at @p now_ms (last write wins).
  void mark_seen(const std::string& node_key, uint64_t now_ms) { seen_[node_key] = now_ms; }

  /// @brief Last activity of @p node_key, if observed this session.
  std::optional<uint64_t> last_seen(const std::string& node_key) const;

  /// @brief Number of distinct node keys observed this session.
  size_t unique_nodes() const { return seen_.size(); }

  /// @brief Add @p by to a named counter, creating it at zero first.
  void increment(const std::string& name, uint64_t by = 1) { counters_[name] += by; }

  /// @brief Current value of a named counter; unknown counters read as 0.
  uint64_t counter(const std::string& name) const;

private:
  std::map<std::string, uint64_t> seen_;      ///< node key -> last activity (ms)
  std::map<std::string, uint64_t> counters_;  ///< counter name -> value
};

} // namespace meshbot

#endif // MESHBOT_SESSION_STATE_HPP
