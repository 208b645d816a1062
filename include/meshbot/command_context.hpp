/**
 * @file command_context.hpp
 * @brief Everything a command handler may touch, passed by reference per dispatch.
 *
 * @details
 * Handlers never reach for globals. The router assembles a `CommandContext`
 * for each packet: the shared stores (mailbox, session state), the read-only
 * views (directory, resolver, registry, config), the injected clock and RNG,
 * and the optional external services. Tests build the same struct around
 * fakes.
 *
 * Lifetime: all references outlive the dispatch call that receives them.
 */
#ifndef MESHBOT_COMMAND_CONTEXT_HPP
#define MESHBOT_COMMAND_CONTEXT_HPP

#include <stdint.h>
#include <functional>
#include <optional>
#include <random>

#include "meshbot/command_registry.hpp"
#include "meshbot/config.hpp"
#include "meshbot/mailbox.hpp"
#include "meshbot/node_directory.hpp"
#include "meshbot/node_resolver.hpp"
#include "meshbot/session_state.hpp"
#include "meshbot/weather.hpp"

namespace meshbot {

/// Returns host uptime in seconds, or nullopt when it cannot be read.
using UptimeSource = std::function<std::optional<double>()>;

struct CommandContext {
  const Config&          config;
  Mailbox&               mailbox;
  SessionState&          state;
  const NodeDirectory&   directory;
  const NodeResolver&    resolver;
  const CommandRegistry& registry;
  WeatherService*        weather;        ///< nullptr when no weather backend is configured
  std::mt19937&          rng;
  uint64_t               started_ms;     ///< bot start, same clock as now_ms
  uint64_t               now_ms;         ///< injected clock for this packet
  UptimeSource           system_uptime;  ///< may be empty

  /// @brief Configured prefix glued to a command name ("!" + "help").
  std::string prefixed(const std::string& s) const { return config.bot.command_prefix + s; }
};

} // namespace meshbot

#endif // MESHBOT_COMMAND_CONTEXT_HPP
