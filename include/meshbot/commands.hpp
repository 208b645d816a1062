#pragma once
/**
 * @page mb-commands MeshBot Built-in Commands
 * @file commands.hpp
 * @brief The command set every MeshBot ships with, plus the plugin sets.
 *
 * @details
 * PURPOSE
 * -------
 * This is the **menu** of the bot. Each function returns a `CommandSet`,
 * a plain list of `CommandSpec` descriptors. Nothing is registered as a
 * side effect; `build_registry()` merges the sets the configuration asks
 * for, in the order it asks for them.
 *
 * BUILT-IN SET ("builtin")
 * ------------------------
 *   help | ? [command]   list commands, or usage + help of one command
 *   ping                 "pong", plus " (SNR x, RSSI y)" when present
 *   whoami               "You are: <name> (<key>)" or "You are: <key>"
 *   nodes                "Nodes: <count> | <up to 8 names>"
 *   uptime               bot uptime, plus host uptime when readable
 *   weather [place]      current conditions (default place from config)
 *   air                  local node airtime metrics
 *   msg <node> <text>    leave a message in the recipient's mailbox
 *   inbox                preview up to 3 pending messages for the sender
 *
 * PLUGIN SETS
 * -----------
 *   diagnostics          snr, route, seen [node], load
 *   fun                  roll [sides], 8ball, stats
 *   radio                noise
 *
 * FIELD UTILITY
 * -------------
 * All replies are single messages in plain text. Length is clamped by the
 * router, not here, except for the mailbox payload (400) and the inbox
 * preview (80 per message).
 */

#include <optional>
#include <string>

#include "meshbot/command_registry.hpp"
#include "meshbot/config.hpp"

namespace meshbot {

/// Longest text stored in a mailbox slot (code points, marker included).
static constexpr size_t MAILBOX_TEXT_MAX  = 400;
/// Longest text shown per message in an inbox preview.
static constexpr size_t INBOX_PREVIEW_MAX = 80;
/// Messages shown by one inbox preview.
static constexpr size_t INBOX_PREVIEW_N   = 3;
/// Names listed by the nodes command.
static constexpr size_t NODES_LIST_MAX    = 8;

CommandSet builtin_commands();
CommandSet diagnostics_commands();
CommandSet fun_commands();
CommandSet radio_commands();

/// @brief Plugin set by name ("diagnostics" | "fun" | "radio").
bool plugin_commands(const std::string& name, CommandSet& out);

/**
 * @brief Merge the built-in set, then every plugin named in @p bot.plugins, in order.
 *
 * @retval false err="unknown_plugin:<name>" or whatever `add_set()` reported.
 */
bool build_registry(const BotSettings& bot, CommandRegistry& registry, std::string& err);

/// @brief Host uptime from /proc/uptime, in seconds; nullopt when unreadable.
std::optional<double> read_proc_uptime();

} // namespace meshbot
