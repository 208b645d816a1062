#pragma once
/**
 * @page mb-command-dispatch MeshBot Command Dispatcher
 * @file command_dispatch.hpp
 * @brief Turn one inbound text into at most one reply, via the command registry.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the **glue layer** between raw channel text and the
 * command handlers. It exists so that:
 *   - the router never has to know about individual commands,
 *   - new commands are added by writing a `CommandSpec` and nothing else,
 *   - parsing, lookup, counting and failure containment live in one place.
 *
 * WHAT THIS DOES
 * --------------
 * - `parse_command_line()` checks the prefix and splits a text into a
 *   lower-cased command name plus whitespace-separated arguments.
 * - `Dispatcher::dispatch()` looks the name up in the registry, counts the
 *   execution, runs the handler and converts its outcome into a reply.
 *
 * PROCESS FLOW
 * ------------
 * 1. Trim. No prefix → no reply. Prefix followed only by spaces → no reply.
 * 2. `cmd` = first token lower-cased, `args` = remaining tokens.
 * 3. Unknown `cmd` → `Unknown command '<cmd>'. Try <prefix>help`.
 *    Counters are **not** touched.
 * 4. Known `cmd` → `commands_executed += 1`, then call the handler.
 *    A returned string is the reply; nullopt means silence.
 * 5. Failures are contained here and never escape:
 *    - `NetworkError` → `Network error: <category>`
 *    - any other `std::exception` → `Error: command '<cmd>' failed`,
 *      logged with its `what()` at error level.
 *
 * DESIGN ADVANTAGES
 * -----------------
 * - **Single point of truth**: the only place a command name is interpreted.
 * - **Contained failure**: one bad handler cannot take down the loop.
 * - **Testable**: no transport, no clock; the context carries both.
 *
 * EXAMPLE
 * -------
 *   meshbot::Dispatcher d(registry, "!");
 *   auto reply = d.dispatch(ctx, pkt, "!a1b2c3d4", "!ping");
 *   if (reply) outbox.push(*reply);
 *
 * @note Reply length is not enforced here; the router clamps every outbound text.
 *
 * @see command_registry.hpp  For CommandSpec and merge policy
 * @see bot.hpp               For the router that owns the dispatcher
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "meshbot/command_context.hpp"
#include "meshbot/command_registry.hpp"
#include "meshbot/packet_event.hpp"

namespace meshbot {

/// @brief A parsed, prefix-stripped command line.
struct CommandLine {
  std::string              cmd;   ///< lower-cased command name
  std::vector<std::string> args;  ///< remaining tokens, case preserved
};

/**
 * @brief Split @p text into command and arguments.
 *
 * @retval false when @p text does not start with @p prefix (after trimming)
 *               or nothing but whitespace follows the prefix.
 */
bool parse_command_line(const std::string& text, const std::string& prefix, CommandLine& out);

class Dispatcher {
public:
  Dispatcher(const CommandRegistry& registry, std::string prefix)
  : registry_(registry), prefix_(std::move(prefix)) {}

  /**
   * @brief Handle one text. Returns the reply, or nullopt for "say nothing".
   * Never throws.
   */
  std::optional<std::string> dispatch(CommandContext& ctx,
                                      const PacketEvent& pkt,
                                      const std::string& sender_key,
                                      const std::string& text) const;

  const std::string& prefix() const { return prefix_; }

private:
  const CommandRegistry& registry_;
  std::string            prefix_;
};

} // namespace meshbot
