#pragma once
/**
 * @page mb-command-registry MeshBot Command Registry
 * @file command_registry.hpp
 * @brief One merged table of command name → handler, built once at startup.
 *
 * @details
 * PURPOSE
 * -------
 * Commands come from several independently written sets: the built-in set
 * and any number of plugin sets (diagnostics, fun, radio, ...). The registry
 * merges them into a single lookup table so the dispatcher never needs to
 * know which set a command came from.
 *
 * WHAT THIS DOES
 * --------------
 * - Defines `CommandSpec`: name, aliases, help, usage (without prefix) and
 *   the typed handler. There is exactly one handler signature.
 * - Defines `CommandSet`: a named, compile-time list of specs.
 * - `CommandRegistry::add_set()` merges a set in. Names and aliases are
 *   stored lower-case; lookup is a case-insensitive exact match.
 * - Remembers primary names in registration order for help listings.
 *
 * COLLISION POLICY
 * ----------------
 * - `LastWins` (default): a later set silently replaces an earlier command
 *   of the same name; the override is logged at info level.
 * - `FailFast`: the whole set is rejected with `err="duplicate_command:<name>"`
 *   and nothing from it is registered. Startup is expected to abort.
 *
 * LIFECYCLE
 * ---------
 * Built during startup, then handed to the dispatcher by const reference.
 * Nothing mutates it afterwards.
 *
 * EXAMPLE
 * -------
 *   meshbot::CommandRegistry reg(meshbot::CollisionPolicy::FailFast);
 *   std::string err;
 *   if (!reg.add_set(meshbot::builtin_commands(), err)) {
 *       std::cerr << "status=error reason=" << err << "\n";
 *       return 2;
 *   }
 */

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "meshbot/packet_event.hpp"

namespace meshbot {

struct CommandContext;

/**
 * @brief The handler contract.
 *
 * (context, packet, sender_key, args) -> reply text, or nullopt for "no reply".
 * May throw `NetworkError` or any `std::exception`; the dispatcher contains it.
 */
using CommandHandler = std::function<std::optional<std::string>(
    CommandContext& ctx,
    const PacketEvent& pkt,
    const std::string& sender_key,
    const std::vector<std::string>& args)>;

/// @brief One command descriptor.
struct CommandSpec {
  std::string              name;     ///< Lower-case primary name, e.g. "msg"
  std::vector<std::string> aliases;  ///< Extra names, e.g. {"?"} for help
  std::string              help;     ///< One-line description
  std::string              usage;    ///< Usage without prefix, e.g. "msg <node> <text>"
  CommandHandler           handler;
};

/// @brief A named list of commands contributed by one module.
struct CommandSet {
  std::string              name;
  std::vector<CommandSpec> commands;
};

enum class CollisionPolicy { LastWins, FailFast };

/// @brief Parse "last_wins" | "fail_fast".
bool parse_collision_policy(const std::string& s, CollisionPolicy& out);

class CommandRegistry {
public:
  explicit CommandRegistry(CollisionPolicy policy = CollisionPolicy::LastWins)
  : policy_(policy) {}

  /**
   * @brief Merge a command set.
   *
   * @retval false err="bad_command:<set>" for an empty name or missing handler,
   *               err="duplicate_command:<name>" under FailFast.
   *               Nothing from the set is registered on failure.
   */
  bool add_set(const CommandSet& set, std::string& err);

  /// @brief Case-insensitive lookup by name or alias; nullptr if unknown.
  const CommandSpec* find(const std::string& name) const;

  /// @brief Primary names in registration order (overridden names keep their slot).
  const std::vector<std::string>& names() const { return order_; }

  size_t size() const { return order_.size(); }
  CollisionPolicy policy() const { return policy_; }

private:
  CollisionPolicy policy_;
  std::map<std::string, std::shared_ptr<const CommandSpec>> by_name_;  ///< names and aliases
  std::vector<std::string> order_;                                     ///< primary names only
};

} // namespace meshbot
