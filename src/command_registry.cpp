// -----------------------------------------------------------------------------
// Implementation for command_registry.hpp
//
// - See command_registry.hpp for the collision policy and lifecycle.
// - See tests/test_command_registry.cpp for runnable cases.
//
// Notes for maintainers:
// - Merging is two-phase: validate the whole set, then insert. A rejected set
//   never leaves half of its commands behind.
// -----------------------------------------------------------------------------

#include "meshbot/command_registry.hpp"
#include "meshbot/log.hpp"
#include "meshbot/text_util.hpp"

#include <algorithm>
#include <set>

namespace meshbot {

bool parse_collision_policy(const std::string& s, CollisionPolicy& out) {
  if (s == "last_wins") { out = CollisionPolicy::LastWins; return true; }
  if (s == "fail_fast") { out = CollisionPolicy::FailFast; return true; }
  return false;
}

// ---------- add_set ----------
// Phase 1: every spec needs a name and a handler; under FailFast no name or
//          alias may already exist, neither in the registry nor twice in the set.
// Phase 2: insert names and aliases; LastWins overrides are logged.
bool CommandRegistry::add_set(const CommandSet& set, std::string& err) {
  std::set<std::string> incoming;
  for (const auto& spec : set.commands) {
    if (trim(spec.name).empty() || !spec.handler) {
      err = "bad_command:" + set.name;
      return false;
    }
    std::vector<std::string> keys{spec.name};
    keys.insert(keys.end(), spec.aliases.begin(), spec.aliases.end());
    for (const auto& k : keys) {
      const std::string key = to_lower(trim(k));
      if (key.empty()) continue;
      if (policy_ == CollisionPolicy::FailFast &&
          (by_name_.count(key) || incoming.count(key))) {
        err = "duplicate_command:" + key;
        return false;
      }
      incoming.insert(key);
    }
  }

  for (const auto& spec : set.commands) {
    auto shared = std::make_shared<const CommandSpec>(spec);
    const std::string primary = to_lower(trim(spec.name));

    std::vector<std::string> keys{primary};
    for (const auto& a : spec.aliases) keys.push_back(to_lower(trim(a)));

    for (const auto& key : keys) {
      if (key.empty()) continue;
      if (by_name_.count(key)) {
        log_event(LogLevel::Info, "command_override", "name=" + key + " set=" + set.name);
      }
      by_name_[key] = shared;
    }
    if (std::find(order_.begin(), order_.end(), primary) == order_.end())
      order_.push_back(primary);
  }
  return true;
}

const CommandSpec* CommandRegistry::find(const std::string& name) const {
  auto it = by_name_.find(to_lower(trim(name)));
  return it == by_name_.end() ? nullptr : it->second.get();
}

} // namespace meshbot
