// -----------------------------------------------------------------------------
// node_resolver.cpp - token -> canonical key resolution
//
// API & resolution order: see include/meshbot/node_resolver.hpp
// Tests:                  see tests/test_node_resolver.cpp
// -----------------------------------------------------------------------------
#include "meshbot/node_resolver.hpp"
#include "meshbot/packet_event.hpp"
#include "meshbot/text_util.hpp"

namespace meshbot {

// Non-empty trimmed value or nothing; an all-blank name is no name.
static std::optional<std::string> usable(const std::optional<std::string>& s) {
  if (!s) return std::nullopt;
  std::string t = trim(*s);
  if (t.empty()) return std::nullopt;
  return t;
}

static std::optional<std::string> name_of(const NodeEntry& e) {
  if (auto s = usable(e.short_name)) return s;
  return usable(e.long_name);
}

std::optional<std::string> NodeResolver::lookup_display_name(const std::string& key) const {
  const NodeEntry* hit = dir_.find(key);
  if (!hit) {
    for (const auto& e : dir_.entries()) {
      if (e.user_id && *e.user_id == key) { hit = &e; break; }  // some radios key by user id
    }
  }
  if (!hit) return std::nullopt;
  return name_of(*hit);
}

Resolution NodeResolver::resolve(const std::string& raw) const {
  const std::string token = trim(raw);
  if (token.empty()) return {};

  // 1) explicit hex id: trusted even when unknown to the directory
  if (is_node_key(token)) {
    const std::string key = to_lower(token);
    return {key, lookup_display_name(key)};
  }

  // 2) first-match scan over long and short names
  for (const auto& e : dir_.entries()) {
    const auto lname = usable(e.long_name);
    const auto sname = usable(e.short_name);
    if ((lname && iequals(*lname, token)) || (sname && iequals(*sname, token))) {
      return {e.key, name_of(e)};
    }
  }

  // 3) nothing
  return {};
}

} // namespace meshbot
