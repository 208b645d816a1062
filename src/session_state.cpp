// -----------------------------------------------------------------------------
// session_state.cpp - in-memory session state
// -----------------------------------------------------------------------------
#include "meshbot/session_state.hpp"

namespace meshbot {

std::optional<uint64_t> SessionState::last_seen(const std::string& node_key) const {
  auto it = seen_.find(node_key);
  if (it == seen_.end()) return std::nullopt;
  return it->second;
}

uint64_t SessionState::counter(const std::string& name) const {
  auto it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second;
}

} // namespace meshbot
