// -----------------------------------------------------------------------------
// mailbox.cpp - Implementation of the store-and-forward Mailbox
//
// API & field descriptions:
//   see include/meshbot/mailbox.hpp
//
// Tests:
//   see tests/test_mailbox.cpp
// -----------------------------------------------------------------------------
#include "meshbot/mailbox.hpp"
#include "meshbot/log.hpp"

namespace meshbot {

Mailbox::Mailbox(uint64_t ttl_ms, size_t max_per_node, size_t max_keys)
: ttl_ms_(ttl_ms),
  max_per_node_(max_per_node == 0 ? 1 : (max_per_node > SLOT_CAP ? SLOT_CAP : max_per_node)),
  max_keys_(max_keys == 0 ? 1 : max_keys) {
}

// expired() - a message survives only while its age is strictly below the TTL.
bool Mailbox::expired(const PendingMessage& m, uint64_t now_ms) const {
  const uint64_t age = (now_ms >= m.created_at_ms) ? (now_ms - m.created_at_ms) : 0; // clock stepped back: treat as fresh
  return age >= ttl_ms_;
}

// purge() - O(total pending). Survivors keep their relative order.
void Mailbox::purge(uint64_t now_ms) {
  for (auto it = slots_.begin(); it != slots_.end(); ) {
    Slot& slot = it->second;
    Slot kept;
    for (const auto& m : slot)
      if (!expired(m, now_ms)) kept.push_back(m);
    if (kept.empty()) {
      it = slots_.erase(it);             // empty slot: drop the key
    } else {
      slot = kept;
      ++it;
    }
  }
}

void Mailbox::add(const std::string& dest_key, const PendingMessage& msg, uint64_t now_ms) {
  purge(now_ms);

  auto it = slots_.find(dest_key);
  if (it == slots_.end()) {
    if (slots_.size() >= max_keys_) evict_stalest_slot();
    it = slots_.emplace(dest_key, Slot{}).first;
  }

  Slot& slot = it->second;
  while (slot.size() >= max_per_node_) {
    slot.pop_front();                    // full: oldest goes first
    log_event(LogLevel::Warn, "mailbox_evict", "dest=" + dest_key + " reason=per_node_cap");
  }
  slot.push_back(msg);
}

std::vector<PendingMessage> Mailbox::get_for(const std::string& dest_key, uint64_t now_ms) {
  purge(now_ms);
  std::vector<PendingMessage> out;
  auto it = slots_.find(dest_key);
  if (it == slots_.end()) return out;
  out.assign(it->second.begin(), it->second.end());
  return out;
}

std::vector<PendingMessage> Mailbox::pop_for(const std::string& dest_key, uint64_t now_ms) {
  std::vector<PendingMessage> out = get_for(dest_key, now_ms);
  slots_.erase(dest_key);
  return out;
}

size_t Mailbox::size() const {
  size_t n = 0;
  for (const auto& kv : slots_) n += kv.second.size();
  return n;
}

// evict_stalest_slot() - pick the destination whose newest message is oldest.
// Ties resolve to the lexicographically first key (map order).
void Mailbox::evict_stalest_slot() {
  auto victim = slots_.end();
  for (auto it = slots_.begin(); it != slots_.end(); ++it) {
    if (it->second.empty()) { victim = it; break; }
    if (victim == slots_.end() ||
        it->second.back().created_at_ms < victim->second.back().created_at_ms) {
      victim = it;
    }
  }
  if (victim == slots_.end()) return;
  log_event(LogLevel::Warn, "mailbox_evict", "dest=" + victim->first + " reason=max_keys");
  slots_.erase(victim);
}

} // namespace meshbot
