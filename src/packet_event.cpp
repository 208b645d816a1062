// -----------------------------------------------------------------------------
// packet_event.cpp - sender normalization helpers
//
// API: see include/meshbot/packet_event.hpp
// -----------------------------------------------------------------------------
#include "meshbot/packet_event.hpp"
#include "meshbot/text_util.hpp"

#include <cctype>
#include <cstdio>

namespace meshbot {

std::string node_key_from_num(uint32_t num) {
  char buf[12];
  std::snprintf(buf, sizeof(buf), "!%08x", static_cast<unsigned>(num));
  return buf;
}

bool is_node_key(const std::string& s) {
  if (s.size() != 9 || s[0] != '!') return false;
  for (size_t i = 1; i < s.size(); ++i)
    if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
  return true;
}

std::optional<std::string> sender_key(const PacketEvent& pkt) {
  if (pkt.from_id) {
    std::string id = to_lower(trim(*pkt.from_id));
    if (is_node_key(id)) return id;             // canonical string id wins when present
  }
  if (pkt.from_num) return node_key_from_num(*pkt.from_num);
  return std::nullopt;
}

} // namespace meshbot
