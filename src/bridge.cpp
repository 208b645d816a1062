// ============================================================================
// bridge.cpp - implementation for bridge.hpp
//
// Two halves:
//   - codec:     JSON frame <-> BridgeEvent / sendText document
//   - transport: bytes on a descriptor <-> frames (SLIP or newline)
// ============================================================================

#include "meshbot/bridge.hpp"
#include "meshbot/json_util.hpp"
#include "meshbot/log.hpp"
#include "meshbot/serial_io.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <initializer_list>
#include <optional>
#include <poll.h>
#include <unistd.h>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace meshbot {

// ---------------------------------------------------------------------------
// codec
// ---------------------------------------------------------------------------

// First path that parses as an int wins; unparsable or out-of-range values
// are skipped, never narrowed.
static std::optional<int> first_int(const json& j,
                                    std::initializer_list<std::initializer_list<const char*>> paths) {
  for (const auto& p : paths) {
    auto v = json_integer(json_find(j, p));
    if (v && *v >= INT_MIN && *v <= INT_MAX) return static_cast<int>(*v);
  }
  return std::nullopt;
}

static void decode_packet(const json& j, PacketEvent& p) {
  p.channel = first_int(j, {{"channel"}, {"decoded", "channel"}, {"decoded", "channelIndex"}, {"rx", "channel"}});
  p.text    = json_string(json_find(j, {"decoded", "text"}));

  p.from_id = json_string(json_find(j, {"fromId"}));
  const json* from = json_find(j, {"from"});
  if (auto n = json_integer(from); n && from->is_number() && *n >= 0 && *n <= 0xFFFFFFFFll) {
    p.from_num = static_cast<uint32_t>(*n);
  } else if (auto s = json_string(from); s && !p.from_id) {
    p.from_id = s;                                   // some bridges send "from" as "!hex"
  }

  p.rx_snr    = json_number(json_find(j, {"rxSnr"}));
  p.rx_rssi   = json_number(json_find(j, {"rxRssi"}));
  p.hops_away = first_int(j, {{"hopsAway"}, {"rxHop"}, {"hops"}, {"hopCount"}});
  p.hop_limit = first_int(j, {{"hopLimit"}});
}

bool decode_bridge_frame(const std::string& frame, BridgeEvent& out, std::string& err) {
  json j = json::parse(frame, nullptr, /*allow_exceptions*/false);
  if (j.is_discarded()) { err = "bad_json"; return false; }
  if (!j.is_object())   { err = "bad_format"; return false; }

  const auto type = json_string(json_find(j, {"type"}));
  if (!type) { err = "missing_field:type"; return false; }

  BridgeEvent ev;
  if (*type == "packet") {
    ev.kind = BridgeEventKind::Packet;
    decode_packet(j, ev.packet);
  } else if (*type == "node") {
    ev.kind = BridgeEventKind::Node;
    if (!node_from_json(j, ev.node, err)) return false;
  } else if (*type == "myInfo") {
    ev.kind = BridgeEventKind::LocalNode;
    auto num = json_integer(json_find(j, {"myNodeNum"}));
    if (!num || *num < 0 || *num > 0xFFFFFFFFll) { err = "missing_field:myNodeNum"; return false; }
    ev.node.key = node_key_from_num(static_cast<uint32_t>(*num));
    ev.node.is_local = true;
  } else {
    err = "unknown_type:" + *type;
    return false;
  }

  out = ev;
  return true;
}

std::string encode_send_text(int channel_index, const std::string& text) {
  json j;
  j["type"] = "sendText";
  j["channelIndex"] = channel_index;
  j["text"] = text;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// transport
// ---------------------------------------------------------------------------

BridgeTransport::BridgeTransport(int in_fd, int out_fd, Framing framing, bool owns_fds)
: in_fd_(in_fd), out_fd_(out_fd), framing_(framing), owns_fds_(owns_fds), slip_(MAX_FRAME) {
}

BridgeTransport::~BridgeTransport() {
  if (!owns_fds_) return;
  close_serial(in_fd_);
  if (out_fd_ != in_fd_) close_serial(out_fd_);
}

// consume() - split raw bytes into complete frames and park them in ready_.
void BridgeTransport::consume(const char* data, size_t n) {
  for (size_t i = 0; i < n; ++i) {
    if (framing_ == Framing::Slip) {
      std::string frame;
      if (slip_.feed(static_cast<uint8_t>(data[i]), frame)) ready_.push_back(frame);
      continue;
    }

    // Lines: '\n' ends a frame, '\r' is ignored, blank lines are separators.
    const char c = data[i];
    if (c == '\n') {
      if (line_overflow_) ++rejected_;
      else if (!line_.empty()) ready_.push_back(line_);
      line_.clear();
      line_overflow_ = false;
    } else if (c != '\r') {
      if (line_.size() >= MAX_FRAME) { line_overflow_ = true; line_.clear(); }
      if (!line_overflow_) line_.push_back(c);
    }
  }
}

// next_event() - decode parked frames until one succeeds.
bool BridgeTransport::next_event(BridgeEvent& ev) {
  while (!ready_.empty()) {
    const std::string frame = ready_.front();
    ready_.pop_front();
    std::string why;
    if (decode_bridge_frame(frame, ev, why)) return true;
    ++rejected_;
    log_event(LogLevel::Debug, "frame_rejected", "reason=" + why + " bytes=" + std::to_string(frame.size()));
  }
  return false;
}

MeshTransport::PollStatus BridgeTransport::poll(BridgeEvent& ev, int timeout_ms, std::string& err) {
  if (next_event(ev)) return PollStatus::Event;

  pollfd pfd{in_fd_, POLLIN, 0};
  const int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr == 0) return PollStatus::Idle;
  if (pr < 0) {
    if (errno == EINTR) return PollStatus::Idle;      // signal: let the loop check its stop flag
    err = std::string("poll_failed:") + std::strerror(errno);
    return PollStatus::Error;
  }

  char buf[4096];
  const ssize_t n = ::read(in_fd_, buf, sizeof(buf));
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return PollStatus::Idle;
    err = std::string("read_failed:") + std::strerror(errno);
    return PollStatus::Error;
  }
  if (n == 0) {
    // end of stream: a final unterminated line still counts
    if (framing_ == Framing::Lines && !line_.empty() && !line_overflow_) {
      ready_.push_back(line_);
      line_.clear();
    }
    if (next_event(ev)) return PollStatus::Event;
    return PollStatus::Closed;
  }

  consume(buf, static_cast<size_t>(n));
  return next_event(ev) ? PollStatus::Event : PollStatus::Idle;
}

bool BridgeTransport::send_text(int channel_index, const std::string& text, std::string& err) {
  std::string doc = encode_send_text(channel_index, text);
  const std::string wire = (framing_ == Framing::Slip) ? slip::encode(doc) : doc + "\n";
  if (!write_all(out_fd_, wire, WRITE_TIMEOUT_MS)) {
    err = std::string("write_failed:") + std::strerror(errno);
    return false;
  }
  return true;
}

} // namespace meshbot
