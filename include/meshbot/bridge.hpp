#pragma once
/**
 * @page mb-bridge MeshBot Transport Bridge
 * @file bridge.hpp
 * @brief JSON event frames between the bot and the companion radio bridge.
 *
 * @details
 * PURPOSE
 * -------
 * The radio driver is not ours. A companion bridge process owns it and
 * translates radio traffic into small JSON frames. This header is the bot's
 * side of that conversation: decode inbound frames into `PacketEvent` /
 * `NodeEntry`, encode outbound "send text" frames, and move them over a
 * byte stream.
 *
 * WIRE FORMAT
 * -----------
 * Inbound (bridge → bot):
 *
 *     {"type":"packet","from":2712847316,"fromId":"!a1b2c3d4","channel":1,
 *      "decoded":{"text":"!ping"},"rxSnr":6.25,"rxRssi":-97,"hopsAway":1,"hopLimit":3}
 *     {"type":"node","num":2712847316,"user":{"shortName":"BOB","longName":"Bob Base"},
 *      "deviceMetrics":{"channelUtilization":7.5}}
 *     {"type":"myInfo","myNodeNum":287454020}
 *
 * Channel index is taken from the first parsable of `channel`,
 * `decoded.channel`, `decoded.channelIndex`, `rx.channel`. Hop count from
 * `hopsAway`, `rxHop`, `hops`, `hopCount`, in that order.
 *
 * Outbound (bot → bridge):
 *
 *     {"type":"sendText","channelIndex":1,"text":"pong"}
 *
 * FRAMING
 * -------
 * - `Framing::Slip`  - serial TTY; one SLIP frame per JSON document.
 * - `Framing::Lines` - stdin/stdout; one JSON document per line.
 *
 * ERRORS
 * ------
 * Malformed frames never reach the router. `decode_bridge_frame()` returns
 * false with one of: "bad_json", "bad_format", "missing_field:type",
 * "unknown_type:<t>", "missing_field:num", "missing_field:myNodeNum".
 * The transport logs the reason at debug level and keeps going.
 */

#include <cstddef>
#include <deque>
#include <string>

#include "meshbot/node_directory.hpp"
#include "meshbot/packet_event.hpp"
#include "meshbot/slip.hpp"

namespace meshbot {

enum class BridgeEventKind { Packet, Node, LocalNode };

/// @brief One decoded inbound frame. Only the member matching `kind` is meaningful.
struct BridgeEvent {
  BridgeEventKind kind{BridgeEventKind::Packet};
  PacketEvent     packet;   ///< kind == Packet
  NodeEntry       node;     ///< kind == Node (full entry) or LocalNode (key only)
};

/// @brief Decode one JSON frame.
bool decode_bridge_frame(const std::string& frame, BridgeEvent& out, std::string& err);

/// @brief Encode a send request as one JSON document (no framing, no newline).
std::string encode_send_text(int channel_index, const std::string& text);

/**
 * @class MeshTransport
 * @brief What the main loop needs from "the radio": events in, text out.
 */
class MeshTransport {
public:
  enum class PollStatus { Event, Idle, Closed, Error };

  virtual ~MeshTransport() = default;

  /**
   * @brief Wait up to @p timeout_ms for the next decoded event.
   * @retval Event   @p ev holds one event.
   * @retval Idle    nothing complete arrived in time.
   * @retval Closed  the peer reached end-of-stream.
   * @retval Error   I/O failure; @p err says which.
   */
  virtual PollStatus poll(BridgeEvent& ev, int timeout_ms, std::string& err) = 0;

  /// @brief Ask the bridge to send @p text on @p channel_index.
  virtual bool send_text(int channel_index, const std::string& text, std::string& err) = 0;
};

enum class Framing { Slip, Lines };

/**
 * @class BridgeTransport
 * @brief MeshTransport over a pair of file descriptors (serial TTY or stdio).
 */
class BridgeTransport : public MeshTransport {
public:
  static constexpr size_t MAX_FRAME       = 64 * 1024;  ///< larger frames are discarded
  static constexpr int    WRITE_TIMEOUT_MS = 2000;

  /**
   * @param in_fd     Descriptor to read frames from (set non-blocking by the caller or not; poll() gates reads).
   * @param out_fd    Descriptor to write frames to (may equal in_fd for a TTY).
   * @param framing   Slip or Lines.
   * @param owns_fds  Close the descriptors on destruction.
   */
  BridgeTransport(int in_fd, int out_fd, Framing framing, bool owns_fds = false);
  ~BridgeTransport() override;

  BridgeTransport(const BridgeTransport&) = delete;
  BridgeTransport& operator=(const BridgeTransport&) = delete;

  PollStatus poll(BridgeEvent& ev, int timeout_ms, std::string& err) override;
  bool send_text(int channel_index, const std::string& text, std::string& err) override;

  /// Frames that arrived but failed to decode (or overflowed MAX_FRAME).
  size_t rejected_frames() const { return rejected_ + slip_.dropped(); }

private:
  void consume(const char* data, size_t n);
  bool next_event(BridgeEvent& ev);

  int                     in_fd_;
  int                     out_fd_;
  Framing                 framing_;
  bool                    owns_fds_;
  slip::Decoder           slip_;
  std::string             line_;
  bool                    line_overflow_{false};
  std::deque<std::string> ready_;
  size_t                  rejected_{0};
};

} // namespace meshbot
