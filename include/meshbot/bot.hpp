/**
 * @file bot.hpp
 * @brief MeshBot Bot - the event router (packet in → mailbox delivery → dispatch → replies out).
 *
 * @details
 * ## Field Brief
 * Every packet the radio hears on any channel arrives here. **Bot** decides
 * whether it matters, hands over mail the sender has waiting, lets the
 * dispatcher answer commands, and keeps the session bookkeeping. It doesn't
 * know radios, sockets, or HTTP. It only knows **packets in** and
 * **texts out**. Wrappers handle transport.
 *
 * ---
 *
 * @par What This File Provides
 * - `meshbot::Bot` - the router that:
 *   - Owns the mailbox, the session state, the resolver and the dispatcher.
 *   - Accepts one normalized `PacketEvent` at a time via `handle_packet()`.
 *   - Queues replies in a bounded outbox retrievable with `get_message()`.
 *
 * ---
 *
 * @par Operational Model (one look, no guessing)
 * ```
 *  [Wrapper: serial / stdio bridge]        [Bot]
 *             │                             │
 *   PacketEvent ── handle_packet(pkt, now) ─┤
 *             │                             ├─ channel != configured? drop
 *             │                             ├─ mailbox.pop_for(sender) → "For ..." replies
 *             │                             ├─ text? → Dispatcher → reply
 *             │                             └─ seen[sender] = now, messages_seen += 1
 *             │                             │
 *             ◄───────────── get_message() ── outbox (bounded, clamped texts)
 * ```
 *
 * ---
 *
 * @par Design Constraints & Trade-offs
 * - **No transport logic here.** The bridge codec rejects malformed frames
 *   before they become a `PacketEvent`.
 * - **Bounded memory.** Outbox capacity is `OUTBOX_CAP`; when full, a reply
 *   is dropped and logged, never blocking the loop.
 * - **Injected time.** `now_ms` comes from the caller, so tests replay whole
 *   conversations without sleeping.
 * - **Single-threaded.** Not thread-safe; one loop feeds it.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * meshbot::Bot bot(cfg, registry, directory, &weather, now_ms());
 * bot.handle_packet(pkt, now_ms());
 *
 * meshbot::OutboundText out;
 * while (bot.get_message(out)) {
 *   transport.send_text(out.channel_index, out.text);
 * }
 * @endcode
 *
 * @authors
 * @author Leo
 */
#ifndef MESHBOT_BOT_HPP
#define MESHBOT_BOT_HPP

#include <stdint.h>
#include <random>
#include <string>
#include <utility>
#include "etl/deque.h"

#include "meshbot/command_context.hpp"
#include "meshbot/command_dispatch.hpp"
#include "meshbot/command_registry.hpp"
#include "meshbot/config.hpp"
#include "meshbot/mailbox.hpp"
#include "meshbot/node_directory.hpp"
#include "meshbot/node_resolver.hpp"
#include "meshbot/packet_event.hpp"
#include "meshbot/session_state.hpp"
#include "meshbot/weather.hpp"

namespace meshbot {

/// @brief One reply waiting to be sent.
struct OutboundText {
  int         channel_index{0};  ///< Channel to send on (always the monitored one)
  std::string text;              ///< Already clamped to max_reply_len
};

class Bot {
public:
  /**
   * @brief Maximum outbound queue size.
   *
   * @details
   * Caps how many replies can wait to be drained by get_message(). A mailbox
   * flush for a busy node can emit many replies at once; past this point
   * they are dropped and logged rather than growing without bound.
   */
  static constexpr size_t OUTBOX_CAP = 64;

  /**
   * @brief Build a router.
   *
   * @param cfg         Configuration; copied.
   * @param registry    Fully built registry; must outlive the Bot and stay unchanged.
   * @param directory   Node roster; must outlive the Bot. May change between packets.
   * @param weather     Weather backend, or nullptr.
   * @param started_ms  Start time on the same clock as later `now_ms` values.
   * @param rng_seed    Seed for roll/8ball; tests pass a fixed value.
   */
  Bot(const Config& cfg,
      const CommandRegistry& registry,
      const NodeDirectory& directory,
      WeatherService* weather,
      uint64_t started_ms,
      uint32_t rng_seed = std::random_device{}());

  /**
   * @brief Route one inbound packet.
   *
   * Order: channel filter, mailbox delivery, dispatch, session bookkeeping.
   * Any replies are queued in the outbox.
   */
  void handle_packet(const PacketEvent& pkt, uint64_t now_ms);

  /**
   * @brief Retrieve the next reply.
   * @retval true  `out` holds the oldest queued reply (removed from the outbox).
   * @retval false The outbox was empty.
   */
  bool get_message(OutboundText& out);

  /// @brief Replace the host-uptime source (defaults to /proc/uptime).
  void set_system_uptime(UptimeSource src) { system_uptime_ = std::move(src); }

  size_t pending_replies() const { return outbox_.size(); }
  size_t dropped_replies() const { return dropped_; }

  Mailbox&            mailbox()       { return mailbox_; }
  const SessionState& state() const   { return state_; }
  const Config&       config() const  { return cfg_; }

private:
  /// @brief Pop and announce everything waiting for @p sender.
  void deliver_mailbox(const std::string& sender, uint64_t now_ms);

  /// @brief Clamp and enqueue; drop with a warning when the outbox is full.
  void queue_reply(const std::string& text);

  Config                 cfg_;
  const CommandRegistry& registry_;
  const NodeDirectory&   directory_;
  WeatherService*        weather_;
  uint64_t               started_ms_;

  Mailbox                mailbox_;
  SessionState           state_;
  NodeResolver           resolver_;
  Dispatcher             dispatcher_;
  std::mt19937           rng_;
  UptimeSource           system_uptime_;

  etl::deque<OutboundText, OUTBOX_CAP> outbox_;  ///< replies waiting for the transport
  size_t                               dropped_{0};
};

} // namespace meshbot

#endif // MESHBOT_BOT_HPP
