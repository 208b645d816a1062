/**
 * @file packet_event.hpp
 * @brief PacketEvent - the one normalized shape of an inbound mesh packet.
 *
 * @details
 * Wrappers (serial bridge, stdio bridge, test harnesses) see packets in many
 * shapes: the channel may live in four different places, the sender may be a
 * node number or a `!hex` string, signal fields may be missing entirely. All
 * of that is flattened **once**, in the bridge codec, into this struct. The
 * router and every command handler only ever read `PacketEvent`.
 *
 * Every field is optional. Absence is information: a packet with no channel
 * is dropped, a packet with no text still counts as activity, a packet with
 * no SNR gets a "?" in the snr command.
 *
 * @par Sender keys
 * The canonical node key is `!` followed by 8 lower-case hex digits. Use
 * `sender_key()` to derive it; never key state by display name.
 *
 * @par Minimal Usage Example
 * @code
 * meshbot::PacketEvent pkt;
 * pkt.channel   = 1;
 * pkt.from_num  = 0xa1b2c3d4;
 * pkt.text      = "!ping";
 * auto key = meshbot::sender_key(pkt);   // "!a1b2c3d4"
 * @endcode
 *
 * @authors
 * @author Leo
 */
#ifndef MESHBOT_PACKET_EVENT_HPP
#define MESHBOT_PACKET_EVENT_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace meshbot {

/// Fallback sender key used when a packet carries no sender at all.
static constexpr const char* UNKNOWN_SENDER = "unknown";

/**
 * @brief Normalized inbound packet.
 *
 * Produced by the bridge codec, consumed by `Bot::handle_packet()` and
 * handed read-only to command handlers.
 */
struct PacketEvent {
  std::optional<int>         channel;    ///< Logical channel index the packet arrived on
  std::optional<std::string> text;       ///< Decoded text payload, if any
  std::optional<std::string> from_id;    ///< Sender as string id (e.g. "!A1B2C3D4", untrimmed)
  std::optional<uint32_t>    from_num;   ///< Sender as node number
  std::optional<double>      rx_snr;     ///< Receive SNR in dB
  std::optional<double>      rx_rssi;    ///< Receive RSSI in dBm
  std::optional<int>         hops_away;  ///< Hops travelled, when the radio reports it
  std::optional<int>         hop_limit;  ///< Remaining hop budget
};

/// @brief Render a node number as a canonical key: `!%08x`.
std::string node_key_from_num(uint32_t num);

/**
 * @brief True if @p s is `!` followed by exactly 8 hex digits (either case).
 */
bool is_node_key(const std::string& s);

/**
 * @brief Canonical sender key of a packet.
 *
 * @details
 * - A string id that is a node key (after trimming) wins; it is lower-cased.
 *   Any other string id is ignored.
 * - Otherwise the node number is rendered with `node_key_from_num()`.
 * - Otherwise there is no sender (`std::nullopt`).
 */
std::optional<std::string> sender_key(const PacketEvent& pkt);

} // namespace meshbot

#endif // MESHBOT_PACKET_EVENT_HPP
