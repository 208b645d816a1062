/**
 * @file mailbox.hpp
 * @brief Store-and-forward mailbox: per-destination queues with lazy TTL expiry.
 *
 * @details
 * ## Field Brief
 * Mesh participants drop in and out. Someone asks the bot to hold a note for
 * a node that is asleep, out of range, or simply off. The mailbox keeps that
 * note until the recipient shows any activity on the monitored channel, then
 * hands it over once. Notes that wait too long are forgotten.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  !msg from A for B ──► add(B, msg, now)        slot[B] = [m1, m2, ...]
 *                                                     │
 *  any packet from B ──► pop_for(B, now) ──► [m1, m2] ┘ (slot removed)
 *  !inbox from B     ──► get_for(B, now)  (snapshot, nothing removed)
 * ```
 *
 * - Every public operation first purges expired messages across **all**
 *   slots, so nothing older than the TTL is ever observed.
 * - A message expires when `now - created_at >= ttl`.
 * - A slot that becomes empty is removed immediately.
 *
 * ---
 *
 * @par Bounded Memory
 * - Each slot is an `etl::deque` with hard capacity `SLOT_CAP`. The runtime
 *   limit `max_per_node` (≤ `SLOT_CAP`) applies on top; when a slot is full
 *   the oldest message is evicted before the new one is appended.
 * - At most `max_keys` destinations are held. Adding a new destination when
 *   the table is full evicts the destination whose newest message is oldest.
 *
 * ---
 *
 * @par Failure Model
 * - No persistence. A restart forgets everything.
 * - No delivery guarantee. Expiry and eviction may drop a message unseen.
 *
 * @note Not thread-safe. The event router owns the mailbox and is the only
 *       caller on the packet path.
 *
 * @authors
 * @author Leo
 */
#ifndef MESHBOT_MAILBOX_HPP
#define MESHBOT_MAILBOX_HPP

#include <stdint.h>
#include <map>
#include <string>
#include <vector>
#include "etl/deque.h"

namespace meshbot {

/**
 * @brief One held message. Immutable once stored.
 */
struct PendingMessage {
  uint64_t    created_at_ms{0};  ///< Wall-clock ms when the message was stored
  std::string from_display;      ///< Pre-rendered sender label, e.g. "Bob(!a1b2c3d4)"
  std::string text;              ///< Payload, already clamped by the caller
};

class Mailbox {
public:
  /// @name Capacities
  ///@{
  static constexpr size_t SLOT_CAP          = 32;   ///< Hard ceiling per destination
  static constexpr size_t MAX_PER_NODE_DEF  = 16;   ///< Default runtime per-destination limit
  static constexpr size_t MAX_KEYS_DEF      = 256;  ///< Default destination limit
  ///@}

  using Slot = etl::deque<PendingMessage, SLOT_CAP>;

  /**
   * @brief Build a mailbox.
   *
   * @param ttl_ms        Message lifetime in milliseconds (0 means messages expire immediately).
   * @param max_per_node  Per-destination limit; clamped to 1..SLOT_CAP.
   * @param max_keys      Destination limit; values below 1 are raised to 1.
   */
  explicit Mailbox(uint64_t ttl_ms,
                   size_t max_per_node = MAX_PER_NODE_DEF,
                   size_t max_keys = MAX_KEYS_DEF);

  /// @brief Purge, then append @p msg to the slot of @p dest_key.
  void add(const std::string& dest_key, const PendingMessage& msg, uint64_t now_ms);

  /// @brief Purge, then copy the slot of @p dest_key (oldest first). Nothing is removed.
  std::vector<PendingMessage> get_for(const std::string& dest_key, uint64_t now_ms);

  /// @brief Purge, then remove and return the slot of @p dest_key. A second call returns empty.
  std::vector<PendingMessage> pop_for(const std::string& dest_key, uint64_t now_ms);

  /// @brief Drop every message with `now - created_at >= ttl`; remove empty slots.
  void purge(uint64_t now_ms);

  size_t size() const;                                  ///< Total pending messages
  size_t key_count() const { return slots_.size(); }    ///< Destinations with pending mail
  bool   contains(const std::string& dest_key) const { return slots_.count(dest_key) != 0; }

  uint64_t ttl_ms() const { return ttl_ms_; }
  size_t   max_per_node() const { return max_per_node_; }
  size_t   max_keys() const { return max_keys_; }

private:
  bool expired(const PendingMessage& m, uint64_t now_ms) const;
  void evict_stalest_slot();

  uint64_t ttl_ms_;
  size_t   max_per_node_;
  size_t   max_keys_;
  std::map<std::string, Slot> slots_;   ///< destination key -> messages, oldest first
};

} // namespace meshbot

#endif // MESHBOT_MAILBOX_HPP
