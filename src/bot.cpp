// -----------------------------------------------------------------------------
// bot.cpp - Implementation of the MeshBot event router
//
// API & field descriptions:
//   see include/meshbot/bot.hpp
//
// Runnable scenarios:
//   see tests/test_bot_flows.cpp
//
// NOTE: This file focuses on *how* the routing order is enforced.
// External-facing API contracts live in the header.
// -----------------------------------------------------------------------------
#include "meshbot/bot.hpp"
#include "meshbot/commands.hpp"
#include "meshbot/log.hpp"
#include "meshbot/text_util.hpp"

namespace meshbot {

// ---------- public ----------

Bot::Bot(const Config& cfg,
         const CommandRegistry& registry,
         const NodeDirectory& directory,
         WeatherService* weather,
         uint64_t started_ms,
         uint32_t rng_seed)
: cfg_(cfg),
  registry_(registry),
  directory_(directory),
  weather_(weather),
  started_ms_(started_ms),
  mailbox_(cfg.bot.mailbox_ttl_seconds * 1000,
           cfg.bot.mailbox_max_per_node,
           cfg.bot.mailbox_max_nodes),
  resolver_(directory),
  dispatcher_(registry, cfg.bot.command_prefix),
  rng_(rng_seed),
  system_uptime_(read_proc_uptime) {
}

// handle_packet() - the routing order is the contract:
//   1) channel filter      (drop: nothing else happens)
//   2) mailbox delivery    (before the command, so "!inbox" right after sees it gone)
//   3) dispatch            (only when there is text)
//   4) bookkeeping         (seen + messages_seen, for every qualifying packet)
void Bot::handle_packet(const PacketEvent& pkt, uint64_t now_ms) {
  // POLICY: monitored channel only
  if (!pkt.channel || *pkt.channel != cfg_.mesh.channel_index) {
    log_event(LogLevel::Debug, "drop_packet",
              "reason=channel ch=" + (pkt.channel ? std::to_string(*pkt.channel) : std::string("none")));
    return;
  }

  const std::optional<std::string> sender = sender_key(pkt);

  // DELIVER: any activity from the recipient flushes their slot
  if (sender) deliver_mailbox(*sender, now_ms);

  // DISPATCH: command-shaped text
  if (pkt.text && !trim(*pkt.text).empty()) {
    CommandContext ctx{cfg_, mailbox_, state_, directory_, resolver_, registry_, weather_,
                       rng_, started_ms_, now_ms, system_uptime_};
    if (auto reply = dispatcher_.dispatch(ctx, pkt, sender.value_or(UNKNOWN_SENDER), *pkt.text))
      queue_reply(*reply);
  }

  // BOOKKEEPING
  if (sender) state_.mark_seen(*sender, now_ms);
  state_.increment(COUNTER_MESSAGES_SEEN);
}

// get_message() - Try to dequeue the next outbound reply; fail if empty.
bool Bot::get_message(OutboundText& out) {
  if (outbox_.empty()) return false;
  out = outbox_.front();
  outbox_.pop_front();
  return true;
}

// ---------- private ----------

void Bot::deliver_mailbox(const std::string& sender, uint64_t now_ms) {
  const auto pending = mailbox_.pop_for(sender, now_ms);
  if (pending.empty()) return;

  const std::string dest_name = resolver_.lookup_display_name(sender).value_or(sender);
  for (const auto& m : pending) {
    const uint64_t age = now_ms >= m.created_at_ms ? (now_ms - m.created_at_ms) / 1000 : 0;
    queue_reply("For " + dest_name + ": from " + m.from_display +
                " (" + format_duration(age) + "): " + m.text);
  }
  log_event(LogLevel::Info, "mailbox_delivered",
            "dest=" + sender + " count=" + std::to_string(pending.size()));
}

void Bot::queue_reply(const std::string& text) {
  if (outbox_.full()) {                              // bounded: drop, never block
    ++dropped_;
    log_event(LogLevel::Warn, "outbox_full", "dropped=" + std::to_string(dropped_));
    return;
  }
  outbox_.push_back({cfg_.mesh.channel_index, clamp(text, cfg_.bot.max_reply_len)});
}

} // namespace meshbot
