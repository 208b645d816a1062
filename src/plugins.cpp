// =============================================================================
// plugins.cpp - optional command sets (diagnostics, fun, radio) and registry assembly
//
// Each set is a plain list of CommandSpec. Which sets load, and in which
// order, comes from bot.plugins in the configuration.
// =============================================================================

#include "meshbot/commands.hpp"
#include "meshbot/command_context.hpp"
#include "meshbot/log.hpp"
#include "meshbot/text_util.hpp"

#include <cstdio>
#include <cstdlib>

namespace meshbot {

using Args = std::vector<std::string>;

static constexpr int ROLL_SIDES_DEFAULT = 6;
static constexpr int ROLL_SIDES_MIN     = 2;
static constexpr int ROLL_SIDES_MAX     = 1000;

// Channel-utilization thresholds (percent) for the load labels.
static constexpr double LOAD_IDLE_BELOW = 1.0;
static constexpr double LOAD_OK_BELOW   = 5.0;
static constexpr double LOAD_BUSY_BELOW = 15.0;

static std::string fixed1(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", v);
  return buf;
}

// =============================================================================
// diagnostics
// =============================================================================

static std::optional<std::string> cmd_snr(CommandContext&, const PacketEvent& pkt,
                                          const std::string&, const Args&) {
  return "SNR: " + (pkt.rx_snr ? format_number(*pkt.rx_snr) : std::string("?")) +
         " | RSSI: " + (pkt.rx_rssi ? format_number(*pkt.rx_rssi) : std::string("?"));
}

static std::optional<std::string> cmd_route(CommandContext&, const PacketEvent& pkt,
                                            const std::string&, const Args&) {
  if (pkt.hops_away) return "Route: " + std::to_string(*pkt.hops_away) + " hops";
  if (pkt.hop_limit) return "Hop limit: " + std::to_string(*pkt.hop_limit);
  return std::string("Route: no hop info");
}

// seen [node] - unresolvable tokens are looked up verbatim, so "!seen foo"
// still answers "never" instead of failing.
static std::optional<std::string> cmd_seen(CommandContext& ctx, const PacketEvent&,
                                           const std::string& sender, const Args& args) {
  std::string target = sender;
  if (!args.empty()) {
    const std::string token = trim(join(args, " "));
    target = ctx.resolver.resolve(token).key.value_or(token);
  }

  const auto ts = ctx.state.last_seen(target);
  if (!ts) return "Seen: " + target + " - never (this session)";
  const uint64_t age = ctx.now_ms >= *ts ? (ctx.now_ms - *ts) / 1000 : 0;
  return "Seen: " + target + " - " + format_age(age) + " ago";
}

static std::optional<std::string> cmd_load(CommandContext& ctx, const PacketEvent&,
                                           const std::string&, const Args&) {
  const auto m = local_airtime(ctx.directory);
  if (!m || !m->channel_utilization) return std::string("Channel load: unknown");

  const double v = *m->channel_utilization;
  const char* label = v < LOAD_IDLE_BELOW ? "IDLE"
                    : v < LOAD_OK_BELOW   ? "OK"
                    : v < LOAD_BUSY_BELOW ? "BUSY"
                    :                       "CONGESTED";
  return std::string("Channel load: ") + label + " (CH " + fixed1(v) + "%)";
}

CommandSet diagnostics_commands() {
  CommandSet set;
  set.name = "diagnostics";
  set.commands = {
    {"snr",   {}, "Show SNR/RSSI of the packet that carried the command.", "snr",         cmd_snr},
    {"route", {}, "Show hop info if the packet carries it.",               "route",       cmd_route},
    {"seen",  {}, "When a node was last seen in this session.",            "seen [node]", cmd_seen},
    {"load",  {}, "Interpret channel utilization of the bot's radio.",     "load",        cmd_load},
  };
  return set;
}

// =============================================================================
// fun
// =============================================================================

static const char* const EIGHT_BALL[] = {
  "It is certain.",
  "Without a doubt.",
  "Yes, definitely.",
  "Most likely.",
  "Ask again later.",
  "Cannot predict now.",
  "Don't count on it.",
  "My reply is no.",
  "Very doubtful.",
};

static std::optional<std::string> cmd_roll(CommandContext& ctx, const PacketEvent&,
                                           const std::string&, const Args& args) {
  long sides = ROLL_SIDES_DEFAULT;
  if (!args.empty()) {
    char* e = nullptr;
    sides = std::strtol(args[0].c_str(), &e, 10);
    if (!e || *e || args[0].empty()) return "Usage: " + ctx.prefixed("roll [sides]");
  }
  if (sides < ROLL_SIDES_MIN || sides > ROLL_SIDES_MAX)
    return "Usage: " + ctx.prefixed("roll [2..1000]");

  std::uniform_int_distribution<long> dist(1, sides);
  return "d" + std::to_string(sides) + ": " + std::to_string(dist(ctx.rng));
}

static std::optional<std::string> cmd_8ball(CommandContext& ctx, const PacketEvent&,
                                            const std::string&, const Args&) {
  const size_t n = sizeof(EIGHT_BALL) / sizeof(EIGHT_BALL[0]);
  std::uniform_int_distribution<size_t> dist(0, n - 1);
  return std::string(EIGHT_BALL[dist(ctx.rng)]);
}

static std::optional<std::string> cmd_stats(CommandContext& ctx, const PacketEvent&,
                                            const std::string&, const Args&) {
  return "Stats: messages=" + std::to_string(ctx.state.counter(COUNTER_MESSAGES_SEEN)) +
         ", commands=" + std::to_string(ctx.state.counter(COUNTER_COMMANDS_EXECUTED)) +
         ", unique_nodes=" + std::to_string(ctx.state.unique_nodes());
}

CommandSet fun_commands() {
  CommandSet set;
  set.name = "fun";
  set.commands = {
    {"roll",  {}, "Roll a die (default d6).",    "roll [sides]", cmd_roll},
    {"8ball", {}, "Magic 8-ball answer.",        "8ball",        cmd_8ball},
    {"stats", {}, "Bot usage in this session.",  "stats",        cmd_stats},
  };
  return set;
}

// =============================================================================
// radio
// =============================================================================

// noise floor estimate: RSSI (dBm) minus SNR (dB)
static std::optional<std::string> cmd_noise(CommandContext&, const PacketEvent& pkt,
                                            const std::string&, const Args&) {
  if (!pkt.rx_snr || !pkt.rx_rssi)
    return std::string("Noise floor: unavailable (no SNR/RSSI in this packet)");
  const double noise = *pkt.rx_rssi - *pkt.rx_snr;
  return "Noise floor (est.): " + fixed1(noise) + " dBm | RSSI " + format_number(*pkt.rx_rssi) +
         " dBm | SNR " + format_number(*pkt.rx_snr) + " dB";
}

CommandSet radio_commands() {
  CommandSet set;
  set.name = "radio";
  set.commands = {
    {"noise", {}, "Estimate the noise floor as RSSI - SNR.", "noise", cmd_noise},
  };
  return set;
}

// =============================================================================
// assembly
// =============================================================================

bool plugin_commands(const std::string& name, CommandSet& out) {
  if (name == "diagnostics") { out = diagnostics_commands(); return true; }
  if (name == "fun")         { out = fun_commands();         return true; }
  if (name == "radio")       { out = radio_commands();       return true; }
  return false;
}

bool build_registry(const BotSettings& bot, CommandRegistry& registry, std::string& err) {
  if (!registry.add_set(builtin_commands(), err)) return false;
  for (const auto& name : bot.plugins) {
    CommandSet set;
    if (!plugin_commands(name, set)) { err = "unknown_plugin:" + name; return false; }
    if (!registry.add_set(set, err)) return false;
    log_event(LogLevel::Debug, "plugin_loaded", "name=" + name +
              " commands=" + std::to_string(set.commands.size()));
  }
  return true;
}

} // namespace meshbot
