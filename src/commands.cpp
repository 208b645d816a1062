// =============================================================================
// commands.cpp - built-in command set
//
// See commands.hpp for the command menu and reply conventions.
// Plugin sets live in plugins.cpp.
// =============================================================================

#include "meshbot/commands.hpp"
#include "meshbot/command_context.hpp"
#include "meshbot/text_util.hpp"

#include <fstream>

namespace meshbot {

using Args = std::vector<std::string>;

// ---------- help ----------
// No argument: every primary name, prefixed, in registration order.
// One argument: usage and help of that command (prefix optional in the argument).
static std::optional<std::string> cmd_help(CommandContext& ctx, const PacketEvent&,
                                           const std::string&, const Args& args) {
  if (args.empty()) {
    std::vector<std::string> names;
    for (const auto& n : ctx.registry.names()) names.push_back(ctx.prefixed(n));
    return "Commands: " + join(names, ", ");
  }

  std::string name = to_lower(args[0]);
  const std::string& prefix = ctx.config.bot.command_prefix;
  if (name.compare(0, prefix.size(), prefix) == 0) name = name.substr(prefix.size());

  const CommandSpec* spec = ctx.registry.find(name);
  if (!spec) return "Unknown command '" + name + "'. Try " + ctx.prefixed("help");
  return ctx.prefixed(spec->usage) + " - " + spec->help;
}

// ---------- ping ----------
static std::optional<std::string> cmd_ping(CommandContext&, const PacketEvent& pkt,
                                           const std::string&, const Args&) {
  std::vector<std::string> extras;
  if (pkt.rx_snr)  extras.push_back("SNR " + format_number(*pkt.rx_snr));
  if (pkt.rx_rssi) extras.push_back("RSSI " + format_number(*pkt.rx_rssi));
  if (extras.empty()) return std::string("pong");
  return "pong (" + join(extras, ", ") + ")";
}

// ---------- whoami ----------
static std::optional<std::string> cmd_whoami(CommandContext& ctx, const PacketEvent&,
                                             const std::string& sender, const Args&) {
  if (auto name = ctx.resolver.lookup_display_name(sender))
    return "You are: " + *name + " (" + sender + ")";
  return "You are: " + sender;
}

// ---------- nodes ----------
static std::optional<std::string> cmd_nodes(CommandContext& ctx, const PacketEvent&,
                                            const std::string&, const Args&) {
  const auto& entries = ctx.directory.entries();
  std::vector<std::string> names;
  for (size_t i = 0; i < entries.size() && i < NODES_LIST_MAX; ++i) {
    const NodeEntry& e = entries[i];
    if (e.short_name && !trim(*e.short_name).empty())     names.push_back(*e.short_name);
    else if (e.long_name && !trim(*e.long_name).empty())  names.push_back(*e.long_name);
    else                                                  names.push_back(e.key);
  }
  std::string out = "Nodes: " + std::to_string(entries.size());
  if (!names.empty()) out += " | " + join(names, ", ");
  return out;
}

// ---------- uptime ----------
std::optional<double> read_proc_uptime() {
  std::ifstream in("/proc/uptime");
  double secs = 0;
  if (!(in >> secs) || secs < 0) return std::nullopt;
  return secs;
}

static std::optional<std::string> cmd_uptime(CommandContext& ctx, const PacketEvent&,
                                             const std::string&, const Args&) {
  const uint64_t bot_s = ctx.now_ms >= ctx.started_ms ? (ctx.now_ms - ctx.started_ms) / 1000 : 0;
  std::string out = "Uptime: bot " + format_duration(bot_s);
  if (ctx.system_uptime) {
    if (auto sys = ctx.system_uptime())
      out += ", system " + format_duration(static_cast<uint64_t>(*sys));
  }
  return out;
}

// ---------- weather ----------
static std::optional<std::string> cmd_weather(CommandContext& ctx, const PacketEvent&,
                                              const std::string&, const Args& args) {
  std::string place = trim(join(args, " "));
  if (place.empty()) place = ctx.config.weather.default_place;
  if (!ctx.weather) return std::string("Weather: not available");
  return ctx.weather->current(place);          // NetworkError is reported by the dispatcher
}

// ---------- air ----------
static std::optional<std::string> cmd_air(CommandContext& ctx, const PacketEvent&,
                                          const std::string&, const Args&) {
  auto m = local_airtime(ctx.directory);
  if (!m)
    return std::string("Airtime: metrics not available (enable telemetry on the node, or wait for an update).");
  return "Airtime: TX " + format_percent(m->air_util_tx) +
         " | RX " + format_percent(m->air_util_rx) +
         " | CH " + format_percent(m->channel_utilization);
}

// ---------- msg ----------
static std::optional<std::string> cmd_msg(CommandContext& ctx, const PacketEvent&,
                                          const std::string& sender, const Args& args) {
  if (args.size() < 2)
    return "Usage: " + ctx.prefixed("msg <node|!hexid|shortName|longName> <text>");

  const std::string& token = args[0];
  const std::string text = trim(join(Args(args.begin() + 1, args.end()), " "));
  if (text.empty()) return std::string("Missing message text.");

  const Resolution target = ctx.resolver.resolve(token);
  if (!target.key)
    return "Cannot find node '" + token + "'. Try " + ctx.prefixed("nodes") + " for a list.";

  PendingMessage pm;
  pm.created_at_ms = ctx.now_ms;
  if (auto name = ctx.resolver.lookup_display_name(sender)) pm.from_display = *name + "(" + sender + ")";
  else                                                       pm.from_display = sender;
  pm.text = clamp(text, MAILBOX_TEXT_MAX);
  ctx.mailbox.add(*target.key, pm, ctx.now_ms);

  return "Saved to mailbox for " + target.display_name.value_or(*target.key) +
         ". Will deliver when active on channel " + std::to_string(ctx.config.mesh.channel_index) + ".";
}

// ---------- inbox ----------
static std::optional<std::string> cmd_inbox(CommandContext& ctx, const PacketEvent&,
                                            const std::string& sender, const Args&) {
  const auto msgs = ctx.mailbox.get_for(sender, ctx.now_ms);
  if (msgs.empty()) return std::string("Inbox: empty.");

  std::vector<std::string> lines;
  for (size_t i = 0; i < msgs.size() && i < INBOX_PREVIEW_N; ++i) {
    const auto& m = msgs[i];
    const uint64_t age = ctx.now_ms >= m.created_at_ms ? (ctx.now_ms - m.created_at_ms) / 1000 : 0;
    lines.push_back("- from " + m.from_display + " (" + format_duration(age) + "): " +
                    clamp(m.text, INBOX_PREVIEW_MAX));
  }
  std::string out = "Inbox:\n" + join(lines, "\n");
  if (msgs.size() > INBOX_PREVIEW_N)
    out += " (+" + std::to_string(msgs.size() - INBOX_PREVIEW_N) + " more)";
  return out;
}

// ---------- the set ----------

CommandSet builtin_commands() {
  CommandSet set;
  set.name = "builtin";
  set.commands = {
    {"help",    {"?"}, "List commands, or show usage of one command.", "help [command]",  cmd_help},
    {"ping",    {},    "Reply with pong and signal readings.",         "ping",            cmd_ping},
    {"whoami",  {},    "Show your node name and id.",                  "whoami",          cmd_whoami},
    {"nodes",   {},    "Count known nodes and list a few names.",      "nodes",           cmd_nodes},
    {"uptime",  {},    "Show bot and host uptime.",                    "uptime",          cmd_uptime},
    {"weather", {},    "Current weather for a place.",                 "weather [place]", cmd_weather},
    {"air",     {},    "Airtime utilization of the bot's radio.",      "air",             cmd_air},
    {"msg",     {},    "Leave a message, delivered when the node is next active.",
                       "msg <node|!hexid|shortName|longName> <text>",                     cmd_msg},
    {"inbox",   {},    "Preview messages waiting for you.",            "inbox",           cmd_inbox},
  };
  return set;
}

} // namespace meshbot
