#pragma once
// Shared fixtures for handler-level tests: an in-memory world around one
// CommandContext, a scripted weather backend, and a packet builder.

#include <random>
#include <string>
#include <vector>

#include "meshbot/command_context.hpp"
#include "meshbot/command_registry.hpp"
#include "meshbot/config.hpp"
#include "meshbot/errors.hpp"
#include "meshbot/mailbox.hpp"
#include "meshbot/node_directory.hpp"
#include "meshbot/node_resolver.hpp"
#include "meshbot/packet_event.hpp"
#include "meshbot/session_state.hpp"
#include "meshbot/weather.hpp"

namespace meshbot {
namespace testing {

// Records every place it is asked about; optionally fails like a dead network.
struct FakeWeather : WeatherService {
  std::vector<std::string> places;
  const char*              fail_category = nullptr;

  std::string current(const std::string& place) override {
    places.push_back(place);
    if (fail_category) throw NetworkError(fail_category, "scripted failure");
    return "Weather in " + place + ": 12\xC2\xB0" "C";
  }
};

inline PacketEvent packet(int channel, const std::string& from_id, const std::string& text) {
  PacketEvent p;
  p.channel = channel;
  p.from_id = from_id;
  p.text = text;
  return p;
}

inline NodeEntry make_node(const std::string& key, const std::string& sname, const std::string& lname) {
  NodeEntry e;
  e.key = key;
  if (!sname.empty()) e.short_name = sname;
  if (!lname.empty()) e.long_name = lname;
  return e;
}

// Everything a handler can touch, with a hand-driven clock.
struct World {
  Config              cfg;
  Mailbox             mailbox{cfg.bot.mailbox_ttl_seconds * 1000};
  SessionState        state;
  MemoryNodeDirectory directory;
  NodeResolver        resolver{directory};
  CommandRegistry     registry;
  FakeWeather         weather;
  std::mt19937        rng{42};
  uint64_t            started_ms = 1000000;
  uint64_t            now_ms = 1000000;
  std::optional<double> uptime_s;

  World() {
    directory.upsert(make_node("!a1b2c3d4", "ALI", "Alice Mobile"));
    directory.upsert(make_node("!11223344", "BOB", "Bob Base"));
  }

  CommandContext ctx() {
    const std::optional<double> up = uptime_s;
    return CommandContext{cfg, mailbox, state, directory, resolver, registry,
                          &weather, rng, started_ms, now_ms,
                          [up]() { return up; }};
  }

  // Run one registered command directly: name looked up, args split by the caller.
  std::optional<std::string> run(const std::string& name,
                                 const std::vector<std::string>& args,
                                 const PacketEvent& pkt,
                                 const std::string& sender = "!a1b2c3d4") {
    const CommandSpec* spec = registry.find(name);
    if (!spec) return std::string("<no such command>");
    CommandContext c = ctx();
    return spec->handler(c, pkt, sender, args);
  }
};

} // namespace testing
} // namespace meshbot
