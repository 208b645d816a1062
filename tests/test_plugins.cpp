#include <doctest/doctest.h>
#include <cstdio>
#include <set>

#include "meshbot/commands.hpp"
#include "meshbot/text_util.hpp"
#include "test_support.hpp"

using namespace meshbot;
using namespace meshbot::testing;

static void load_all(World& w) {
    std::string err;
    REQUIRE(build_registry(w.cfg.bot, w.registry, err));
}

static PacketEvent from_ali() { return packet(1, "!a1b2c3d4", ""); }

static void make_local(World& w, std::optional<double> tx, std::optional<double> rx, std::optional<double> ch) {
    NodeEntry me = make_node("!0000beef", "BOT", "");
    me.is_local = true;
    me.metrics = NodeMetrics{tx, rx, ch};
    w.directory.upsert(me);
}

// ----------------------------------------------------------------------------
// builtin
// ----------------------------------------------------------------------------

TEST_CASE("help lists every command in registration order") {
    World w;
    load_all(w);
    CHECK(*w.run("help", {}, from_ali()) ==
          "Commands: !help, !ping, !whoami, !nodes, !uptime, !weather, !air, !msg, !inbox, "
          "!snr, !route, !seen, !load, !roll, !8ball, !stats, !noise");
}

TEST_CASE("help with an argument shows usage and help") {
    World w;
    load_all(w);
    CHECK(*w.run("help", {"msg"}, from_ali()) ==
          "!msg <node|!hexid|shortName|longName> <text> - Leave a message, delivered when the node is next active.");
    CHECK(*w.run("?", {"!PING"}, from_ali()) == "!ping - Reply with pong and signal readings.");
    CHECK(*w.run("help", {"zzz"}, from_ali()) == "Unknown command 'zzz'. Try !help");
}

TEST_CASE("ping reports signal readings when the packet has them") {
    World w;
    load_all(w);
    CHECK(*w.run("ping", {}, from_ali()) == "pong");

    PacketEvent p = from_ali();
    p.rx_snr = 6.25;
    p.rx_rssi = -97;
    CHECK(*w.run("ping", {}, p) == "pong (SNR 6.25, RSSI -97)");

    p.rx_snr.reset();
    CHECK(*w.run("ping", {}, p) == "pong (RSSI -97)");
}

TEST_CASE("whoami names the sender when the directory knows it") {
    World w;
    load_all(w);
    CHECK(*w.run("whoami", {}, from_ali()) == "You are: ALI (!a1b2c3d4)");
    CHECK(*w.run("whoami", {}, from_ali(), "!deadbeef") == "You are: !deadbeef");
}

TEST_CASE("nodes counts everything and lists at most eight names") {
    World w;
    load_all(w);
    CHECK(*w.run("nodes", {}, from_ali()) == "Nodes: 2 | ALI, BOB");

    w.directory.upsert(make_node("!00000003", "", "Long Only"));
    w.directory.upsert(make_node("!00000004", "", ""));
    for (int i = 5; i <= 11; ++i) {
        char key[12];
        std::snprintf(key, sizeof(key), "!%08x", i);
        w.directory.upsert(make_node(key, "N" + std::to_string(i), ""));
    }
    CHECK(*w.run("nodes", {}, from_ali()) ==
          "Nodes: 11 | ALI, BOB, Long Only, !00000004, N5, N6, N7, N8");

    MemoryNodeDirectory empty;
    NodeResolver r(empty);
    CommandContext c{w.cfg, w.mailbox, w.state, empty, r, w.registry, &w.weather,
                     w.rng, w.started_ms, w.now_ms, nullptr};
    CHECK(*w.registry.find("nodes")->handler(c, from_ali(), "!a1b2c3d4", {}) == "Nodes: 0");
}

TEST_CASE("uptime shows bot time and host time when readable") {
    World w;
    load_all(w);
    w.now_ms = w.started_ms + 3661000;
    CHECK(*w.run("uptime", {}, from_ali()) == "Uptime: bot 1h 1m 1s");

    w.uptime_s = 90061.7;
    CHECK(*w.run("uptime", {}, from_ali()) == "Uptime: bot 1h 1m 1s, system 1d 1h 1m 1s");
}

TEST_CASE("weather defaults to the configured place and joins multi-word places") {
    World w;
    load_all(w);
    CHECK(*w.run("weather", {}, from_ali()) == "Weather in Prague: 12\xC2\xB0" "C");
    CHECK(*w.run("weather", {"New", "York"}, from_ali()) == "Weather in New York: 12\xC2\xB0" "C");
    REQUIRE(w.weather.places.size() == 2);
    CHECK(w.weather.places[0] == "Prague");
    CHECK(w.weather.places[1] == "New York");

    CommandContext c = w.ctx();
    c.weather = nullptr;
    CHECK(*w.registry.find("weather")->handler(c, from_ali(), "!a1b2c3d4", {}) == "Weather: not available");
}

TEST_CASE("air reads the local node metrics") {
    World w;
    load_all(w);
    CHECK(*w.run("air", {}, from_ali()) ==
          "Airtime: metrics not available (enable telemetry on the node, or wait for an update).");

    make_local(w, 1.5, std::nullopt, 12.0);
    CHECK(*w.run("air", {}, from_ali()) == "Airtime: TX 1.5% | RX ? | CH 12%");
}

TEST_CASE("msg validates its input and stores attributed mail") {
    World w;
    load_all(w);

    CHECK(*w.run("msg", {}, from_ali()) == "Usage: !msg <node|!hexid|shortName|longName> <text>");
    CHECK(*w.run("msg", {"BOB"}, from_ali()) == "Usage: !msg <node|!hexid|shortName|longName> <text>");
    CHECK(*w.run("msg", {"BOB", "  "}, from_ali()) == "Missing message text.");
    CHECK(*w.run("msg", {"carol", "hi"}, from_ali()) == "Cannot find node 'carol'. Try !nodes for a list.");
    CHECK(w.mailbox.size() == 0);

    CHECK(*w.run("msg", {"bob", "see", "you", "at", "8"}, from_ali()) ==
          "Saved to mailbox for BOB. Will deliver when active on channel 1.");
    auto got = w.mailbox.get_for("!11223344", w.now_ms);
    REQUIRE(got.size() == 1);
    CHECK(got[0].text == "see you at 8");
    CHECK(got[0].from_display == "ALI(!a1b2c3d4)");
    CHECK(got[0].created_at_ms == w.now_ms);

    CHECK(*w.run("msg", {"!DEADBEEF", "hi"}, from_ali(), "!0badc0de") ==
          "Saved to mailbox for !deadbeef. Will deliver when active on channel 1.");
    CHECK(w.mailbox.get_for("!deadbeef", w.now_ms)[0].from_display == "!0badc0de");
}

TEST_CASE("msg clamps long text before storing it") {
    World w;
    load_all(w);
    const std::string long_text(600, 'x');
    w.run("msg", {"BOB", long_text}, from_ali());
    auto got = w.mailbox.get_for("!11223344", w.now_ms);
    REQUIRE(got.size() == 1);
    CHECK(utf8_length(got[0].text) == MAILBOX_TEXT_MAX);
    CHECK(got[0].text.substr(got[0].text.size() - 3) == ELLIPSIS);
}

TEST_CASE("inbox previews up to three messages without consuming them") {
    World w;
    load_all(w);
    CHECK(*w.run("inbox", {}, from_ali(), "!11223344") == "Inbox: empty.");

    const uint64_t t0 = w.now_ms;
    for (int i = 1; i <= 4; ++i)
        w.mailbox.add("!11223344", PendingMessage{t0, "ALI(!a1b2c3d4)", "m" + std::to_string(i)}, t0);
    w.mailbox.add("!11223344", PendingMessage{t0, "X", std::string(100, 'y')}, t0);

    w.now_ms = t0 + 65000;
    const std::string expect =
        "Inbox:\n"
        "- from ALI(!a1b2c3d4) (1m 5s): m1\n"
        "- from ALI(!a1b2c3d4) (1m 5s): m2\n"
        "- from ALI(!a1b2c3d4) (1m 5s): m3 (+2 more)";
    CHECK(*w.run("inbox", {}, from_ali(), "!11223344") == expect);
    CHECK(w.mailbox.size() == 5);
}

TEST_CASE("inbox clamps long previews") {
    World w;
    load_all(w);
    w.mailbox.add("!11223344", PendingMessage{w.now_ms, "ALI", std::string(100, 'y')}, w.now_ms);
    const std::string out = *w.run("inbox", {}, from_ali(), "!11223344");
    CHECK(out == "Inbox:\n- from ALI (0s): " + std::string(79, 'y') + ELLIPSIS);
}

// ----------------------------------------------------------------------------
// diagnostics
// ----------------------------------------------------------------------------

TEST_CASE("snr and route read the triggering packet") {
    World w;
    load_all(w);
    PacketEvent p = from_ali();
    CHECK(*w.run("snr", {}, p) == "SNR: ? | RSSI: ?");
    p.rx_rssi = -97;
    CHECK(*w.run("snr", {}, p) == "SNR: ? | RSSI: -97");

    CHECK(*w.run("route", {}, p) == "Route: no hop info");
    p.hop_limit = 3;
    CHECK(*w.run("route", {}, p) == "Hop limit: 3");
    p.hops_away = 2;
    CHECK(*w.run("route", {}, p) == "Route: 2 hops");
}

TEST_CASE("seen reports session activity for the sender or a named node") {
    World w;
    load_all(w);
    CHECK(*w.run("seen", {}, from_ali()) == "Seen: !a1b2c3d4 - never (this session)");

    w.state.mark_seen("!11223344", w.now_ms - 125000);
    CHECK(*w.run("seen", {"BOB"}, from_ali()) == "Seen: !11223344 - 2m ago");
    CHECK(*w.run("seen", {"Bob", "Base"}, from_ali()) == "Seen: !11223344 - 2m ago");
    CHECK(*w.run("seen", {"carol"}, from_ali()) == "Seen: carol - never (this session)");
}

TEST_CASE("load labels channel utilization") {
    World w;
    load_all(w);
    CHECK(*w.run("load", {}, from_ali()) == "Channel load: unknown");

    make_local(w, 1.0, std::nullopt, std::nullopt);
    CHECK(*w.run("load", {}, from_ali()) == "Channel load: unknown");

    make_local(w, std::nullopt, std::nullopt, 0.5);
    CHECK(*w.run("load", {}, from_ali()) == "Channel load: IDLE (CH 0.5%)");
    make_local(w, std::nullopt, std::nullopt, 3.0);
    CHECK(*w.run("load", {}, from_ali()) == "Channel load: OK (CH 3.0%)");
    make_local(w, std::nullopt, std::nullopt, 7.5);
    CHECK(*w.run("load", {}, from_ali()) == "Channel load: BUSY (CH 7.5%)");
    make_local(w, std::nullopt, std::nullopt, 15.0);
    CHECK(*w.run("load", {}, from_ali()) == "Channel load: CONGESTED (CH 15.0%)");
}

// ----------------------------------------------------------------------------
// fun
// ----------------------------------------------------------------------------

TEST_CASE("roll stays within the requested die") {
    World w;
    load_all(w);
    for (int i = 0; i < 200; ++i) {
        const std::string r = *w.run("roll", {}, from_ali());
        REQUIRE(r.rfind("d6: ", 0) == 0);
        const int v = std::stoi(r.substr(4));
        CHECK(v >= 1);
        CHECK(v <= 6);
    }
    const std::string d20 = *w.run("roll", {"20"}, from_ali());
    REQUIRE(d20.rfind("d20: ", 0) == 0);
    const int v = std::stoi(d20.substr(5));
    CHECK(v >= 1);
    CHECK(v <= 20);
}

TEST_CASE("roll rejects bad sides") {
    World w;
    load_all(w);
    CHECK(*w.run("roll", {"abc"}, from_ali()) == "Usage: !roll [sides]");
    CHECK(*w.run("roll", {"6x"}, from_ali()) == "Usage: !roll [sides]");
    CHECK(*w.run("roll", {"1"}, from_ali()) == "Usage: !roll [2..1000]");
    CHECK(*w.run("roll", {"1001"}, from_ali()) == "Usage: !roll [2..1000]");
    CHECK(w.run("roll", {"1000"}, from_ali())->rfind("d1000: ", 0) == 0);
}

TEST_CASE("8ball answers from its fixed list") {
    World w;
    load_all(w);
    const std::set<std::string> answers = {
        "It is certain.", "Without a doubt.", "Yes, definitely.", "Most likely.",
        "Ask again later.", "Cannot predict now.", "Don't count on it.",
        "My reply is no.", "Very doubtful.",
    };
    for (int i = 0; i < 50; ++i) CHECK(answers.count(*w.run("8ball", {}, from_ali())) == 1);
}

TEST_CASE("stats reads session counters") {
    World w;
    load_all(w);
    CHECK(*w.run("stats", {}, from_ali()) == "Stats: messages=0, commands=0, unique_nodes=0");
    w.state.increment(COUNTER_MESSAGES_SEEN, 5);
    w.state.increment(COUNTER_COMMANDS_EXECUTED, 2);
    w.state.mark_seen("!a1b2c3d4", 1);
    w.state.mark_seen("!a1b2c3d4", 2);
    w.state.mark_seen("!11223344", 3);
    CHECK(*w.run("stats", {}, from_ali()) == "Stats: messages=5, commands=2, unique_nodes=2");
}

// ----------------------------------------------------------------------------
// radio
// ----------------------------------------------------------------------------

TEST_CASE("noise estimates the floor as RSSI minus SNR") {
    World w;
    load_all(w);
    PacketEvent p = from_ali();
    CHECK(*w.run("noise", {}, p) == "Noise floor: unavailable (no SNR/RSSI in this packet)");
    p.rx_rssi = -97;
    CHECK(*w.run("noise", {}, p) == "Noise floor: unavailable (no SNR/RSSI in this packet)");
    p.rx_snr = 6.5;
    CHECK(*w.run("noise", {}, p) == "Noise floor (est.): -103.5 dBm | RSSI -97 dBm | SNR 6.5 dB");
}

// ----------------------------------------------------------------------------
// assembly
// ----------------------------------------------------------------------------

TEST_CASE("Only configured plugin sets are loaded, in configured order") {
    World w;
    w.cfg.bot.plugins = {"radio", "fun"};
    load_all(w);
    const auto& names = w.registry.names();
    REQUIRE(names.size() == 9 + 1 + 3);
    CHECK(names[9] == "noise");
    CHECK(names[10] == "roll");
    CHECK(w.registry.find("snr") == nullptr);
}

TEST_CASE("Unknown plugin names and clashes under fail-fast stop the build") {
    std::string err;
    BotSettings bot;
    bot.plugins = {"diagnostics", "weather2"};
    CommandRegistry reg;
    CHECK_FALSE(build_registry(bot, reg, err));
    CHECK(err == "unknown_plugin:weather2");

    BotSettings twice;
    twice.plugins = {"fun", "fun"};
    CommandRegistry strict(CollisionPolicy::FailFast);
    CHECK_FALSE(build_registry(twice, strict, err));
    CHECK(err == "duplicate_command:roll");

    CommandRegistry lenient(CollisionPolicy::LastWins);
    CHECK(build_registry(twice, lenient, err));
    CHECK(lenient.size() == 9 + 3);
}
