#include <doctest/doctest.h>
#include <string>

#include <unistd.h>

#include "nlohmann/json.hpp"

#include "meshbot/bridge.hpp"
#include "meshbot/slip.hpp"

using namespace meshbot;
using json = nlohmann::json;

static BridgeEvent decode_ok(const std::string& frame) {
    BridgeEvent ev;
    std::string err;
    REQUIRE_MESSAGE(decode_bridge_frame(frame, ev, err), err);
    return ev;
}

static std::string decode_err(const std::string& frame) {
    BridgeEvent ev;
    std::string err;
    CHECK_FALSE(decode_bridge_frame(frame, ev, err));
    return err;
}

// ----------------------------------------------------------------------------
// codec
// ----------------------------------------------------------------------------

TEST_CASE("Packet frames decode every documented field") {
    auto ev = decode_ok(R"({"type":"packet","from":2712847316,"fromId":"!a1b2c3d4","channel":1,
                            "decoded":{"text":"!ping"},"rxSnr":6.25,"rxRssi":-97,
                            "hopsAway":1,"hopLimit":3})");
    REQUIRE(ev.kind == BridgeEventKind::Packet);
    const PacketEvent& p = ev.packet;
    CHECK(*p.channel == 1);
    CHECK(*p.text == "!ping");
    CHECK(*p.from_id == "!a1b2c3d4");
    CHECK(*p.from_num == 2712847316u);
    CHECK(*p.rx_snr == doctest::Approx(6.25));
    CHECK(*p.rx_rssi == doctest::Approx(-97));
    CHECK(*p.hops_away == 1);
    CHECK(*p.hop_limit == 3);
    CHECK(*sender_key(p) == "!a1b2c3d4");
}

TEST_CASE("Channel index is found on every known path, first parsable wins") {
    CHECK(*decode_ok(R"({"type":"packet","channel":2})").packet.channel == 2);
    CHECK(*decode_ok(R"({"type":"packet","decoded":{"channel":3}})").packet.channel == 3);
    CHECK(*decode_ok(R"({"type":"packet","decoded":{"channelIndex":4}})").packet.channel == 4);
    CHECK(*decode_ok(R"({"type":"packet","rx":{"channel":"5"}})").packet.channel == 5);
    CHECK(*decode_ok(R"({"type":"packet","channel":"x","decoded":{"channel":6}})").packet.channel == 6);
    CHECK(*decode_ok(R"({"type":"packet","channel":0,"decoded":{"channel":6}})").packet.channel == 0);
    CHECK_FALSE(decode_ok(R"({"type":"packet","decoded":{"text":"hi"}})").packet.channel);
}

TEST_CASE("Channel values that do not fit an int are skipped, not wrapped") {
    // 2^32 + 1 would narrow to 1, the monitored channel
    auto big = decode_ok(R"({"type":"packet","channel":4294967297,"fromId":"!11223344",
                             "decoded":{"text":"!ping"}})").packet;
    CHECK_FALSE(big.channel);
    CHECK_FALSE(decode_ok(R"({"type":"packet","channel":1e300})").packet.channel);
    CHECK_FALSE(decode_ok(R"({"type":"packet","channel":-1e19})").packet.channel);
    CHECK_FALSE(decode_ok(R"({"type":"packet","channel":18446744073709551615})").packet.channel);
    CHECK_FALSE(decode_ok(R"({"type":"packet","channel":"99999999999999999999"})").packet.channel);
    CHECK(*decode_ok(R"({"type":"packet","channel":1e300,"decoded":{"channel":2}})").packet.channel == 2);
}

TEST_CASE("Senders arrive as a numeric from, a fromId, or a string from") {
    auto num = decode_ok(R"({"type":"packet","from":287454020})").packet;
    CHECK_FALSE(num.from_id);
    CHECK(*sender_key(num) == "!11223344");

    auto str = decode_ok(R"({"type":"packet","from":"!CAFEF00D"})").packet;
    CHECK_FALSE(str.from_num);
    CHECK(*sender_key(str) == "!cafef00d");

    auto both = decode_ok(R"({"type":"packet","from":"!00000001","fromId":"!00000002"})").packet;
    CHECK(*both.from_id == "!00000002");

    auto none = decode_ok(R"({"type":"packet","from":-5})").packet;
    CHECK_FALSE(sender_key(none));
}

TEST_CASE("Display names in fromId never become sender keys") {
    auto named = decode_ok(R"({"type":"packet","fromId":"Bob","from":287454020})").packet;
    CHECK(*named.from_id == "Bob");
    CHECK(*sender_key(named) == "!11223344");

    auto padded = decode_ok(R"({"type":"packet","fromId":" !A1B2C3D4 "})").packet;
    CHECK(*sender_key(padded) == "!a1b2c3d4");

    CHECK_FALSE(sender_key(decode_ok(R"({"type":"packet","fromId":"Bob"})").packet));
    CHECK_FALSE(sender_key(decode_ok(R"({"type":"packet","fromId":"!a1b2c3d"})").packet));
}

TEST_CASE("Hop count comes from the first present alias") {
    CHECK(*decode_ok(R"({"type":"packet","rxHop":2})").packet.hops_away == 2);
    CHECK(*decode_ok(R"({"type":"packet","hops":3,"hopCount":9})").packet.hops_away == 3);
    CHECK(*decode_ok(R"({"type":"packet","hopCount":4})").packet.hops_away == 4);
    auto p = decode_ok(R"({"type":"packet","hopLimit":7})").packet;
    CHECK_FALSE(p.hops_away);
    CHECK(*p.hop_limit == 7);
}

TEST_CASE("Node and myInfo frames become directory updates") {
    auto ev = decode_ok(R"({"type":"node","num":2712847316,
                            "user":{"shortName":"ALI","longName":"Alice Mobile"},
                            "deviceMetrics":{"channelUtilization":7.5}})");
    REQUIRE(ev.kind == BridgeEventKind::Node);
    CHECK(ev.node.key == "!a1b2c3d4");
    CHECK(*ev.node.short_name == "ALI");
    CHECK(*ev.node.metrics->channel_utilization == doctest::Approx(7.5));

    auto me = decode_ok(R"({"type":"myInfo","myNodeNum":287454020})");
    REQUIRE(me.kind == BridgeEventKind::LocalNode);
    CHECK(me.node.key == "!11223344");
}

TEST_CASE("Malformed frames are rejected with a stable reason") {
    CHECK(decode_err("not json") == "bad_json");
    CHECK(decode_err("[1]") == "bad_format");
    CHECK(decode_err(R"({"channel":1})") == "missing_field:type");
    CHECK(decode_err(R"({"type":7})") == "missing_field:type");
    CHECK(decode_err(R"({"type":"position"})") == "unknown_type:position");
    CHECK(decode_err(R"({"type":"node","user":{"shortName":"X"}})") == "missing_field:num");
    CHECK(decode_err(R"({"type":"myInfo"})") == "missing_field:myNodeNum");
}

TEST_CASE("sendText frames carry channel and text") {
    json j = json::parse(encode_send_text(1, "pong \"quoted\"\nline"));
    CHECK(j["type"] == "sendText");
    CHECK(j["channelIndex"] == 1);
    CHECK(j["text"] == "pong \"quoted\"\nline");
    CHECK(encode_send_text(0, "x").find('\n') == std::string::npos);
}

// ----------------------------------------------------------------------------
// transport over pipes
// ----------------------------------------------------------------------------

struct Pipes {
    int in[2]{-1, -1};     // test writes in[1], transport reads in[0]
    int out[2]{-1, -1};    // transport writes out[1], test reads out[0]
    Pipes()  { REQUIRE(::pipe(in) == 0); REQUIRE(::pipe(out) == 0); }
    ~Pipes() { for (int fd : {in[0], in[1], out[0], out[1]}) if (fd >= 0) ::close(fd); }

    void write_in(const std::string& s) {
        REQUIRE(::write(in[1], s.data(), s.size()) == static_cast<ssize_t>(s.size()));
    }
    void close_in() { ::close(in[1]); in[1] = -1; }
    std::string read_out() {
        char buf[1024];
        const ssize_t n = ::read(out[0], buf, sizeof(buf));
        return n > 0 ? std::string(buf, static_cast<size_t>(n)) : std::string();
    }
};

TEST_CASE("Line transport yields one event per line and skips bad lines") {
    Pipes p;
    BridgeTransport t(p.in[0], p.out[1], Framing::Lines);

    p.write_in("{\"type\":\"packet\",\"channel\":1,\"decoded\":{\"text\":\"!ping\"}}\r\n"
               "garbage\n"
               "\n"
               "{\"type\":\"node\",\"num\":1}\n");

    BridgeEvent ev;
    std::string err;
    REQUIRE(t.poll(ev, 100, err) == MeshTransport::PollStatus::Event);
    CHECK(ev.kind == BridgeEventKind::Packet);
    CHECK(*ev.packet.text == "!ping");

    REQUIRE(t.poll(ev, 100, err) == MeshTransport::PollStatus::Event);
    CHECK(ev.kind == BridgeEventKind::Node);
    CHECK(t.rejected_frames() == 1);

    CHECK(t.poll(ev, 10, err) == MeshTransport::PollStatus::Idle);

    // last line without a newline still counts at end of stream
    p.write_in("{\"type\":\"myInfo\",\"myNodeNum\":2}");
    CHECK(t.poll(ev, 100, err) == MeshTransport::PollStatus::Idle);
    p.close_in();
    REQUIRE(t.poll(ev, 100, err) == MeshTransport::PollStatus::Event);
    CHECK(ev.kind == BridgeEventKind::LocalNode);
    CHECK(t.poll(ev, 100, err) == MeshTransport::PollStatus::Closed);
}

TEST_CASE("Line transport writes one JSON document per line") {
    Pipes p;
    BridgeTransport t(p.in[0], p.out[1], Framing::Lines);
    std::string err;
    REQUIRE(t.send_text(2, "pong", err));
    const std::string line = p.read_out();
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
    json j = json::parse(line);
    CHECK(j["channelIndex"] == 2);
    CHECK(j["text"] == "pong");
}

TEST_CASE("SLIP transport decodes frames and frames its output") {
    Pipes p;
    BridgeTransport t(p.in[0], p.out[1], Framing::Slip);

    p.write_in("noise" + slip::encode(R"({"type":"packet","channel":1,"from":1})"));
    BridgeEvent ev;
    std::string err;
    REQUIRE(t.poll(ev, 100, err) == MeshTransport::PollStatus::Event);
    CHECK(*ev.packet.from_num == 1u);

    REQUIRE(t.send_text(1, "hi", err));
    const std::string wire = p.read_out();
    CHECK(wire == slip::encode(encode_send_text(1, "hi")));
}
