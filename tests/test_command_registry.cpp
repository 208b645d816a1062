#include <doctest/doctest.h>
#include <sstream>

#include "meshbot/log.hpp"
#include "test_support.hpp"

using namespace meshbot;
using namespace meshbot::testing;

static CommandSpec fixed_reply(const std::string& name, const std::string& reply,
                               std::vector<std::string> aliases = {}) {
    CommandSpec s;
    s.name = name;
    s.aliases = std::move(aliases);
    s.help = "test command";
    s.usage = name;
    s.handler = [reply](CommandContext&, const PacketEvent&, const std::string&,
                        const std::vector<std::string>&) -> std::optional<std::string> {
        return reply;
    };
    return s;
}

static std::string call(World& w, const CommandRegistry& reg, const std::string& name) {
    const CommandSpec* spec = reg.find(name);
    REQUIRE(spec != nullptr);
    CommandContext c = w.ctx();
    return spec->handler(c, PacketEvent{}, "!a1b2c3d4", {}).value_or("<none>");
}

TEST_CASE("Later sets override earlier ones under last-wins, and say so") {
    std::ostringstream sink;
    set_log_sink(&sink);
    set_log_level(LogLevel::Info);

    World w;
    CommandRegistry reg(CollisionPolicy::LastWins);
    std::string err;
    REQUIRE(reg.add_set(CommandSet{"first", {fixed_reply("ping", "one"), fixed_reply("time", "t")}}, err));
    REQUIRE(reg.add_set(CommandSet{"second", {fixed_reply("PING", "two")}}, err));

    CHECK(call(w, reg, "ping") == "two");
    CHECK(call(w, reg, "time") == "t");
    REQUIRE(reg.names().size() == 2);
    CHECK(reg.names()[0] == "ping");           // overridden name keeps its slot
    CHECK(reg.names()[1] == "time");
    CHECK(sink.str().find("event=command_override name=ping set=second") != std::string::npos);

    set_log_sink(nullptr);
}

TEST_CASE("Fail-fast rejects a clash and leaves the registry untouched") {
    World w;
    CommandRegistry reg(CollisionPolicy::FailFast);
    std::string err;
    REQUIRE(reg.add_set(CommandSet{"first", {fixed_reply("ping", "one", {"p"})}}, err));

    CHECK_FALSE(reg.add_set(CommandSet{"second", {fixed_reply("extra", "x"), fixed_reply("P", "two")}}, err));
    CHECK(err == "duplicate_command:p");
    CHECK(reg.find("extra") == nullptr);       // nothing from the failed set landed
    CHECK(call(w, reg, "p") == "one");
    CHECK(reg.size() == 1);

    CHECK_FALSE(reg.add_set(CommandSet{"self", {fixed_reply("a", "1", {"b"}), fixed_reply("b", "2")}}, err));
    CHECK(err == "duplicate_command:b");
}

TEST_CASE("Aliases resolve to the same command, lookups ignore case") {
    World w;
    CommandRegistry reg;
    std::string err;
    REQUIRE(reg.add_set(CommandSet{"set", {fixed_reply("help", "h", {"?", "H"})}}, err));

    CHECK(reg.find("?") == reg.find("help"));
    CHECK(reg.find("HeLp") == reg.find("help"));
    CHECK(reg.find("h") == reg.find("help"));
    CHECK(reg.find("nope") == nullptr);
    CHECK(reg.names().size() == 1);            // aliases are not listed
    CHECK(call(w, reg, "?") == "h");
}

TEST_CASE("Malformed command specs are refused") {
    CommandRegistry reg;
    std::string err;

    CommandSpec nameless = fixed_reply("  ", "x");
    CHECK_FALSE(reg.add_set(CommandSet{"broken", {nameless}}, err));
    CHECK(err == "bad_command:broken");

    CommandSpec handlerless = fixed_reply("ok", "x");
    handlerless.handler = nullptr;
    CHECK_FALSE(reg.add_set(CommandSet{"broken2", {handlerless}}, err));
    CHECK(err == "bad_command:broken2");
    CHECK(reg.size() == 0);
}

TEST_CASE("Collision policy names parse strictly") {
    CollisionPolicy p = CollisionPolicy::LastWins;
    CHECK(parse_collision_policy("fail_fast", p));
    CHECK(p == CollisionPolicy::FailFast);
    CHECK(parse_collision_policy("last_wins", p));
    CHECK(p == CollisionPolicy::LastWins);
    CHECK_FALSE(parse_collision_policy("Last_Wins", p));
    CHECK_FALSE(parse_collision_policy("", p));
}
