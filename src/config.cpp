// ============================================================================
// config.cpp - implementation for config.hpp
// For the file layout and error strings see the matching .hpp.
// ============================================================================
#include "meshbot/config.hpp"
#include "meshbot/mailbox.hpp"
#include "meshbot/text_util.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace meshbot {

const std::vector<std::string>& known_plugins() {
  static const std::vector<std::string> names{"diagnostics", "fun", "radio"};
  return names;
}

// ---------- typed field readers ----------
// Each reader leaves the default in place when the key is absent, fails with
// "bad_type:<path>" when the key has the wrong JSON type. Range checks are
// done by the caller so the error names the exact field.

static bool read_string(const json& sec, const char* key, const std::string& path,
                        std::string& out, std::string& err) {
  auto it = sec.find(key);
  if (it == sec.end()) return true;
  if (!it->is_string()) { err = "bad_type:" + path; return false; }
  out = it->get<std::string>();
  return true;
}

static bool read_int(const json& sec, const char* key, const std::string& path,
                     long long& out, bool& present, std::string& err) {
  present = false;
  auto it = sec.find(key);
  if (it == sec.end()) return true;
  if (!it->is_number_integer()) { err = "bad_type:" + path; return false; }
  out = it->get<long long>();
  present = true;
  return true;
}

static bool section(const json& root, const char* name, const json*& out, std::string& err) {
  out = nullptr;
  auto it = root.find(name);
  if (it == root.end()) return true;
  if (!it->is_object()) { err = std::string("bad_type:") + name; return false; }
  out = &*it;
  return true;
}

// ---------- sections ----------

static bool parse_mesh(const json& s, MeshConfig& m, std::string& err) {
  long long v = 0; bool has = false;
  if (!read_string(s, "device", "meshtastic.device", m.device, err)) return false;

  if (!read_int(s, "channel_index", "meshtastic.channel_index", v, has, err)) return false;
  if (has) {
    if (v < 0 || v > 255) { err = "bad_value:meshtastic.channel_index"; return false; }
    m.channel_index = static_cast<int>(v);
  }

  if (!read_int(s, "baud", "meshtastic.baud", v, has, err)) return false;
  if (has) {
    if (v <= 0 || v > 4000000) { err = "bad_value:meshtastic.baud"; return false; }
    m.baud = static_cast<int>(v);
  }
  return true;
}

static bool parse_bot(const json& s, BotSettings& b, std::string& err) {
  long long v = 0; bool has = false;

  if (!read_string(s, "command_prefix", "bot.command_prefix", b.command_prefix, err)) return false;
  if (trim(b.command_prefix).empty()) { err = "bad_value:bot.command_prefix"; return false; }
  b.command_prefix = trim(b.command_prefix);

  if (!read_int(s, "max_reply_len", "bot.max_reply_len", v, has, err)) return false;
  if (has) {
    if (v < 2) { err = "bad_value:bot.max_reply_len"; return false; }
    b.max_reply_len = static_cast<size_t>(v);
  }

  if (!read_int(s, "mailbox_ttl_seconds", "bot.mailbox_ttl_seconds", v, has, err)) return false;
  if (has) {
    if (v <= 0 || v > MAX_MAILBOX_TTL_SECONDS) { err = "bad_value:bot.mailbox_ttl_seconds"; return false; }
    b.mailbox_ttl_seconds = static_cast<uint64_t>(v);
  }

  if (!read_int(s, "mailbox_max_per_node", "bot.mailbox_max_per_node", v, has, err)) return false;
  if (has) {
    if (v < 1 || v > static_cast<long long>(Mailbox::SLOT_CAP)) {
      err = "bad_value:bot.mailbox_max_per_node"; return false;
    }
    b.mailbox_max_per_node = static_cast<size_t>(v);
  }

  if (!read_int(s, "mailbox_max_nodes", "bot.mailbox_max_nodes", v, has, err)) return false;
  if (has) {
    if (v < 1) { err = "bad_value:bot.mailbox_max_nodes"; return false; }
    b.mailbox_max_nodes = static_cast<size_t>(v);
  }

  if (auto it = s.find("plugins"); it != s.end()) {
    if (!it->is_array()) { err = "bad_type:bot.plugins"; return false; }
    std::vector<std::string> names;
    for (const auto& p : *it) {
      if (!p.is_string()) { err = "bad_type:bot.plugins"; return false; }
      const std::string name = to_lower(trim(p.get<std::string>()));
      const auto& known = known_plugins();
      if (std::find(known.begin(), known.end(), name) == known.end()) {
        err = "unknown_plugin:" + name; return false;
      }
      names.push_back(name);
    }
    b.plugins = names;
  }

  std::string policy;
  if (!read_string(s, "command_collision", "bot.command_collision", policy, err)) return false;
  if (!policy.empty() && !parse_collision_policy(policy, b.command_collision)) {
    err = "bad_value:bot.command_collision"; return false;
  }
  return true;
}

static bool parse_weather(const json& s, WeatherConfig& w, std::string& err) {
  if (!read_string(s, "units", "weather.units", w.units, err)) return false;
  if (w.units != "metric" && w.units != "imperial") { err = "bad_value:weather.units"; return false; }

  if (!read_string(s, "lang", "weather.lang", w.lang, err)) return false;
  if (!read_string(s, "default_place", "weather.default_place", w.default_place, err)) return false;
  if (trim(w.default_place).empty()) { err = "bad_value:weather.default_place"; return false; }

  long long v = 0; bool has = false;
  if (!read_int(s, "timeout_ms", "weather.timeout_ms", v, has, err)) return false;
  if (has) {
    if (v <= 0) { err = "bad_value:weather.timeout_ms"; return false; }
    w.timeout_ms = static_cast<long>(v);
  }
  return true;
}

static bool parse_log(const json& s, LogConfig& l, std::string& err) {
  std::string level;
  if (!read_string(s, "level", "log.level", level, err)) return false;
  if (!level.empty() && !parse_log_level(level, l.level)) { err = "bad_value:log.level"; return false; }
  return true;
}

// ---------- public ----------

bool parse_config(const std::string& text, Config& out, std::string& err) {
  json root = json::parse(text, nullptr, /*allow_exceptions*/false);
  if (root.is_discarded()) { err = "bad_json"; return false; }
  if (!root.is_object())   { err = "bad_type:root"; return false; }

  Config cfg;                                     // start from defaults
  const json* sec = nullptr;

  if (!section(root, "meshtastic", sec, err)) return false;
  if (sec && !parse_mesh(*sec, cfg.mesh, err)) return false;

  if (!section(root, "bot", sec, err)) return false;
  if (sec && !parse_bot(*sec, cfg.bot, err)) return false;

  if (!section(root, "weather", sec, err)) return false;
  if (sec && !parse_weather(*sec, cfg.weather, err)) return false;

  if (!section(root, "log", sec, err)) return false;
  if (sec && !parse_log(*sec, cfg.log, err)) return false;

  out = cfg;                                      // commit only a fully valid config
  return true;
}

bool load_config(const std::string& path, Config& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "open_failed"; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), cfg, err);
}

} // namespace meshbot
