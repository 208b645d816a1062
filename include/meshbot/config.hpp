#pragma once
/**
 * @page mb-config MeshBot Configuration
 * @file config.hpp
 * @brief JSON configuration: radio link, bot policy, weather lookup, logging.
 *
 * @details
 * PURPOSE
 * -------
 * Every tunable the operator may want to change without recompiling lives in
 * one human-editable JSON file. Missing keys fall back to the defaults below;
 * present keys are type-checked and range-checked.
 *
 * FILE LAYOUT
 * -----------
 *     {
 *       "meshtastic": { "device": "/dev/ttyUSB0", "channel_index": 1, "baud": 115200 },
 *       "bot": {
 *         "command_prefix": "!", "max_reply_len": 220,
 *         "mailbox_ttl_seconds": 604800, "mailbox_max_per_node": 16,
 *         "mailbox_max_nodes": 256,
 *         "plugins": ["diagnostics", "fun", "radio"],
 *         "command_collision": "last_wins"
 *       },
 *       "weather": { "units": "metric", "lang": "cs", "default_place": "Prague",
 *                    "timeout_ms": 10000 },
 *       "log": { "level": "info" }
 *     }
 *
 * ERRORS
 * ------
 * Stable strings, so scripts and the CLI can report them verbatim:
 *   "open_failed", "bad_json", "bad_type:<path>", "bad_value:<path>",
 *   "unknown_plugin:<name>".
 */

#include <cstdint>
#include <string>
#include <vector>

#include "meshbot/command_registry.hpp"
#include "meshbot/log.hpp"

namespace meshbot {

struct MeshConfig {
  std::string device{"/dev/ttyUSB0"};
  int         channel_index{1};
  int         baud{115200};
};

/// Upper bound for bot.mailbox_ttl_seconds (ten years).
constexpr long long MAX_MAILBOX_TTL_SECONDS = 10ll * 365 * 24 * 3600;

struct BotSettings {
  std::string              command_prefix{"!"};
  size_t                   max_reply_len{220};
  uint64_t                 mailbox_ttl_seconds{7ull * 24 * 3600};
  size_t                   mailbox_max_per_node{16};
  size_t                   mailbox_max_nodes{256};
  std::vector<std::string> plugins{"diagnostics", "fun", "radio"};
  CollisionPolicy          command_collision{CollisionPolicy::LastWins};
};

struct WeatherConfig {
  std::string units{"metric"};          ///< "metric" | "imperial"
  std::string lang{"cs"};               ///< geocoding language
  std::string default_place{"Prague"};  ///< used when !weather has no argument
  long        timeout_ms{10000};        ///< per HTTP request
};

struct LogConfig {
  LogLevel level{LogLevel::Info};
};

struct Config {
  MeshConfig    mesh;
  BotSettings   bot;
  WeatherConfig weather;
  LogConfig     log;
};

/// Plugin set names the binary knows how to load.
const std::vector<std::string>& known_plugins();

/// @brief Parse a JSON document into @p cfg, starting from defaults.
bool parse_config(const std::string& text, Config& cfg, std::string& err);

/// @brief Read @p path and parse it. A missing file is an error ("open_failed").
bool load_config(const std::string& path, Config& cfg, std::string& err);

} // namespace meshbot
