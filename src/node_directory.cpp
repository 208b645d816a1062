// ============================================================================
// node_directory.cpp - implementation for node_directory.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file node_directory.cpp
 */

#include "meshbot/node_directory.hpp"   // roster types and snapshot API
#include "meshbot/json_util.hpp"        // json_find()/json_number() tolerant lookups
#include "meshbot/packet_event.hpp"     // node_key_from_num(), is_node_key()
#include "meshbot/text_util.hpp"        // to_lower(), trim()

#include <filesystem>         // create_directories, rename
#include <fstream>            // snapshot read/write
#include <system_error>       // std::error_code for non-throwing filesystem ops

#include "nlohmann/json.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace meshbot {

// -------- MemoryNodeDirectory --------

const NodeEntry* MemoryNodeDirectory::find(const std::string& key) const {
  for (const auto& e : entries_)
    if (e.key == key) return &e;
  return nullptr;
}

const NodeEntry* MemoryNodeDirectory::local_node() const {
  if (!local_key_.empty()) {
    if (const NodeEntry* e = find(local_key_)) return e;
  }
  for (const auto& e : entries_)
    if (e.is_local) return &e;
  return nullptr;
}

static void merge_metric(std::optional<double>& dst, const std::optional<double>& src) {
  if (src) dst = src;
}

/*
 * upsert()
 * --------
 * Bridge node frames are partial: a telemetry update may carry only metrics,
 * a user update only names. Present fields win, absent fields keep history.
 */
void MemoryNodeDirectory::upsert(const NodeEntry& in) {
  for (auto& e : entries_) {
    if (e.key != in.key) continue;
    if (in.user_id)    e.user_id = in.user_id;
    if (in.short_name) e.short_name = in.short_name;
    if (in.long_name)  e.long_name = in.long_name;
    if (in.is_local)   e.is_local = true;                  // sticky
    if (in.metrics) {
      if (!e.metrics) e.metrics = NodeMetrics{};
      merge_metric(e.metrics->air_util_tx, in.metrics->air_util_tx);
      merge_metric(e.metrics->air_util_rx, in.metrics->air_util_rx);
      merge_metric(e.metrics->channel_utilization, in.metrics->channel_utilization);
    }
    return;
  }
  entries_.push_back(in);                                   // first sighting: append
}

std::optional<NodeMetrics> local_airtime(const NodeDirectory& dir) {
  const NodeEntry* local = dir.local_node();
  if (!local || !local->metrics || local->metrics->empty()) return std::nullopt;
  return local->metrics;
}

// -------- JSON mapping --------

/*
 * metrics_at()
 * ------------
 * Metrics live under deviceMetrics on most firmware, under
 * telemetry.deviceMetrics on some, and under a bare "metrics" object on a
 * few. The first location carrying at least one value wins.
 */
static std::optional<NodeMetrics> metrics_at(const json& j) {
  const json* bases[] = {
    json_find(j, {"deviceMetrics"}),
    json_find(j, {"telemetry", "deviceMetrics"}),
    json_find(j, {"metrics"}),
  };
  for (const json* b : bases) {
    if (!b) continue;
    NodeMetrics m;
    m.air_util_tx         = json_number(json_find(*b, {"airUtilTx"}));
    m.air_util_rx         = json_number(json_find(*b, {"airUtilRx"}));
    m.channel_utilization = json_number(json_find(*b, {"channelUtilization"}));
    if (!m.empty()) return m;
  }
  return std::nullopt;
}

bool node_from_json(const json& j, NodeEntry& out, std::string& err) {
  if (!j.is_object()) { err = "bad_format"; return false; }

  NodeEntry e;
  e.user_id    = json_string(json_find(j, {"user", "id"}));
  e.short_name = json_string(json_find(j, {"user", "shortName"}));
  e.long_name  = json_string(json_find(j, {"user", "longName"}));
  e.is_local   = json_bool(json_find(j, {"user", "isLocal"})).value_or(false);
  e.metrics    = metrics_at(j);

  // Key preference: numeric "num", then string "id", then user.id.
  if (auto num = json_integer(json_find(j, {"num"})); num && *num >= 0 && *num <= 0xFFFFFFFFll) {
    e.key = node_key_from_num(static_cast<uint32_t>(*num));
  } else if (auto id = json_string(json_find(j, {"id"})); id && is_node_key(trim(*id))) {
    e.key = to_lower(trim(*id));
  } else if (e.user_id && is_node_key(trim(*e.user_id))) {
    e.key = to_lower(trim(*e.user_id));
  } else {
    err = "missing_field:num";
    return false;
  }

  out = e;
  return true;
}

json node_to_json(const NodeEntry& e) {
  json j;
  j["id"] = e.key;
  json user = json::object();
  if (e.user_id)    user["id"] = *e.user_id;
  if (e.short_name) user["shortName"] = *e.short_name;
  if (e.long_name)  user["longName"] = *e.long_name;
  user["isLocal"] = e.is_local;
  j["user"] = user;
  if (e.metrics && !e.metrics->empty()) {
    json m = json::object();
    if (e.metrics->air_util_tx)         m["airUtilTx"] = *e.metrics->air_util_tx;
    if (e.metrics->air_util_rx)         m["airUtilRx"] = *e.metrics->air_util_rx;
    if (e.metrics->channel_utilization) m["channelUtilization"] = *e.metrics->channel_utilization;
    j["deviceMetrics"] = m;
  }
  return j;
}

// -------- snapshot files --------

/*
 * load_directory()
 * ----------------
 * Parse into a scratch table first; only a fully valid snapshot replaces
 * what the caller already has.
 */
bool load_directory(const std::string& path, MemoryNodeDirectory& dir, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "open_failed"; return false; }

  json root = json::parse(in, nullptr, /*allow_exceptions*/false);
  if (root.is_discarded()) { err = "bad_json"; return false; }

  const json* nodes = json_find(root, {"nodes"});
  if (!nodes || !nodes->is_array()) { err = "bad_format"; return false; }

  MemoryNodeDirectory scratch;
  for (size_t i = 0; i < nodes->size(); ++i) {
    NodeEntry e;
    std::string why;
    if (!node_from_json((*nodes)[i], e, why)) {
      err = "bad_node:" + std::to_string(i) + ":" + why;
      return false;
    }
    scratch.upsert(e);
  }

  for (const auto& e : scratch.entries()) dir.upsert(e);
  return true;
}

bool save_directory(const std::string& path, const NodeDirectory& dir, std::string& err) {
  const fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);           // non-throwing; check ec
    if (ec) { err = "mkdir_failed"; return false; }
  }

  json root;
  root["nodes"] = json::array();
  for (const auto& e : dir.entries()) root["nodes"].push_back(node_to_json(e));

  fs::path tmp = p; tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "open_failed"; return false; }
    out << root.dump(2) << "\n";
    out.flush();
    if (!out) { err = "write_failed"; return false; }
  }
  fs::rename(tmp, p, ec);                                   // atomic replace on POSIX
  if (ec) { err = "rename_failed"; return false; }
  return true;
}

} // namespace meshbot
