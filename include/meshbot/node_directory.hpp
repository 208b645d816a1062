#pragma once
/**
 * @page mb-node-directory MeshBot Node Directory
 * @file node_directory.hpp
 * @brief Read-only view of the mesh's known-node table, plus the in-memory table that backs it.
 *
 * @details
 * PURPOSE
 * -------
 * The radio knows who is around: node numbers, short and long names, which
 * node is local, and (sometimes) airtime metrics. The bot needs that roster
 * to resolve `!msg Bob ...`, to print `!nodes`, and to answer `!air`. This
 * header is the "roster" every other layer reads through.
 *
 * WHAT THIS DOES
 * --------------
 * - `NodeDirectory` is the narrow, read-only interface the resolver and the
 *   command handlers depend on. Iteration order is meaningful: the resolver
 *   takes the first name match.
 * - `MemoryNodeDirectory` is the concrete table. It keeps insertion order,
 *   merges updates from bridge `node` frames, and tracks the local node.
 * - `load_directory()` / `save_directory()` seed and persist a small JSON
 *   snapshot so names survive bot restarts. Only directory data is saved;
 *   mailbox and session state never touch disk.
 *
 * SNAPSHOT FORMAT
 * ---------------
 * Field names follow the radio's own JSON so a snapshot can be written by
 * hand or produced by the bridge:
 *
 *     { "nodes": [
 *         { "num": 2712847316,
 *           "user": { "id": "!a1b2c3d4", "shortName": "BOB", "longName": "Bob Base",
 *                     "isLocal": false },
 *           "deviceMetrics": { "airUtilTx": 1.5, "airUtilRx": 3, "channelUtilization": 7.25 } }
 *     ] }
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - Directory data is advisory. Names may be missing, stale, or duplicated;
 *   every consumer must cope with that.
 * - Snapshot writes go through a temp file + rename so a crash never leaves
 *   a half-written roster behind.
 *
 * @note Not thread-safe.
 */

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json_fwd.hpp"

namespace meshbot {

/**
 * @struct NodeMetrics
 * @brief Airtime metrics in percent. Each value is independently optional.
 */
struct NodeMetrics {
  std::optional<double> air_util_tx;          ///< Share of airtime this node transmitted
  std::optional<double> air_util_rx;          ///< Share of airtime spent receiving
  std::optional<double> channel_utilization;  ///< Overall channel busy ratio

  bool empty() const { return !air_util_tx && !air_util_rx && !channel_utilization; }
};

/**
 * @struct NodeEntry
 * @brief One roster row. `key` is always canonical (`!` + 8 lower-case hex).
 */
struct NodeEntry {
  std::string                key;         ///< Canonical node key
  std::optional<std::string> user_id;     ///< User id as reported by the radio (may differ in case)
  std::optional<std::string> short_name;  ///< e.g. "BOB"
  std::optional<std::string> long_name;   ///< e.g. "Bob Base"
  bool                       is_local{false};
  std::optional<NodeMetrics> metrics;
};

/**
 * @class NodeDirectory
 * @brief Read-only roster interface.
 */
class NodeDirectory {
public:
  virtual ~NodeDirectory() = default;

  /// @brief All entries in directory order.
  virtual const std::vector<NodeEntry>& entries() const = 0;

  /// @brief Entry with exactly this canonical key, or nullptr.
  virtual const NodeEntry* find(const std::string& key) const = 0;

  /// @brief The node the bot itself runs on, or nullptr if unknown.
  virtual const NodeEntry* local_node() const = 0;

  size_t size() const { return entries().size(); }
};

/**
 * @class MemoryNodeDirectory
 * @brief Insertion-ordered in-memory roster fed by bridge `node` frames.
 */
class MemoryNodeDirectory : public NodeDirectory {
public:
  const std::vector<NodeEntry>& entries() const override { return entries_; }
  const NodeEntry* find(const std::string& key) const override;
  const NodeEntry* local_node() const override;

  /**
   * @brief Insert a new entry or merge into an existing one with the same key.
   *
   * Merge rules: present fields overwrite, absent fields keep the old value,
   * metrics merge value by value, `is_local` is sticky once true.
   * New keys are appended, so first-seen order is preserved.
   */
  void upsert(const NodeEntry& e);

  /// @brief Declare the local node by key (used when the bridge reports it separately).
  void set_local_key(const std::string& key) { local_key_ = key; }

  void clear() { entries_.clear(); local_key_.clear(); }

private:
  std::vector<NodeEntry> entries_;
  std::string            local_key_;
};

/**
 * @brief Airtime metrics of the local node, if the radio has reported any.
 * @return nullopt when there is no local node or it carries no metric at all.
 */
std::optional<NodeMetrics> local_airtime(const NodeDirectory& dir);

/**
 * @brief Decode one node object (`num`/`id`, `user.*`, metrics at any of the
 *        known paths) into a NodeEntry.
 *
 * @retval false with err = "missing_field:num" when no usable key is present.
 */
bool node_from_json(const nlohmann::json& j, NodeEntry& out, std::string& err);

/// @brief Encode an entry in snapshot form (inverse of node_from_json for the fields it knows).
nlohmann::json node_to_json(const NodeEntry& e);

/**
 * @brief Seed @p dir from a snapshot file.
 *
 * Errors: "open_failed", "bad_json", "bad_format", "bad_node:<index>:<reason>".
 * On failure @p dir is left untouched.
 */
bool load_directory(const std::string& path, MemoryNodeDirectory& dir, std::string& err);

/**
 * @brief Atomically write @p dir to @p path (temp file + rename).
 *
 * Errors: "mkdir_failed", "open_failed", "write_failed", "rename_failed".
 */
bool save_directory(const std::string& path, const NodeDirectory& dir, std::string& err);

} // namespace meshbot
