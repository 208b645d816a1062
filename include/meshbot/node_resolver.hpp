/**
 * @file node_resolver.hpp
 * @brief Map user-typed tokens ("!a1b2c3d4", "BOB", "Bob Base") to canonical node keys.
 *
 * @details
 * ## Field Brief
 * People type what they remember: a short name, a long name, sometimes the
 * raw hex id read off a screen. The directory behind it is incomplete, stale,
 * or holds two nodes both called "Base". The resolver turns the token into
 * one canonical key, or says plainly that it cannot.
 *
 * @par Resolution Order
 * 1. Token (trimmed) is `!` + 8 hex digits → lower-cased key, accepted even
 *    if the directory has never heard of it. Display name via
 *    `lookup_display_name()`.
 * 2. Otherwise scan the directory in its own order, comparing the token
 *    case-insensitively against each entry's trimmed long name and short
 *    name. **First match wins.** Returns the entry key and its short name
 *    (falling back to the long name).
 * 3. No match → both fields empty.
 *
 * Resolution is a pure function of (token, directory snapshot): resolving
 * the returned key again yields the same key.
 *
 * @authors
 * @author Leo
 */
#ifndef MESHBOT_NODE_RESOLVER_HPP
#define MESHBOT_NODE_RESOLVER_HPP

#include <optional>
#include <string>
#include "meshbot/node_directory.hpp"

namespace meshbot {

/// @brief Result of a resolution attempt. `key` empty means "not found".
struct Resolution {
  std::optional<std::string> key;
  std::optional<std::string> display_name;
};

class NodeResolver {
public:
  explicit NodeResolver(const NodeDirectory& dir) : dir_(dir) {}

  /// @brief Resolve a user token. Never throws for "not found".
  Resolution resolve(const std::string& token) const;

  /**
   * @brief Short name (else long name) of the node with this key.
   *
   * Looks the entry up by key first, then by user id. Returns nullopt when
   * neither matches or the entry has no usable name.
   */
  std::optional<std::string> lookup_display_name(const std::string& key) const;

private:
  const NodeDirectory& dir_;
};

} // namespace meshbot

#endif // MESHBOT_NODE_RESOLVER_HPP
