#pragma once
/**
 * @file json_util.hpp
 * @brief Tolerant lookups into loosely-shaped JSON (bridge frames, snapshots, HTTP replies).
 *
 * @details
 * Radio firmware versions disagree on where fields live and what type they
 * carry: a channel may be `1`, `1.0` or `"1"`. These helpers walk a path and
 * coerce the value, returning `nullopt` instead of throwing when the shape
 * does not fit. Callers try paths in order and keep the first hit.
 */

#include <initializer_list>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace meshbot {

/// @brief Follow object keys; nullptr if any hop is missing, not an object, or null.
const nlohmann::json* json_find(const nlohmann::json& j, std::initializer_list<const char*> path);

/// @brief Number, or a string holding a full decimal number.
std::optional<double> json_number(const nlohmann::json* v);

/// @brief Integer, an integral float, or a string holding a full integer.
std::optional<long long> json_integer(const nlohmann::json* v);

/// @brief String value only; no coercion.
std::optional<std::string> json_string(const nlohmann::json* v);

/// @brief Boolean value only; no coercion.
std::optional<bool> json_bool(const nlohmann::json* v);

} // namespace meshbot
