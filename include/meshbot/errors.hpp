/**
 * @file errors.hpp
 * @brief Typed failures that command handlers may throw across the dispatcher boundary.
 *
 * @details
 * Library code reports errors with `bool` + `std::string& err`. Handlers are
 * the one place where exceptions are allowed: a handler deep in an HTTP call
 * cannot return a status cleanly, so it throws, and the dispatcher turns the
 * throw into a single-line reply. Nothing thrown here ever escapes
 * `Dispatcher::dispatch()`.
 */
#ifndef MESHBOT_ERRORS_HPP
#define MESHBOT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace meshbot {

/// @name NetworkError categories (stable, user-visible)
///@{
static constexpr const char* NET_TIMEOUT      = "timeout";
static constexpr const char* NET_CONNECTION   = "connection";
static constexpr const char* NET_HTTP_STATUS  = "http_status";
static constexpr const char* NET_BAD_RESPONSE = "bad_response";
///@}

/**
 * @class NetworkError
 * @brief An external lookup failed. Never retried; reported as
 *        `Network error: <category>`.
 */
class NetworkError : public std::runtime_error {
public:
  NetworkError(std::string category, const std::string& detail)
  : std::runtime_error(detail), category_(std::move(category)) {}

  /// One of the NET_* categories above.
  const std::string& category() const { return category_; }

private:
  std::string category_;
};

} // namespace meshbot

#endif // MESHBOT_ERRORS_HPP
