#pragma once
/**
 * @file weather.hpp
 * @brief Current-conditions lookup: the service interface and the Open-Meteo client.
 *
 * @details
 * PURPOSE
 * -------
 * `!weather [place]` is the one command that leaves the mesh: it geocodes a
 * place name, then asks for current conditions. The command handler only
 * sees `WeatherService`, so tests swap in a fake and the bot never needs the
 * network to be exercised.
 *
 * WHAT THIS DOES
 * --------------
 * - `WeatherService::current(place)` returns a ready-to-send reply line, or
 *   throws `NetworkError` (timeout / connection / http_status / bad_response).
 * - `OpenMeteoWeather` implements it with libcurl and nlohmann/json:
 *     1) GET geocoding-api.open-meteo.com/v1/search?name=<place>&count=1&language=<lang>
 *     2) GET api.open-meteo.com/v1/forecast?latitude=..&longitude=..&current=...
 *   Every request is bounded by `WeatherConfig::timeout_ms`.
 * - The pure parsing and formatting steps are exposed separately so they can
 *   be tested against canned JSON bodies.
 *
 * REPLY FORMAT
 * ------------
 *     Prague, Czechia: 12.5°C (feels like 10°C), light rain, wind 14.2 km/h
 *     Location not found: Atlantis
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "meshbot/config.hpp"

namespace meshbot {

/**
 * @class WeatherService
 * @brief Narrow seam between the weather command and whatever answers it.
 */
class WeatherService {
public:
  virtual ~WeatherService() = default;

  /// @brief One-line reply for @p place. Throws NetworkError on transport failures.
  virtual std::string current(const std::string& place) = 0;
};

/// @brief First geocoding hit.
struct GeoPlace {
  double      latitude{0};
  double      longitude{0};
  std::string name;
  std::string country;
};

/// @brief Fields read from the forecast "current" block. Each may be missing.
struct CurrentConditions {
  std::optional<double> temperature;
  std::optional<double> apparent_temperature;
  std::optional<double> wind_speed;
  std::optional<int>    weather_code;
};

/// @brief WMO weather interpretation code → short English text ("unknown" if missing, "code N" if unmapped).
std::string wmo_description(const std::optional<int>& code);

/**
 * @brief Parse a geocoding response.
 * @return the first result, or nullopt when the result list is empty/missing.
 * @throws NetworkError(bad_response) when the body is not JSON or a hit lacks coordinates.
 */
std::optional<GeoPlace> parse_geocoding(const std::string& body, const std::string& fallback_name);

/// @throws NetworkError(bad_response) when the body is not a JSON object.
CurrentConditions parse_forecast(const std::string& body);

/// @brief Render the reply line for @p units ("metric" | "imperial").
std::string format_weather(const GeoPlace& place, const CurrentConditions& cur, const std::string& units);

/**
 * @class OpenMeteoWeather
 * @brief libcurl-backed WeatherService.
 *
 * Call `curl_global_init()` once at process start before using it (the CLI does).
 */
class OpenMeteoWeather : public WeatherService {
public:
  explicit OpenMeteoWeather(WeatherConfig cfg) : cfg_(std::move(cfg)) {}

  std::string current(const std::string& place) override;

private:
  using Query = std::vector<std::pair<std::string, std::string>>;

  /// @brief GET @p base with URL-escaped @p query; throws NetworkError on any failure or non-2xx.
  std::string http_get(const std::string& base, const Query& query) const;

  WeatherConfig cfg_;
};

} // namespace meshbot
