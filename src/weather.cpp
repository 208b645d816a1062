// -----------------------------------------------------------------------------
// weather.cpp - Open-Meteo client behind the WeatherService seam
//
// API & reply format: see include/meshbot/weather.hpp
// Tests (no network): see tests/test_weather.cpp
//
// Failure mapping (every one surfaces as NetworkError, never retried):
//   curl timeout                 -> "timeout"
//   DNS / connect / other curl   -> "connection"
//   HTTP status outside 2xx      -> "http_status"
//   body not the expected JSON   -> "bad_response"
// -----------------------------------------------------------------------------
#include "meshbot/weather.hpp"
#include "meshbot/errors.hpp"
#include "meshbot/json_util.hpp"
#include "meshbot/text_util.hpp"

#include <map>
#include <memory>

#include <curl/curl.h>
#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace meshbot {

static constexpr const char* GEOCODING_URL = "https://geocoding-api.open-meteo.com/v1/search";
static constexpr const char* FORECAST_URL  = "https://api.open-meteo.com/v1/forecast";
static constexpr const char* USER_AGENT    = "meshbot/1.0";

// ---------- WMO codes ----------

std::string wmo_description(const std::optional<int>& code) {
  static const std::map<int, const char*> table = {
    {0, "clear"}, {1, "mostly clear"}, {2, "partly cloudy"}, {3, "overcast"},
    {45, "fog"}, {48, "rime fog / freezing fog"},
    {51, "light drizzle"}, {53, "drizzle"}, {55, "heavy drizzle"},
    {56, "light freezing drizzle"}, {57, "freezing drizzle"},
    {61, "light rain"}, {63, "rain"}, {65, "heavy rain"},
    {66, "light freezing rain"}, {67, "freezing rain"},
    {71, "light snow"}, {73, "snow"}, {75, "heavy snow"}, {77, "snow grains"},
    {80, "light showers"}, {81, "showers"}, {82, "heavy showers"},
    {85, "light snow showers"}, {86, "snow showers"},
    {95, "thunderstorm"}, {96, "thunderstorm with hail"}, {99, "severe thunderstorm with hail"},
  };
  if (!code) return "unknown";
  auto it = table.find(*code);
  if (it == table.end()) return "code " + std::to_string(*code);
  return it->second;
}

// ---------- parsing ----------

std::optional<GeoPlace> parse_geocoding(const std::string& body, const std::string& fallback_name) {
  json root = json::parse(body, nullptr, false);
  if (root.is_discarded() || !root.is_object())
    throw NetworkError(NET_BAD_RESPONSE, "geocoding: body is not a JSON object");

  const json* results = json_find(root, {"results"});
  if (!results || !results->is_array() || results->empty()) return std::nullopt;

  const json& hit = (*results)[0];
  auto lat = json_number(json_find(hit, {"latitude"}));
  auto lon = json_number(json_find(hit, {"longitude"}));
  if (!lat || !lon)
    throw NetworkError(NET_BAD_RESPONSE, "geocoding: result without coordinates");

  GeoPlace p;
  p.latitude  = *lat;
  p.longitude = *lon;
  p.name      = json_string(json_find(hit, {"name"})).value_or(fallback_name);
  p.country   = json_string(json_find(hit, {"country"})).value_or("");
  return p;
}

CurrentConditions parse_forecast(const std::string& body) {
  json root = json::parse(body, nullptr, false);
  if (root.is_discarded() || !root.is_object())
    throw NetworkError(NET_BAD_RESPONSE, "forecast: body is not a JSON object");

  CurrentConditions c;
  const json* cur = json_find(root, {"current"});
  if (!cur || !cur->is_object()) return c;          // no block: every field reads "?"

  c.temperature          = json_number(json_find(*cur, {"temperature_2m"}));
  c.apparent_temperature = json_number(json_find(*cur, {"apparent_temperature"}));
  c.wind_speed           = json_number(json_find(*cur, {"wind_speed_10m"}));
  if (auto code = json_integer(json_find(*cur, {"weather_code"})))
    c.weather_code = static_cast<int>(*code);
  return c;
}

static std::string num_or_unknown(const std::optional<double>& v) {
  return v ? format_number(*v) : "?";
}

std::string format_weather(const GeoPlace& place, const CurrentConditions& cur, const std::string& units) {
  const bool imperial = (units == "imperial");
  const std::string t_unit = imperial ? "\xC2\xB0" "F" : "\xC2\xB0" "C";
  const std::string w_unit = imperial ? "mph" : "km/h";

  std::string out = place.name;
  if (!place.country.empty()) out += ", " + place.country;
  out += ": " + num_or_unknown(cur.temperature) + t_unit;
  out += " (feels like " + num_or_unknown(cur.apparent_temperature) + t_unit + ")";
  out += ", " + wmo_description(cur.weather_code);
  out += ", wind " + num_or_unknown(cur.wind_speed) + " " + w_unit;
  return out;
}

// ---------- HTTP (libcurl) ----------

static size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

static std::string escape(CURL* curl, const std::string& s) {
  char* e = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
  if (!e) throw NetworkError(NET_CONNECTION, "curl_easy_escape failed");
  std::string out(e);
  curl_free(e);
  return out;
}

std::string OpenMeteoWeather::http_get(const std::string& base, const Query& query) const {
  CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) throw NetworkError(NET_CONNECTION, "curl_easy_init failed");

  std::string url = base;
  for (size_t i = 0; i < query.size(); ++i) {
    url += (i == 0 ? "?" : "&");
    url += escape(curl.get(), query[i].first) + "=" + escape(curl.get(), query[i].second);
  }

  std::string body;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, cfg_.timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc == CURLE_OPERATION_TIMEDOUT)
    throw NetworkError(NET_TIMEOUT, curl_easy_strerror(rc));
  if (rc != CURLE_OK)
    throw NetworkError(NET_CONNECTION, curl_easy_strerror(rc));

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300)
    throw NetworkError(NET_HTTP_STATUS, "HTTP " + std::to_string(status) + " from " + base);

  return body;
}

std::string OpenMeteoWeather::current(const std::string& place) {
  const std::string geo_body = http_get(GEOCODING_URL, {
    {"name", place}, {"count", "1"}, {"language", cfg_.lang}, {"format", "json"},
  });
  const auto hit = parse_geocoding(geo_body, place);
  if (!hit) return "Location not found: " + place;

  const bool imperial = (cfg_.units == "imperial");
  const std::string wx_body = http_get(FORECAST_URL, {
    {"latitude", format_number(hit->latitude)},
    {"longitude", format_number(hit->longitude)},
    {"current", "temperature_2m,apparent_temperature,wind_speed_10m,weather_code"},
    {"temperature_unit", imperial ? "fahrenheit" : "celsius"},
    {"wind_speed_unit", imperial ? "mph" : "kmh"},
  });
  return format_weather(*hit, parse_forecast(wx_body), cfg_.units);
}

} // namespace meshbot
