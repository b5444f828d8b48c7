#include "kisancpp/identifiers.hpp"

#include <cctype>
#include <string>

namespace kisancpp {

std::string Slugify(std::string_view text) {
  std::string out{};
  out.reserve(text.size());
  bool pending_separator = false;
  for (const unsigned char ch : text) {
    if (std::isspace(ch) != 0) {
      pending_separator = !out.empty();
      continue;
    }
    if (pending_separator) {
      out.push_back('_');
      pending_separator = false;
    }
    out.push_back(static_cast<char>(std::tolower(ch)));
  }
  return out;
}

std::string MakeNodeId(EntityType type, std::string_view name) {
  return ToString(type) + ":" + Slugify(name);
}

std::string DisplayNameFromNodeId(std::string_view node_id) {
  const auto colon = node_id.find(':');
  std::string out(colon == std::string_view::npos ? node_id : node_id.substr(colon + 1));
  for (auto& ch : out) {
    if (ch == '_') {
      ch = ' ';
    }
  }
  return out;
}

std::string WeatherMetricId(WeatherMetric metric, std::string_view district) {
  const auto slug = Slugify(district);
  switch (metric) {
    case WeatherMetric::kHighTemperature:
      return "weather:temperature:high:" + slug;
    case WeatherMetric::kLowTemperature:
      return "weather:temperature:low:" + slug;
    case WeatherMetric::kRainfall:
      return "weather:rainfall:" + slug;
    case WeatherMetric::kHumidity:
      return "weather:humidity:" + slug;
    case WeatherMetric::kWindSpeed:
      return "weather:wind_speed:" + slug;
  }
  return "weather:unknown:" + slug;
}

std::string MarketPriceMetricId(std::string_view crop, std::optional<std::string_view> market_area) {
  std::string id = "market:price:" + Slugify(crop);
  if (market_area.has_value() && !market_area->empty() && Slugify(*market_area) != "all") {
    id += ":" + Slugify(*market_area);
  }
  return id;
}

std::string ReverseRelationshipType(std::string_view relationship_type) {
  return std::string(kReversePrefix) + std::string(relationship_type);
}

}  // namespace kisancpp
