#pragma once

#include "kisancpp/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace kisancpp {

// Lowercase, trimmed, internal whitespace runs collapsed to '_'.
std::string Slugify(std::string_view text);

// "<type>:<slug(name)>"
std::string MakeNodeId(EntityType type, std::string_view name);

// Reverses MakeNodeId for display: strips the type prefix, '_' becomes ' '.
std::string DisplayNameFromNodeId(std::string_view node_id);

enum class WeatherMetric {
  kHighTemperature,
  kLowTemperature,
  kRainfall,
  kHumidity,
  kWindSpeed,
};

std::string WeatherMetricId(WeatherMetric metric, std::string_view district);

// "market:price:<crop>" or "market:price:<crop>:<market>"; "all" means no market suffix.
std::string MarketPriceMetricId(std::string_view crop, std::optional<std::string_view> market_area);

inline constexpr std::string_view kReversePrefix = "reverse:";

std::string ReverseRelationshipType(std::string_view relationship_type);

}  // namespace kisancpp
