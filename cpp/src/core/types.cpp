#include "kisancpp/types.hpp"

#include <array>
#include <utility>

namespace kisancpp {
namespace {

constexpr std::array<std::pair<EntityType, const char*>, 9> kEntityTypeNames = {{
    {EntityType::kCrop, "crop"},
    {EntityType::kDisease, "disease"},
    {EntityType::kPest, "pest"},
    {EntityType::kTreatment, "treatment"},
    {EntityType::kWeather, "weather"},
    {EntityType::kLocation, "location"},
    {EntityType::kSeason, "season"},
    {EntityType::kMarketFactor, "market_factor"},
    {EntityType::kSoil, "soil"},
}};

}  // namespace

std::string ToString(EntityType type) {
  for (const auto& [value, name] : kEntityTypeNames) {
    if (value == type) {
      return name;
    }
  }
  return "unknown";
}

std::optional<EntityType> ParseEntityType(const std::string& name) {
  for (const auto& [value, known] : kEntityTypeNames) {
    if (name == known) {
      return value;
    }
  }
  return std::nullopt;
}

std::string ToString(RelationshipType type) {
  switch (type) {
    case RelationshipType::kGrowsIn:
      return "grows_in";
    case RelationshipType::kSusceptibleTo:
      return "susceptible_to";
    case RelationshipType::kAffectedBy:
      return "affected_by";
    case RelationshipType::kTreatedWith:
      return "treated_with";
    case RelationshipType::kGrownDuring:
      return "grown_during";
    case RelationshipType::kPriceAffectedBy:
      return "price_affected_by";
    case RelationshipType::kSuitableFor:
      return "suitable_for";
    case RelationshipType::kTolerantTo:
      return "tolerant_to";
    case RelationshipType::kHasPest:
      return "has_pest";
    case RelationshipType::kPrevents:
      return "prevents";
  }
  return "unknown";
}

std::string ToString(Trend trend) {
  switch (trend) {
    case Trend::kIncreasing:
      return "increasing";
    case Trend::kDecreasing:
      return "decreasing";
    case Trend::kStable:
      return "stable";
  }
  return "stable";
}

}  // namespace kisancpp
