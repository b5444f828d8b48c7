#include "kisancpp/knowledge_ingestor.hpp"
#include "kisancpp/errors.hpp"
#include "kisancpp/identifiers.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <string>
#include <string_view>
#include <utility>

namespace kisancpp {
namespace {

constexpr std::int64_t kFeedStalenessMs = kMillisPerDay;

std::string Join(const std::vector<std::string>& values, const char* separator = ", ") {
  std::string out{};
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += values[i];
  }
  return out;
}

void AppendSection(std::string& text, const char* header, const std::string& body) {
  if (body.empty()) {
    return;
  }
  text += "\n\n";
  text += header;
  text += ": ";
  text += body;
}

std::string CropDocumentText(const CropProfile& profile) {
  std::string text = profile.name;
  if (!profile.scientific_name.empty()) {
    text += " (" + profile.scientific_name + ")";
  }
  AppendSection(text, "Description", profile.description);
  AppendSection(text, "Growing Seasons", Join(profile.growing_seasons));
  AppendSection(text, "Suitable Regions", Join(profile.suitable_regions));
  AppendSection(text, "Water Requirements", profile.water_requirements);
  AppendSection(text, "Temperature Range", profile.temperature_range);
  AppendSection(text, "Soil Types", Join(profile.soil_types));
  AppendSection(text, "Growth Duration", profile.growth_duration);
  AppendSection(text, "Common Varieties", Join(profile.varieties));
  AppendSection(text, "Common Pests", Join(profile.common_pests));
  AppendSection(text, "Common Diseases", Join(profile.common_diseases));
  return text;
}

std::string SchemeDocumentText(const SchemeDocument& scheme) {
  std::string text = scheme.name;
  AppendSection(text, "Description", scheme.description);
  AppendSection(text, "Eligibility", scheme.eligibility);
  AppendSection(text, "Benefits", scheme.benefits);
  AppendSection(text, "How to Apply", scheme.application_process);
  AppendSection(text, "Deadlines", scheme.deadlines);
  AppendSection(text, "States", Join(scheme.states));
  return text;
}

}  // namespace

KnowledgeIngestor::KnowledgeIngestor(VectorStore& vectors, RelationshipGraph& graph, MetricSeries& metrics)
    : vectors_(vectors), graph_(graph), metrics_(metrics) {}

IngestSummary KnowledgeIngestor::IngestWeatherForecast(const std::string& district,
                                                       const std::vector<DailyWeather>& days,
                                                       const std::string& source,
                                                       std::int64_t now_ms) {
  if (Slugify(district).empty()) {
    throw ValidationError("IngestWeatherForecast district must be non-empty");
  }

  struct WeatherSeries {
    WeatherMetric metric;
    const char* unit;
    double DailyWeather::*field;
  };
  constexpr std::array<WeatherSeries, 5> kSeries = {{
      {WeatherMetric::kHighTemperature, "celsius", &DailyWeather::high_c},
      {WeatherMetric::kLowTemperature, "celsius", &DailyWeather::low_c},
      {WeatherMetric::kRainfall, "mm", &DailyWeather::rainfall_mm},
      {WeatherMetric::kHumidity, "percent", &DailyWeather::humidity_pct},
      {WeatherMetric::kWindSpeed, "km/h", &DailyWeather::wind_speed_kmh},
  }};

  IngestSummary summary{};
  const Metadata location{{"district", district}};
  // One batch per series; the five series are independent writes.
  for (const auto& series : kSeries) {
    const auto metric_id = WeatherMetricId(series.metric, district);
    std::vector<MetricPoint> points{};
    points.reserve(days.size());
    for (std::size_t i = 0; i < days.size(); ++i) {
      MetricPoint point{};
      point.metric_id = metric_id;
      point.timestamp = now_ms + static_cast<std::int64_t>(i) * kMillisPerDay;
      point.value = days[i].*(series.field);
      point.location = location;
      point.source = source;
      point.unit = series.unit;
      points.push_back(std::move(point));
    }
    metrics_.AppendBatch(points);
    summary.points += points.size();
  }
  spdlog::info("ingested {}-day weather forecast for {} ({} points)", days.size(), district, summary.points);
  return summary;
}

IngestSummary KnowledgeIngestor::IngestMarketPrices(const std::string& crop,
                                                    const std::optional<std::string>& market,
                                                    const std::vector<PriceObservation>& prices,
                                                    const std::string& source) {
  if (Slugify(crop).empty()) {
    throw ValidationError("IngestMarketPrices crop must be non-empty");
  }
  std::optional<std::string_view> market_view{};
  if (market.has_value()) {
    market_view = *market;
  }
  const auto metric_id = MarketPriceMetricId(crop, market_view);

  std::vector<MetricPoint> points{};
  points.reserve(prices.size());
  for (const auto& observation : prices) {
    MetricPoint point{};
    point.metric_id = metric_id;
    point.timestamp = observation.timestamp;
    point.value = observation.price;
    point.source = source;
    point.unit = "INR/quintal";
    point.metadata = Metadata{{"crop", crop}, {"market", market.value_or("all")}};
    points.push_back(std::move(point));
  }
  metrics_.AppendBatch(points);
  spdlog::info("ingested {} price points for {}", points.size(), metric_id);

  IngestSummary summary{};
  summary.points = points.size();
  return summary;
}

std::string KnowledgeIngestor::IngestDocument(const std::string& text,
                                              const Metadata& metadata,
                                              const std::optional<std::string>& id) {
  return vectors_.PutText(text, metadata, id);
}

IngestSummary KnowledgeIngestor::IngestCropProfile(const CropProfile& profile) {
  if (Slugify(profile.name).empty()) {
    throw ValidationError("IngestCropProfile crop name must be non-empty");
  }

  IngestSummary summary{};
  Properties crop_properties{};
  if (!profile.scientific_name.empty()) {
    crop_properties["scientific_name"] = profile.scientific_name;
  }
  if (!profile.growth_duration.empty()) {
    crop_properties["growth_duration"] = profile.growth_duration;
  }
  const auto crop_id = graph_.CreateNode(EntityType::kCrop, profile.name, crop_properties, 1.0, "crop_profile");
  ++summary.nodes;

  auto link = [&](EntityType type, const std::string& name, auto&& connect) {
    const auto node_id = graph_.CreateNode(type, name, {}, 1.0, "crop_profile");
    ++summary.nodes;
    connect(node_id);
  };
  auto edge = [&](const std::string& from, RelationshipType type, const std::string& to) {
    graph_.CreateEdge(from, type, to, {}, 1.0, "crop_profile");
    ++summary.edges;
  };

  for (const auto& season : profile.growing_seasons) {
    link(EntityType::kSeason, season,
         [&](const std::string& season_id) { edge(crop_id, RelationshipType::kGrownDuring, season_id); });
  }
  for (const auto& region : profile.suitable_regions) {
    link(EntityType::kLocation, region, [&](const std::string& region_id) {
      edge(crop_id, RelationshipType::kGrowsIn, region_id);
      edge(region_id, RelationshipType::kSuitableFor, crop_id);
    });
  }
  for (const auto& soil : profile.soil_types) {
    link(EntityType::kSoil, soil,
         [&](const std::string& soil_id) { edge(soil_id, RelationshipType::kSuitableFor, crop_id); });
  }
  for (const auto& pest : profile.common_pests) {
    link(EntityType::kPest, pest,
         [&](const std::string& pest_id) { edge(crop_id, RelationshipType::kAffectedBy, pest_id); });
  }
  for (const auto& disease : profile.common_diseases) {
    link(EntityType::kDisease, disease, [&](const std::string& disease_id) {
      edge(crop_id, RelationshipType::kSusceptibleTo, disease_id);
      const auto treatments = profile.disease_treatments.find(disease);
      if (treatments == profile.disease_treatments.end()) {
        return;
      }
      for (const auto& treatment : treatments->second) {
        link(EntityType::kTreatment, treatment,
             [&](const std::string& treatment_id) { edge(disease_id, RelationshipType::kTreatedWith, treatment_id); });
      }
    });
  }

  Metadata metadata{{"category", kCategoryCropInfo}, {"name", profile.name}};
  if (!profile.scientific_name.empty()) {
    metadata["scientific_name"] = profile.scientific_name;
  }
  (void)vectors_.PutText(CropDocumentText(profile), metadata, crop_id);
  ++summary.documents;

  spdlog::info("ingested crop profile {} ({} nodes, {} edges)", crop_id, summary.nodes, summary.edges);
  return summary;
}

IngestSummary KnowledgeIngestor::IngestGovernmentScheme(const SchemeDocument& scheme) {
  const auto slug = Slugify(scheme.name);
  if (slug.empty()) {
    throw ValidationError("IngestGovernmentScheme scheme name must be non-empty");
  }
  Metadata metadata{{"category", kCategoryGovernmentScheme}, {"name", scheme.name}};
  if (!scheme.states.empty()) {
    metadata["states"] = Join(scheme.states);
  }
  if (!scheme.relevant_crops.empty()) {
    metadata["crops"] = Join(scheme.relevant_crops);
  }
  (void)vectors_.PutText(SchemeDocumentText(scheme), metadata, "scheme:" + slug);

  IngestSummary summary{};
  summary.documents = 1;
  spdlog::info("ingested government scheme scheme:{}", slug);
  return summary;
}

std::vector<std::string> KnowledgeIngestor::CheckDataFreshness(std::int64_t now_ms) const {
  std::vector<std::string> stale{};
  const auto weather = metrics_.Freshness("weather:");
  if (!weather.has_value() || now_ms - *weather > kFeedStalenessMs) {
    stale.emplace_back("weather");
  }
  const auto market = metrics_.Freshness("market:");
  if (!market.has_value() || now_ms - *market > kFeedStalenessMs) {
    stale.emplace_back("market");
  }
  if (vectors_.CountMatching({{"category", kCategoryGovernmentScheme}}) == 0) {
    stale.emplace_back("gov-schemes");
  }
  if (!stale.empty()) {
    spdlog::warn("stale data sources: {}", Join(stale));
  }
  return stale;
}

}  // namespace kisancpp
