#pragma once

#include "kisancpp/metric_series.hpp"
#include "kisancpp/relationship_graph.hpp"
#include "kisancpp/types.hpp"
#include "kisancpp/vector_store.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kisancpp {

inline constexpr const char* kCategoryCropInfo = "crop_info";
inline constexpr const char* kCategoryGovernmentScheme = "government_scheme";
inline constexpr const char* kCategoryPestManagement = "pest_management";

struct DailyWeather {
  double high_c = 25.0;
  double low_c = 15.0;
  double rainfall_mm = 0.0;
  double humidity_pct = 50.0;
  double wind_speed_kmh = 5.0;
};

struct PriceObservation {
  std::int64_t timestamp = 0;
  double price = 0.0;
};

struct CropProfile {
  std::string name;
  std::string scientific_name;
  std::string description;
  std::vector<std::string> growing_seasons;
  std::vector<std::string> suitable_regions;
  std::vector<std::string> soil_types;
  std::string water_requirements;
  std::string temperature_range;
  std::string growth_duration;
  std::vector<std::string> varieties;
  std::vector<std::string> common_pests;
  std::vector<std::string> common_diseases;
  // disease name -> treatment names
  std::map<std::string, std::vector<std::string>> disease_treatments;
};

struct SchemeDocument {
  std::string name;
  std::string description;
  std::string eligibility;
  std::string benefits;
  std::string application_process;
  std::string deadlines;
  std::vector<std::string> states;
  std::vector<std::string> relevant_crops;
};

struct IngestSummary {
  std::size_t nodes = 0;
  std::size_t edges = 0;
  std::size_t points = 0;
  std::size_t documents = 0;
};

// Writes feed data into the three stores. Multi-store writes are not atomic:
// a failure part way leaves the earlier writes in place.
class KnowledgeIngestor {
 public:
  KnowledgeIngestor(VectorStore& vectors, RelationshipGraph& graph, MetricSeries& metrics);

  // Day i lands at now_ms + i days on each of the five weather series.
  IngestSummary IngestWeatherForecast(const std::string& district,
                                      const std::vector<DailyWeather>& days,
                                      const std::string& source,
                                      std::int64_t now_ms);
  IngestSummary IngestMarketPrices(const std::string& crop,
                                   const std::optional<std::string>& market,
                                   const std::vector<PriceObservation>& prices,
                                   const std::string& source = "market_feed");
  std::string IngestDocument(const std::string& text,
                             const Metadata& metadata,
                             const std::optional<std::string>& id = std::nullopt);
  IngestSummary IngestCropProfile(const CropProfile& profile);
  IngestSummary IngestGovernmentScheme(const SchemeDocument& scheme);

  // Names of feeds that need a refresh: "weather", "market", "gov-schemes".
  [[nodiscard]] std::vector<std::string> CheckDataFreshness(std::int64_t now_ms) const;

 private:
  VectorStore& vectors_;
  RelationshipGraph& graph_;
  MetricSeries& metrics_;
};

}  // namespace kisancpp
