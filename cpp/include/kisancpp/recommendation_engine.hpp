#pragma once

#include "kisancpp/errors.hpp"
#include "kisancpp/metric_series.hpp"
#include "kisancpp/relationship_graph.hpp"
#include "kisancpp/types.hpp"
#include "kisancpp/vector_store.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kisancpp {

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

struct DayForecast {
  std::string date;
  std::int64_t timestamp = 0;
  double high_c = 25.0;
  double low_c = 15.0;
  double rainfall_mm = 0.0;
  double humidity_pct = 50.0;
  double wind_speed_kmh = 5.0;
  // True when at least one reading fell back to its default.
  bool defaulted = false;
};

struct TemperatureSummary {
  double min = 0.0;
  double max = 0.0;
  double avg = 0.0;
};

struct WeatherForecastReport {
  std::string district;
  std::vector<DayForecast> days;
  TemperatureSummary temperature;
  double total_rainfall_mm = 0.0;
  double rain_probability = 0.0;
  std::vector<std::string> advisories;
};

struct CropRecommendationReport {
  std::string district;
  std::string soil_type;
  std::string season;
  std::vector<RankedCrop> recommendations;
  // crop id -> supporting cultivation texts
  std::map<std::string, std::vector<std::string>> cultivation_practices;
  // Set when the graph had no match and the default staple list was returned.
  bool insufficient_data = false;
};

enum class MarketTrend {
  kRising,
  kFalling,
  kStable,
};

struct MarketAnalysis {
  std::string crop;
  std::string market_area;
  std::optional<double> current_price;
  std::optional<std::string> weekly_change;
  std::optional<std::string> monthly_change;
  std::optional<MarketTrend> trend;
  std::optional<std::string> price_forecast;
  std::vector<std::string> marketing_tips;
  std::size_t points_considered = 0;
};

struct SchemeSummary {
  std::string id;
  std::string name;
  std::string description;
  std::string eligibility;
  std::string benefits;
  std::string application_process;
  double similarity = 0.0;
};

struct SchemeLookup {
  std::string query;
  std::vector<SchemeSummary> schemes;
  std::vector<std::string> additional_resources;
};

struct PestAdvice {
  std::string pest;
  std::vector<std::string> management_methods;
};

struct PestManagementReport {
  std::string crop;
  std::string pest;
  std::vector<std::string> management_methods;
  std::vector<std::string> organic_solutions;
  std::vector<std::string> chemical_solutions;
  std::vector<std::string> preventive_measures;
  std::vector<PestAdvice> common_pests;
  bool general_advice = false;
};

struct KnowledgeHit {
  std::string id;
  std::string title;
  std::string text;
  std::string category;
  double similarity = 0.0;
};

struct KnowledgeSearchReport {
  std::string query;
  std::string category;
  std::vector<KnowledgeHit> results;
  // The category filter matched nothing and unfiltered results were used.
  bool category_fallback = false;
};

struct CropInformationReport {
  std::string crop_id;
  std::string crop_name;
  EntityWithRelationships relationships;
  std::vector<std::string> details;
};

// ---------------------------------------------------------------------------
// Tool layer
// ---------------------------------------------------------------------------

using ToolArguments = std::map<std::string, std::string>;

// Per-call context supplied by the dialogue layer.
struct SessionContext {
  std::string session_id;
  std::string language = "en";
  std::int64_t now_ms = 0;
};

struct ToolError {
  ErrorCode code = ErrorCode::kValidation;
  std::string message;
};

using ToolPayload = std::variant<std::monostate,
                                 WeatherForecastReport,
                                 CropRecommendationReport,
                                 MarketAnalysis,
                                 SchemeLookup,
                                 PestManagementReport,
                                 KnowledgeSearchReport,
                                 CropInformationReport>;

struct ToolResult {
  std::string tool_name;
  ToolPayload payload;
  std::optional<ToolError> error;

  [[nodiscard]] bool ok() const { return !error.has_value(); }
};

// Stateless composition over the three stores. Time-dependent operations take
// `now_ms` explicitly.
class RecommendationEngine {
 public:
  RecommendationEngine(VectorStore& vectors,
                       RelationshipGraph& graph,
                       MetricSeries& metrics,
                       EngineConfig config = {});

  [[nodiscard]] WeatherForecastReport WeatherForecast(const std::string& district, int days, std::int64_t now_ms) const;
  [[nodiscard]] CropRecommendationReport CropRecommendations(const std::string& district,
                                                             const std::string& soil_type,
                                                             const std::string& season) const;
  [[nodiscard]] MarketAnalysis MarketPrices(const std::string& crop,
                                            int days,
                                            const std::string& market_area,
                                            std::int64_t now_ms) const;
  [[nodiscard]] SchemeLookup GovernmentSchemes(const std::string& farmer_type,
                                               const std::string& crop_type,
                                               const std::string& state) const;
  [[nodiscard]] PestManagementReport PestManagement(const std::string& crop,
                                                    const std::optional<std::string>& pest) const;
  [[nodiscard]] KnowledgeSearchReport SearchKnowledge(const std::string& query, const std::string& category) const;
  [[nodiscard]] CropInformationReport CropInformation(const std::string& crop_name) const;

  // Never throws; failures come back as ToolResult::error.
  ToolResult Invoke(const std::string& tool_name, const ToolArguments& arguments, const SessionContext& context) const;

  [[nodiscard]] static std::vector<std::string> ToolNames();

 private:
  VectorStore& vectors_;
  RelationshipGraph& graph_;
  MetricSeries& metrics_;
  EngineConfig config_;
};

std::string ToString(MarketTrend trend);
// "YYYY-MM-DD" in UTC.
std::string FormatDate(std::int64_t epoch_ms);

}  // namespace kisancpp
