#include "kisancpp/recommendation_engine.hpp"
#include "kisancpp/identifiers.hpp"
#include "kisancpp/knowledge_ingestor.hpp"
#include "kisancpp/text_extraction.hpp"

#include "../core/parallel.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <functional>
#include <utility>

namespace kisancpp {
namespace {

constexpr int kMaxForecastDays = 366;
constexpr std::size_t kCultivationCropCount = 3;
constexpr std::size_t kCommonPestCount = 3;
constexpr int kPestSearchTopK = 5;
constexpr double kTrendThresholdPct = 3.0;
constexpr std::size_t kTrendWindow = 7;

constexpr double kHeatStressC = 35.0;
constexpr double kFrostRiskC = 10.0;
constexpr double kHeavyRainMm = 50.0;
constexpr double kDryRainMm = 5.0;
constexpr int kDrySpellDays = 7;

std::vector<std::string> SchemeResources() {
  return {
      "Contact your local Krishi Vigyan Kendra for more information",
      "Visit the official PM-KISAN portal at pmkisan.gov.in",
      "Download the Kisan Suvidha mobile app for more government schemes",
  };
}

std::vector<std::string> MarketingTips(std::optional<MarketTrend> trend) {
  if (trend == MarketTrend::kRising) {
    return {
        "Consider phased selling to benefit from potential further price increases.",
        "Monitor daily market rates before selling large quantities.",
        "Explore nearby markets for better price options.",
    };
  }
  if (trend == MarketTrend::kFalling) {
    return {
        "Consider selling soon if storage costs are high.",
        "Explore value-added processing options to increase returns.",
        "Check government procurement programs for minimum support price options.",
    };
  }
  return {
      "Prices are stable. Good time for planned, gradual marketing.",
      "Compare prices across different markets before selling.",
      "Consider quality grading to fetch premium prices.",
  };
}

std::string PriceForecast(MarketTrend trend) {
  const char* range = "±2%";
  if (trend == MarketTrend::kRising) {
    range = "+5 to +10%";
  } else if (trend == MarketTrend::kFalling) {
    range = "-5 to -10%";
  }
  return fmt::format("Based on current trends, prices are expected to change by {} over the next 2 weeks.", range);
}

void FillGeneralPestAdvice(PestManagementReport& report) {
  report.management_methods = {
      "Implement Integrated Pest Management (IPM) practices.",
      "Regularly monitor your fields for early detection of pests.",
      "Use pest-resistant varieties when available.",
      "Maintain field hygiene by removing crop residues and weeds.",
  };
  report.organic_solutions = {
      "Apply neem oil spray for general pest control.",
      "Use beneficial insects like ladybugs for biological control.",
      "Apply compost tea or vermicompost to strengthen plants.",
      "Set up yellow sticky traps to monitor and reduce flying pests.",
  };
  report.chemical_solutions = {
      "Use pesticides as a last resort when other methods fail.",
      "Follow recommended dosage and safety precautions when applying chemicals.",
      "Rotate pesticide classes to prevent resistance development.",
      "Apply pesticides during calm weather to prevent drift.",
  };
  report.preventive_measures = {
      "Implement crop rotation to break pest cycles.",
      "Maintain healthy soil with proper nutrition to strengthen plants.",
      "Use mulch to reduce weed pressure and improve soil health.",
      "Time planting to avoid peak pest pressure periods.",
  };
  report.general_advice = true;
}

// First non-empty extraction across the results, or the fallback sentence.
std::vector<std::string> FirstSection(const std::vector<ScoredKnowledgeItem>& results,
                                      const std::function<std::vector<std::string>(const std::string&)>& extract,
                                      const char* fallback) {
  for (const auto& result : results) {
    auto sentences = extract(result.item.text);
    if (!sentences.empty()) {
      return sentences;
    }
  }
  return {fallback};
}

std::optional<std::string> PercentChange(double current, std::optional<double> baseline) {
  if (!baseline.has_value() || *baseline == 0.0) {
    return std::nullopt;
  }
  return fmt::format("{:+.2f}%", (current - *baseline) / *baseline * 100.0);
}

double Mean(const std::vector<MetricPoint>& points, std::size_t begin, std::size_t end) {
  double sum = 0.0;
  for (std::size_t i = begin; i < end; ++i) {
    sum += points[i].value;
  }
  return sum / static_cast<double>(end - begin);
}

std::string TitleFor(const KnowledgeItem& item) {
  const auto name = item.metadata.find("name");
  if (name != item.metadata.end() && !name->second.empty()) {
    return name->second;
  }
  return DisplayNameFromNodeId(item.id);
}

const std::string& RequireArgument(const ToolArguments& arguments, const std::string& name) {
  const auto it = arguments.find(name);
  if (it == arguments.end() || it->second.empty()) {
    throw ValidationError(name + " is required");
  }
  return it->second;
}

std::string OptionalArgument(const ToolArguments& arguments, const std::string& name, const std::string& fallback) {
  const auto it = arguments.find(name);
  if (it == arguments.end() || it->second.empty()) {
    return fallback;
  }
  return it->second;
}

int IntArgument(const ToolArguments& arguments, const std::string& name, int fallback) {
  const auto it = arguments.find(name);
  if (it == arguments.end() || it->second.empty()) {
    return fallback;
  }
  int value = 0;
  const auto* begin = it->second.data();
  const auto* end = begin + it->second.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end) {
    throw ValidationError(name + " must be an integer, got '" + it->second + "'");
  }
  return value;
}

std::int64_t WallClockMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

std::string ToString(MarketTrend trend) {
  switch (trend) {
    case MarketTrend::kRising:
      return "rising";
    case MarketTrend::kFalling:
      return "falling";
    case MarketTrend::kStable:
      return "stable";
  }
  return "stable";
}

std::string FormatDate(std::int64_t epoch_ms) {
  using namespace std::chrono;
  const year_month_day date{floor<days>(sys_time<milliseconds>(milliseconds(epoch_ms)))};
  return fmt::format("{:04d}-{:02d}-{:02d}", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()));
}

RecommendationEngine::RecommendationEngine(VectorStore& vectors,
                                           RelationshipGraph& graph,
                                           MetricSeries& metrics,
                                           EngineConfig config)
    : vectors_(vectors), graph_(graph), metrics_(metrics), config_(config) {
  if (config_.cultivation_top_k <= 0 || config_.recommendation_limit <= 0 || config_.scheme_top_k <= 0 ||
      config_.knowledge_top_k <= 0) {
    throw ValidationError("EngineConfig top-k limits must be positive");
  }
  if (config_.default_forecast_days <= 0 || config_.default_market_days <= 0) {
    throw ValidationError("EngineConfig default day windows must be positive");
  }
}

WeatherForecastReport RecommendationEngine::WeatherForecast(const std::string& district,
                                                            int days,
                                                            std::int64_t now_ms) const {
  if (Slugify(district).empty()) {
    throw ValidationError("district is required");
  }
  if (days <= 0 || days > kMaxForecastDays) {
    throw ValidationError("days must be within [1, " + std::to_string(kMaxForecastDays) + "]");
  }

  constexpr std::array<WeatherMetric, 5> kMetrics = {
      WeatherMetric::kHighTemperature, WeatherMetric::kLowTemperature, WeatherMetric::kRainfall,
      WeatherMetric::kHumidity,        WeatherMetric::kWindSpeed,
  };
  std::vector<std::string> metric_ids{};
  for (const auto metric : kMetrics) {
    metric_ids.push_back(WeatherMetricId(metric, district));
  }
  const auto window_end = now_ms + static_cast<std::int64_t>(days) * kMillisPerDay - 1;
  const auto series = metrics_.MultiRange(metric_ids, now_ms, window_end);

  // values[metric][day]; the first point inside a day wins.
  std::array<std::vector<std::optional<double>>, 5> values{};
  for (std::size_t m = 0; m < kMetrics.size(); ++m) {
    values[m].assign(static_cast<std::size_t>(days), std::nullopt);
    for (const auto& point : series.at(metric_ids[m])) {
      const auto day = static_cast<std::size_t>((point.timestamp - now_ms) / kMillisPerDay);
      if (day < values[m].size() && !values[m][day].has_value()) {
        values[m][day] = point.value;
      }
    }
  }

  WeatherForecastReport report{};
  report.district = district;
  std::size_t defaulted_days = 0;
  std::size_t rainy_days = 0;
  double temperature_sum = 0.0;
  for (std::size_t i = 0; i < static_cast<std::size_t>(days); ++i) {
    DayForecast day{};
    day.timestamp = now_ms + static_cast<std::int64_t>(i) * kMillisPerDay;
    day.date = FormatDate(day.timestamp);
    const std::array<double*, 5> fields = {&day.high_c, &day.low_c, &day.rainfall_mm, &day.humidity_pct,
                                           &day.wind_speed_kmh};
    for (std::size_t m = 0; m < fields.size(); ++m) {
      if (values[m][i].has_value()) {
        *fields[m] = *values[m][i];
      } else {
        day.defaulted = true;
      }
    }
    defaulted_days += day.defaulted ? 1 : 0;
    rainy_days += day.rainfall_mm > 0.0 ? 1 : 0;
    report.total_rainfall_mm += day.rainfall_mm;
    temperature_sum += day.high_c + day.low_c;
    if (i == 0) {
      report.temperature.min = std::min(day.high_c, day.low_c);
      report.temperature.max = std::max(day.high_c, day.low_c);
    } else {
      report.temperature.min = std::min({report.temperature.min, day.high_c, day.low_c});
      report.temperature.max = std::max({report.temperature.max, day.high_c, day.low_c});
    }
    report.days.push_back(std::move(day));
  }
  report.temperature.avg = temperature_sum / (2.0 * static_cast<double>(days));
  report.rain_probability = static_cast<double>(rainy_days) / static_cast<double>(days);

  if (report.temperature.max > kHeatStressC) {
    report.advisories.emplace_back("High temperatures may cause heat stress in crops. Consider additional irrigation.");
  } else if (report.temperature.min < kFrostRiskC) {
    report.advisories.emplace_back("Low temperatures may affect sensitive crops. Monitor for frost damage.");
  } else {
    report.advisories.emplace_back("Temperature conditions are favorable for most crops.");
  }
  if (report.total_rainfall_mm > kHeavyRainMm) {
    report.advisories.emplace_back("Heavy rainfall expected. Ensure proper drainage in fields.");
  } else if (report.total_rainfall_mm < kDryRainMm && days >= kDrySpellDays) {
    report.advisories.emplace_back("Dry conditions expected. Plan for irrigation if available.");
  } else if (report.total_rainfall_mm > 0.0) {
    report.advisories.emplace_back("Moderate rainfall expected. Good conditions for most crops.");
  }

  if (defaulted_days > 0) {
    spdlog::warn("weather forecast for {} used defaults on {} of {} days", district, defaulted_days, days);
  }
  return report;
}

CropRecommendationReport RecommendationEngine::CropRecommendations(const std::string& district,
                                                                   const std::string& soil_type,
                                                                   const std::string& season) const {
  if (Slugify(district).empty()) {
    throw ValidationError("district is required");
  }

  CropRecommendationReport report{};
  report.district = district;
  report.soil_type = soil_type;
  report.season = season;
  auto ranked = graph_.GetRecommendedCrops(district, soil_type, season);
  report.insufficient_data = !ranked.empty() && ranked.front().is_default;

  const auto top = std::min(ranked.size(), kCultivationCropCount);
  std::vector<std::vector<std::string>> practices(top);
  const Metadata filter{{"category", kCategoryCropInfo}};
  core::ParallelFor(top, kCultivationCropCount, [&](std::size_t i) {
    for (auto& hit :
         vectors_.SearchByText("cultivation practices for " + ranked[i].crop_name, filter, config_.cultivation_top_k)) {
      practices[i].push_back(std::move(hit.item.text));
    }
  });
  for (std::size_t i = 0; i < top; ++i) {
    report.cultivation_practices[ranked[i].crop_id] = std::move(practices[i]);
  }

  if (ranked.size() > static_cast<std::size_t>(config_.recommendation_limit)) {
    ranked.resize(static_cast<std::size_t>(config_.recommendation_limit));
  }
  report.recommendations = std::move(ranked);
  return report;
}

MarketAnalysis RecommendationEngine::MarketPrices(const std::string& crop,
                                                  int days,
                                                  const std::string& market_area,
                                                  std::int64_t now_ms) const {
  if (Slugify(crop).empty()) {
    throw ValidationError("crop is required");
  }
  if (days <= 0) {
    throw ValidationError("days must be positive");
  }

  MarketAnalysis analysis{};
  analysis.crop = crop;
  analysis.market_area = market_area.empty() ? std::string("all") : market_area;
  const auto metric_id = MarketPriceMetricId(crop, std::string_view(analysis.market_area));
  auto points = metrics_.Range(metric_id, now_ms - static_cast<std::int64_t>(days) * kMillisPerDay, now_ms);
  analysis.points_considered = points.size();
  if (points.empty()) {
    spdlog::warn("no price data for {} in the last {} days", metric_id, days);
    return analysis;
  }

  std::reverse(points.begin(), points.end());
  const double current = points.front().value;
  analysis.current_price = current;

  auto baseline_at = [&](std::int64_t cutoff) -> std::optional<double> {
    const auto it = std::find_if(points.begin(), points.end(),
                                 [cutoff](const MetricPoint& point) { return point.timestamp <= cutoff; });
    if (it == points.end()) {
      return std::nullopt;
    }
    return it->value;
  };
  analysis.weekly_change = PercentChange(current, baseline_at(now_ms - 7 * kMillisPerDay));
  analysis.monthly_change = PercentChange(current, baseline_at(now_ms - 30 * kMillisPerDay));

  if (points.size() >= kTrendWindow) {
    const double recent = Mean(points, 0, kTrendWindow);
    const double older = Mean(points, points.size() - kTrendWindow, points.size());
    const double change_pct = older != 0.0 ? (recent - older) / older * 100.0 : 0.0;
    if (change_pct > kTrendThresholdPct) {
      analysis.trend = MarketTrend::kRising;
    } else if (change_pct < -kTrendThresholdPct) {
      analysis.trend = MarketTrend::kFalling;
    } else {
      analysis.trend = MarketTrend::kStable;
    }
    analysis.price_forecast = PriceForecast(*analysis.trend);
  }
  analysis.marketing_tips = MarketingTips(analysis.trend);
  return analysis;
}

SchemeLookup RecommendationEngine::GovernmentSchemes(const std::string& farmer_type,
                                                     const std::string& crop_type,
                                                     const std::string& state) const {
  SchemeLookup lookup{};
  lookup.query = "government scheme";
  if (!farmer_type.empty() && farmer_type != "all") {
    lookup.query += " for " + farmer_type + " farmers";
  }
  if (!crop_type.empty() && crop_type != "all") {
    lookup.query += " growing " + crop_type;
  }
  if (!state.empty() && state != "all") {
    lookup.query += " in " + state;
  }

  const auto results =
      vectors_.SearchByText(lookup.query, {{"category", kCategoryGovernmentScheme}}, config_.scheme_top_k);
  for (const auto& result : results) {
    const auto& body = result.item.text;
    lookup.schemes.push_back(SchemeSummary{
        result.item.id,
        text::ExtractSchemeName(body),
        text::ExtractSchemeDescription(body),
        text::ExtractSchemeEligibility(body),
        text::ExtractSchemeBenefits(body),
        text::ExtractSchemeApplication(body),
        result.similarity,
    });
  }
  lookup.additional_resources = SchemeResources();
  return lookup;
}

PestManagementReport RecommendationEngine::PestManagement(const std::string& crop,
                                                          const std::optional<std::string>& pest) const {
  if (Slugify(crop).empty()) {
    throw ValidationError("crop is required");
  }
  PestManagementReport report{};
  report.crop = crop;
  const auto crop_id = MakeNodeId(EntityType::kCrop, crop);
  const auto crop_pests = graph_.Traverse(crop_id, RelationshipType::kAffectedBy, false);

  if (pest.has_value() && !Slugify(*pest).empty()) {
    report.pest = *pest;
    const auto pest_id = MakeNodeId(EntityType::kPest, *pest);
    const bool affects_crop = std::find(crop_pests.begin(), crop_pests.end(), pest_id) != crop_pests.end();
    if (affects_crop) {
      const auto results =
          vectors_.SearchByText("pest management for " + *pest + " in " + crop, {}, kPestSearchTopK);
      if (!results.empty()) {
        report.management_methods = text::ExtractManagementMethods(results.front().item.text);
        if (report.management_methods.empty()) {
          report.management_methods = {"No specific management methods found."};
        }
        report.organic_solutions =
            FirstSection(results, text::ExtractOrganicSolutions, "No specific organic solutions found.");
        report.chemical_solutions =
            FirstSection(results, text::ExtractChemicalSolutions, "No specific chemical solutions found.");
        report.preventive_measures =
            FirstSection(results, text::ExtractPreventiveMeasures, "No specific preventive measures found.");
        return report;
      }
    }
    spdlog::debug("no pest guidance for {} on {}; using general advice", pest_id, crop_id);
    FillGeneralPestAdvice(report);
    return report;
  }

  report.pest = "general";
  for (std::size_t i = 0; i < crop_pests.size() && i < kCommonPestCount; ++i) {
    const auto details = vectors_.Get(crop_pests[i]);
    if (!details.has_value()) {
      continue;
    }
    auto methods = text::ExtractManagementMethods(details->text);
    if (methods.empty()) {
      methods = {"No specific management methods found."};
    }
    report.common_pests.push_back(PestAdvice{DisplayNameFromNodeId(crop_pests[i]), std::move(methods)});
  }
  FillGeneralPestAdvice(report);
  return report;
}

KnowledgeSearchReport RecommendationEngine::SearchKnowledge(const std::string& query,
                                                            const std::string& category) const {
  if (query.empty()) {
    throw ValidationError("query is required");
  }
  KnowledgeSearchReport report{};
  report.query = query;
  report.category = category.empty() ? std::string("all") : category;

  std::vector<ScoredKnowledgeItem> results{};
  if (report.category != "all") {
    results = vectors_.SearchByText(query, {{"category", report.category}}, config_.knowledge_top_k);
    report.category_fallback = results.empty();
  }
  if (report.category == "all" || report.category_fallback) {
    results = vectors_.SearchByText(query, {}, config_.knowledge_top_k);
  }

  for (auto& result : results) {
    const auto category_it = result.item.metadata.find("category");
    report.results.push_back(KnowledgeHit{
        result.item.id,
        TitleFor(result.item),
        std::move(result.item.text),
        category_it != result.item.metadata.end() ? category_it->second : std::string("unknown"),
        result.similarity,
    });
  }
  return report;
}

CropInformationReport RecommendationEngine::CropInformation(const std::string& crop_name) const {
  if (Slugify(crop_name).empty()) {
    throw ValidationError("crop is required");
  }
  CropInformationReport report{};
  report.crop_id = MakeNodeId(EntityType::kCrop, crop_name);
  report.crop_name = crop_name;
  report.relationships = graph_.GetEntityWithRelationships(report.crop_id);
  for (auto& hit : vectors_.SearchByText(crop_name, {{"category", kCategoryCropInfo}}, config_.cultivation_top_k)) {
    report.details.push_back(std::move(hit.item.text));
  }
  return report;
}

std::vector<std::string> RecommendationEngine::ToolNames() {
  return {
      "get_weather_forecast",  "get_crop_recommendations", "get_market_prices",
      "check_government_schemes", "get_pest_management",   "search_agricultural_knowledge",
      "get_crop_information",
  };
}

ToolResult RecommendationEngine::Invoke(const std::string& tool_name,
                                        const ToolArguments& arguments,
                                        const SessionContext& context) const {
  ToolResult result{};
  result.tool_name = tool_name;
  const auto now_ms = context.now_ms > 0 ? context.now_ms : WallClockMillis();
  spdlog::debug("session={} language={} tool={}", context.session_id, context.language, tool_name);

  try {
    if (tool_name == "get_weather_forecast") {
      result.payload = WeatherForecast(RequireArgument(arguments, "district"),
                                       IntArgument(arguments, "days", config_.default_forecast_days), now_ms);
    } else if (tool_name == "get_crop_recommendations") {
      result.payload = CropRecommendations(RequireArgument(arguments, "district"),
                                           OptionalArgument(arguments, "soil_type", "medium"),
                                           OptionalArgument(arguments, "season", "current"));
    } else if (tool_name == "get_market_prices") {
      result.payload = MarketPrices(RequireArgument(arguments, "crop"),
                                    IntArgument(arguments, "days", config_.default_market_days),
                                    OptionalArgument(arguments, "market_area", "all"), now_ms);
    } else if (tool_name == "check_government_schemes") {
      result.payload = GovernmentSchemes(OptionalArgument(arguments, "farmer_type", "all"),
                                         OptionalArgument(arguments, "crop_type", "all"),
                                         OptionalArgument(arguments, "state", "all"));
    } else if (tool_name == "get_pest_management") {
      std::optional<std::string> pest{};
      if (const auto it = arguments.find("pest"); it != arguments.end() && !it->second.empty()) {
        pest = it->second;
      }
      result.payload = PestManagement(RequireArgument(arguments, "crop"), pest);
    } else if (tool_name == "search_agricultural_knowledge") {
      result.payload = SearchKnowledge(RequireArgument(arguments, "query"),
                                       OptionalArgument(arguments, "category", "all"));
    } else if (tool_name == "get_crop_information") {
      result.payload = CropInformation(RequireArgument(arguments, "crop"));
    } else {
      throw ValidationError("unknown tool '" + tool_name + "'");
    }
  } catch (const KisanError& ex) {
    spdlog::error("tool {} failed for session {}: [{}] {}", tool_name, context.session_id, ToString(ex.code()),
                  ex.what());
    result.payload = std::monostate{};
    result.error = ToolError{ex.code(), ex.what()};
  } catch (const std::exception& ex) {
    spdlog::error("tool {} failed for session {}: {}", tool_name, context.session_id, ex.what());
    result.payload = std::monostate{};
    result.error = ToolError{ErrorCode::kProvider, ex.what()};
  }
  return result;
}

}  // namespace kisancpp
