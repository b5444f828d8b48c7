#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kisancpp {

using Metadata = std::unordered_map<std::string, std::string>;
using Properties = Metadata;

using Clock = std::chrono::steady_clock;

// Absent deadline means "no limit".
struct Deadline {
  std::optional<Clock::time_point> at;

  static Deadline After(std::chrono::milliseconds budget) { return Deadline{Clock::now() + budget}; }
  [[nodiscard]] bool Expired() const { return at.has_value() && Clock::now() >= *at; }
};

inline constexpr std::int64_t kMillisPerDay = 24LL * 60LL * 60LL * 1000LL;

// ---------------------------------------------------------------------------
// Vector store
// ---------------------------------------------------------------------------

struct KnowledgeItem {
  std::string id;
  std::string text;
  std::vector<float> embedding;
  Metadata metadata;
};

struct ScoredKnowledgeItem {
  KnowledgeItem item;
  float similarity = 0.0F;
};

// ---------------------------------------------------------------------------
// Relationship graph
// ---------------------------------------------------------------------------

enum class EntityType {
  kCrop,
  kDisease,
  kPest,
  kTreatment,
  kWeather,
  kLocation,
  kSeason,
  kMarketFactor,
  kSoil,
};

enum class RelationshipType {
  kGrowsIn,
  kSusceptibleTo,
  kAffectedBy,
  kTreatedWith,
  kGrownDuring,
  kPriceAffectedBy,
  kSuitableFor,
  kTolerantTo,
  kHasPest,
  kPrevents,
};

struct EntityNode {
  std::string node_id;
  EntityType type = EntityType::kCrop;
  std::string name;
  Properties properties;
  double confidence = 1.0;
  std::string source = "manual";
};

struct RelationshipEdge {
  std::string source_node_id;
  std::string relationship_type;
  std::string target_node_id;
  Properties properties;
  double confidence = 1.0;
  std::string source = "manual";
};

struct RelatedEntitySummary {
  std::string node_id;
  std::string name;
  EntityType type = EntityType::kCrop;
  double confidence = 1.0;
};

struct EntityWithRelationships {
  std::optional<EntityNode> entity;
  std::map<std::string, std::vector<RelatedEntitySummary>> relationships;
};

struct RankedCrop {
  std::string crop_id;
  std::string crop_name;
  double suitability_score = 0.0;
  std::vector<std::string> reasons;
  bool is_default = false;
};

enum class EdgeIndexMode {
  kSecondaryIndex,
  kDualWrite,
};

// ---------------------------------------------------------------------------
// Metric series
// ---------------------------------------------------------------------------

struct MetricPoint {
  std::string metric_id;
  std::int64_t timestamp = 0;
  double value = 0.0;
  std::optional<Metadata> location;
  std::optional<std::string> source;
  std::optional<std::string> unit;
  std::optional<Metadata> metadata;
  std::optional<std::int64_t> expiry;
};

struct Bucket {
  std::int64_t timestamp = 0;
  double min = 0.0;
  double max = 0.0;
  double avg = 0.0;
  std::size_t count = 0;
};

enum class Trend {
  kIncreasing,
  kDecreasing,
  kStable,
};

struct SeriesStatistics {
  double min = 0.0;
  double max = 0.0;
  double avg = 0.0;
  std::size_t count = 0;
  double std_dev = 0.0;
  Trend trend = Trend::kStable;
};

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

struct StoreConfig {
  std::string database_path = ":memory:";
  int busy_timeout_ms = 5000;
};

struct VectorStoreConfig {
  int dimensions = 0;
  int deadline_check_interval = 256;
};

struct GraphConfig {
  EdgeIndexMode edge_index_mode = EdgeIndexMode::kSecondaryIndex;
};

struct RetentionPolicy {
  std::int64_t weather_ttl_ms = 365LL * kMillisPerDay;
  std::int64_t market_ttl_ms = 2LL * 365LL * kMillisPerDay;
  std::int64_t default_ttl_ms = 365LL * kMillisPerDay;
};

struct EngineConfig {
  int cultivation_top_k = 5;
  int recommendation_limit = 5;
  int scheme_top_k = 5;
  int knowledge_top_k = 3;
  int default_forecast_days = 7;
  int default_market_days = 30;
};

struct KisanConfig {
  StoreConfig store{};
  VectorStoreConfig vectors{};
  GraphConfig graph{};
  RetentionPolicy retention{};
  EngineConfig engine{};
  int embedding_dimensions = 384;
  std::string log_level = "info";
};

std::string ToString(EntityType type);
std::optional<EntityType> ParseEntityType(const std::string& name);
std::string ToString(RelationshipType type);
std::string ToString(Trend trend);

}  // namespace kisancpp
