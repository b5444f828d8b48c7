#include "kisancpp/config.hpp"
#include "kisancpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace kisancpp {
namespace {

std::string Lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::optional<std::string> ReadEnv(const char* name) {
  const char* env = std::getenv(name);
  if (env == nullptr || *env == '\0') {
    return std::nullopt;
  }
  return std::string(env);
}

int ParsePositiveInt(const std::string& name, const std::string& value) {
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::exception&) {
    throw ValidationError(name + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size() || parsed <= 0) {
    throw ValidationError(name + " must be a positive integer, got '" + value + "'");
  }
  return parsed;
}

// spdlog maps unknown names to off, so only an explicit "off" may yield it.
std::optional<spdlog::level::level_enum> ParseLevel(const std::string& level) {
  const auto lowered = Lowercase(level);
  const auto parsed = spdlog::level::from_str(lowered);
  if (parsed == spdlog::level::off && lowered != "off") {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

KisanConfig LoadConfigFromEnvironment(KisanConfig base) {
  if (const auto path = ReadEnv("KISANCPP_DB_PATH")) {
    base.store.database_path = *path;
  }
  if (const auto dims = ReadEnv("KISANCPP_EMBED_DIMS")) {
    base.embedding_dimensions = ParsePositiveInt("KISANCPP_EMBED_DIMS", *dims);
  }
  if (const auto level = ReadEnv("KISANCPP_LOG_LEVEL")) {
    base.log_level = *level;
  }
  if (const auto mode = ReadEnv("KISANCPP_EDGE_INDEX")) {
    const auto lowered = Lowercase(*mode);
    if (lowered == "index") {
      base.graph.edge_index_mode = EdgeIndexMode::kSecondaryIndex;
    } else if (lowered == "dual") {
      base.graph.edge_index_mode = EdgeIndexMode::kDualWrite;
    } else {
      throw ValidationError("KISANCPP_EDGE_INDEX must be 'index' or 'dual', got '" + *mode + "'");
    }
  }
  ValidateConfig(base);
  return base;
}

void ValidateConfig(const KisanConfig& config) {
  if (config.store.database_path.empty()) {
    throw ValidationError("store.database_path must be non-empty");
  }
  if (config.store.busy_timeout_ms < 0) {
    throw ValidationError("store.busy_timeout_ms must be non-negative");
  }
  if (config.vectors.dimensions < 0) {
    throw ValidationError("vectors.dimensions must be non-negative");
  }
  if (config.vectors.deadline_check_interval <= 0) {
    throw ValidationError("vectors.deadline_check_interval must be positive");
  }
  if (config.embedding_dimensions <= 0) {
    throw ValidationError("embedding_dimensions must be positive");
  }
  if (config.vectors.dimensions > 0 && config.vectors.dimensions != config.embedding_dimensions) {
    throw ValidationError("vectors.dimensions must match embedding_dimensions");
  }
  if (config.retention.weather_ttl_ms <= 0 || config.retention.market_ttl_ms <= 0 ||
      config.retention.default_ttl_ms <= 0) {
    throw ValidationError("retention ttl values must be positive");
  }
  const auto& engine = config.engine;
  if (engine.cultivation_top_k <= 0 || engine.recommendation_limit <= 0 || engine.scheme_top_k <= 0 ||
      engine.knowledge_top_k <= 0) {
    throw ValidationError("engine top_k limits must be positive");
  }
  if (engine.default_forecast_days <= 0 || engine.default_market_days <= 0) {
    throw ValidationError("engine default day windows must be positive");
  }
  if (!ParseLevel(config.log_level).has_value()) {
    throw ValidationError("unknown log level '" + config.log_level + "'");
  }
}

void ConfigureLogging(const std::string& level) {
  const auto parsed = ParseLevel(level);
  if (!parsed.has_value()) {
    throw ValidationError("unknown log level '" + level + "'");
  }
  spdlog::set_level(*parsed);
}

}  // namespace kisancpp
