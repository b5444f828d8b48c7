#include "kisancpp/config.hpp"
#include "kisancpp/errors.hpp"
#include "kisancpp/types.hpp"

#include "../test_logger.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void ClearEnvironment() {
  ::unsetenv("KISANCPP_DB_PATH");
  ::unsetenv("KISANCPP_EMBED_DIMS");
  ::unsetenv("KISANCPP_LOG_LEVEL");
  ::unsetenv("KISANCPP_EDGE_INDEX");
}

void ScenarioDefaults() {
  kisancpp::tests::Log("scenario: defaults");
  const kisancpp::KisanConfig config;
  Require(config.store.database_path == ":memory:", "default database path mismatch");
  Require(config.embedding_dimensions == 384, "default embedding dimension mismatch");
  Require(config.graph.edge_index_mode == kisancpp::EdgeIndexMode::kSecondaryIndex, "default edge mode mismatch");
  Require(config.engine.knowledge_top_k == 3, "default knowledge top_k mismatch");
  Require(config.engine.default_forecast_days == 7, "default forecast window mismatch");
  Require(config.retention.market_ttl_ms > config.retention.weather_ttl_ms, "market retention should be longer");
  kisancpp::ValidateConfig(config);
}

void ScenarioEnvironmentOverlay() {
  kisancpp::tests::Log("scenario: environment overlay");
  ClearEnvironment();
  ::setenv("KISANCPP_DB_PATH", "/tmp/kisancpp-smoke.db", 1);
  ::setenv("KISANCPP_EMBED_DIMS", "128", 1);
  ::setenv("KISANCPP_LOG_LEVEL", "debug", 1);
  ::setenv("KISANCPP_EDGE_INDEX", "dual", 1);
  const auto config = kisancpp::LoadConfigFromEnvironment();
  Require(config.store.database_path == "/tmp/kisancpp-smoke.db", "db path not loaded");
  Require(config.embedding_dimensions == 128, "embedding dims not loaded");
  Require(config.log_level == "debug", "log level not loaded");
  Require(config.graph.edge_index_mode == kisancpp::EdgeIndexMode::kDualWrite, "edge mode not loaded");
  ClearEnvironment();
}

void ScenarioMalformedValues() {
  kisancpp::tests::Log("scenario: malformed values");
  auto expect_validation = [](const char* name, const char* value) {
    ClearEnvironment();
    ::setenv(name, value, 1);
    bool threw = false;
    try {
      (void)kisancpp::LoadConfigFromEnvironment();
    } catch (const kisancpp::ValidationError& ex) {
      threw = true;
      kisancpp::tests::LogKV("rejected", ex.what());
    }
    ClearEnvironment();
    Require(threw, std::string(name) + "=" + value + " should be rejected");
  };
  expect_validation("KISANCPP_EMBED_DIMS", "abc");
  expect_validation("KISANCPP_EMBED_DIMS", "-4");
  expect_validation("KISANCPP_EDGE_INDEX", "both");
  expect_validation("KISANCPP_LOG_LEVEL", "chatty");

  kisancpp::KisanConfig config;
  config.engine.scheme_top_k = 0;
  bool threw = false;
  try {
    kisancpp::ValidateConfig(config);
  } catch (const kisancpp::ValidationError&) {
    threw = true;
  }
  Require(threw, "non-positive scheme_top_k should be rejected");
}

void ScenarioConfigureLogging() {
  kisancpp::tests::Log("scenario: configure logging");
  kisancpp::ConfigureLogging("WARNING");
  Require(spdlog::get_level() == spdlog::level::warn, "level names are case-insensitive");
  kisancpp::ConfigureLogging("error");
  Require(spdlog::get_level() == spdlog::level::err, "error level mismatch");
  kisancpp::ConfigureLogging("off");
  Require(spdlog::get_level() == spdlog::level::off, "off must be accepted");
  kisancpp::ConfigureLogging("info");
  Require(spdlog::get_level() == spdlog::level::info, "info level mismatch");
  bool threw = false;
  try {
    kisancpp::ConfigureLogging("loud");
  } catch (const kisancpp::ValidationError&) {
    threw = true;
  }
  Require(threw, "unknown log level should be rejected");
}

}  // namespace

int main() {
  try {
    kisancpp::tests::Log("smoke_test: start");
    ScenarioDefaults();
    ScenarioEnvironmentOverlay();
    ScenarioMalformedValues();
    ScenarioConfigureLogging();
    kisancpp::tests::Log("smoke_test: finished");
    std::cout << "kisancpp smoke test passed\n";
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    kisancpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
