#include "kisancpp/embeddings.hpp"
#include "kisancpp/errors.hpp"
#include "kisancpp/metric_series.hpp"
#include "kisancpp/sqlite_backend.hpp"
#include "kisancpp/vector_store.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

template <typename Error, typename Fn>
void RequireThrows(Fn&& fn, const std::string& message) {
  try {
    fn();
  } catch (const Error&) {
    return;
  }
  throw std::runtime_error(message);
}

class FailingEmbedder final : public kisancpp::EmbeddingProvider {
 public:
  int dimensions() const override { return 3; }
  bool normalize() const override { return false; }
  std::optional<kisancpp::EmbeddingIdentity> identity() const override { return std::nullopt; }
  std::vector<float> Embed(const std::string&) override { throw std::runtime_error("model offline"); }
};

class ShortEmbedder final : public kisancpp::EmbeddingProvider {
 public:
  int dimensions() const override { return 3; }
  bool normalize() const override { return false; }
  std::optional<kisancpp::EmbeddingIdentity> identity() const override { return std::nullopt; }
  std::vector<float> Embed(const std::string&) override { return {1.0F}; }
};

std::filesystem::path TempDatabasePath(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / ("kisancpp_" + name + "_" + std::to_string(stamp) + ".db");
}

void RemoveDatabase(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(path.string() + "-wal", ec);
  std::filesystem::remove(path.string() + "-shm", ec);
}

void ScenarioPutGetDelete() {
  kisancpp::tests::Log("scenario: put get delete");
  kisancpp::SqliteBackend backend;
  kisancpp::VectorStore store(backend, std::make_shared<kisancpp::HashingEmbedder>());

  const auto id = store.Put("Rice grows in standing water", {1.0F, 0.0F, 0.0F}, {{"category", "crop_info"}},
                            std::string("crop:rice"));
  Require(id == "crop:rice", "explicit id should be kept");
  Require(store.dimensions() == 3, "first put should fix the dimension");

  const auto generated = store.Put("Wheat prefers cool winters", {0.0F, 1.0F, 0.0F});
  Require(generated.size() == 36 && generated[14] == '4', "generated id should be a v4 uuid");
  Require(store.Count() == 2, "count mismatch after puts");

  const auto item = store.Get("crop:rice");
  Require(item.has_value(), "stored item should be readable");
  Require(item->text == "Rice grows in standing water", "text mismatch");
  Require(item->embedding == std::vector<float>({1.0F, 0.0F, 0.0F}), "embedding mismatch");
  Require(item->metadata.at("category") == "crop_info", "metadata mismatch");

  store.Put("Rice needs puddled fields", {0.0F, 0.0F, 1.0F}, {{"category", "cultivation"}}, std::string("crop:rice"));
  Require(store.Count() == 2, "re-put must replace, not add");
  const auto replaced = store.Get("crop:rice");
  Require(replaced.has_value() && replaced->text == "Rice needs puddled fields", "re-put should replace text");
  Require(replaced->metadata.count("category") == 1 && replaced->metadata.at("category") == "cultivation",
          "re-put should replace metadata");

  Require(store.Delete("crop:rice"), "delete of existing id should report true");
  Require(!store.Delete("crop:rice"), "second delete should report false");
  Require(!store.Get("crop:rice").has_value(), "deleted item must be gone");
  Require(store.Count() == 1, "count after delete mismatch");
}

void ScenarioValidation() {
  kisancpp::tests::Log("scenario: validation");
  kisancpp::SqliteBackend backend;
  kisancpp::VectorStore store(backend, std::make_shared<kisancpp::HashingEmbedder>());
  RequireThrows<kisancpp::ValidationError>([&] { store.Put("", {1.0F}); }, "empty text rejected");
  RequireThrows<kisancpp::ValidationError>([&] { store.Put("text", {}); }, "empty embedding rejected");
  RequireThrows<kisancpp::ValidationError>([&] { store.Put("text", {1.0F}, {}, std::string()); },
                                           "empty explicit id rejected");
  store.Put("first", {1.0F, 0.0F});
  RequireThrows<kisancpp::ValidationError>([&] { store.Put("second", {1.0F, 0.0F, 0.0F}); },
                                           "dimension mismatch rejected");
  RequireThrows<kisancpp::ValidationError>([&] { (void)store.Search({1.0F}, {}, 3); },
                                           "query dimension mismatch rejected");
  Require(store.Count() == 1, "rejected puts must not store anything");
}

void ScenarioFilteredSearch() {
  kisancpp::tests::Log("scenario: filtered search");
  kisancpp::SqliteBackend backend;
  kisancpp::VectorStore store(backend, std::make_shared<kisancpp::HashingEmbedder>());
  store.Put("a", {1.0F, 0.0F}, {{"category", "crop_info"}, {"region", "north"}}, std::string("a"));
  store.Put("b", {0.9F, 0.1F}, {{"category", "crop_info"}, {"region", "south"}}, std::string("b"));
  store.Put("c", {1.0F, 0.0F}, {{"category", "government_scheme"}}, std::string("c"));
  store.Put("d", {1.0F, 0.0F}, {{"category", "crop_info"}, {"region", "north"}}, std::string("d"));

  const auto all = store.Search({1.0F, 0.0F}, {}, 10);
  Require(all.size() == 4, "unfiltered search should see every item");
  Require(all[0].item.id == "a" && all[1].item.id == "c" && all[2].item.id == "d",
          "equal scores must keep insertion order");
  Require(all[3].item.id == "b", "lower score ranks last");

  const auto crops = store.Search({1.0F, 0.0F}, {{"category", "crop_info"}}, 10);
  Require(crops.size() == 3, "category filter mismatch");
  for (const auto& result : crops) {
    Require(result.item.metadata.at("category") == "crop_info", "filtered result has wrong category");
  }

  const auto north = store.Search({0.0F, 1.0F}, {{"category", "crop_info"}, {"region", "north"}}, 10);
  Require(north.size() == 2, "conjunctive filter mismatch");

  const auto top_one = store.Search({1.0F, 0.0F}, {{"category", "crop_info"}}, 1);
  Require(top_one.size() == 1 && top_one[0].item.id == "a", "top_k must apply after filtering");

  Require(store.Search({1.0F, 0.0F}, {{"category", "pest_management"}}, 10).empty(), "no match yields empty");
  Require(store.CountMatching({{"category", "crop_info"}}) == 3, "count matching mismatch");
  Require(store.CountMatching({}) == 4, "empty filter counts every item");
}

void ScenarioEmptyStoreAndText() {
  kisancpp::tests::Log("scenario: empty store and text search");
  kisancpp::SqliteBackend backend;
  auto embedder = std::make_shared<kisancpp::HashingEmbedder>(64);
  kisancpp::VectorStore store(backend, embedder);
  Require(store.SearchByText("anything", {}, 5).empty(), "empty store returns nothing");

  store.PutText("Rice cultivation practices in flooded paddies", {{"category", "crop_info"}}, std::string("rice"));
  store.PutText("Government scheme for tractor subsidy", {{"category", "government_scheme"}}, std::string("tractor"));
  const auto results = store.SearchByText("rice cultivation practices", {}, 2);
  Require(results.size() == 2, "text search result size mismatch");
  Require(results[0].item.id == "rice", "closest text should rank first");
  Require(results[0].similarity >= results[1].similarity, "results must be sorted by similarity");
}

void ScenarioProviderErrors() {
  kisancpp::tests::Log("scenario: provider errors");
  kisancpp::SqliteBackend backend;
  kisancpp::VectorStore failing(backend, std::make_shared<FailingEmbedder>());
  RequireThrows<kisancpp::ProviderError>([&] { failing.PutText("text"); }, "provider exception should wrap");
  Require(failing.Count() == 0, "failed embed must not store");

  kisancpp::SqliteBackend other;
  kisancpp::VectorStore short_store(other, std::make_shared<ShortEmbedder>());
  RequireThrows<kisancpp::ProviderError>([&] { (void)short_store.SearchByText("text", {}, 3); },
                                         "wrong-size embedding should be a provider error");

  kisancpp::SqliteBackend third;
  kisancpp::VectorStore no_provider(third, nullptr);
  RequireThrows<kisancpp::ProviderError>([&] { no_provider.PutText("text"); }, "missing provider rejected");
}

void ScenarioReopenRebuildsIndex() {
  kisancpp::tests::Log("scenario: reopen rebuilds index");
  const auto path = TempDatabasePath("vector_store");
  kisancpp::tests::LogKV("db_path", path.string());
  kisancpp::StoreConfig config{};
  config.database_path = path.string();
  try {
    {
      kisancpp::SqliteBackend backend(config);
      kisancpp::VectorStore store(backend, std::make_shared<kisancpp::HashingEmbedder>());
      store.Put("north", {1.0F, 0.0F}, {{"region", "north"}}, std::string("n"));
      store.Put("south", {0.0F, 1.0F}, {{"region", "south"}}, std::string("s"));
    }
    kisancpp::SqliteBackend backend(config);
    kisancpp::VectorStore store(backend, std::make_shared<kisancpp::HashingEmbedder>());
    Require(store.Count() == 2, "reopened store should load items");
    Require(store.dimensions() == 2, "reopened store should infer dimension");
    const auto results = store.Search({0.0F, 1.0F}, {}, 1);
    Require(results.size() == 1 && results[0].item.id == "s", "reopened index should rank");
    Require(results[0].item.metadata.at("region") == "south", "reopened metadata mismatch");
  } catch (...) {
    RemoveDatabase(path);
    throw;
  }
  RemoveDatabase(path);
}

void ScenarioDeadline() {
  kisancpp::tests::Log("scenario: deadline");
  kisancpp::SqliteBackend backend;
  kisancpp::VectorStoreConfig config{};
  config.deadline_check_interval = 1;
  kisancpp::VectorStore store(backend, std::make_shared<kisancpp::HashingEmbedder>(), config);
  for (int i = 0; i < 8; ++i) {
    store.Put("item " + std::to_string(i), {1.0F, static_cast<float>(i)});
  }
  const kisancpp::Deadline expired{kisancpp::Clock::now() - std::chrono::milliseconds(1)};
  RequireThrows<kisancpp::TimeoutError>([&] { (void)store.Search({1.0F, 0.0F}, {}, 3, expired); },
                                        "expired deadline should time out");
  const auto generous = kisancpp::Deadline::After(std::chrono::minutes(1));
  Require(store.Search({1.0F, 0.0F}, {}, 3, generous).size() == 3, "generous deadline should succeed");
}

void ScenarioConcurrentPutAndSearch() {
  kisancpp::tests::Log("scenario: concurrent put and search");
  kisancpp::SqliteBackend backend;
  auto embedder = std::make_shared<kisancpp::HashingEmbedder>(64);
  kisancpp::VectorStore store(backend, embedder);
  kisancpp::MetricSeries series(backend);
  constexpr int kItemsPerWriter = 100;

  std::mutex failure_mutex;
  std::vector<std::string> failures{};
  const auto record_failure = [&](const std::string& message) {
    std::lock_guard<std::mutex> lock(failure_mutex);
    failures.push_back(message);
  };

  std::vector<std::thread> workers{};
  for (int writer = 0; writer < 2; ++writer) {
    workers.emplace_back([&, writer] {
      for (int i = 0; i < kItemsPerWriter; ++i) {
        try {
          const auto id = "doc:" + std::to_string(writer) + ":" + std::to_string(i);
          (void)store.PutText("Irrigation note " + id, {{"writer", std::to_string(writer)}}, id);
        } catch (const std::exception& ex) {
          record_failure(ex.what());
        }
      }
    });
  }
  workers.emplace_back([&] {
    for (int i = 0; i < kItemsPerWriter; ++i) {
      try {
        kisancpp::MetricPoint point{};
        point.metric_id = "weather:rainfall:pune";
        point.timestamp = i;
        point.value = 1.0;
        series.Append(point);
      } catch (const std::exception& ex) {
        record_failure(ex.what());
      }
    }
  });
  workers.emplace_back([&] {
    for (int i = 0; i < 50; ++i) {
      try {
        const auto results = store.SearchByText("irrigation note", {}, 5);
        if (results.size() > 5) {
          record_failure("search returned more than top_k results");
        }
      } catch (const std::exception& ex) {
        record_failure(ex.what());
      }
    }
  });
  for (auto& worker : workers) {
    worker.join();
  }

  if (!failures.empty()) {
    kisancpp::tests::LogError(failures.front());
  }
  Require(failures.empty(), "concurrent writes to different stores must not fail");
  Require(store.Count() == static_cast<std::size_t>(2 * kItemsPerWriter), "every put must be stored");
  Require(store.CountMatching({{"writer", "1"}}) == static_cast<std::size_t>(kItemsPerWriter),
          "metadata rows must follow their items");
  Require(series.Range("weather:rainfall:pune", 0, kItemsPerWriter).size() ==
              static_cast<std::size_t>(kItemsPerWriter),
          "metric appends sharing the backend must be stored");
}

}  // namespace

int main() {
  try {
    kisancpp::tests::Log("vector_store_test: start");
    ScenarioPutGetDelete();
    ScenarioValidation();
    ScenarioFilteredSearch();
    ScenarioEmptyStoreAndText();
    ScenarioProviderErrors();
    ScenarioReopenRebuildsIndex();
    ScenarioDeadline();
    ScenarioConcurrentPutAndSearch();
    kisancpp::tests::Log("vector_store_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    kisancpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
