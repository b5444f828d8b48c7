#include "kisancpp/errors.hpp"
#include "kisancpp/vector_index.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
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

void ScenarioCosineProperties() {
  kisancpp::tests::Log("scenario: cosine properties");
  const std::vector<float> a = {1.0F, 2.0F, 3.0F};
  const std::vector<float> b = {2.0F, 4.0F, 6.0F};
  const std::vector<float> c = {-1.0F, -2.0F, -3.0F};
  const std::vector<float> zero = {0.0F, 0.0F, 0.0F};

  Require(std::fabs(kisancpp::CosineSimilarity(a, b) - 1.0F) < 1e-6F, "parallel vectors should score 1");
  Require(std::fabs(kisancpp::CosineSimilarity(a, c) + 1.0F) < 1e-6F, "opposite vectors should score -1");
  Require(kisancpp::CosineSimilarity(a, b) == kisancpp::CosineSimilarity(b, a), "cosine must be symmetric");
  Require(kisancpp::CosineSimilarity(a, zero) == 0.0F, "zero vector should score 0");
  RequireThrows<kisancpp::ValidationError>([&] { (void)kisancpp::CosineSimilarity(a, {1.0F}); },
                                           "dimension mismatch should throw");
}

void ScenarioOrderingAndTies() {
  kisancpp::tests::Log("scenario: ordering and ties");
  kisancpp::FlatVectorIndex index(2);
  index.Add(7, {1.0F, 0.0F});
  index.Add(3, {1.0F, 0.0F});
  index.Add(5, {0.0F, 1.0F});
  index.Add(9, {0.6F, 0.8F});

  const auto results = index.Search({1.0F, 0.0F}, 10, nullptr, {});
  Require(results.size() == 4, "all vectors should be ranked");
  Require(results[0].first == 3 && results[1].first == 7, "ties must break by ascending key");
  Require(results[2].first == 9, "partial match should rank third");
  Require(results[3].first == 5, "orthogonal vector should rank last");

  const auto top_two = index.Search({1.0F, 0.0F}, 2, nullptr, {});
  Require(top_two.size() == 2, "top_k must bound result size");
  Require(index.Search({1.0F, 0.0F}, 0, nullptr, {}).empty(), "top_k 0 yields nothing");
}

void ScenarioCandidateFilter() {
  kisancpp::tests::Log("scenario: candidate filter");
  kisancpp::FlatVectorIndex index(2);
  index.AddBatch({1, 2, 3}, {{1.0F, 0.0F}, {0.9F, 0.1F}, {0.0F, 1.0F}});
  const kisancpp::CandidateFilter filter = {3};
  const auto results = index.Search({1.0F, 0.0F}, 5, &filter, {});
  Require(results.size() == 1 && results[0].first == 3, "filter must restrict candidates");

  index.Remove(1);
  Require(index.Size() == 2, "remove should shrink index");
  index.Clear();
  Require(index.Size() == 0, "clear should empty index");
}

void ScenarioValidationAndDeadline() {
  kisancpp::tests::Log("scenario: validation and deadline");
  RequireThrows<kisancpp::ValidationError>([] { kisancpp::FlatVectorIndex bad(0); }, "zero dims rejected");
  kisancpp::FlatVectorIndex index(3, 1);
  RequireThrows<kisancpp::ValidationError>([&] { index.Add(1, {1.0F}); }, "wrong add dimension rejected");
  RequireThrows<kisancpp::ValidationError>([&] { index.AddBatch({1, 2}, {{1.0F, 0.0F, 0.0F}}); },
                                           "batch size mismatch rejected");
  index.Add(1, {1.0F, 0.0F, 0.0F});
  RequireThrows<kisancpp::ValidationError>([&] { (void)index.Search({1.0F}, 1, nullptr, {}); },
                                           "wrong query dimension rejected");

  const kisancpp::Deadline expired{kisancpp::Clock::now() - std::chrono::milliseconds(1)};
  RequireThrows<kisancpp::TimeoutError>([&] { (void)index.Search({1.0F, 0.0F, 0.0F}, 1, nullptr, expired); },
                                        "expired deadline should time out");
}

}  // namespace

int main() {
  try {
    kisancpp::tests::Log("vector_index_test: start");
    ScenarioCosineProperties();
    ScenarioOrderingAndTies();
    ScenarioCandidateFilter();
    ScenarioValidationAndDeadline();
    kisancpp::tests::Log("vector_index_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    kisancpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
