#include "kisancpp/embeddings.hpp"
#include "kisancpp/errors.hpp"
#include "kisancpp/vector_index.hpp"

#include "../test_logger.hpp"

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

double L2Norm(const std::vector<float>& values) {
  double sum = 0.0;
  for (const auto value : values) {
    sum += static_cast<double>(value) * static_cast<double>(value);
  }
  return std::sqrt(sum);
}

bool ApproxEqual(double lhs, double rhs, double eps) {
  return std::fabs(lhs - rhs) <= eps;
}

void ScenarioIdentityAndShape() {
  kisancpp::tests::Log("scenario: identity and shape");
  kisancpp::HashingEmbedder embedder;
  Require(embedder.dimensions() == 384, "unexpected embedding dimension");
  Require(embedder.normalize(), "embedder should normalize vectors");
  const auto identity = embedder.identity();
  Require(identity.has_value(), "identity should be present");
  Require(identity->model.has_value() && *identity->model == "feature-hashing", "identity model mismatch");
  Require(identity->dimensions.has_value() && *identity->dimensions == 384, "identity dimensions mismatch");

  bool threw = false;
  try {
    kisancpp::HashingEmbedder invalid(0);
  } catch (const kisancpp::ValidationError&) {
    threw = true;
  }
  Require(threw, "zero dimensions must be rejected");
}

void ScenarioDeterministicEmbedding() {
  kisancpp::tests::Log("scenario: deterministic embedding");
  kisancpp::HashingEmbedder embedder;
  const auto first = embedder.Embed("wheat rust management in punjab");
  const auto second = embedder.Embed("wheat rust management in punjab");
  const auto third = embedder.Embed("monsoon rainfall advisory");

  Require(first.size() == static_cast<std::size_t>(embedder.dimensions()), "embedding size mismatch");
  Require(first == second, "same text should produce identical embedding");
  Require(first != third, "different text should produce different embedding");
}

void ScenarioSimilarityFavorsSharedTerms() {
  kisancpp::tests::Log("scenario: similarity favors shared terms");
  kisancpp::HashingEmbedder embedder(256, 0);
  const auto query = embedder.Embed("rice cultivation practices");
  const auto related = embedder.Embed("Rice cultivation practices for kharif season");
  const auto unrelated = embedder.Embed("tractor subsidy application deadline");
  const auto related_score = kisancpp::CosineSimilarity(query, related);
  const auto unrelated_score = kisancpp::CosineSimilarity(query, unrelated);
  kisancpp::tests::LogKV("related_score", static_cast<double>(related_score));
  kisancpp::tests::LogKV("unrelated_score", static_cast<double>(unrelated_score));
  Require(related_score > unrelated_score, "shared terms should rank higher");
}

void ScenarioNormalizationAndEmptyInput() {
  kisancpp::tests::Log("scenario: normalization and empty input");
  kisancpp::HashingEmbedder embedder;
  const auto non_empty = embedder.Embed("alpha beta gamma");
  Require(ApproxEqual(L2Norm(non_empty), 1.0, 1e-5), "non-empty embedding must be L2 normalized");

  const auto empty = embedder.Embed("");
  Require(ApproxEqual(L2Norm(empty), 0.0, 1e-6), "empty embedding should stay zero vector");
}

void ScenarioStopWordsAndPlurals() {
  kisancpp::tests::Log("scenario: stop words and plurals");
  kisancpp::HashingEmbedder embedder(128, 0);
  Require(embedder.Embed("Pests of the Crops") == embedder.Embed("pest crop"),
          "stop words and plural endings should not change the embedding");
  Require(ApproxEqual(L2Norm(embedder.Embed("of the and")), 0.0, 1e-6), "stop words alone embed to zero");
}

void ScenarioBatchParity() {
  kisancpp::tests::Log("scenario: batch parity");
  kisancpp::HashingEmbedder embedder;
  const std::vector<std::string> texts = {"first item", "second item", "third item"};
  const auto batch = embedder.EmbedBatch(texts);

  Require(batch.size() == texts.size(), "batch result size mismatch");
  for (std::size_t i = 0; i < texts.size(); ++i) {
    Require(batch[i] == embedder.Embed(texts[i]), "batch item must match single Embed output");
  }
}

void ScenarioMemoizationCapacity() {
  kisancpp::tests::Log("scenario: memoization capacity");
  kisancpp::HashingEmbedder cached_embedder(384, 2);
  const auto first_a = cached_embedder.Embed("alpha");
  const auto second_a = cached_embedder.Embed("alpha");
  Require(first_a == second_a, "memoized embedding must remain deterministic");
  Require(cached_embedder.cache_size() == 1, "repeated key should not increase cache size");

  (void)cached_embedder.Embed("beta");
  Require(cached_embedder.cache_size() == 2, "second unique key should fill cache");
  (void)cached_embedder.Embed("gamma");
  Require(cached_embedder.cache_size() == 2, "cache should enforce capacity bound");
  Require(cached_embedder.Embed("alpha") == first_a, "evicted key recomputation should remain deterministic");

  kisancpp::HashingEmbedder uncached_embedder(384, 0);
  (void)uncached_embedder.Embed("alpha");
  Require(uncached_embedder.cache_size() == 0, "zero-capacity embedder should not memoize");
}

}  // namespace

int main() {
  try {
    kisancpp::tests::Log("embeddings_test: start");
    ScenarioIdentityAndShape();
    ScenarioDeterministicEmbedding();
    ScenarioSimilarityFavorsSharedTerms();
    ScenarioNormalizationAndEmptyInput();
    ScenarioStopWordsAndPlurals();
    ScenarioBatchParity();
    ScenarioMemoizationCapacity();
    kisancpp::tests::Log("embeddings_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    kisancpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
