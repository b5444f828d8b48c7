#include "kisancpp/vector_index.hpp"
#include "kisancpp/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace kisancpp {
namespace {

double Dot(std::span<const float> lhs, std::span<const float> rhs) {
  double dot = 0.0;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += static_cast<double>(lhs[i]) * static_cast<double>(rhs[i]);
  }
  return dot;
}

double Norm(std::span<const float> v) {
  const auto dot = Dot(v, v);
  return std::sqrt(std::max(dot, 0.0));
}

float Cosine(std::span<const float> lhs, std::span<const float> rhs) {
  const auto lhs_norm = Norm(lhs);
  const auto rhs_norm = Norm(rhs);
  if (lhs_norm <= 0.0 || rhs_norm <= 0.0) {
    return 0.0F;
  }
  const auto similarity = Dot(lhs, rhs) / (lhs_norm * rhs_norm);
  return static_cast<float>(std::clamp(similarity, -1.0, 1.0));
}

}  // namespace

float CosineSimilarity(const std::vector<float>& lhs, const std::vector<float>& rhs) {
  if (lhs.size() != rhs.size()) {
    throw ValidationError("cosine similarity dimension mismatch: " + std::to_string(lhs.size()) + " vs " +
                          std::to_string(rhs.size()));
  }
  return Cosine(std::span<const float>(lhs.data(), lhs.size()), std::span<const float>(rhs.data(), rhs.size()));
}

FlatVectorIndex::FlatVectorIndex(int dimensions, int deadline_check_interval)
    : dimensions_(dimensions), deadline_check_interval_(deadline_check_interval) {
  if (dimensions_ <= 0) {
    throw ValidationError("FlatVectorIndex dimensions must be positive");
  }
  if (deadline_check_interval_ <= 0) {
    throw ValidationError("FlatVectorIndex deadline check interval must be positive");
  }
}

int FlatVectorIndex::dimensions() const {
  return dimensions_;
}

std::size_t FlatVectorIndex::Size() const {
  return vectors_.size();
}

void FlatVectorIndex::Add(IndexKey key, const std::vector<float>& vector) {
  if (vector.size() != static_cast<std::size_t>(dimensions_)) {
    throw ValidationError("FlatVectorIndex::Add dimension mismatch: expected " + std::to_string(dimensions_) +
                          ", got " + std::to_string(vector.size()));
  }
  vectors_[key] = vector;
}

void FlatVectorIndex::AddBatch(const std::vector<IndexKey>& keys, const std::vector<std::vector<float>>& vectors) {
  if (keys.size() != vectors.size()) {
    throw ValidationError("FlatVectorIndex::AddBatch size mismatch");
  }
  for (const auto& vector : vectors) {
    if (vector.size() != static_cast<std::size_t>(dimensions_)) {
      throw ValidationError("FlatVectorIndex::AddBatch dimension mismatch");
    }
  }
  for (std::size_t i = 0; i < keys.size(); ++i) {
    vectors_[keys[i]] = vectors[i];
  }
}

void FlatVectorIndex::Remove(IndexKey key) {
  vectors_.erase(key);
}

void FlatVectorIndex::Clear() {
  vectors_.clear();
}

std::vector<std::pair<IndexKey, float>> FlatVectorIndex::Search(const std::vector<float>& query,
                                                                int top_k,
                                                                const CandidateFilter* candidate_filter,
                                                                const Deadline& deadline) const {
  if (query.size() != static_cast<std::size_t>(dimensions_)) {
    throw ValidationError("FlatVectorIndex::Search dimension mismatch: expected " + std::to_string(dimensions_) +
                          ", got " + std::to_string(query.size()));
  }
  if (top_k <= 0 || vectors_.empty()) {
    return {};
  }

  const auto query_span = std::span<const float>(query.data(), query.size());
  std::vector<std::pair<IndexKey, float>> results{};
  results.reserve(candidate_filter != nullptr ? candidate_filter->size() : vectors_.size());
  std::size_t scanned = 0;
  for (const auto& [key, candidate] : vectors_) {
    if (++scanned % static_cast<std::size_t>(deadline_check_interval_) == 0 && deadline.Expired()) {
      throw TimeoutError("vector search exceeded deadline after scanning " + std::to_string(scanned) + " items");
    }
    if (candidate_filter != nullptr && candidate_filter->find(key) == candidate_filter->end()) {
      continue;
    }
    const auto doc = std::span<const float>(candidate.data(), candidate.size());
    results.emplace_back(key, Cosine(query_span, doc));
  }
  if (deadline.Expired()) {
    throw TimeoutError("vector search exceeded deadline");
  }

  std::sort(results.begin(), results.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.second != rhs.second) {
      return lhs.second > rhs.second;
    }
    return lhs.first < rhs.first;
  });

  const auto target_size = std::min<std::size_t>(results.size(), static_cast<std::size_t>(top_k));
  results.resize(target_size);
  return results;
}

}  // namespace kisancpp
