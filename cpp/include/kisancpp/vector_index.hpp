#pragma once

#include "kisancpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kisancpp {

// dot(a,b) / (|a||b|); 0 when either vector has zero norm. Throws
// ValidationError when the dimensions differ.
float CosineSimilarity(const std::vector<float>& lhs, const std::vector<float>& rhs);

using IndexKey = std::uint64_t;
using CandidateFilter = std::unordered_set<IndexKey>;

// Similarity index over embedding vectors. Keys are insertion sequence numbers,
// so ascending-key tie-breaks preserve insertion order.
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  virtual int dimensions() const = 0;
  virtual std::size_t Size() const = 0;
  virtual void Add(IndexKey key, const std::vector<float>& vector) = 0;
  virtual void AddBatch(const std::vector<IndexKey>& keys, const std::vector<std::vector<float>>& vectors) = 0;
  virtual void Remove(IndexKey key) = 0;
  virtual void Clear() = 0;
  // `candidate_filter` restricts ranking to the listed keys when non-null.
  virtual std::vector<std::pair<IndexKey, float>> Search(const std::vector<float>& query,
                                                         int top_k,
                                                         const CandidateFilter* candidate_filter,
                                                         const Deadline& deadline) const = 0;
};

// Exhaustive scan over every stored vector.
class FlatVectorIndex final : public VectorIndex {
 public:
  explicit FlatVectorIndex(int dimensions, int deadline_check_interval = 256);

  int dimensions() const override;
  std::size_t Size() const override;
  void Add(IndexKey key, const std::vector<float>& vector) override;
  void AddBatch(const std::vector<IndexKey>& keys, const std::vector<std::vector<float>>& vectors) override;
  void Remove(IndexKey key) override;
  void Clear() override;
  std::vector<std::pair<IndexKey, float>> Search(const std::vector<float>& query,
                                                 int top_k,
                                                 const CandidateFilter* candidate_filter,
                                                 const Deadline& deadline) const override;

 private:
  int dimensions_;
  int deadline_check_interval_;
  std::unordered_map<IndexKey, std::vector<float>> vectors_;
};

}  // namespace kisancpp
