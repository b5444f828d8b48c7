#pragma once

#include "kisancpp/embeddings.hpp"
#include "kisancpp/sqlite_backend.hpp"
#include "kisancpp/types.hpp"
#include "kisancpp/vector_index.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>

namespace kisancpp {

using VectorIndexFactory = std::function<std::unique_ptr<VectorIndex>(int dimensions)>;

// Knowledge items persisted in SQLite with an in-memory similarity index
// rebuilt on open. Search is safe to call from several threads at once.
class VectorStore {
 public:
  VectorStore(SqliteBackend& backend,
              std::shared_ptr<EmbeddingProvider> provider,
              VectorStoreConfig config = {},
              VectorIndexFactory index_factory = {});
  ~VectorStore();

  VectorStore(const VectorStore&) = delete;
  VectorStore& operator=(const VectorStore&) = delete;

  // Stores the triple; replaces any item already stored under `id`.
  std::string Put(const std::string& text,
                  const std::vector<float>& embedding,
                  const Metadata& metadata = {},
                  const std::optional<std::string>& id = std::nullopt);
  // Embeds `text` through the provider, then Put.
  std::string PutText(const std::string& text,
                      const Metadata& metadata = {},
                      const std::optional<std::string>& id = std::nullopt);

  [[nodiscard]] std::optional<KnowledgeItem> Get(const std::string& id) const;
  bool Delete(const std::string& id);

  // `filter` is an exact-match conjunction over metadata, applied before ranking.
  [[nodiscard]] std::vector<ScoredKnowledgeItem> Search(const std::vector<float>& query,
                                                        const Metadata& filter,
                                                        int top_k,
                                                        const Deadline& deadline = {}) const;
  [[nodiscard]] std::vector<ScoredKnowledgeItem> SearchByText(const std::string& text,
                                                              const Metadata& filter,
                                                              int top_k,
                                                              const Deadline& deadline = {}) const;

  [[nodiscard]] std::size_t Count() const;
  [[nodiscard]] std::size_t CountMatching(const Metadata& filter) const;
  // 0 until the first item fixes the dimension.
  [[nodiscard]] int dimensions() const;

 private:
  std::vector<float> EmbedWithProvider(const std::string& text) const;
  std::string NextGeneratedId();
  void EnsureIndex(int dimensions);
  void LoadIndex();

  SqliteBackend& backend_;
  std::shared_ptr<EmbeddingProvider> provider_;
  VectorStoreConfig config_;
  VectorIndexFactory index_factory_;
  std::unique_ptr<VectorIndex> index_;
  int dimensions_ = 0;
  mutable std::shared_mutex mutex_{};

  std::mutex id_mutex_{};
  std::mt19937_64 id_rng_;
};

}  // namespace kisancpp
