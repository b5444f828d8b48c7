#include "kisancpp/vector_store.hpp"
#include "kisancpp/errors.hpp"

#include "../core/record_codec.hpp"
#include "../core/sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace kisancpp {
namespace {

constexpr const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS knowledge_items ("
    "seq INTEGER PRIMARY KEY AUTOINCREMENT,"
    "id TEXT NOT NULL UNIQUE,"
    "text TEXT NOT NULL,"
    "embedding BLOB NOT NULL);"
    "CREATE TABLE IF NOT EXISTS knowledge_item_metadata ("
    "item_seq INTEGER NOT NULL,"
    "key TEXT NOT NULL,"
    "value TEXT NOT NULL,"
    "PRIMARY KEY(item_seq, key)) WITHOUT ROWID;"
    "CREATE INDEX IF NOT EXISTS knowledge_item_metadata_kv "
    "ON knowledge_item_metadata(key, value, item_seq);";

std::string DimensionMismatch(const char* context, int expected, std::size_t actual) {
  return std::string(context) + " dimension mismatch: expected " + std::to_string(expected) + ", got " +
         std::to_string(actual);
}

Metadata LoadMetadata(sqlite3* db, std::int64_t seq) {
  core::Statement stmt(db, "SELECT key, value FROM knowledge_item_metadata WHERE item_seq = ?;");
  stmt.BindInt64(1, seq);
  Metadata metadata{};
  while (stmt.Step()) {
    metadata.emplace(stmt.ColumnText(0), stmt.ColumnText(1));
  }
  return metadata;
}

std::optional<KnowledgeItem> LoadItemBySeq(sqlite3* db, std::int64_t seq) {
  core::Statement stmt(db, "SELECT id, text, embedding FROM knowledge_items WHERE seq = ?;");
  stmt.BindInt64(1, seq);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  auto embedding = core::codec::DecodeEmbedding(stmt.ColumnBlob(2));
  if (!embedding.has_value()) {
    throw ProviderError("knowledge item embedding is corrupt: seq=" + std::to_string(seq));
  }
  KnowledgeItem item{};
  item.id = stmt.ColumnText(0);
  item.text = stmt.ColumnText(1);
  item.embedding = std::move(*embedding);
  item.metadata = LoadMetadata(db, seq);
  return item;
}

void DeleteItemRows(sqlite3* db, std::int64_t seq) {
  core::Statement meta(db, "DELETE FROM knowledge_item_metadata WHERE item_seq = ?;");
  meta.BindInt64(1, seq);
  meta.StepDone();
  core::Statement item(db, "DELETE FROM knowledge_items WHERE seq = ?;");
  item.BindInt64(1, seq);
  item.StepDone();
}

std::optional<std::int64_t> FindSeq(sqlite3* db, const std::string& id) {
  core::Statement stmt(db, "SELECT seq FROM knowledge_items WHERE id = ?;");
  stmt.BindText(1, id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return stmt.ColumnInt64(0);
}

// Intersection of item seqs matching every key/value pair.
CandidateFilter ResolveFilter(sqlite3* db, const Metadata& filter) {
  CandidateFilter candidates{};
  bool first = true;
  core::Statement stmt(db, "SELECT item_seq FROM knowledge_item_metadata WHERE key = ? AND value = ?;");
  for (const auto& [key, value] : filter) {
    stmt.Reset();
    stmt.BindText(1, key);
    stmt.BindText(2, value);
    CandidateFilter matched{};
    while (stmt.Step()) {
      const auto seq = static_cast<IndexKey>(stmt.ColumnInt64(0));
      if (first || candidates.count(seq) != 0) {
        matched.insert(seq);
      }
    }
    candidates = std::move(matched);
    first = false;
    if (candidates.empty()) {
      break;
    }
  }
  return candidates;
}

}  // namespace

VectorStore::VectorStore(SqliteBackend& backend,
                         std::shared_ptr<EmbeddingProvider> provider,
                         VectorStoreConfig config,
                         VectorIndexFactory index_factory)
    : backend_(backend),
      provider_(std::move(provider)),
      config_(config),
      index_factory_(std::move(index_factory)),
      id_rng_(std::random_device{}()) {
  if (config_.dimensions < 0) {
    throw ValidationError("VectorStore dimensions must be >= 0");
  }
  if (config_.deadline_check_interval <= 0) {
    throw ValidationError("VectorStore deadline_check_interval must be positive");
  }
  if (!index_factory_) {
    const int interval = config_.deadline_check_interval;
    index_factory_ = [interval](int dimensions) {
      return std::make_unique<FlatVectorIndex>(dimensions, interval);
    };
  }
  {
    core::WriteLock lock(backend_.connection());
    core::Exec(backend_.connection().db, kSchemaSql);
  }
  if (config_.dimensions > 0) {
    EnsureIndex(config_.dimensions);
  }
  LoadIndex();
}

VectorStore::~VectorStore() = default;

void VectorStore::EnsureIndex(int dimensions) {
  if (index_ != nullptr) {
    return;
  }
  index_ = index_factory_(dimensions);
  if (index_ == nullptr || index_->dimensions() != dimensions) {
    throw ValidationError("vector index factory returned an index with the wrong dimension");
  }
  dimensions_ = dimensions;
}

void VectorStore::LoadIndex() {
  auto* db = backend_.connection().db;
  core::Statement stmt(db, "SELECT seq, embedding FROM knowledge_items ORDER BY seq;");
  std::vector<IndexKey> keys{};
  std::vector<std::vector<float>> vectors{};
  while (stmt.Step()) {
    auto embedding = core::codec::DecodeEmbedding(stmt.ColumnBlob(1));
    if (!embedding.has_value()) {
      throw ProviderError("knowledge item embedding is corrupt: seq=" + std::to_string(stmt.ColumnInt64(0)));
    }
    if (dimensions_ == 0) {
      EnsureIndex(static_cast<int>(embedding->size()));
    }
    if (embedding->size() != static_cast<std::size_t>(dimensions_)) {
      throw ValidationError(DimensionMismatch("stored knowledge item", dimensions_, embedding->size()));
    }
    keys.push_back(static_cast<IndexKey>(stmt.ColumnInt64(0)));
    vectors.push_back(std::move(*embedding));
  }
  if (!keys.empty()) {
    index_->AddBatch(keys, vectors);
    spdlog::info("vector store loaded {} knowledge items (dimensions={})", keys.size(), dimensions_);
  }
}

std::string VectorStore::NextGeneratedId() {
  std::lock_guard<std::mutex> lock(id_mutex_);
  std::uniform_int_distribution<std::uint64_t> dist{};
  std::uint64_t hi = dist(id_rng_);
  std::uint64_t lo = dist(id_rng_);
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
  char buffer[37];
  std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32U),
                static_cast<unsigned>((hi >> 16U) & 0xFFFFU), static_cast<unsigned>(hi & 0xFFFFU),
                static_cast<unsigned>(lo >> 48U), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string(buffer);
}

std::string VectorStore::Put(const std::string& text,
                             const std::vector<float>& embedding,
                             const Metadata& metadata,
                             const std::optional<std::string>& id) {
  if (text.empty()) {
    throw ValidationError("VectorStore::Put text must be non-empty");
  }
  if (embedding.empty()) {
    throw ValidationError("VectorStore::Put embedding must be non-empty");
  }
  if (id.has_value() && id->empty()) {
    throw ValidationError("VectorStore::Put id must be non-empty when provided");
  }
  const std::string item_id = id.has_value() ? *id : NextGeneratedId();

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (dimensions_ != 0 && embedding.size() != static_cast<std::size_t>(dimensions_)) {
    throw ValidationError(DimensionMismatch("VectorStore::Put", dimensions_, embedding.size()));
  }

  auto* db = backend_.connection().db;
  core::Transaction txn(backend_.connection());
  const auto previous = FindSeq(db, item_id);
  if (previous.has_value()) {
    DeleteItemRows(db, *previous);
  }

  core::Statement insert(db, "INSERT INTO knowledge_items(id, text, embedding) VALUES(?, ?, ?) RETURNING seq;");
  insert.BindText(1, item_id);
  insert.BindText(2, text);
  insert.BindBlob(3, core::codec::EncodeEmbedding(embedding));
  if (!insert.Step()) {
    throw ProviderError("knowledge item insert returned no sequence");
  }
  const auto seq = insert.ColumnInt64(0);
  insert.Reset();

  core::Statement meta(db, "INSERT INTO knowledge_item_metadata(item_seq, key, value) VALUES(?, ?, ?);");
  for (const auto& [key, value] : metadata) {
    meta.Reset();
    meta.BindInt64(1, seq);
    meta.BindText(2, key);
    meta.BindText(3, value);
    meta.StepDone();
  }
  txn.Commit();

  EnsureIndex(static_cast<int>(embedding.size()));
  if (previous.has_value()) {
    index_->Remove(static_cast<IndexKey>(*previous));
  }
  index_->Add(static_cast<IndexKey>(seq), embedding);
  spdlog::debug("stored knowledge item id={} seq={} replaced={}", item_id, seq, previous.has_value());
  return item_id;
}

std::string VectorStore::PutText(const std::string& text,
                                 const Metadata& metadata,
                                 const std::optional<std::string>& id) {
  if (text.empty()) {
    throw ValidationError("VectorStore::PutText text must be non-empty");
  }
  return Put(text, EmbedWithProvider(text), metadata, id);
}

std::optional<KnowledgeItem> VectorStore::Get(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto* db = backend_.connection().db;
  const auto seq = FindSeq(db, id);
  if (!seq.has_value()) {
    return std::nullopt;
  }
  return LoadItemBySeq(db, *seq);
}

bool VectorStore::Delete(const std::string& id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto* db = backend_.connection().db;
  core::Transaction txn(backend_.connection());
  const auto seq = FindSeq(db, id);
  if (!seq.has_value()) {
    return false;
  }
  DeleteItemRows(db, *seq);
  txn.Commit();
  if (index_ != nullptr) {
    index_->Remove(static_cast<IndexKey>(*seq));
  }
  return true;
}

std::vector<ScoredKnowledgeItem> VectorStore::Search(const std::vector<float>& query,
                                                     const Metadata& filter,
                                                     int top_k,
                                                     const Deadline& deadline) const {
  if (query.empty()) {
    throw ValidationError("VectorStore::Search query must be non-empty");
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (index_ == nullptr || top_k <= 0) {
    return {};
  }
  if (query.size() != static_cast<std::size_t>(dimensions_)) {
    throw ValidationError(DimensionMismatch("VectorStore::Search", dimensions_, query.size()));
  }

  auto* db = backend_.connection().db;
  std::optional<CandidateFilter> candidates{};
  if (!filter.empty()) {
    candidates = ResolveFilter(db, filter);
    if (candidates->empty()) {
      return {};
    }
  }

  const auto ranked = index_->Search(query, top_k, candidates.has_value() ? &*candidates : nullptr, deadline);
  std::vector<ScoredKnowledgeItem> results{};
  results.reserve(ranked.size());
  for (const auto& [key, similarity] : ranked) {
    auto item = LoadItemBySeq(db, static_cast<std::int64_t>(key));
    if (!item.has_value()) {
      continue;
    }
    results.push_back(ScoredKnowledgeItem{std::move(*item), similarity});
  }
  return results;
}

std::vector<ScoredKnowledgeItem> VectorStore::SearchByText(const std::string& text,
                                                           const Metadata& filter,
                                                           int top_k,
                                                           const Deadline& deadline) const {
  if (text.empty()) {
    throw ValidationError("VectorStore::SearchByText text must be non-empty");
  }
  return Search(EmbedWithProvider(text), filter, top_k, deadline);
}

std::vector<float> VectorStore::EmbedWithProvider(const std::string& text) const {
  if (provider_ == nullptr) {
    throw ProviderError("no embedding provider configured");
  }
  std::vector<float> embedding{};
  try {
    embedding = provider_->Embed(text);
  } catch (const ProviderError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProviderError(std::string("embedding provider failed: ") + ex.what());
  }
  if (embedding.size() != static_cast<std::size_t>(provider_->dimensions())) {
    throw ProviderError(DimensionMismatch("embedding provider", provider_->dimensions(), embedding.size()));
  }
  return embedding;
}

std::size_t VectorStore::Count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return index_ != nullptr ? index_->Size() : 0;
}

std::size_t VectorStore::CountMatching(const Metadata& filter) const {
  if (filter.empty()) {
    return Count();
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return ResolveFilter(backend_.connection().db, filter).size();
}

int VectorStore::dimensions() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return dimensions_;
}

}  // namespace kisancpp
