#include "kisancpp/relationship_graph.hpp"
#include "kisancpp/identifiers.hpp"

#include "../core/parallel.hpp"
#include "../core/record_codec.hpp"
#include "../core/sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iterator>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace kisancpp {
namespace {

std::atomic<std::uint32_t> g_test_reverse_write_fail_countdown{0};

constexpr std::size_t kDeadlineCheckInterval = 256;
constexpr double kLocationWeight = 0.4;
constexpr double kSeasonWeight = 0.4;
constexpr double kSoilWeight = 0.2;

constexpr const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS graph_nodes ("
    "node_id TEXT PRIMARY KEY,"
    "type TEXT NOT NULL,"
    "name TEXT NOT NULL,"
    "properties BLOB NOT NULL,"
    "confidence REAL NOT NULL,"
    "source TEXT NOT NULL) WITHOUT ROWID;"
    "CREATE TABLE IF NOT EXISTS graph_edges ("
    "seq INTEGER PRIMARY KEY AUTOINCREMENT,"
    "source_node_id TEXT NOT NULL,"
    "relationship_type TEXT NOT NULL,"
    "target_node_id TEXT NOT NULL,"
    "properties BLOB NOT NULL,"
    "confidence REAL NOT NULL,"
    "source TEXT NOT NULL,"
    "UNIQUE(source_node_id, relationship_type, target_node_id));"
    "CREATE INDEX IF NOT EXISTS graph_edges_by_target "
    "ON graph_edges(target_node_id, relationship_type, seq, source_node_id);";

constexpr const char* kEdgeColumns = "seq, source_node_id, relationship_type, target_node_id, properties, confidence, source";

void MaybeInjectReverseWriteFailure() {
  auto remaining = g_test_reverse_write_fail_countdown.load(std::memory_order_relaxed);
  while (remaining > 0) {
    if (g_test_reverse_write_fail_countdown.compare_exchange_weak(remaining,
                                                                  remaining - 1,
                                                                  std::memory_order_relaxed,
                                                                  std::memory_order_relaxed)) {
      throw ProviderError("RelationshipGraph reverse edge write injected failure");
    }
  }
}

bool IsReverseType(std::string_view relationship_type) {
  return relationship_type.substr(0, kReversePrefix.size()) == kReversePrefix;
}

std::string StripReversePrefix(std::string_view relationship_type) {
  return std::string(relationship_type.substr(kReversePrefix.size()));
}

void ValidateConfidence(double confidence, const char* context) {
  if (!(confidence >= 0.0 && confidence <= 1.0)) {
    throw ValidationError(std::string(context) + " confidence must be within [0, 1]");
  }
}

Properties DecodeProperties(const std::vector<std::byte>& payload, const std::string& owner) {
  auto decoded = core::codec::DecodeMap(payload);
  if (!decoded.has_value()) {
    throw ProviderError("graph properties are corrupt for " + owner);
  }
  return std::move(*decoded);
}

struct EdgeRow {
  std::int64_t seq = 0;
  RelationshipEdge edge;
};

// `mirrored` turns a stored forward row into its "reverse:" view from the target.
EdgeRow ReadEdgeRow(const core::Statement& stmt, bool mirrored) {
  EdgeRow row{};
  row.seq = stmt.ColumnInt64(0);
  auto source_node = stmt.ColumnText(1);
  auto type = stmt.ColumnText(2);
  auto target_node = stmt.ColumnText(3);
  row.edge.properties = DecodeProperties(stmt.ColumnBlob(4), source_node + " -" + type + "-> " + target_node);
  row.edge.confidence = stmt.ColumnDouble(5);
  row.edge.source = stmt.ColumnText(6);
  if (mirrored) {
    row.edge.source_node_id = std::move(target_node);
    row.edge.relationship_type = ReverseRelationshipType(type);
    row.edge.target_node_id = std::move(source_node);
  } else {
    row.edge.source_node_id = std::move(source_node);
    row.edge.relationship_type = std::move(type);
    row.edge.target_node_id = std::move(target_node);
  }
  return row;
}

std::vector<EdgeRow> QueryForward(sqlite3* db, const std::string& node_id, const std::optional<std::string>& type) {
  const std::string sql = std::string("SELECT ") + kEdgeColumns +
                          " FROM graph_edges WHERE source_node_id = ?1 AND (?2 IS NULL OR relationship_type = ?2)"
                          " ORDER BY seq;";
  core::Statement stmt(db, sql.c_str());
  stmt.BindText(1, node_id);
  stmt.BindOptionalText(2, type);
  std::vector<EdgeRow> rows{};
  while (stmt.Step()) {
    rows.push_back(ReadEdgeRow(stmt, false));
  }
  return rows;
}

std::vector<EdgeRow> QueryMirrored(sqlite3* db,
                                   const std::string& node_id,
                                   const std::optional<std::string>& base_type) {
  const std::string sql = std::string("SELECT ") + kEdgeColumns +
                          " FROM graph_edges WHERE target_node_id = ?1 AND (?2 IS NULL OR relationship_type = ?2)"
                          " ORDER BY seq;";
  core::Statement stmt(db, sql.c_str());
  stmt.BindText(1, node_id);
  stmt.BindOptionalText(2, base_type);
  std::vector<EdgeRow> rows{};
  while (stmt.Step()) {
    rows.push_back(ReadEdgeRow(stmt, true));
  }
  return rows;
}

bool InsertEdgeRow(sqlite3* db,
                   const std::string& source_node_id,
                   const std::string& relationship_type,
                   const std::string& target_node_id,
                   const std::vector<std::byte>& properties,
                   double confidence,
                   const std::string& source) {
  core::Statement stmt(db,
                       "INSERT OR IGNORE INTO graph_edges(source_node_id, relationship_type, target_node_id, "
                       "properties, confidence, source) VALUES(?, ?, ?, ?, ?, ?) RETURNING seq;");
  stmt.BindText(1, source_node_id);
  stmt.BindText(2, relationship_type);
  stmt.BindText(3, target_node_id);
  stmt.BindBlob(4, properties);
  stmt.BindDouble(5, confidence);
  stmt.BindText(6, source);
  const bool inserted = stmt.Step();
  stmt.Reset();
  return inserted;
}

bool DeleteEdgeRow(sqlite3* db,
                   const std::string& source_node_id,
                   const std::string& relationship_type,
                   const std::string& target_node_id) {
  core::Statement stmt(db,
                       "DELETE FROM graph_edges WHERE source_node_id = ? AND relationship_type = ? "
                       "AND target_node_id = ? RETURNING seq;");
  stmt.BindText(1, source_node_id);
  stmt.BindText(2, relationship_type);
  stmt.BindText(3, target_node_id);
  const bool deleted = stmt.Step();
  stmt.Reset();
  return deleted;
}

std::size_t CountRows(sqlite3* db, const char* sql) {
  core::Statement stmt(db, sql);
  if (!stmt.Step()) {
    return 0;
  }
  return static_cast<std::size_t>(stmt.ColumnInt64(0));
}

std::vector<RankedCrop> DefaultCropRecommendations() {
  std::vector<RankedCrop> crops{};
  crops.push_back(RankedCrop{"crop:wheat", "Wheat", 0.9, {"Common crop for most regions"}, true});
  crops.push_back(RankedCrop{"crop:rice", "Rice", 0.8, {"Staple crop in many regions"}, true});
  crops.push_back(RankedCrop{"crop:maize", "Maize", 0.7, {"Versatile crop for various conditions"}, true});
  return crops;
}

}  // namespace

RelationshipGraph::RelationshipGraph(SqliteBackend& backend, GraphConfig config)
    : backend_(backend), config_(config) {
  core::WriteLock lock(backend_.connection());
  core::Exec(backend_.connection().db, kSchemaSql);
}

std::string RelationshipGraph::CreateNode(EntityType type,
                                          const std::string& name,
                                          const Properties& properties,
                                          double confidence,
                                          const std::string& source) {
  if (Slugify(name).empty()) {
    throw ValidationError("RelationshipGraph::CreateNode name must be non-empty");
  }
  ValidateConfidence(confidence, "RelationshipGraph::CreateNode");
  const auto node_id = MakeNodeId(type, name);

  core::WriteLock lock(backend_.connection());
  core::Statement stmt(backend_.connection().db,
                       "INSERT OR IGNORE INTO graph_nodes(node_id, type, name, properties, confidence, source) "
                       "VALUES(?, ?, ?, ?, ?, ?);");
  stmt.BindText(1, node_id);
  stmt.BindText(2, ToString(type));
  stmt.BindText(3, name);
  stmt.BindBlob(4, core::codec::EncodeMap(properties));
  stmt.BindDouble(5, confidence);
  stmt.BindText(6, source.empty() ? std::string("manual") : source);
  stmt.StepDone();
  return node_id;
}

std::optional<EntityNode> RelationshipGraph::GetNode(const std::string& node_id) const {
  core::Statement stmt(backend_.connection().db,
                       "SELECT type, name, properties, confidence, source FROM graph_nodes WHERE node_id = ?;");
  stmt.BindText(1, node_id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  const auto type_name = stmt.ColumnText(0);
  const auto type = ParseEntityType(type_name);
  if (!type.has_value()) {
    throw ProviderError("graph node " + node_id + " has unknown type '" + type_name + "'");
  }
  EntityNode node{};
  node.node_id = node_id;
  node.type = *type;
  node.name = stmt.ColumnText(1);
  node.properties = DecodeProperties(stmt.ColumnBlob(2), node_id);
  node.confidence = stmt.ColumnDouble(3);
  node.source = stmt.ColumnText(4);
  return node;
}

void RelationshipGraph::CreateEdge(const std::string& source_node_id,
                                   const std::string& relationship_type,
                                   const std::string& target_node_id,
                                   const Properties& properties,
                                   double confidence,
                                   const std::string& source) {
  if (source_node_id.empty() || target_node_id.empty()) {
    throw ValidationError("RelationshipGraph::CreateEdge node ids must be non-empty");
  }
  if (relationship_type.empty()) {
    throw ValidationError("RelationshipGraph::CreateEdge relationship type must be non-empty");
  }
  if (IsReverseType(relationship_type)) {
    throw ValidationError("RelationshipGraph::CreateEdge relationship type must not use the reverse: namespace");
  }
  ValidateConfidence(confidence, "RelationshipGraph::CreateEdge");

  auto* db = backend_.connection().db;
  const auto encoded = core::codec::EncodeMap(properties);
  const auto provenance = source.empty() ? std::string("manual") : source;
  bool inserted = false;
  {
    core::WriteLock lock(backend_.connection());
    inserted = InsertEdgeRow(db, source_node_id, relationship_type, target_node_id, encoded, confidence, provenance);
  }
  spdlog::debug("edge {} -{}-> {} inserted={}", source_node_id, relationship_type, target_node_id, inserted);
  if (config_.edge_index_mode != EdgeIndexMode::kDualWrite) {
    return;
  }

  // Separate write: a failure here leaves the graph asymmetric until repaired.
  // Re-creating the edge retries the twin.
  try {
    MaybeInjectReverseWriteFailure();
    core::WriteLock lock(backend_.connection());
    (void)InsertEdgeRow(db, target_node_id, ReverseRelationshipType(relationship_type), source_node_id, encoded,
                        confidence, provenance);
  } catch (const ProviderError& ex) {
    ReportConsistencyWarning(ConsistencyWarning{
        ConsistencyWarningKind::kMissingReverseEdge,
        target_node_id,
        source_node_id + " -" + relationship_type + "-> " + target_node_id + ": " + ex.what(),
    });
  }
}

void RelationshipGraph::CreateEdge(const std::string& source_node_id,
                                   RelationshipType relationship_type,
                                   const std::string& target_node_id,
                                   const Properties& properties,
                                   double confidence,
                                   const std::string& source) {
  CreateEdge(source_node_id, ToString(relationship_type), target_node_id, properties, confidence, source);
}

bool RelationshipGraph::DeleteEdge(const std::string& source_node_id,
                                   const std::string& relationship_type,
                                   const std::string& target_node_id) {
  std::string from = source_node_id;
  std::string type = relationship_type;
  std::string to = target_node_id;
  if (IsReverseType(type)) {
    type = StripReversePrefix(type);
    std::swap(from, to);
  }

  auto* db = backend_.connection().db;
  if (config_.edge_index_mode != EdgeIndexMode::kDualWrite) {
    core::WriteLock lock(backend_.connection());
    return DeleteEdgeRow(db, from, type, to);
  }
  core::Transaction txn(backend_.connection());
  const bool forward = DeleteEdgeRow(db, from, type, to);
  const bool reverse = DeleteEdgeRow(db, to, ReverseRelationshipType(type), from);
  txn.Commit();
  return forward || reverse;
}

std::vector<RelationshipEdge> RelationshipGraph::GetEdges(const std::string& node_id,
                                                          const std::optional<std::string>& relationship_type) const {
  auto* db = backend_.connection().db;
  std::vector<EdgeRow> rows{};
  if (config_.edge_index_mode == EdgeIndexMode::kDualWrite) {
    rows = QueryForward(db, node_id, relationship_type);
  } else {
    const bool want_reverse = !relationship_type.has_value() || IsReverseType(*relationship_type);
    const bool want_forward = !relationship_type.has_value() || !IsReverseType(*relationship_type);
    if (want_forward) {
      rows = QueryForward(db, node_id, relationship_type);
    }
    if (want_reverse) {
      std::optional<std::string> base_type{};
      if (relationship_type.has_value()) {
        base_type = StripReversePrefix(*relationship_type);
      }
      auto mirrored = QueryMirrored(db, node_id, base_type);
      std::vector<EdgeRow> merged{};
      merged.reserve(rows.size() + mirrored.size());
      std::merge(std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()),
                 std::make_move_iterator(mirrored.begin()), std::make_move_iterator(mirrored.end()),
                 std::back_inserter(merged),
                 [](const EdgeRow& lhs, const EdgeRow& rhs) { return lhs.seq < rhs.seq; });
      rows = std::move(merged);
    }
  }

  std::vector<RelationshipEdge> edges{};
  edges.reserve(rows.size());
  for (auto& row : rows) {
    edges.push_back(std::move(row.edge));
  }
  return edges;
}

std::vector<std::string> RelationshipGraph::Traverse(const std::string& node_id,
                                                     const std::string& relationship_type,
                                                     bool reverse) const {
  const auto type = reverse ? ReverseRelationshipType(relationship_type) : relationship_type;
  std::vector<std::string> targets{};
  for (auto& edge : GetEdges(node_id, type)) {
    targets.push_back(std::move(edge.target_node_id));
  }
  return targets;
}

std::vector<std::string> RelationshipGraph::Traverse(const std::string& node_id,
                                                     RelationshipType relationship_type,
                                                     bool reverse) const {
  return Traverse(node_id, ToString(relationship_type), reverse);
}

EntityWithRelationships RelationshipGraph::GetEntityWithRelationships(const std::string& node_id) const {
  EntityWithRelationships out{};
  out.entity = GetNode(node_id);
  if (!out.entity.has_value()) {
    return out;
  }

  const auto edges = GetEdges(node_id);
  std::vector<std::optional<EntityNode>> targets(edges.size());
  core::ParallelFor(edges.size(), core::kDefaultReadConcurrency,
                    [&](std::size_t i) { targets[i] = GetNode(edges[i].target_node_id); });

  for (std::size_t i = 0; i < edges.size(); ++i) {
    if (!targets[i].has_value()) {
      spdlog::debug("edge target {} of {} has no node", edges[i].target_node_id, node_id);
      continue;
    }
    out.relationships[edges[i].relationship_type].push_back(RelatedEntitySummary{
        targets[i]->node_id,
        targets[i]->name,
        targets[i]->type,
        edges[i].confidence,
    });
  }
  return out;
}

std::vector<RankedCrop> RelationshipGraph::GetRecommendedCrops(const std::string& location,
                                                               const std::string& soil_type,
                                                               const std::string& season) const {
  const auto location_id = MakeNodeId(EntityType::kLocation, location);
  const auto season_id = MakeNodeId(EntityType::kSeason, season);
  const auto soil_id = MakeNodeId(EntityType::kSoil, soil_type);

  const auto location_crops = Traverse(location_id, RelationshipType::kSuitableFor, false);
  const auto season_crops = Traverse(season_id, RelationshipType::kGrownDuring, true);
  const auto soil_crops = Traverse(soil_id, RelationshipType::kSuitableFor, false);

  const std::unordered_set<std::string> location_set(location_crops.begin(), location_crops.end());
  const std::unordered_set<std::string> season_set(season_crops.begin(), season_crops.end());
  const std::unordered_set<std::string> soil_set(soil_crops.begin(), soil_crops.end());

  std::vector<std::string> candidates{};
  std::unordered_set<std::string> seen{};
  for (const auto* list : {&location_crops, &season_crops, &soil_crops}) {
    for (const auto& crop_id : *list) {
      if (seen.insert(crop_id).second) {
        candidates.push_back(crop_id);
      }
    }
  }

  if (candidates.empty()) {
    spdlog::warn("no crop candidates for location={} season={} soil={}; returning default list", location, season,
                 soil_type);
    return DefaultCropRecommendations();
  }

  std::vector<RankedCrop> ranked{};
  ranked.reserve(candidates.size());
  for (const auto& crop_id : candidates) {
    RankedCrop crop{};
    crop.crop_id = crop_id;
    double score = 0.0;
    if (location_set.count(crop_id) != 0) {
      score += kLocationWeight;
      crop.reasons.push_back("Suitable for " + location + " region");
    }
    if (season_set.count(crop_id) != 0) {
      score += kSeasonWeight;
      crop.reasons.push_back("Ideal for " + season + " season");
    }
    if (soil_set.count(crop_id) != 0) {
      score += kSoilWeight;
      crop.reasons.push_back("Well-suited for " + soil_type + " soil");
    }
    if (score <= 0.0) {
      continue;
    }
    crop.suitability_score = std::round(score * 10.0) / 10.0;
    const auto node = GetNode(crop_id);
    crop.crop_name = node.has_value() ? node->name : DisplayNameFromNodeId(crop_id);
    ranked.push_back(std::move(crop));
  }

  std::stable_sort(ranked.begin(), ranked.end(), [](const RankedCrop& lhs, const RankedCrop& rhs) {
    return lhs.suitability_score > rhs.suitability_score;
  });
  return ranked;
}

std::map<std::string, std::vector<std::string>> RelationshipGraph::FindDiseaseTreatments(
    const std::string& crop_name) const {
  std::map<std::string, std::vector<std::string>> treatments{};
  const auto crop_id = MakeNodeId(EntityType::kCrop, crop_name);
  for (const auto& disease_id : Traverse(crop_id, RelationshipType::kSusceptibleTo, false)) {
    const auto disease = GetNode(disease_id);
    if (!disease.has_value()) {
      continue;
    }
    auto& names = treatments[disease->name];
    for (const auto& treatment_id : Traverse(disease_id, RelationshipType::kTreatedWith, false)) {
      const auto treatment = GetNode(treatment_id);
      if (treatment.has_value()) {
        names.push_back(treatment->name);
      }
    }
  }
  return treatments;
}

std::vector<ConsistencyWarning> RelationshipGraph::VerifySymmetry(const Deadline& deadline) const {
  std::vector<ConsistencyWarning> warnings{};
  if (config_.edge_index_mode != EdgeIndexMode::kDualWrite) {
    return warnings;
  }

  auto* db = backend_.connection().db;
  core::Statement scan(db, "SELECT source_node_id, relationship_type, target_node_id FROM graph_edges ORDER BY seq;");
  core::Statement twin(db,
                       "SELECT 1 FROM graph_edges WHERE source_node_id = ? AND relationship_type = ? "
                       "AND target_node_id = ?;");
  std::size_t scanned = 0;
  while (scan.Step()) {
    if (++scanned % kDeadlineCheckInterval == 0 && deadline.Expired()) {
      throw TimeoutError("graph symmetry scan exceeded deadline after " + std::to_string(scanned) + " edges");
    }
    const auto from = scan.ColumnText(0);
    const auto type = scan.ColumnText(1);
    const auto to = scan.ColumnText(2);
    const bool reverse = IsReverseType(type);
    const auto twin_type = reverse ? StripReversePrefix(type) : ReverseRelationshipType(type);

    twin.Reset();
    twin.BindText(1, to);
    twin.BindText(2, twin_type);
    twin.BindText(3, from);
    if (twin.Step()) {
      continue;
    }
    ConsistencyWarning warning{
        reverse ? ConsistencyWarningKind::kOrphanReverseEdge : ConsistencyWarningKind::kMissingReverseEdge,
        from,
        from + " -" + type + "-> " + to + " has no twin",
    };
    ReportConsistencyWarning(warning);
    warnings.push_back(std::move(warning));
  }
  return warnings;
}

std::size_t RelationshipGraph::NodeCount() const {
  return CountRows(backend_.connection().db, "SELECT COUNT(*) FROM graph_nodes;");
}

std::size_t RelationshipGraph::EdgeRowCount() const {
  return CountRows(backend_.connection().db, "SELECT COUNT(*) FROM graph_edges;");
}

namespace graph::testing {

void SetReverseWriteFailCountdown(std::uint32_t countdown) {
  g_test_reverse_write_fail_countdown.store(countdown, std::memory_order_relaxed);
}

void ClearReverseWriteFailCountdown() {
  g_test_reverse_write_fail_countdown.store(0, std::memory_order_relaxed);
}

}  // namespace graph::testing

}  // namespace kisancpp
