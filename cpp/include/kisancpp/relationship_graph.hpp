#pragma once

#include "kisancpp/errors.hpp"
#include "kisancpp/sqlite_backend.hpp"
#include "kisancpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kisancpp {

// Typed entity graph. In kSecondaryIndex mode each edge is one row and
// reverse traversal goes through the (target, type) index; in kDualWrite
// mode a "reverse:<type>" twin row is written after the forward row.
class RelationshipGraph {
 public:
  explicit RelationshipGraph(SqliteBackend& backend, GraphConfig config = {});

  RelationshipGraph(const RelationshipGraph&) = delete;
  RelationshipGraph& operator=(const RelationshipGraph&) = delete;

  // Create-if-absent; an existing node is returned untouched.
  std::string CreateNode(EntityType type,
                         const std::string& name,
                         const Properties& properties = {},
                         double confidence = 1.0,
                         const std::string& source = "manual");
  [[nodiscard]] std::optional<EntityNode> GetNode(const std::string& node_id) const;

  // A repeated (source, type, target) triple is a no-op.
  void CreateEdge(const std::string& source_node_id,
                  const std::string& relationship_type,
                  const std::string& target_node_id,
                  const Properties& properties = {},
                  double confidence = 1.0,
                  const std::string& source = "manual");
  void CreateEdge(const std::string& source_node_id,
                  RelationshipType relationship_type,
                  const std::string& target_node_id,
                  const Properties& properties = {},
                  double confidence = 1.0,
                  const std::string& source = "manual");
  // Removes the edge in both directions. Accepts either the forward or the
  // "reverse:" form of the type.
  bool DeleteEdge(const std::string& source_node_id,
                  const std::string& relationship_type,
                  const std::string& target_node_id);

  // Edges leaving `node_id` in insertion order, reverse twins included.
  [[nodiscard]] std::vector<RelationshipEdge> GetEdges(
      const std::string& node_id,
      const std::optional<std::string>& relationship_type = std::nullopt) const;
  [[nodiscard]] std::vector<std::string> Traverse(const std::string& node_id,
                                                  const std::string& relationship_type,
                                                  bool reverse) const;
  [[nodiscard]] std::vector<std::string> Traverse(const std::string& node_id,
                                                  RelationshipType relationship_type,
                                                  bool reverse) const;

  [[nodiscard]] EntityWithRelationships GetEntityWithRelationships(const std::string& node_id) const;

  // 0.4 location + 0.4 season + 0.2 soil; falls back to a fixed staple list
  // flagged `is_default` when the graph yields no candidates.
  [[nodiscard]] std::vector<RankedCrop> GetRecommendedCrops(const std::string& location,
                                                            const std::string& soil_type,
                                                            const std::string& season) const;

  // disease name -> treatment names for the crop's susceptible_to edges.
  [[nodiscard]] std::map<std::string, std::vector<std::string>> FindDiseaseTreatments(
      const std::string& crop_name) const;

  // Reports every edge without its reverse twin. Always empty in
  // kSecondaryIndex mode.
  std::vector<ConsistencyWarning> VerifySymmetry(const Deadline& deadline = {}) const;

  [[nodiscard]] std::size_t NodeCount() const;
  // Stored rows; dual-write mode counts each twin separately.
  [[nodiscard]] std::size_t EdgeRowCount() const;
  [[nodiscard]] EdgeIndexMode edge_index_mode() const { return config_.edge_index_mode; }

 private:
  SqliteBackend& backend_;
  GraphConfig config_;
};

namespace graph::testing {

// The next `countdown` reverse-twin writes fail in kDualWrite mode.
void SetReverseWriteFailCountdown(std::uint32_t countdown);
void ClearReverseWriteFailCountdown();

}  // namespace graph::testing

}  // namespace kisancpp
