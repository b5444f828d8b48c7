#include "kisancpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <atomic>

namespace kisancpp {
namespace {

std::atomic<std::size_t> g_consistency_warning_count{0};

}  // namespace

std::string ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kValidation:
      return "validation";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kProvider:
      return "provider";
    case ErrorCode::kTimeout:
      return "timeout";
  }
  return "unknown";
}

std::string ToString(ConsistencyWarningKind kind) {
  switch (kind) {
    case ConsistencyWarningKind::kMissingReverseEdge:
      return "missing_reverse_edge";
    case ConsistencyWarningKind::kOrphanReverseEdge:
      return "orphan_reverse_edge";
    case ConsistencyWarningKind::kDanglingEdgeTarget:
      return "dangling_edge_target";
  }
  return "unknown";
}

void ReportConsistencyWarning(const ConsistencyWarning& warning) {
  g_consistency_warning_count.fetch_add(1, std::memory_order_relaxed);
  spdlog::warn("consistency warning [{}] node={} {}", ToString(warning.kind), warning.node_id, warning.detail);
}

std::size_t ConsistencyWarningCount() {
  return g_consistency_warning_count.load(std::memory_order_relaxed);
}

}  // namespace kisancpp
