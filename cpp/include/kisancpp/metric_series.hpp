#pragma once

#include "kisancpp/sqlite_backend.hpp"
#include "kisancpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kisancpp {

// Time-stamped measurements keyed by (metric_id, timestamp). Ranges are
// inclusive on both ends. Expired points stay readable until SweepExpired.
class MetricSeries {
 public:
  explicit MetricSeries(SqliteBackend& backend, RetentionPolicy retention = {});

  MetricSeries(const MetricSeries&) = delete;
  MetricSeries& operator=(const MetricSeries&) = delete;

  // Last write wins per (metric_id, timestamp). A point without expiry gets
  // timestamp + the retention TTL for its metric family.
  void Append(const MetricPoint& point);
  void AppendBatch(const std::vector<MetricPoint>& points);

  [[nodiscard]] std::vector<MetricPoint> Range(const std::string& metric_id,
                                               std::int64_t start,
                                               std::int64_t end) const;
  [[nodiscard]] std::optional<MetricPoint> Latest(const std::string& metric_id) const;
  [[nodiscard]] std::map<std::string, std::vector<MetricPoint>> MultiRange(const std::vector<std::string>& metric_ids,
                                                                           std::int64_t start,
                                                                           std::int64_t end) const;

  // Sparse buckets keyed by floor(timestamp / bucket_ms) * bucket_ms.
  [[nodiscard]] std::vector<Bucket> Aggregate(const std::string& metric_id,
                                              std::int64_t start,
                                              std::int64_t end,
                                              std::int64_t bucket_ms) const;
  // Throws NotFoundError on an empty range.
  [[nodiscard]] SeriesStatistics Statistics(const std::string& metric_id,
                                            std::int64_t start,
                                            std::int64_t end) const;

  // Enumerates matching points, then deletes each one. Absent bounds are open.
  std::size_t DeleteRange(const std::string& metric_id,
                          std::optional<std::int64_t> start = std::nullopt,
                          std::optional<std::int64_t> end = std::nullopt,
                          const Deadline& deadline = {});
  std::size_t SweepExpired(std::int64_t now_ms);

  [[nodiscard]] std::vector<std::string> MetricIds(const std::string& prefix) const;
  // Newest timestamp across every series whose id starts with `prefix`.
  [[nodiscard]] std::optional<std::int64_t> Freshness(const std::string& prefix) const;

  [[nodiscard]] std::int64_t DefaultExpiry(const std::string& metric_id, std::int64_t timestamp) const;

 private:
  SqliteBackend& backend_;
  RetentionPolicy retention_;
};

}  // namespace kisancpp
