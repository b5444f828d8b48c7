#include "kisancpp/metric_series.hpp"
#include "kisancpp/errors.hpp"

#include "../core/parallel.hpp"
#include "../core/record_codec.hpp"
#include "../core/sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string_view>
#include <utility>

namespace kisancpp {
namespace {

constexpr std::size_t kDeadlineCheckInterval = 256;
constexpr double kTrendSlopeFraction = 0.05;

constexpr const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS metric_points ("
    "metric_id TEXT NOT NULL,"
    "ts INTEGER NOT NULL,"
    "value REAL NOT NULL,"
    "location BLOB,"
    "source TEXT,"
    "unit TEXT,"
    "metadata BLOB,"
    "expiry INTEGER,"
    "PRIMARY KEY(metric_id, ts)) WITHOUT ROWID;"
    "CREATE INDEX IF NOT EXISTS metric_points_by_expiry ON metric_points(expiry);";

constexpr const char* kPointColumns = "metric_id, ts, value, location, source, unit, metadata, expiry";

void ValidateMetricId(const std::string& metric_id, const char* context) {
  if (metric_id.empty()) {
    throw ValidationError(std::string(context) + " metric id must be non-empty");
  }
}

void ValidateWindow(std::int64_t start, std::int64_t end, const char* context) {
  if (start > end) {
    throw ValidationError(std::string(context) + " start must not be after end");
  }
}

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

std::int64_t FloorToBucket(std::int64_t timestamp, std::int64_t bucket_ms) {
  auto quotient = timestamp / bucket_ms;
  if (timestamp % bucket_ms != 0 && timestamp < 0) {
    --quotient;
  }
  return quotient * bucket_ms;
}

std::optional<Metadata> ReadOptionalMap(const core::Statement& stmt, int column, const std::string& owner) {
  if (stmt.ColumnIsNull(column)) {
    return std::nullopt;
  }
  auto decoded = core::codec::DecodeMap(stmt.ColumnBlob(column));
  if (!decoded.has_value()) {
    throw ProviderError("metric point attributes are corrupt for " + owner);
  }
  return decoded;
}

MetricPoint ReadPoint(const core::Statement& stmt) {
  MetricPoint point{};
  point.metric_id = stmt.ColumnText(0);
  point.timestamp = stmt.ColumnInt64(1);
  point.value = stmt.ColumnDouble(2);
  const auto owner = point.metric_id + "@" + std::to_string(point.timestamp);
  point.location = ReadOptionalMap(stmt, 3, owner);
  point.source = stmt.ColumnOptionalText(4);
  point.unit = stmt.ColumnOptionalText(5);
  point.metadata = ReadOptionalMap(stmt, 6, owner);
  point.expiry = stmt.ColumnOptionalInt64(7);
  return point;
}

void BindOptionalMap(core::Statement& stmt, int index, const std::optional<Metadata>& map) {
  if (map.has_value()) {
    stmt.BindBlob(index, core::codec::EncodeMap(*map));
    return;
  }
  stmt.BindNull(index);
}

}  // namespace

MetricSeries::MetricSeries(SqliteBackend& backend, RetentionPolicy retention)
    : backend_(backend), retention_(retention) {
  if (retention_.weather_ttl_ms <= 0 || retention_.market_ttl_ms <= 0 || retention_.default_ttl_ms <= 0) {
    throw ValidationError("MetricSeries retention TTLs must be positive");
  }
  core::WriteLock lock(backend_.connection());
  core::Exec(backend_.connection().db, kSchemaSql);
}

std::int64_t MetricSeries::DefaultExpiry(const std::string& metric_id, std::int64_t timestamp) const {
  if (StartsWith(metric_id, "weather:")) {
    return timestamp + retention_.weather_ttl_ms;
  }
  if (StartsWith(metric_id, "market:")) {
    return timestamp + retention_.market_ttl_ms;
  }
  return timestamp + retention_.default_ttl_ms;
}

void MetricSeries::Append(const MetricPoint& point) {
  AppendBatch({point});
}

void MetricSeries::AppendBatch(const std::vector<MetricPoint>& points) {
  for (const auto& point : points) {
    ValidateMetricId(point.metric_id, "MetricSeries::Append");
    if (!std::isfinite(point.value)) {
      throw ValidationError("MetricSeries::Append value must be finite: " + point.metric_id);
    }
  }
  if (points.empty()) {
    return;
  }

  auto* db = backend_.connection().db;
  core::Transaction txn(backend_.connection());
  core::Statement stmt(db,
                       "INSERT OR REPLACE INTO metric_points(metric_id, ts, value, location, source, unit, "
                       "metadata, expiry) VALUES(?, ?, ?, ?, ?, ?, ?, ?);");
  for (const auto& point : points) {
    stmt.Reset();
    stmt.BindText(1, point.metric_id);
    stmt.BindInt64(2, point.timestamp);
    stmt.BindDouble(3, point.value);
    BindOptionalMap(stmt, 4, point.location);
    stmt.BindOptionalText(5, point.source);
    stmt.BindOptionalText(6, point.unit);
    BindOptionalMap(stmt, 7, point.metadata);
    stmt.BindInt64(8, point.expiry.value_or(DefaultExpiry(point.metric_id, point.timestamp)));
    stmt.StepDone();
  }
  txn.Commit();
  spdlog::debug("appended {} metric points", points.size());
}

std::vector<MetricPoint> MetricSeries::Range(const std::string& metric_id,
                                             std::int64_t start,
                                             std::int64_t end) const {
  ValidateMetricId(metric_id, "MetricSeries::Range");
  ValidateWindow(start, end, "MetricSeries::Range");
  const std::string sql = std::string("SELECT ") + kPointColumns +
                          " FROM metric_points WHERE metric_id = ? AND ts BETWEEN ? AND ? ORDER BY ts ASC;";
  core::Statement stmt(backend_.connection().db, sql.c_str());
  stmt.BindText(1, metric_id);
  stmt.BindInt64(2, start);
  stmt.BindInt64(3, end);
  std::vector<MetricPoint> points{};
  while (stmt.Step()) {
    points.push_back(ReadPoint(stmt));
  }
  return points;
}

std::optional<MetricPoint> MetricSeries::Latest(const std::string& metric_id) const {
  ValidateMetricId(metric_id, "MetricSeries::Latest");
  const std::string sql = std::string("SELECT ") + kPointColumns +
                          " FROM metric_points WHERE metric_id = ? ORDER BY ts DESC LIMIT 1;";
  core::Statement stmt(backend_.connection().db, sql.c_str());
  stmt.BindText(1, metric_id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadPoint(stmt);
}

std::map<std::string, std::vector<MetricPoint>> MetricSeries::MultiRange(const std::vector<std::string>& metric_ids,
                                                                         std::int64_t start,
                                                                         std::int64_t end) const {
  ValidateWindow(start, end, "MetricSeries::MultiRange");
  std::vector<std::vector<MetricPoint>> results(metric_ids.size());
  core::ParallelFor(metric_ids.size(), core::kDefaultReadConcurrency,
                    [&](std::size_t i) { results[i] = Range(metric_ids[i], start, end); });

  std::map<std::string, std::vector<MetricPoint>> out{};
  for (std::size_t i = 0; i < metric_ids.size(); ++i) {
    out[metric_ids[i]] = std::move(results[i]);
  }
  return out;
}

std::vector<Bucket> MetricSeries::Aggregate(const std::string& metric_id,
                                            std::int64_t start,
                                            std::int64_t end,
                                            std::int64_t bucket_ms) const {
  if (bucket_ms <= 0) {
    throw ValidationError("MetricSeries::Aggregate bucket size must be positive");
  }
  std::map<std::int64_t, std::pair<Bucket, double>> buckets{};
  for (const auto& point : Range(metric_id, start, end)) {
    const auto key = FloorToBucket(point.timestamp, bucket_ms);
    auto [it, inserted] = buckets.try_emplace(key);
    auto& [bucket, sum] = it->second;
    if (inserted) {
      bucket.timestamp = key;
      bucket.min = point.value;
      bucket.max = point.value;
    } else {
      bucket.min = std::min(bucket.min, point.value);
      bucket.max = std::max(bucket.max, point.value);
    }
    sum += point.value;
    ++bucket.count;
  }

  std::vector<Bucket> out{};
  out.reserve(buckets.size());
  for (auto& [key, entry] : buckets) {
    auto& [bucket, sum] = entry;
    bucket.avg = sum / static_cast<double>(bucket.count);
    out.push_back(bucket);
  }
  return out;
}

SeriesStatistics MetricSeries::Statistics(const std::string& metric_id,
                                          std::int64_t start,
                                          std::int64_t end) const {
  const auto points = Range(metric_id, start, end);
  if (points.empty()) {
    throw NotFoundError("no data for metric " + metric_id + " in [" + std::to_string(start) + ", " +
                        std::to_string(end) + "]");
  }

  SeriesStatistics stats{};
  stats.count = points.size();
  stats.min = points.front().value;
  stats.max = points.front().value;
  double sum = 0.0;
  for (const auto& point : points) {
    stats.min = std::min(stats.min, point.value);
    stats.max = std::max(stats.max, point.value);
    sum += point.value;
  }
  const auto count = static_cast<double>(points.size());
  stats.avg = sum / count;

  double squared_diffs = 0.0;
  for (const auto& point : points) {
    squared_diffs += (point.value - stats.avg) * (point.value - stats.avg);
  }
  stats.std_dev = std::sqrt(squared_diffs / count);

  // Least-squares slope of value against days since the first point.
  const auto first_timestamp = points.front().timestamp;
  double day_sum = 0.0;
  for (const auto& point : points) {
    day_sum += static_cast<double>(point.timestamp - first_timestamp) / static_cast<double>(kMillisPerDay);
  }
  const double day_avg = day_sum / count;
  double numerator = 0.0;
  double denominator = 0.0;
  for (const auto& point : points) {
    const double day =
        static_cast<double>(point.timestamp - first_timestamp) / static_cast<double>(kMillisPerDay) - day_avg;
    numerator += day * (point.value - stats.avg);
    denominator += day * day;
  }
  const double slope = denominator != 0.0 ? numerator / denominator : 0.0;
  const double threshold = kTrendSlopeFraction * stats.avg;
  if (slope > threshold) {
    stats.trend = Trend::kIncreasing;
  } else if (slope < -threshold) {
    stats.trend = Trend::kDecreasing;
  } else {
    stats.trend = Trend::kStable;
  }
  return stats;
}

std::size_t MetricSeries::DeleteRange(const std::string& metric_id,
                                      std::optional<std::int64_t> start,
                                      std::optional<std::int64_t> end,
                                      const Deadline& deadline) {
  ValidateMetricId(metric_id, "MetricSeries::DeleteRange");
  if (start.has_value() && end.has_value()) {
    ValidateWindow(*start, *end, "MetricSeries::DeleteRange");
  }

  auto* db = backend_.connection().db;
  std::vector<std::int64_t> timestamps{};
  {
    core::Statement scan(db,
                         "SELECT ts FROM metric_points WHERE metric_id = ?1 AND (?2 IS NULL OR ts >= ?2) "
                         "AND (?3 IS NULL OR ts <= ?3) ORDER BY ts;");
    scan.BindText(1, metric_id);
    scan.BindOptionalInt64(2, start);
    scan.BindOptionalInt64(3, end);
    while (scan.Step()) {
      timestamps.push_back(scan.ColumnInt64(0));
    }
  }

  // Each point is its own write; an append racing this loop may survive.
  core::Statement erase(db, "DELETE FROM metric_points WHERE metric_id = ? AND ts = ?;");
  std::size_t deleted = 0;
  for (const auto timestamp : timestamps) {
    if (deleted % kDeadlineCheckInterval == 0 && deadline.Expired()) {
      throw TimeoutError("metric delete for " + metric_id + " exceeded deadline after " + std::to_string(deleted) +
                         " points");
    }
    core::WriteLock lock(backend_.connection());
    erase.Reset();
    erase.BindText(1, metric_id);
    erase.BindInt64(2, timestamp);
    erase.StepDone();
    ++deleted;
  }
  spdlog::debug("deleted {} points from {}", deleted, metric_id);
  return deleted;
}

std::size_t MetricSeries::SweepExpired(std::int64_t now_ms) {
  core::WriteLock lock(backend_.connection());
  core::Statement stmt(backend_.connection().db,
                       "DELETE FROM metric_points WHERE expiry IS NOT NULL AND expiry <= ? RETURNING ts;");
  stmt.BindInt64(1, now_ms);
  std::size_t removed = 0;
  while (stmt.Step()) {
    ++removed;
  }
  stmt.Reset();
  if (removed > 0) {
    spdlog::info("retention sweep removed {} expired metric points", removed);
  }
  return removed;
}

std::vector<std::string> MetricSeries::MetricIds(const std::string& prefix) const {
  core::Statement stmt(backend_.connection().db,
                       "SELECT DISTINCT metric_id FROM metric_points WHERE substr(metric_id, 1, length(?1)) = ?1 "
                       "ORDER BY metric_id;");
  stmt.BindText(1, prefix);
  std::vector<std::string> ids{};
  while (stmt.Step()) {
    ids.push_back(stmt.ColumnText(0));
  }
  return ids;
}

std::optional<std::int64_t> MetricSeries::Freshness(const std::string& prefix) const {
  core::Statement stmt(backend_.connection().db,
                       "SELECT MAX(ts) FROM metric_points WHERE substr(metric_id, 1, length(?1)) = ?1;");
  stmt.BindText(1, prefix);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return stmt.ColumnOptionalInt64(0);
}

}  // namespace kisancpp
