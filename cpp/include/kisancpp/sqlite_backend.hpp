#pragma once

#include "kisancpp/types.hpp"

#include <memory>
#include <string>

namespace kisancpp {

// Shared keyed store behind VectorStore, RelationshipGraph and MetricSeries.
// Offers point get/put/delete and ordered range scans over composite keys.
class SqliteBackend {
 public:
  explicit SqliteBackend(const StoreConfig& config = {});
  ~SqliteBackend();
  SqliteBackend(const SqliteBackend&) = delete;
  SqliteBackend& operator=(const SqliteBackend&) = delete;

  [[nodiscard]] const std::string& path() const;

  struct Connection;
  [[nodiscard]] Connection& connection() const;

 private:
  std::string path_;
  std::unique_ptr<Connection> connection_;
};

}  // namespace kisancpp
