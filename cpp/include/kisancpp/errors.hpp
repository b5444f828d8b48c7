#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace kisancpp {

enum class ErrorCode {
  kValidation,
  kNotFound,
  kProvider,
  kTimeout,
};

class KisanError : public std::runtime_error {
 public:
  KisanError(const std::string& message, ErrorCode code) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Missing or malformed argument. Never retried.
class ValidationError : public KisanError {
 public:
  explicit ValidationError(const std::string& message) : KisanError(message, ErrorCode::kValidation) {}
};

// No data for the requested entity or window.
class NotFoundError : public KisanError {
 public:
  explicit NotFoundError(const std::string& message) : KisanError(message, ErrorCode::kNotFound) {}
};

// Embedding provider or backend store unavailable.
class ProviderError : public KisanError {
 public:
  explicit ProviderError(const std::string& message) : KisanError(message, ErrorCode::kProvider) {}
};

// Caller-supplied deadline passed during a scan.
class TimeoutError : public KisanError {
 public:
  explicit TimeoutError(const std::string& message) : KisanError(message, ErrorCode::kTimeout) {}
};

enum class ConsistencyWarningKind {
  kMissingReverseEdge,
  kOrphanReverseEdge,
  kDanglingEdgeTarget,
};

// Logged and counted, never thrown.
struct ConsistencyWarning {
  ConsistencyWarningKind kind = ConsistencyWarningKind::kMissingReverseEdge;
  std::string node_id;
  std::string detail;
};

std::string ToString(ErrorCode code);
std::string ToString(ConsistencyWarningKind kind);

// Emits the warning through the default logger and bumps the process counter.
void ReportConsistencyWarning(const ConsistencyWarning& warning);
[[nodiscard]] std::size_t ConsistencyWarningCount();

}  // namespace kisancpp
