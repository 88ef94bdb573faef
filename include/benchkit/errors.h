#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace benchkit {

// Root of every error benchkit raises. Per-attempt failures are never thrown;
// they are recorded as data on the Attempt.
class error : public std::runtime_error {
  public:
    explicit error(std::string message) : std::runtime_error(std::move(message)) {}
};

// Invalid Spec values or selection requests (bad n_attempts, unknown id, ...).
class ConfigurationError : public error {
  public:
    explicit ConfigurationError(std::string message) : error(std::move(message)) {}
};

// Heterogeneous instance types, duplicate metric names, scores missing for an
// aggregator target, stats pooled across different metrics.
class ConsistencyError : public error {
  public:
    explicit ConsistencyError(std::string message) : error(std::move(message)) {}
};

class ArtifactCorruptedError : public error {
  public:
    explicit ArtifactCorruptedError(std::string message, std::optional<std::string> path = std::nullopt)
        : error(path ? message + " (path: " + *path + ")" : message), path_(std::move(path)) {}

    const std::optional<std::string> &path() const { return path_; }

  private:
    std::optional<std::string> path_;
};

class StatsInsufficientDataError : public error {
  public:
    explicit StatsInsufficientDataError(std::string message) : error(std::move(message)) {}
};

} // namespace benchkit
