#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace benchkit {

enum class AttemptStatus {
    Success,
    Failure,
    Timeout,
};

std::string_view to_string(AttemptStatus status);
bool             parse_status(std::string_view text, AttemptStatus &out);

enum class MetricType {
    Boolean,
    Regression,
    Categorical,
};

std::string_view to_string(MetricType type);

// A single metric score. Null (std::nullopt) means the attempt could not be
// scored, e.g. it produced no response.
using ScoreValue = std::variant<bool, double, std::string>;
using Score      = std::optional<ScoreValue>;
using Scores     = std::vector<Score>;

// Resource usage counters reported by the callable (token counts, ...).
using UsageCounters = std::map<std::string, std::int64_t>;

// Value returned by the callable under test.
struct Output {
    std::optional<std::string> answer;
    UsageCounters              usage;
};

class Attempt {
  public:
    Attempt(std::optional<std::string> response, std::optional<double> runtime_s, AttemptStatus status,
            UsageCounters usage = {}, std::optional<std::string> error = std::nullopt);

    const std::optional<std::string> &response() const { return response_; }
    const std::optional<double>      &runtime() const { return runtime_s_; }
    AttemptStatus                     status() const { return status_; }
    const UsageCounters              &usage() const { return usage_; }
    const std::optional<std::string> &error() const { return error_; }

    bool is_success() const { return status_ == AttemptStatus::Success; }

    friend bool operator==(const Attempt &, const Attempt &) = default;

  private:
    std::optional<std::string> response_;
    std::optional<double>      runtime_s_;
    AttemptStatus              status_;
    UsageCounters              usage_;
    std::optional<std::string> error_;
};

} // namespace benchkit
