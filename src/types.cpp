#include "benchkit/types.h"

#include "benchkit/errors.h"

#include <fmt/format.h>

#include <utility>

namespace benchkit {

std::string_view to_string(AttemptStatus status) {
    switch (status) {
    case AttemptStatus::Success: return "success";
    case AttemptStatus::Failure: return "failure";
    case AttemptStatus::Timeout: return "timeout";
    }
    return "failure";
}

bool parse_status(std::string_view text, AttemptStatus &out) {
    if (text == "success") { out = AttemptStatus::Success; return true; }
    if (text == "failure") { out = AttemptStatus::Failure; return true; }
    if (text == "timeout") { out = AttemptStatus::Timeout; return true; }
    return false;
}

std::string_view to_string(MetricType type) {
    switch (type) {
    case MetricType::Boolean: return "boolean";
    case MetricType::Regression: return "regression";
    case MetricType::Categorical: return "categorical";
    }
    return "boolean";
}

Attempt::Attempt(std::optional<std::string> response, std::optional<double> runtime_s, AttemptStatus status, UsageCounters usage,
                 std::optional<std::string> error)
    : response_(std::move(response)), runtime_s_(runtime_s), status_(status), usage_(std::move(usage)), error_(std::move(error)) {
    if (runtime_s_ && *runtime_s_ < 0.0)
        throw ConsistencyError(fmt::format("attempt runtime must be non-negative, got {}", *runtime_s_));
}

} // namespace benchkit
