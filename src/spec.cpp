#include "benchkit/spec.h"

#include "benchkit/errors.h"

#include <fmt/format.h>

#include <cstdint>
#include <random>
#include <utility>

namespace benchkit {
namespace {

void validate(const SpecOptions &o) {
    if (o.n_attempts <= 0)
        throw ConfigurationError(fmt::format("n_attempts must be a strictly positive integer, got {}", o.n_attempts));
    if (o.n_instance && *o.n_instance <= 0) {
        throw ConfigurationError(fmt::format(
            "n_instance must be a strictly positive integer, or unset to select all the instances; got {}", *o.n_instance));
    }
    if (o.timeout_s && !(*o.timeout_s > 0.0))
        throw ConfigurationError(fmt::format("timeout must be strictly positive, got {}", *o.timeout_s));
    if (o.execution_time_s && *o.execution_time_s < 0.0)
        throw ConfigurationError(fmt::format("execution_time must be non-negative, got {}", *o.execution_time_s));
    if (o.evaluation_time_s && *o.evaluation_time_s < 0.0)
        throw ConfigurationError(fmt::format("evaluation_time must be non-negative, got {}", *o.evaluation_time_s));
}

} // namespace

std::string generate_benchmark_name() {
    std::random_device rd;
    std::mt19937_64    rng((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    return fmt::format("benchmark-{:016x}", rng());
}

Spec::Spec() : Spec(SpecOptions{}) {}

Spec::Spec(SpecOptions options) : options_(std::move(options)) {
    validate(options_);
    if (options_.name.empty())
        options_.name = generate_benchmark_name();
}

Spec Spec::with_execution_time(double seconds) const {
    SpecOptions next      = options_;
    next.execution_time_s = seconds;
    return Spec(std::move(next));
}

Spec Spec::with_evaluation_time(double seconds) const {
    SpecOptions next       = options_;
    next.evaluation_time_s = seconds;
    return Spec(std::move(next));
}

bool operator==(const Spec &lhs, const Spec &rhs) {
    const auto &a = lhs.options_;
    const auto &b = rhs.options_;
    return a.name == b.name && a.instance_ids == b.instance_ids && a.n_attempts == b.n_attempts && a.n_instance == b.n_instance &&
           a.timeout_s == b.timeout_s && a.logs_filepath == b.logs_filepath && a.execution_time_s == b.execution_time_s &&
           a.evaluation_time_s == b.evaluation_time_s;
}

} // namespace benchkit
