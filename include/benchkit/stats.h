#pragma once

#include "benchkit/types.h"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace benchkit {

// Per-metric summaries. `from_eval` summarizes one instance's per-attempt
// values; `aggregate` pools summaries of the same metric so that the result
// equals `from_eval` over the concatenated values. Null values count toward
// n_attempts but not toward n_valid_attempts.

struct BooleanStats {
    std::string metric_name;
    std::size_t n_attempts       = 0;
    std::size_t n_valid_attempts = 0;
    std::size_t n_true           = 0;
    std::size_t n_false          = 0;

    static BooleanStats from_eval(std::string metric_name, std::span<const std::optional<bool>> values);
    static BooleanStats aggregate(std::span<const BooleanStats> stats);

    // n_true / n_valid_attempts, 0 when nothing is valid.
    double proportion() const;

    // Wilson score interval for the proportion of `true`. Supported levels:
    // 0.90, 0.95 and 0.99. Returns (0, 0) when n_valid_attempts is 0.
    std::pair<double, double> confidence_interval(double level = 0.95) const;
};

struct RegressionStats {
    std::string metric_name;
    std::size_t n_attempts       = 0;
    std::size_t n_valid_attempts = 0;
    double      mean             = 0.0;
    double      stddev           = 0.0; // population
    double      min              = 0.0;
    double      max              = 0.0;

    static RegressionStats from_eval(std::string metric_name, std::span<const std::optional<double>> values);
    static RegressionStats aggregate(std::span<const RegressionStats> stats);
};

struct CategoricalStats {
    std::string                   metric_name;
    std::size_t                   n_attempts       = 0;
    std::size_t                   n_valid_attempts = 0;
    std::map<std::string, std::size_t> counts;
    std::map<std::string, double> frequencies;
    std::optional<std::string>    mode; // ties go to the smallest label

    static CategoricalStats from_eval(std::string metric_name, std::span<const std::optional<std::string>> values);
    static CategoricalStats aggregate(std::span<const CategoricalStats> stats);
};

using MetricStats = std::variant<BooleanStats, RegressionStats, CategoricalStats>;

const std::string &metric_name_of(const MetricStats &stats);
std::size_t        n_valid_of(const MetricStats &stats);

// Typed views over raw scores. Boolean and regression views reject values of
// another type with ConsistencyError; the categorical view stringifies.
std::vector<std::optional<bool>>        as_booleans(const Scores &scores);
std::vector<std::optional<double>>      as_reals(const Scores &scores);
std::vector<std::optional<std::string>> as_labels(const Scores &scores);

MetricStats stats_from_scores(MetricType type, std::string metric_name, const Scores &scores);
// All entries must hold the same stats kind and metric name.
MetricStats aggregate_stats(std::span<const MetricStats> stats);

} // namespace benchkit
