#include "benchkit/stats.h"

#include "benchkit/detail/sample_stats.h"
#include "benchkit/errors.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string_view>
#include <utility>

namespace benchkit {
namespace {

template <typename Stats>
void require_poolable(std::span<const Stats> stats) {
    if (stats.empty())
        throw StatsInsufficientDataError("cannot aggregate an empty stats list");
    for (const auto &s : stats) {
        if (s.metric_name != stats.front().metric_name) {
            throw ConsistencyError(fmt::format("all stats must have the same metric, got '{}' and '{}'", stats.front().metric_name,
                                               s.metric_name));
        }
    }
}

void fill_frequencies(CategoricalStats &out) {
    std::size_t total = 0;
    for (const auto &[label, count] : out.counts)
        total += count;
    out.frequencies.clear();
    out.mode.reset();
    std::size_t best = 0;
    for (const auto &[label, count] : out.counts) {
        out.frequencies[label] = total == 0 ? 0.0 : static_cast<double>(count) / static_cast<double>(total);
        if (count > best) {
            best     = count;
            out.mode = label;
        }
    }
}

double z_for_level(double level) {
    struct Entry {
        double level;
        double z;
    };
    static constexpr Entry kTable[] = {
        {0.90, 1.6448536269514722},
        {0.95, 1.959963984540054},
        {0.99, 2.5758293035489004},
    };
    for (const auto &e : kTable) {
        if (std::abs(e.level - level) < 1e-12)
            return e.z;
    }
    throw ConfigurationError(fmt::format("unsupported confidence level {}; use one of 0.90, 0.95, 0.99", level));
}

std::string label_of(const ScoreValue &value) {
    if (const auto *b = std::get_if<bool>(&value))
        return *b ? "true" : "false";
    if (const auto *d = std::get_if<double>(&value))
        return fmt::format("{}", *d);
    return std::get<std::string>(value);
}

std::string_view kind_of(const ScoreValue &value) {
    if (std::holds_alternative<bool>(value))
        return "boolean";
    if (std::holds_alternative<double>(value))
        return "number";
    return "string";
}

} // namespace

BooleanStats BooleanStats::from_eval(std::string metric_name, std::span<const std::optional<bool>> values) {
    BooleanStats out;
    out.metric_name = std::move(metric_name);
    out.n_attempts  = values.size();
    for (const auto &v : values) {
        if (!v)
            continue;
        ++out.n_valid_attempts;
        if (*v)
            ++out.n_true;
    }
    if (out.n_valid_attempts == 0)
        throw StatsInsufficientDataError(fmt::format("metric '{}': all values are null", out.metric_name));
    out.n_false = out.n_valid_attempts - out.n_true;
    return out;
}

BooleanStats BooleanStats::aggregate(std::span<const BooleanStats> stats) {
    require_poolable(stats);
    BooleanStats out;
    out.metric_name = stats.front().metric_name;
    for (const auto &s : stats) {
        out.n_attempts += s.n_attempts;
        out.n_valid_attempts += s.n_valid_attempts;
        out.n_true += s.n_true;
    }
    out.n_false = out.n_valid_attempts - out.n_true;
    return out;
}

double BooleanStats::proportion() const {
    if (n_valid_attempts == 0)
        return 0.0;
    return static_cast<double>(n_true) / static_cast<double>(n_valid_attempts);
}

std::pair<double, double> BooleanStats::confidence_interval(double level) const {
    if (n_valid_attempts == 0)
        return {0.0, 0.0};
    const double z = z_for_level(level);

    const double n      = static_cast<double>(n_valid_attempts);
    const double p_hat  = proportion();
    const double z2     = z * z;
    const double denom  = 1.0 + z2 / n;
    const double center = (p_hat + z2 / (2.0 * n)) / denom;
    const double margin = z * std::sqrt((p_hat * (1.0 - p_hat) + z2 / (4.0 * n)) / n) / denom;
    // Rounding in center +/- margin can step past p_hat when it sits on 0 or 1.
    const double lower = std::min(p_hat, std::max(0.0, center - margin));
    const double upper = std::max(p_hat, std::min(1.0, center + margin));
    return {lower, upper};
}

RegressionStats RegressionStats::from_eval(std::string metric_name, std::span<const std::optional<double>> values) {
    std::vector<double> valid;
    valid.reserve(values.size());
    for (const auto &v : values) {
        if (v)
            valid.push_back(*v);
    }
    if (valid.empty())
        throw StatsInsufficientDataError(fmt::format("metric '{}': all values are null", metric_name));

    const auto      sample = detail::sample_moments(valid);
    RegressionStats out;
    out.metric_name      = std::move(metric_name);
    out.n_attempts       = values.size();
    out.n_valid_attempts = sample.count;
    out.mean             = sample.mean;
    out.stddev           = sample.stddev;
    out.min              = sample.min;
    out.max              = sample.max;
    return out;
}

RegressionStats RegressionStats::aggregate(std::span<const RegressionStats> stats) {
    require_poolable(stats);
    RegressionStats out;
    out.metric_name = stats.front().metric_name;
    out.min         = std::numeric_limits<double>::infinity();
    out.max         = -std::numeric_limits<double>::infinity();

    double weighted_sum = 0.0;
    for (const auto &s : stats) {
        out.n_attempts += s.n_attempts;
        out.n_valid_attempts += s.n_valid_attempts;
        weighted_sum += s.mean * static_cast<double>(s.n_valid_attempts);
    }
    if (out.n_valid_attempts == 0)
        throw StatsInsufficientDataError(fmt::format("metric '{}': no valid attempts to aggregate", out.metric_name));

    const double total = static_cast<double>(out.n_valid_attempts);
    out.mean           = weighted_sum / total;

    double pooled = 0.0;
    for (const auto &s : stats) {
        if (s.n_valid_attempts == 0)
            continue;
        const double diff = s.mean - out.mean;
        pooled += static_cast<double>(s.n_valid_attempts) * (s.stddev * s.stddev + diff * diff);
        out.min = std::min(out.min, s.min);
        out.max = std::max(out.max, s.max);
    }
    out.stddev = std::sqrt(pooled / total);
    return out;
}

CategoricalStats CategoricalStats::from_eval(std::string metric_name, std::span<const std::optional<std::string>> values) {
    CategoricalStats out;
    out.metric_name = std::move(metric_name);
    out.n_attempts  = values.size();
    for (const auto &v : values) {
        if (!v)
            continue;
        ++out.n_valid_attempts;
        ++out.counts[*v];
    }
    fill_frequencies(out);
    return out;
}

CategoricalStats CategoricalStats::aggregate(std::span<const CategoricalStats> stats) {
    require_poolable(stats);
    CategoricalStats out;
    out.metric_name = stats.front().metric_name;
    for (const auto &s : stats) {
        out.n_attempts += s.n_attempts;
        out.n_valid_attempts += s.n_valid_attempts;
        for (const auto &[label, count] : s.counts)
            out.counts[label] += count;
    }
    fill_frequencies(out);
    return out;
}

const std::string &metric_name_of(const MetricStats &stats) {
    return std::visit([](const auto &s) -> const std::string & { return s.metric_name; }, stats);
}

std::size_t n_valid_of(const MetricStats &stats) {
    return std::visit([](const auto &s) { return s.n_valid_attempts; }, stats);
}

std::vector<std::optional<bool>> as_booleans(const Scores &scores) {
    std::vector<std::optional<bool>> out;
    out.reserve(scores.size());
    for (const auto &score : scores) {
        if (!score) {
            out.emplace_back();
            continue;
        }
        const auto *b = std::get_if<bool>(&*score);
        if (b == nullptr)
            throw ConsistencyError(fmt::format("expected a boolean score, got a {}", kind_of(*score)));
        out.emplace_back(*b);
    }
    return out;
}

std::vector<std::optional<double>> as_reals(const Scores &scores) {
    std::vector<std::optional<double>> out;
    out.reserve(scores.size());
    for (const auto &score : scores) {
        if (!score) {
            out.emplace_back();
            continue;
        }
        const auto *d = std::get_if<double>(&*score);
        if (d == nullptr)
            throw ConsistencyError(fmt::format("expected a numeric score, got a {}", kind_of(*score)));
        out.emplace_back(*d);
    }
    return out;
}

std::vector<std::optional<std::string>> as_labels(const Scores &scores) {
    std::vector<std::optional<std::string>> out;
    out.reserve(scores.size());
    for (const auto &score : scores) {
        if (!score)
            out.emplace_back();
        else
            out.emplace_back(label_of(*score));
    }
    return out;
}

MetricStats stats_from_scores(MetricType type, std::string metric_name, const Scores &scores) {
    switch (type) {
    case MetricType::Boolean: return BooleanStats::from_eval(std::move(metric_name), as_booleans(scores));
    case MetricType::Regression: return RegressionStats::from_eval(std::move(metric_name), as_reals(scores));
    case MetricType::Categorical: return CategoricalStats::from_eval(std::move(metric_name), as_labels(scores));
    }
    throw ConsistencyError("unknown metric type");
}

namespace {
template <typename Stats>
MetricStats pool_as(std::span<const MetricStats> stats) {
    std::vector<Stats> typed;
    typed.reserve(stats.size());
    for (const auto &s : stats) {
        const auto *t = std::get_if<Stats>(&s);
        if (t == nullptr)
            throw ConsistencyError(fmt::format("cannot pool stats of different kinds for metric '{}'", metric_name_of(s)));
        typed.push_back(*t);
    }
    return Stats::aggregate(typed);
}
} // namespace

MetricStats aggregate_stats(std::span<const MetricStats> stats) {
    if (stats.empty())
        throw StatsInsufficientDataError("cannot aggregate an empty stats list");
    switch (stats.front().index()) {
    case 0: return pool_as<BooleanStats>(stats);
    case 1: return pool_as<RegressionStats>(stats);
    default: return pool_as<CategoricalStats>(stats);
    }
}

} // namespace benchkit
