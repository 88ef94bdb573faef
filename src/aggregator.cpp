#include "benchkit/aggregator.h"

#include "benchkit/detail/sample_stats.h"
#include "benchkit/errors.h"
#include "benchkit/log.h"

#include <fmt/format.h>

#include <numeric>
#include <utility>
#include <variant>

namespace benchkit {

void Aggregator::write_params(boost::json::object &) const {}

Report RuntimesAggregator::aggregate(const InstanceList &instances) const {
    Report              report{std::string(kName), 0.0, {}};
    std::vector<double> medians;
    for (const auto &instance : instances) {
        std::vector<double> runtimes;
        for (const auto &attempt : instance->attempts()) {
            if (attempt.is_success() && attempt.runtime())
                runtimes.push_back(*attempt.runtime());
        }
        if (runtimes.empty())
            continue;
        const double median = detail::median_of(runtimes);
        report.inner.emplace(instance->id(), median);
        medians.push_back(median);
    }
    report.outer = detail::geometric_mean(medians);
    return report;
}

Report StatusAggregator::aggregate(const InstanceList &instances) const {
    Report              report{std::string(kName), 0.0, {}};
    std::vector<double> values;
    std::vector<double> weights;
    for (const auto &instance : instances) {
        const auto &attempts = instance->attempts();
        if (attempts.empty())
            continue;
        std::vector<double> indicators;
        indicators.reserve(attempts.size());
        for (const auto &attempt : attempts)
            indicators.push_back(attempt.is_success() ? 1.0 : 0.0);
        const double median = detail::median_of(indicators);
        report.inner.emplace(instance->id(), median);
        values.push_back(median);
        weights.push_back(static_cast<double>(attempts.size()));
    }
    report.outer = detail::weighted_mean(values, weights);
    return report;
}

ConsensusAggregator::ConsensusAggregator(std::string target) : target_(std::move(target)) {
    if (target_.empty())
        throw ConfigurationError("consensus aggregator requires a target metric name");
}

void ConsensusAggregator::write_params(boost::json::object &out) const { out["target"] = target_; }

Report ConsensusAggregator::aggregate(const InstanceList &instances) const {
    if (instances.empty())
        throw StatsInsufficientDataError("consensus aggregator: no instances to aggregate");

    Report              report{std::string(kName), 0.0, {}};
    std::vector<double> fractions;
    for (const auto &instance : instances) {
        const Scores *scores = instance->scores_for(target_);
        if (scores == nullptr)
            throw ConsistencyError(fmt::format("consensus aggregator: instance '{}' has no scores for metric '{}'",
                                               instance->id(), target_));
        if (scores->empty())
            continue;
        std::size_t n_true = 0;
        for (const auto &score : *scores) {
            if (score && std::holds_alternative<bool>(*score) && std::get<bool>(*score))
                ++n_true;
        }
        const double fraction = static_cast<double>(n_true) / static_cast<double>(scores->size());
        report.inner.emplace(instance->id(), fraction);
        fractions.push_back(fraction);
    }
    if (fractions.empty()) {
        log::warn("consensus aggregator: no attempts scored on '{}'", target_);
        return report;
    }
    const double mean = std::accumulate(fractions.begin(), fractions.end(), 0.0) / static_cast<double>(fractions.size());
    report.outer      = mean > 0.5 ? 1.0 : 0.0;
    return report;
}

} // namespace benchkit
