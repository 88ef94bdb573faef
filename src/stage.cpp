#include "benchkit/stage.h"

#include "benchkit/errors.h"
#include "benchkit/log.h"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <typeinfo>
#include <utility>

namespace benchkit {
namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) { return std::chrono::duration<double>(Clock::now() - start).count(); }

void check_instances(const InstanceList &instances) {
    const Instance *first = nullptr;
    for (const auto &instance : instances) {
        if (!instance)
            throw ConsistencyError("stage holds a null instance");
        if (first == nullptr) {
            first = instance.get();
            continue;
        }
        if (typeid(*instance) != typeid(*first)) {
            throw ConsistencyError(fmt::format("mixed instance types: '{}' ({}) and '{}' ({})", first->id(), first->type_tag(),
                                               instance->id(), instance->type_tag()));
        }
    }
}

void check_metrics(const MetricList &metrics) {
    std::set<std::string_view> seen;
    for (const auto &metric : metrics) {
        if (!metric)
            throw ConsistencyError("stage holds a null metric");
        if (!seen.insert(metric->name()).second)
            throw ConsistencyError(fmt::format("duplicate metric name '{}'", metric->name()));
    }
}

void check_aggregators(const AggregatorList &aggregators) {
    for (const auto &aggregator : aggregators) {
        if (!aggregator)
            throw ConsistencyError("stage holds a null aggregator");
    }
}

InstanceList select_instances(const Spec &spec, const InstanceSource &source) {
    const auto  &ids = spec.instance_ids();
    const auto  &n   = spec.n_instance();
    InstanceList selected;

    if (!ids.empty()) {
        std::size_t count = ids.size();
        if (n) {
            count = std::min(count, static_cast<std::size_t>(*n));
            log::warn("both n_instance ({}) and instance_ids ({} ids) given; selecting the first {} of instance_ids", *n,
                      ids.size(), count);
        }
        selected.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
            selected.push_back(source.get(std::string_view(ids[i])));
        return selected;
    }

    std::size_t count = source.size();
    if (n) {
        const auto wanted = static_cast<std::size_t>(*n);
        if (wanted > count)
            log::warn("n_instance ({}) exceeds the {} available instances; selecting all", wanted, count);
        count = std::min(count, wanted);
    }
    selected.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        selected.push_back(source.get(i));
    return selected;
}

AttemptStatus status_for(ExecOutcome outcome) {
    switch (outcome) {
    case ExecOutcome::Success: return AttemptStatus::Success;
    case ExecOutcome::Timeout: return AttemptStatus::Timeout;
    case ExecOutcome::Error: break;
    }
    return AttemptStatus::Failure;
}

Attempt make_attempt(TimedResult timed) {
    const AttemptStatus status = status_for(timed.outcome);
    if (timed.is_success() && timed.result) {
        return Attempt(std::move(timed.result->answer), timed.runtime_s, status, std::move(timed.result->usage));
    }
    std::optional<std::string> error;
    if (!timed.error.empty())
        error = std::move(timed.error);
    return Attempt(std::nullopt, timed.runtime_s, status, {}, std::move(error));
}

// Mirrors log lines into the spec's logs file for the duration of a transition.
class TransitionLog {
  public:
    explicit TransitionLog(const Spec &spec) {
        if (spec.logs_filepath())
            scope_.emplace(*spec.logs_filepath());
    }

  private:
    std::optional<log::FileScope> scope_;
};

} // namespace

std::string_view stage_name(StageKind kind) {
    switch (kind) {
    case StageKind::Benchmark: return "Benchmark";
    case StageKind::Execution: return "BenchmarkExec";
    case StageKind::Evaluation: return "BenchmarkEval";
    case StageKind::Report: return "BenchmarkReport";
    }
    return "Benchmark";
}

bool parse_stage_name(std::string_view text, StageKind &out) {
    for (StageKind kind : {StageKind::Benchmark, StageKind::Execution, StageKind::Evaluation, StageKind::Report}) {
        if (stage_name(kind) == text) {
            out = kind;
            return true;
        }
    }
    return false;
}

StageBase::StageBase(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators)
    : spec_(std::move(spec)), instances_(std::move(instances)), metrics_(std::move(metrics)), aggregators_(std::move(aggregators)) {
    check_instances(instances_);
    check_metrics(metrics_);
    check_aggregators(aggregators_);
}

std::optional<std::string_view> StageBase::instance_type() const {
    if (instances_.empty())
        return std::nullopt;
    return instances_.front()->type_tag();
}

const Metric *StageBase::find_metric(std::string_view name) const {
    for (const auto &metric : metrics_) {
        if (metric->name() == name)
            return metric.get();
    }
    return nullptr;
}

// ---- Benchmark ----

Benchmark::Benchmark(Spec spec, const InstanceSource &source, MetricList metrics, AggregatorList aggregators)
    : StageBase(spec, select_instances(spec, source), std::move(metrics), std::move(aggregators)) {}

Benchmark::Benchmark(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators)
    : Benchmark(std::move(spec), ListSource(std::move(instances)), std::move(metrics), std::move(aggregators)) {}

Benchmark::Benchmark(Selected, Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators)
    : StageBase(std::move(spec), std::move(instances), std::move(metrics), std::move(aggregators)) {}

Benchmark Benchmark::restore(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators) {
    return Benchmark(Selected{}, std::move(spec), std::move(instances), std::move(metrics), std::move(aggregators));
}

BenchmarkExec Benchmark::run(const Callable &fn) const { return run(fn, ProcessExecutor{}); }

BenchmarkExec Benchmark::run(const Callable &fn, const Executor &executor) const {
    TransitionLog logs(spec());
    const auto    start = Clock::now();
    log::info("running benchmark '{}': {} instances x {} attempts", spec().name(), instances().size(), spec().n_attempts());

    InstanceList executed;
    executed.reserve(instances().size());
    for (const auto &instance : instances()) {
        std::vector<Attempt> attempts = instance->attempts();
        for (int i = 0; i < spec().n_attempts(); ++i) {
            TimedResult timed = executor.execute(fn, spec().timeout(), *instance);
            if (!timed.is_success())
                log::warn("instance '{}' attempt {}: {} ({})", instance->id(), i + 1, to_string(timed.outcome), timed.error);
            else
                log::debug("instance '{}' attempt {}: success in {:.3f}s", instance->id(), i + 1, timed.runtime_s);
            attempts.push_back(make_attempt(std::move(timed)));
        }
        executed.push_back(instance->with_attempts(std::move(attempts)));
    }

    const double elapsed = seconds_since(start);
    log::info("benchmark '{}' executed in {:.2f}s", spec().name(), elapsed);
    return BenchmarkExec(spec().with_execution_time(elapsed), std::move(executed), metrics(), aggregators());
}

// ---- BenchmarkExec ----

BenchmarkExec::BenchmarkExec(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators)
    : StageBase(std::move(spec), std::move(instances), std::move(metrics), std::move(aggregators)) {}

BenchmarkExec BenchmarkExec::with_metric(MetricPtr metric) const {
    MetricList extended = metrics();
    extended.push_back(std::move(metric));
    return BenchmarkExec(spec(), instances(), std::move(extended), aggregators());
}

BenchmarkEval BenchmarkExec::evaluate() const {
    TransitionLog logs(spec());
    const auto    start = Clock::now();
    log::info("evaluating benchmark '{}' on {} metrics", spec().name(), metrics().size());

    InstanceList evaluated;
    evaluated.reserve(instances().size());
    for (const auto &instance : instances()) {
        auto scores = instance->scores();
        for (const auto &metric : metrics())
            scores[std::string(metric->name())] = metric->evaluate(*instance, instance->attempts());
        evaluated.push_back(instance->with_scores(std::move(scores)));
    }

    const double elapsed = seconds_since(start);
    log::info("benchmark '{}' evaluated in {:.2f}s", spec().name(), elapsed);
    return BenchmarkEval(spec().with_evaluation_time(elapsed), std::move(evaluated), metrics(), aggregators());
}

// ---- BenchmarkEval ----

BenchmarkEval::BenchmarkEval(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators)
    : StageBase(std::move(spec), std::move(instances), std::move(metrics), std::move(aggregators)) {}

BenchmarkReport BenchmarkEval::report() const {
    TransitionLog logs(spec());
    std::vector<Report> reports;
    reports.reserve(aggregators().size());
    for (const auto &aggregator : aggregators()) {
        reports.push_back(aggregator->aggregate(instances()));
        log::info("{}: {}", aggregator->name(), reports.back().outer);
    }
    return BenchmarkReport(spec(), instances(), metrics(), aggregators(), std::move(reports));
}

MetricStats BenchmarkEval::summarize(std::string_view metric_name) const { return summarize_metric(*this, metric_name); }

// ---- BenchmarkReport ----

BenchmarkReport::BenchmarkReport(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators,
                                 std::vector<Report> reports)
    : StageBase(std::move(spec), std::move(instances), std::move(metrics), std::move(aggregators)), reports_(std::move(reports)) {
    if (reports_.size() != this->aggregators().size()) {
        throw ConsistencyError(
            fmt::format("report stage holds {} reports for {} aggregators", reports_.size(), this->aggregators().size()));
    }
}

MetricStats BenchmarkReport::summarize(std::string_view metric_name) const { return summarize_metric(*this, metric_name); }

MetricStats summarize_metric(const StageBase &stage, std::string_view metric_name) {
    const Metric *metric = stage.find_metric(metric_name);
    if (metric == nullptr)
        throw ConfigurationError(fmt::format("unknown metric '{}'", metric_name));

    std::vector<MetricStats> per_instance;
    for (const auto &instance : stage.instances()) {
        const Scores *scores = instance->scores_for(metric_name);
        if (scores == nullptr)
            throw ConsistencyError(fmt::format("instance '{}' was not evaluated on metric '{}'", instance->id(), metric_name));
        const bool any_valid = std::any_of(scores->begin(), scores->end(), [](const Score &s) { return s.has_value(); });
        if (!any_valid)
            continue;
        per_instance.push_back(stats_from_scores(metric->type(), std::string(metric_name), *scores));
    }
    if (per_instance.empty())
        throw StatsInsufficientDataError(fmt::format("metric '{}' has no valid scores", metric_name));
    return aggregate_stats(per_instance);
}

} // namespace benchkit
