#pragma once

#include "benchkit/aggregator.h"
#include "benchkit/executor.h"
#include "benchkit/instance.h"
#include "benchkit/metric.h"
#include "benchkit/spec.h"
#include "benchkit/stats.h"

#include <optional>
#include <string_view>
#include <vector>

namespace benchkit {

// Ordered: a stage may be restored from an artifact of equal or higher rank.
enum class StageKind {
    Benchmark  = 1,
    Execution  = 2,
    Evaluation = 3,
    Report     = 4,
};

std::string_view stage_name(StageKind kind);
bool             parse_stage_name(std::string_view text, StageKind &out);
inline int       stage_rank(StageKind kind) { return static_cast<int>(kind); }

// Snapshot shared by every stage: spec, instances, metrics and aggregators.
// Construction rejects mixed instance types and duplicate metric names.
class StageBase {
  public:
    virtual ~StageBase() = default;

    virtual StageKind kind() const = 0;

    const Spec           &spec() const { return spec_; }
    const InstanceList   &instances() const { return instances_; }
    const MetricList     &metrics() const { return metrics_; }
    const AggregatorList &aggregators() const { return aggregators_; }

    // Registry tag shared by all instances; unset for an empty stage.
    std::optional<std::string_view> instance_type() const;
    const Metric                   *find_metric(std::string_view name) const;

  protected:
    StageBase(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators);

  private:
    Spec           spec_;
    InstanceList   instances_;
    MetricList     metrics_;
    AggregatorList aggregators_;
};

class BenchmarkExec;
class BenchmarkEval;
class BenchmarkReport;

// Initial stage: instances selected from a source, nothing executed yet.
class Benchmark final : public StageBase {
  public:
    Benchmark(Spec spec, const InstanceSource &source, MetricList metrics = {}, AggregatorList aggregators = {});
    Benchmark(Spec spec, InstanceList instances, MetricList metrics = {}, AggregatorList aggregators = {});

    // Rebuilds a stage whose instances were already selected (artifact load).
    static Benchmark restore(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators);

    StageKind kind() const override { return StageKind::Benchmark; }

    // Runs `fn` n_attempts times per instance, each under the spec timeout.
    BenchmarkExec run(const Callable &fn) const;
    BenchmarkExec run(const Callable &fn, const Executor &executor) const;

  private:
    struct Selected {};
    Benchmark(Selected, Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators);
};

class BenchmarkExec final : public StageBase {
  public:
    BenchmarkExec(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators);

    StageKind kind() const override { return StageKind::Execution; }

    [[nodiscard]] BenchmarkExec with_metric(MetricPtr metric) const;

    // Scores every instance on every metric.
    BenchmarkEval evaluate() const;
};

class BenchmarkEval final : public StageBase {
  public:
    BenchmarkEval(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators);

    StageKind kind() const override { return StageKind::Evaluation; }

    BenchmarkReport report() const;
    MetricStats     summarize(std::string_view metric_name) const;
};

class BenchmarkReport final : public StageBase {
  public:
    BenchmarkReport(Spec spec, InstanceList instances, MetricList metrics, AggregatorList aggregators,
                    std::vector<Report> reports);

    StageKind kind() const override { return StageKind::Report; }

    const std::vector<Report> &reports() const { return reports_; }
    MetricStats                summarize(std::string_view metric_name) const;

  private:
    std::vector<Report> reports_;
};

// Pools the per-instance stats of one metric over `instances`, skipping
// instances with no valid score.
MetricStats summarize_metric(const StageBase &stage, std::string_view metric_name);

} // namespace benchkit
