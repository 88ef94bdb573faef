#pragma once

#include "benchkit/instance.h"
#include "benchkit/types.h"

#include <boost/json.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace benchkit {

// Stateless scoring strategy: (instance, attempt) -> typed, possibly-null
// score. One Metric object may be reused across any number of instances.
class Metric {
  public:
    virtual ~Metric() = default;

    // Unique name; scores are stored under it.
    virtual std::string_view name() const = 0;
    virtual MetricType       type() const = 0;
    // Registry tag used to rebuild the metric from an artifact.
    virtual std::string_view type_tag() const = 0;

    virtual Score score(const Instance &instance, const Attempt &attempt) const = 0;

    // Extra constructor parameters persisted next to the type tag.
    virtual void write_params(boost::json::object &out) const;

    // One score per attempt, in attempt order. Warns when `instance` already
    // carries scores under this metric's name; they will be overwritten.
    Scores evaluate(const Instance &instance, const std::vector<Attempt> &attempts) const;
};

using MetricPtr  = std::shared_ptr<const Metric>;
using MetricList = std::vector<MetricPtr>;

// Case-insensitive whole-word match of the ground truth inside the response.
class ExactMatchMetric final : public Metric {
  public:
    static constexpr std::string_view kName    = "exact_match";
    static constexpr std::string_view kTypeTag = "ExactMatchMetric";

    std::string_view name() const override { return kName; }
    MetricType       type() const override { return MetricType::Boolean; }
    std::string_view type_tag() const override { return kTypeTag; }
    Score            score(const Instance &instance, const Attempt &attempt) const override;
};

// Wall-clock runtime of successful attempts, in seconds.
class RuntimeMetric final : public Metric {
  public:
    static constexpr std::string_view kName    = "runtime";
    static constexpr std::string_view kTypeTag = "RuntimeMetric";

    std::string_view name() const override { return kName; }
    MetricType       type() const override { return MetricType::Regression; }
    std::string_view type_tag() const override { return kTypeTag; }
    Score            score(const Instance &instance, const Attempt &attempt) const override;
};

// Terminal status label of each attempt.
class StatusMetric final : public Metric {
  public:
    static constexpr std::string_view kName    = "status";
    static constexpr std::string_view kTypeTag = "StatusMetric";

    std::string_view name() const override { return kName; }
    MetricType       type() const override { return MetricType::Categorical; }
    std::string_view type_tag() const override { return kTypeTag; }
    Score            score(const Instance &instance, const Attempt &attempt) const override;
};

// Builds the `\b<escaped>\b` pattern used by ExactMatchMetric.
std::string whole_word_pattern(std::string_view text);

} // namespace benchkit
