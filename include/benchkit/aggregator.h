#pragma once

#include "benchkit/instance.h"

#include <boost/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace benchkit {

struct Report {
    std::string                   aggregator_name;
    double                        outer = 0.0;
    std::map<std::string, double> inner; // instance id -> per-instance value

    friend bool operator==(const Report &, const Report &) = default;
};

// Two-level reduction of evaluated instances into one Report.
class Aggregator {
  public:
    virtual ~Aggregator() = default;

    virtual std::string_view name() const     = 0;
    virtual std::string_view type_tag() const = 0;
    virtual void             write_params(boost::json::object &out) const;

    virtual Report aggregate(const InstanceList &instances) const = 0;
};

using AggregatorPtr  = std::shared_ptr<const Aggregator>;
using AggregatorList = std::vector<AggregatorPtr>;

// inner: median runtime of the successful attempts.
// outer: geometric mean of the inner values.
class RuntimesAggregator final : public Aggregator {
  public:
    static constexpr std::string_view kName    = "runtime_aggregator";
    static constexpr std::string_view kTypeTag = "RuntimesAggregator";

    std::string_view name() const override { return kName; }
    std::string_view type_tag() const override { return kTypeTag; }
    Report           aggregate(const InstanceList &instances) const override;
};

// inner: median of the per-attempt success indicators.
// outer: attempt-count weighted mean of the inner values.
class StatusAggregator final : public Aggregator {
  public:
    static constexpr std::string_view kName    = "status_success_rate_aggregator";
    static constexpr std::string_view kTypeTag = "StatusAggregator";

    std::string_view name() const override { return kName; }
    std::string_view type_tag() const override { return kTypeTag; }
    Report           aggregate(const InstanceList &instances) const override;
};

// inner: fraction of attempts scored true on `target`.
// outer: 1 when the mean inner value exceeds one half, else 0.
class ConsensusAggregator final : public Aggregator {
  public:
    static constexpr std::string_view kName    = "consensus_aggregator";
    static constexpr std::string_view kTypeTag = "ConsensusAggregator";

    explicit ConsensusAggregator(std::string target);

    const std::string &target() const { return target_; }

    std::string_view name() const override { return kName; }
    std::string_view type_tag() const override { return kTypeTag; }
    void             write_params(boost::json::object &out) const override;
    Report           aggregate(const InstanceList &instances) const override;

  private:
    std::string target_;
};

} // namespace benchkit
