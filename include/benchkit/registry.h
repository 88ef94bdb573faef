#pragma once

#include "benchkit/aggregator.h"
#include "benchkit/instance.h"
#include "benchkit/metric.h"

#include <boost/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace benchkit {

// Module name written next to every type tag in artifacts.
inline constexpr std::string_view kClassModule = "benchkit";

// Maps artifact type tags to factories. Factories receive the JSON record the
// type was written to and throw ArtifactCorruptedError on malformed input.
class TypeRegistry {
  public:
    using InstanceFactory   = std::function<std::unique_ptr<Instance>(const boost::json::object &)>;
    using MetricFactory     = std::function<MetricPtr(const boost::json::object &)>;
    using AggregatorFactory = std::function<AggregatorPtr(const boost::json::object &)>;

    void add_instance(std::string tag, InstanceFactory factory);
    void add_metric(std::string tag, MetricFactory factory);
    void add_aggregator(std::string tag, AggregatorFactory factory);

    bool has_instance(std::string_view tag) const;
    bool has_metric(std::string_view tag) const;
    bool has_aggregator(std::string_view tag) const;

    std::unique_ptr<Instance> make_instance(std::string_view tag, const boost::json::object &record) const;
    MetricPtr                 make_metric(std::string_view tag, const boost::json::object &record) const;
    AggregatorPtr             make_aggregator(std::string_view tag, const boost::json::object &record) const;

  private:
    std::map<std::string, InstanceFactory, std::less<>>   instances_;
    std::map<std::string, MetricFactory, std::less<>>     metrics_;
    std::map<std::string, AggregatorFactory, std::less<>> aggregators_;
};

// Registry pre-populated with the built-in instance, metric and aggregator
// types. Shared and mutable so applications can register their own.
TypeRegistry &default_registry();

void register_builtin_types(TypeRegistry &registry);

} // namespace benchkit
