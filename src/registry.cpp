#include "benchkit/registry.h"

#include "benchkit/errors.h"

#include <fmt/format.h>

#include <utility>

namespace benchkit {
namespace {

template <typename Map>
const typename Map::mapped_type &lookup(const Map &map, std::string_view kind, std::string_view tag) {
    auto it = map.find(tag);
    if (it == map.end())
        throw ArtifactCorruptedError(fmt::format("unknown {} type '{}'", kind, tag));
    return it->second;
}

template <typename Map, typename Factory>
void insert(Map &map, std::string_view kind, std::string tag, Factory factory) {
    if (tag.empty())
        throw ConfigurationError(fmt::format("{} type tag must not be empty", kind));
    if (!factory)
        throw ConfigurationError(fmt::format("{} type '{}' registered without a factory", kind, tag));
    map.insert_or_assign(std::move(tag), std::move(factory));
}

} // namespace

void TypeRegistry::add_instance(std::string tag, InstanceFactory factory) {
    insert(instances_, "instance", std::move(tag), std::move(factory));
}

void TypeRegistry::add_metric(std::string tag, MetricFactory factory) {
    insert(metrics_, "metric", std::move(tag), std::move(factory));
}

void TypeRegistry::add_aggregator(std::string tag, AggregatorFactory factory) {
    insert(aggregators_, "aggregator", std::move(tag), std::move(factory));
}

bool TypeRegistry::has_instance(std::string_view tag) const { return instances_.find(tag) != instances_.end(); }
bool TypeRegistry::has_metric(std::string_view tag) const { return metrics_.find(tag) != metrics_.end(); }
bool TypeRegistry::has_aggregator(std::string_view tag) const { return aggregators_.find(tag) != aggregators_.end(); }

std::unique_ptr<Instance> TypeRegistry::make_instance(std::string_view tag, const boost::json::object &record) const {
    return lookup(instances_, "instance", tag)(record);
}

MetricPtr TypeRegistry::make_metric(std::string_view tag, const boost::json::object &record) const {
    return lookup(metrics_, "metric", tag)(record);
}

AggregatorPtr TypeRegistry::make_aggregator(std::string_view tag, const boost::json::object &record) const {
    return lookup(aggregators_, "aggregator", tag)(record);
}

void register_builtin_types(TypeRegistry &registry) {
    registry.add_instance(std::string(QaInstance::kTypeTag), &QaInstance::from_fields);

    registry.add_metric(std::string(ExactMatchMetric::kTypeTag),
                        [](const boost::json::object &) -> MetricPtr { return std::make_shared<ExactMatchMetric>(); });
    registry.add_metric(std::string(RuntimeMetric::kTypeTag),
                        [](const boost::json::object &) -> MetricPtr { return std::make_shared<RuntimeMetric>(); });
    registry.add_metric(std::string(StatusMetric::kTypeTag),
                        [](const boost::json::object &) -> MetricPtr { return std::make_shared<StatusMetric>(); });

    registry.add_aggregator(std::string(RuntimesAggregator::kTypeTag),
                            [](const boost::json::object &) -> AggregatorPtr { return std::make_shared<RuntimesAggregator>(); });
    registry.add_aggregator(std::string(StatusAggregator::kTypeTag),
                            [](const boost::json::object &) -> AggregatorPtr { return std::make_shared<StatusAggregator>(); });
    registry.add_aggregator(std::string(ConsensusAggregator::kTypeTag), [](const boost::json::object &record) -> AggregatorPtr {
        const auto *target = record.if_contains("target");
        if (target == nullptr || !target->is_string())
            throw ArtifactCorruptedError("ConsensusAggregator record lacks a string 'target'");
        return std::make_shared<ConsensusAggregator>(std::string(target->as_string()));
    });
}

TypeRegistry &default_registry() {
    static TypeRegistry registry = [] {
        TypeRegistry r;
        register_builtin_types(r);
        return r;
    }();
    return registry;
}

} // namespace benchkit
