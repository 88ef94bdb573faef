#include "benchkit/artifact.h"

#include "benchkit/errors.h"
#include "benchkit/log.h"

#include <fmt/format.h>

#include <boost/json.hpp>
#include <boost/json/src.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace benchkit {

namespace bjson = boost::json;

namespace {

// ---- writing ----

bjson::value optional_number(const std::optional<double> &value) {
    if (!value)
        return nullptr;
    return *value;
}

bjson::value optional_string(const std::optional<std::string> &value) {
    if (!value)
        return nullptr;
    return bjson::value(*value);
}

bjson::value score_to_json(const Score &score) {
    if (!score)
        return nullptr;
    return std::visit(
        [](const auto &v) -> bjson::value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>)
                return bjson::value(v);
            else
                return v;
        },
        *score);
}

void write_type(bjson::object &out, std::string_view tag) {
    out["class_module"] = std::string(kClassModule);
    out["class_name"]   = std::string(tag);
}

bjson::object spec_to_json(const Spec &spec) {
    bjson::object j;
    j["name"] = spec.name();
    bjson::array ids;
    for (const auto &id : spec.instance_ids())
        ids.emplace_back(id);
    j["instance_ids"] = std::move(ids);
    if (spec.n_instance())
        j["n_instance"] = *spec.n_instance();
    else
        j["n_instance"] = nullptr;
    j["n_attempts"]      = spec.n_attempts();
    j["timeout"]         = optional_number(spec.timeout());
    j["logs_filepath"]   = optional_string(spec.logs_filepath());
    j["execution_time"]  = optional_number(spec.execution_time());
    j["evaluation_time"] = optional_number(spec.evaluation_time());
    return j;
}

bjson::object attempt_to_json(const Attempt &attempt) {
    bjson::object j;
    j["_response"] = optional_string(attempt.response());
    j["_runtime"]  = optional_number(attempt.runtime());
    j["_status"]   = std::string(to_string(attempt.status()));
    bjson::object usage;
    for (const auto &[key, value] : attempt.usage())
        usage[key] = value;
    j["_token_usage"] = std::move(usage);
    j["_error"]       = optional_string(attempt.error());
    return j;
}

bjson::object instance_to_json(const Instance &instance) {
    bjson::object j;
    write_type(j, instance.type_tag());
    j["id"] = instance.id();
    instance.write_fields(j);

    bjson::array attempts;
    for (const auto &attempt : instance.attempts())
        attempts.emplace_back(attempt_to_json(attempt));
    j["_attempts"] = std::move(attempts);

    bjson::object evaluated;
    for (const auto &[name, scores] : instance.scores()) {
        bjson::array values;
        for (const auto &score : scores)
            values.push_back(score_to_json(score));
        evaluated[name] = std::move(values);
    }
    j["_evaluated_attempts"] = std::move(evaluated);
    return j;
}

bjson::object report_to_json(const Report &report) {
    bjson::object j;
    j["aggregator_name"] = report.aggregator_name;
    j["outer"]           = report.outer;
    bjson::object inner;
    for (const auto &[id, value] : report.inner)
        inner[id] = value;
    j["inner"] = std::move(inner);
    return j;
}

// ---- reading ----

[[noreturn]] void corrupted(std::string message) { throw ArtifactCorruptedError(std::move(message)); }

const bjson::object &require_object(const bjson::value &value, std::string_view what) {
    if (!value.is_object())
        corrupted(fmt::format("{} is not a JSON object", what));
    return value.as_object();
}

const bjson::value &require_field(const bjson::object &obj, std::string_view key, std::string_view what) {
    const bjson::value *value = obj.if_contains(key);
    if (value == nullptr)
        corrupted(fmt::format("{} lacks field '{}'", what, key));
    return *value;
}

std::string require_string(const bjson::object &obj, std::string_view key, std::string_view what) {
    const bjson::value &value = require_field(obj, key, what);
    if (!value.is_string())
        corrupted(fmt::format("{}: field '{}' is not a string", what, key));
    return std::string(value.as_string());
}

// `label` names the value in diagnostics, e.g. "spec: field 'n_attempts'".
template <typename Int>
Int integer_of(const bjson::value &value, std::string_view label) {
    if (value.is_int64()) {
        const std::int64_t v = value.as_int64();
        if (v < std::numeric_limits<Int>::min() || v > std::numeric_limits<Int>::max())
            corrupted(fmt::format("{} is out of range", label));
        return static_cast<Int>(v);
    }
    if (value.is_uint64()) {
        const std::uint64_t v = value.as_uint64();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<Int>::max()))
            corrupted(fmt::format("{} is out of range", label));
        return static_cast<Int>(v);
    }
    corrupted(fmt::format("{} is not an integer", label));
}

bool number_of(const bjson::value &value, double &out) {
    if (value.is_double()) {
        out = value.as_double();
        return true;
    }
    if (value.is_int64()) {
        out = static_cast<double>(value.as_int64());
        return true;
    }
    if (value.is_uint64()) {
        out = static_cast<double>(value.as_uint64());
        return true;
    }
    return false;
}

std::optional<double> optional_number_field(const bjson::object &obj, std::string_view key, std::string_view what) {
    const bjson::value *value = obj.if_contains(key);
    if (value == nullptr || value->is_null())
        return std::nullopt;
    double number = 0.0;
    if (!number_of(*value, number))
        corrupted(fmt::format("{}: field '{}' is not a number", what, key));
    return number;
}

std::optional<std::string> optional_string_field(const bjson::object &obj, std::string_view key, std::string_view what) {
    const bjson::value *value = obj.if_contains(key);
    if (value == nullptr || value->is_null())
        return std::nullopt;
    if (!value->is_string())
        corrupted(fmt::format("{}: field '{}' is not a string", what, key));
    return std::string(value->as_string());
}

Spec spec_from_json(const bjson::value &value) {
    const bjson::object &j = require_object(value, "spec");
    SpecOptions          options;
    options.name = require_string(j, "name", "spec");

    if (const bjson::value *ids = j.if_contains("instance_ids"); ids != nullptr && !ids->is_null()) {
        if (!ids->is_array())
            corrupted("spec: field 'instance_ids' is not an array");
        for (const bjson::value &id : ids->as_array()) {
            if (!id.is_string())
                corrupted("spec: 'instance_ids' holds a non-string entry");
            options.instance_ids.emplace_back(id.as_string());
        }
    }

    options.n_attempts = integer_of<int>(require_field(j, "n_attempts", "spec"), "spec: field 'n_attempts'");
    if (const bjson::value *n = j.if_contains("n_instance"); n != nullptr && !n->is_null())
        options.n_instance = integer_of<int>(*n, "spec: field 'n_instance'");

    options.timeout_s         = optional_number_field(j, "timeout", "spec");
    options.logs_filepath     = optional_string_field(j, "logs_filepath", "spec");
    options.execution_time_s  = optional_number_field(j, "execution_time", "spec");
    options.evaluation_time_s = optional_number_field(j, "evaluation_time", "spec");

    try {
        return Spec(std::move(options));
    } catch (const ConfigurationError &e) {
        corrupted(fmt::format("spec: {}", e.what()));
    }
}

Attempt attempt_from_json(const bjson::value &value, std::string_view what) {
    const bjson::object &j = require_object(value, what);

    AttemptStatus     status = AttemptStatus::Failure;
    const std::string label  = require_string(j, "_status", what);
    if (!parse_status(label, status))
        corrupted(fmt::format("{}: unknown status '{}'", what, label));

    UsageCounters usage;
    if (const bjson::value *counters = j.if_contains("_token_usage"); counters != nullptr && !counters->is_null()) {
        for (const auto &entry : require_object(*counters, fmt::format("{} '_token_usage'", what))) {
            const auto label = fmt::format("{}: usage counter '{}'", what, std::string_view(entry.key()));
            usage.emplace(std::string(entry.key()), integer_of<std::int64_t>(entry.value(), label));
        }
    }

    try {
        return Attempt(optional_string_field(j, "_response", what), optional_number_field(j, "_runtime", what), status,
                       std::move(usage), optional_string_field(j, "_error", what));
    } catch (const ConsistencyError &e) {
        corrupted(fmt::format("{}: {}", what, e.what()));
    }
}

Score score_from_json(const bjson::value &value, std::string_view what) {
    if (value.is_null())
        return std::nullopt;
    if (value.is_bool())
        return ScoreValue{value.as_bool()};
    if (value.is_string())
        return ScoreValue{std::string(value.as_string())};
    double number = 0.0;
    if (number_of(value, number))
        return ScoreValue{number};
    corrupted(fmt::format("{}: unsupported score value", what));
}

InstancePtr instance_from_json(const bjson::object &j, std::string_view tag, StageKind target, const TypeRegistry &registry,
                               std::string_view what) {
    std::unique_ptr<Instance> instance;
    try {
        instance = registry.make_instance(tag, j);
    } catch (const ArtifactCorruptedError &e) {
        corrupted(fmt::format("{}: {}", what, e.what()));
    } catch (const ConsistencyError &e) {
        corrupted(fmt::format("{}: {}", what, e.what()));
    }

    if (stage_rank(target) < stage_rank(StageKind::Execution))
        return instance;

    std::vector<Attempt> attempts;
    if (const bjson::value *list = j.if_contains("_attempts"); list != nullptr && !list->is_null()) {
        if (!list->is_array())
            corrupted(fmt::format("{}: field '_attempts' is not an array", what));
        std::size_t index = 0;
        for (const bjson::value &attempt : list->as_array())
            attempts.push_back(attempt_from_json(attempt, fmt::format("{} attempt {}", what, index++)));
    }
    instance = instance->with_attempts(std::move(attempts));

    if (stage_rank(target) < stage_rank(StageKind::Evaluation))
        return instance;

    std::map<std::string, Scores> scores;
    if (const bjson::value *evaluated = j.if_contains("_evaluated_attempts"); evaluated != nullptr && !evaluated->is_null()) {
        for (const auto &entry : require_object(*evaluated, fmt::format("{} '_evaluated_attempts'", what))) {
            const std::string metric(entry.key());
            if (!entry.value().is_array())
                corrupted(fmt::format("{}: scores for metric '{}' are not an array", what, metric));
            Scores values;
            for (const bjson::value &score : entry.value().as_array())
                values.push_back(score_from_json(score, fmt::format("{} metric '{}'", what, metric)));
            scores.emplace(metric, std::move(values));
        }
    }
    try {
        return instance->with_scores(std::move(scores));
    } catch (const ConsistencyError &e) {
        corrupted(fmt::format("{}: {}", what, e.what()));
    }
}

InstanceList instances_from_json(const bjson::object &root, StageKind target, const TypeRegistry &registry) {
    const bjson::value &value = require_field(root, "instances", "artifact");
    if (!value.is_array())
        corrupted("artifact field 'instances' is not an array");

    InstanceList instances;
    std::string  first_tag;
    std::size_t  index = 0;
    for (const bjson::value &record : value.as_array()) {
        const std::string    what = fmt::format("instance record {}", index++);
        const bjson::object &j    = require_object(record, what);
        const std::string    tag  = require_string(j, "class_name", what);
        if (first_tag.empty()) {
            first_tag = tag;
        } else if (tag != first_tag) {
            corrupted(fmt::format("{}: instance type '{}' differs from '{}'; all instances must share one type", what, tag,
                                  first_tag));
        }
        instances.push_back(instance_from_json(j, tag, target, registry, what));
    }
    return instances;
}

template <typename Product, typename Make>
std::vector<Product> typed_list_from_json(const bjson::object &root, std::string_view key, Make make) {
    std::vector<Product> out;
    const bjson::value  *value = root.if_contains(key);
    if (value == nullptr || value->is_null())
        return out;
    if (!value->is_array())
        corrupted(fmt::format("artifact field '{}' is not an array", key));
    std::size_t index = 0;
    for (const bjson::value &record : value->as_array()) {
        const std::string    what = fmt::format("{} record {}", key, index++);
        const bjson::object &j    = require_object(record, what);
        const std::string    tag  = require_string(j, "class_name", what);
        try {
            out.push_back(make(tag, j));
        } catch (const ArtifactCorruptedError &e) {
            corrupted(fmt::format("{}: {}", what, e.what()));
        } catch (const ConfigurationError &e) {
            corrupted(fmt::format("{}: {}", what, e.what()));
        }
    }
    return out;
}

std::vector<Report> reports_from_json(const bjson::object &root) {
    const bjson::value &value = require_field(root, "reports", "artifact");
    if (!value.is_array())
        corrupted("artifact field 'reports' is not an array");
    std::vector<Report> reports;
    std::size_t         index = 0;
    for (const bjson::value &record : value.as_array()) {
        const std::string    what = fmt::format("reports record {}", index++);
        const bjson::object &j    = require_object(record, what);
        Report               report;
        report.aggregator_name = require_string(j, "aggregator_name", what);
        if (!number_of(require_field(j, "outer", what), report.outer))
            corrupted(fmt::format("{}: field 'outer' is not a number", what));
        for (const auto &entry : require_object(require_field(j, "inner", what), fmt::format("{} 'inner'", what))) {
            double inner = 0.0;
            if (!number_of(entry.value(), inner))
                corrupted(fmt::format("{}: inner value for '{}' is not a number", what, std::string_view(entry.key())));
            report.inner.emplace(std::string(entry.key()), inner);
        }
        reports.push_back(std::move(report));
    }
    return reports;
}

template <typename Stage> constexpr StageKind kind_of();
template <> constexpr StageKind kind_of<Benchmark>() { return StageKind::Benchmark; }
template <> constexpr StageKind kind_of<BenchmarkExec>() { return StageKind::Execution; }
template <> constexpr StageKind kind_of<BenchmarkEval>() { return StageKind::Evaluation; }
template <> constexpr StageKind kind_of<BenchmarkReport>() { return StageKind::Report; }

bjson::value parse_file(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw ArtifactCorruptedError("cannot open artifact", path);
    std::ostringstream input;
    input << file.rdbuf();

    boost::system::error_code ec;
    bjson::value              root = bjson::parse(input.str(), ec);
    if (ec)
        throw ArtifactCorruptedError(fmt::format("invalid JSON: {}", ec.message()), path);
    return root;
}

void write_text(const std::string &text, const std::string &path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error(fmt::format("cannot open '{}' for writing", path));
    out << text;
    out.flush();
    if (!out)
        throw std::runtime_error(fmt::format("failed writing '{}'", path));
}

} // namespace

const StageBase &stage_of(const AnyStage &stage) {
    return std::visit([](const auto &s) -> const StageBase & { return s; }, stage);
}

bjson::value to_json(const StageBase &stage) {
    bjson::object root;

    bjson::object metadata;
    write_type(metadata, stage_name(stage.kind()));
    root["metadata"] = std::move(metadata);
    root["spec"]     = spec_to_json(stage.spec());

    bjson::array instances;
    for (const auto &instance : stage.instances())
        instances.emplace_back(instance_to_json(*instance));
    root["instances"] = std::move(instances);

    bjson::array metrics;
    for (const auto &metric : stage.metrics()) {
        bjson::object j;
        write_type(j, metric->type_tag());
        metric->write_params(j);
        metrics.emplace_back(std::move(j));
    }
    root["metrics"] = std::move(metrics);

    bjson::array aggregators;
    for (const auto &aggregator : stage.aggregators()) {
        bjson::object j;
        write_type(j, aggregator->type_tag());
        aggregator->write_params(j);
        aggregators.emplace_back(std::move(j));
    }
    root["aggregators"] = std::move(aggregators);

    if (const auto *report = dynamic_cast<const BenchmarkReport *>(&stage)) {
        bjson::array reports;
        for (const auto &r : report->reports())
            reports.emplace_back(report_to_json(r));
        root["reports"] = std::move(reports);
    }
    return root;
}

std::string to_json_string(const StageBase &stage) { return bjson::serialize(to_json(stage)); }

void write_json(const StageBase &stage, const std::string &path) {
    write_text(to_json_string(stage), path);
    log::info("wrote {} artifact to {}", stage_name(stage.kind()), path);
}

StageKind artifact_stage(const bjson::value &root) {
    const bjson::object &j        = require_object(root, "artifact");
    const bjson::object &metadata = require_object(require_field(j, "metadata", "artifact"), "artifact metadata");
    const std::string    name     = require_string(metadata, "class_name", "artifact metadata");
    StageKind            kind     = StageKind::Benchmark;
    if (!parse_stage_name(name, kind))
        corrupted(fmt::format("artifact metadata names unknown stage '{}'", name));
    return kind;
}

template <typename Stage>
Stage from_json(const bjson::value &root, const TypeRegistry &registry) {
    constexpr StageKind target = kind_of<Stage>();
    const StageKind     source = artifact_stage(root);
    if (stage_rank(source) < stage_rank(target)) {
        corrupted(fmt::format("cannot load a {} from a {} artifact; the artifact holds an earlier stage", stage_name(target),
                              stage_name(source)));
    }

    const bjson::object &j         = root.as_object();
    Spec                 spec      = spec_from_json(require_field(j, "spec", "artifact"));
    InstanceList         instances = instances_from_json(j, target, registry);
    MetricList           metrics   = typed_list_from_json<MetricPtr>(
        j, "metrics", [&](const std::string &tag, const bjson::object &rec) { return registry.make_metric(tag, rec); });
    AggregatorList aggregators = typed_list_from_json<AggregatorPtr>(
        j, "aggregators", [&](const std::string &tag, const bjson::object &rec) { return registry.make_aggregator(tag, rec); });

    try {
        if constexpr (std::is_same_v<Stage, Benchmark>) {
            return Benchmark::restore(std::move(spec), std::move(instances), std::move(metrics), std::move(aggregators));
        } else if constexpr (std::is_same_v<Stage, BenchmarkReport>) {
            return BenchmarkReport(std::move(spec), std::move(instances), std::move(metrics), std::move(aggregators),
                                   reports_from_json(j));
        } else {
            return Stage(std::move(spec), std::move(instances), std::move(metrics), std::move(aggregators));
        }
    } catch (const ConsistencyError &e) {
        corrupted(fmt::format("inconsistent {} artifact: {}", stage_name(source), e.what()));
    }
}

template <typename Stage>
Stage read_json(const std::string &path, const TypeRegistry &registry) {
    const bjson::value root = parse_file(path);
    try {
        return from_json<Stage>(root, registry);
    } catch (const ArtifactCorruptedError &e) {
        throw ArtifactCorruptedError(e.what(), path);
    }
}

AnyStage any_from_json(const bjson::value &root, const TypeRegistry &registry) {
    switch (artifact_stage(root)) {
    case StageKind::Benchmark: return from_json<Benchmark>(root, registry);
    case StageKind::Execution: return from_json<BenchmarkExec>(root, registry);
    case StageKind::Evaluation: return from_json<BenchmarkEval>(root, registry);
    case StageKind::Report: break;
    }
    return from_json<BenchmarkReport>(root, registry);
}

AnyStage read_any_json(const std::string &path, const TypeRegistry &registry) {
    const bjson::value root = parse_file(path);
    try {
        return any_from_json(root, registry);
    } catch (const ArtifactCorruptedError &e) {
        throw ArtifactCorruptedError(e.what(), path);
    }
}

template Benchmark       from_json<Benchmark>(const bjson::value &, const TypeRegistry &);
template BenchmarkExec   from_json<BenchmarkExec>(const bjson::value &, const TypeRegistry &);
template BenchmarkEval   from_json<BenchmarkEval>(const bjson::value &, const TypeRegistry &);
template BenchmarkReport from_json<BenchmarkReport>(const bjson::value &, const TypeRegistry &);
template Benchmark       read_json<Benchmark>(const std::string &, const TypeRegistry &);
template BenchmarkExec   read_json<BenchmarkExec>(const std::string &, const TypeRegistry &);
template BenchmarkEval   read_json<BenchmarkEval>(const std::string &, const TypeRegistry &);
template BenchmarkReport read_json<BenchmarkReport>(const std::string &, const TypeRegistry &);

} // namespace benchkit
