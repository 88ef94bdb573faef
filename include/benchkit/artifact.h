#pragma once

#include "benchkit/registry.h"
#include "benchkit/stage.h"

#include <boost/json.hpp>

#include <string>
#include <variant>

namespace benchkit {

using AnyStage = std::variant<Benchmark, BenchmarkExec, BenchmarkEval, BenchmarkReport>;

const StageBase &stage_of(const AnyStage &stage);

// ---- JSON ----

boost::json::value to_json(const StageBase &stage);
std::string        to_json_string(const StageBase &stage);
// Throws std::runtime_error naming `path` when the file cannot be written.
void write_json(const StageBase &stage, const std::string &path);

// Stage named by the artifact metadata.
StageKind artifact_stage(const boost::json::value &root);

// Rebuilds `Stage` from an artifact of the same or a later stage; data the
// target stage does not hold (attempts, scores, reports) is dropped.
// Throws ArtifactCorruptedError on malformed input or an earlier stage.
template <typename Stage>
Stage from_json(const boost::json::value &root, const TypeRegistry &registry = default_registry());

template <typename Stage>
Stage read_json(const std::string &path, const TypeRegistry &registry = default_registry());

// Loads whichever stage the artifact holds.
AnyStage any_from_json(const boost::json::value &root, const TypeRegistry &registry = default_registry());
AnyStage read_any_json(const std::string &path, const TypeRegistry &registry = default_registry());

extern template Benchmark       from_json<Benchmark>(const boost::json::value &, const TypeRegistry &);
extern template BenchmarkExec   from_json<BenchmarkExec>(const boost::json::value &, const TypeRegistry &);
extern template BenchmarkEval   from_json<BenchmarkEval>(const boost::json::value &, const TypeRegistry &);
extern template BenchmarkReport from_json<BenchmarkReport>(const boost::json::value &, const TypeRegistry &);
extern template Benchmark       read_json<Benchmark>(const std::string &, const TypeRegistry &);
extern template BenchmarkExec   read_json<BenchmarkExec>(const std::string &, const TypeRegistry &);
extern template BenchmarkEval   read_json<BenchmarkEval>(const std::string &, const TypeRegistry &);
extern template BenchmarkReport read_json<BenchmarkReport>(const std::string &, const TypeRegistry &);

// ---- CSV ----

// One row per instance: id, ground truth, then per attempt its response,
// status, runtime and usage counters, then every metric score per attempt
// (suffixed `_score` when the metric name collides with an attempt column).
std::string to_csv(const StageBase &stage);
void        write_csv(const StageBase &stage, const std::string &path);

std::string csv_escape(std::string_view field);

} // namespace benchkit
