#include "test_support.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace benchkit;
using namespace benchkit::test_support;

namespace {

BenchmarkEval evaluated_stage() {
    const auto a = with_scores(
        with_attempts(qa("a", "What is six times seven?", "42"),
                      {ok("42", 0.25, {{"input_tokens", 10}, {"output_tokens", 1}}), failed("worker crashed")}),
        {{"exact_match", booleans({1, -1})}, {"status", Scores{ScoreValue{std::string("success")}, ScoreValue{std::string("failure")}}}});
    const auto b = with_scores(with_attempts(qa("b", "Capital of France?", "Paris"), {ok("London, \"probably\"", 1.5), timed_out()}),
                               {{"exact_match", booleans({0, -1})},
                                {"status", Scores{ScoreValue{std::string("success")}, ScoreValue{std::string("timeout")}}}});

    const Spec spec(SpecOptions{.name            = "artifact",
                                .instance_ids    = {"a", "b"},
                                .n_attempts      = 2,
                                .timeout_s       = 3.0,
                                .execution_time_s = 2.5,
                                .evaluation_time_s = 0.125});
    return BenchmarkEval(spec, {a, b}, {std::make_shared<ExactMatchMetric>(), std::make_shared<StatusMetric>()},
                         {std::make_shared<StatusAggregator>(), std::make_shared<ConsensusAggregator>("exact_match")});
}

std::string temp_path(const char *name) { return (std::filesystem::temp_directory_path() / name).string(); }

std::string slurp(const std::string &path) {
    std::ifstream      in(path, std::ios::binary);
    std::ostringstream text;
    text << in.rdbuf();
    return text.str();
}

template <typename Fn>
std::string corruption_message(Fn &&fn) {
    try {
        fn();
    } catch (const ArtifactCorruptedError &e) {
        return e.what();
    }
    return {};
}

} // namespace

TEST(ArtifactJson, EvalRoundTrip) {
    const BenchmarkEval original = evaluated_stage();
    const auto          json     = to_json(original);

    const auto &metadata = json.as_object().at("metadata").as_object();
    EXPECT_EQ(std::string(metadata.at("class_name").as_string()), "BenchmarkEval");
    EXPECT_EQ(std::string(metadata.at("class_module").as_string()), "benchkit");
    EXPECT_FALSE(json.as_object().contains("reports"));

    const auto restored = from_json<BenchmarkEval>(json);
    EXPECT_TRUE(restored.spec() == original.spec());
    ASSERT_EQ(restored.instances().size(), 2u);
    for (std::size_t i = 0; i < 2; ++i) {
        const auto &want = *original.instances()[i];
        const auto &got  = *restored.instances()[i];
        EXPECT_EQ(got.id(), want.id());
        EXPECT_EQ(got.type_tag(), "QaInstance");
        EXPECT_EQ(got.ground_truth(), want.ground_truth());
        EXPECT_EQ(got.attempts(), want.attempts());
        EXPECT_EQ(got.scores(), want.scores());
    }
    ASSERT_EQ(restored.metrics().size(), 2u);
    EXPECT_EQ(restored.metrics()[0]->name(), "exact_match");
    EXPECT_EQ(restored.metrics()[1]->name(), "status");
    ASSERT_EQ(restored.aggregators().size(), 2u);
    const auto *consensus = dynamic_cast<const ConsensusAggregator *>(restored.aggregators()[1].get());
    ASSERT_NE(consensus, nullptr);
    EXPECT_EQ(consensus->target(), "exact_match");
}

TEST(ArtifactJson, ReportArtifactLoadsAsEveryStage) {
    const BenchmarkReport report = evaluated_stage().report();
    const auto            json   = to_json(report);
    ASSERT_TRUE(json.as_object().contains("reports"));

    const auto as_report = from_json<BenchmarkReport>(json);
    EXPECT_EQ(as_report.reports(), report.reports());

    const auto as_eval = from_json<BenchmarkEval>(json);
    EXPECT_FALSE(as_eval.instances()[0]->scores().empty());

    const auto as_exec = from_json<BenchmarkExec>(json);
    EXPECT_EQ(as_exec.instances()[0]->attempts().size(), 2u);
    EXPECT_TRUE(as_exec.instances()[0]->scores().empty());

    const auto as_bench = from_json<Benchmark>(json);
    EXPECT_EQ(as_bench.instances().size(), 2u);
    EXPECT_TRUE(as_bench.instances()[0]->attempts().empty());
    EXPECT_TRUE(as_bench.instances()[1]->scores().empty());
    EXPECT_EQ(as_bench.spec().name(), "artifact");
}

TEST(ArtifactJson, EarlierStageCannotBePromoted) {
    const Benchmark bench(Spec(SpecOptions{.name = "early"}), {qa("a", "q", "42")});
    const auto      json = to_json(bench);

    const std::string message = corruption_message([&] { (void)from_json<BenchmarkEval>(json); });
    EXPECT_NE(message.find("BenchmarkEval"), std::string::npos);
    EXPECT_NE(message.find("Benchmark artifact"), std::string::npos);
    EXPECT_NO_THROW((void)from_json<Benchmark>(json));
}

TEST(ArtifactJson, MalformedArtifactsAreRejected) {
    auto json = to_json(evaluated_stage());

    auto no_metadata = json;
    no_metadata.as_object().erase("metadata");
    EXPECT_THROW((void)from_json<BenchmarkEval>(no_metadata), ArtifactCorruptedError);

    auto unknown_stage = json;
    unknown_stage.as_object()["metadata"].as_object()["class_name"] = "BenchmarkDone";
    EXPECT_NE(corruption_message([&] { (void)from_json<Benchmark>(unknown_stage); }).find("BenchmarkDone"), std::string::npos);

    auto unknown_type = json;
    for (auto &record : unknown_type.as_object()["instances"].as_array())
        record.as_object()["class_name"] = "MysteryInstance";
    EXPECT_NE(corruption_message([&] { (void)from_json<BenchmarkEval>(unknown_type); }).find("MysteryInstance"), std::string::npos);

    auto bad_status = json;
    bad_status.as_object()["instances"].as_array()[0].as_object()["_attempts"].as_array()[0].as_object()["_status"] = "exploded";
    EXPECT_NE(corruption_message([&] { (void)from_json<BenchmarkExec>(bad_status); }).find("instance record 0"), std::string::npos);

    EXPECT_THROW((void)from_json<Benchmark>(boost::json::value(42)), ArtifactCorruptedError);
}

TEST(ArtifactJson, OutOfRangeIntegersAreRejected) {
    auto wide = to_json(evaluated_stage());
    wide.as_object()["spec"].as_object()["n_attempts"] = std::int64_t{4294967297};
    EXPECT_NE(corruption_message([&] { (void)from_json<BenchmarkEval>(wide); }).find("'n_attempts' is out of range"), std::string::npos);

    auto huge = to_json(evaluated_stage());
    huge.as_object()["spec"].as_object()["n_instance"] = std::numeric_limits<std::uint64_t>::max();
    EXPECT_NE(corruption_message([&] { (void)from_json<BenchmarkEval>(huge); }).find("'n_instance' is out of range"), std::string::npos);

    auto counter = to_json(evaluated_stage());
    counter.as_object()["instances"].as_array()[0].as_object()["_attempts"].as_array()[0].as_object()["_token_usage"].as_object()["input_tokens"] =
        std::numeric_limits<std::uint64_t>::max();
    const std::string message = corruption_message([&] { (void)from_json<BenchmarkExec>(counter); });
    EXPECT_NE(message.find("usage counter 'input_tokens' is out of range"), std::string::npos);
    EXPECT_NE(message.find("instance record 0"), std::string::npos);
}

TEST(ArtifactJson, MixedInstanceTypesAreRejected) {
    auto json = to_json(evaluated_stage());
    json.as_object()["instances"].as_array()[1].as_object()["class_name"] = "CodeInstance";

    const std::string message = corruption_message([&] { (void)from_json<Benchmark>(json); });
    EXPECT_NE(message.find("instance record 1"), std::string::npos);
    EXPECT_NE(message.find("CodeInstance"), std::string::npos);
}

TEST(ArtifactJson, CustomTypesResolveThroughTheRegistry) {
    auto json = to_json(evaluated_stage());
    for (auto &record : json.as_object()["instances"].as_array())
        record.as_object()["class_name"] = "TriviaInstance";

    EXPECT_THROW((void)from_json<BenchmarkEval>(json), ArtifactCorruptedError);

    TypeRegistry registry;
    register_builtin_types(registry);
    registry.add_instance("TriviaInstance", &QaInstance::from_fields);
    const auto restored = from_json<BenchmarkEval>(json, registry);
    EXPECT_EQ(restored.instances().size(), 2u);
}

TEST(ArtifactJson, FilesRoundTripAndReportTheirPath) {
    const std::string path = temp_path("benchkit_artifact_test.json");
    write_json(evaluated_stage(), path);

    const AnyStage any = read_any_json(path);
    EXPECT_TRUE(std::holds_alternative<BenchmarkEval>(any));
    EXPECT_EQ(stage_of(any).instances().size(), 2u);
    EXPECT_EQ(read_json<BenchmarkExec>(path).kind(), StageKind::Execution);

    try {
        (void)read_json<BenchmarkReport>(path);
        ADD_FAILURE() << "expected ArtifactCorruptedError";
    } catch (const ArtifactCorruptedError &e) {
        ASSERT_TRUE(e.path().has_value());
        EXPECT_EQ(*e.path(), path);
    }
    std::filesystem::remove(path);

    EXPECT_THROW((void)read_json<Benchmark>(temp_path("benchkit_missing_artifact.json")), ArtifactCorruptedError);
    EXPECT_THROW(write_json(evaluated_stage(), "/nonexistent-dir/benchkit/out.json"), std::runtime_error);
}

TEST(ArtifactCsv, HeaderIsTheUnionOfColumnsInFirstSeenOrder) {
    const std::string csv = to_csv(evaluated_stage());

    std::istringstream lines(csv);
    std::string        header;
    std::getline(lines, header);
    if (!header.empty() && header.back() == '\r')
        header.pop_back();
    EXPECT_EQ(header, "id,ground_truth,"
                      "attempt_1_response,attempt_1_status,attempt_1_runtime,attempt_1_input_tokens,attempt_1_output_tokens,"
                      "attempt_2_response,attempt_2_status,attempt_2_runtime,"
                      "attempt_1_exact_match,attempt_2_exact_match,attempt_1_status_score,attempt_2_status_score");
}

TEST(ArtifactCsv, RowsQuoteAndRoundRuntimes) {
    const std::string csv = to_csv(evaluated_stage());
    EXPECT_NE(csv.find("a,42,42,success,0.25,10,1,,failure,0.01,true,,"), std::string::npos);
    EXPECT_NE(csv.find("b,Paris,\"London, \"\"probably\"\"\",success,1.50,,,,timeout,1.00,false,,"), std::string::npos);
    EXPECT_NE(csv.find(",true,,success,failure\r\n"), std::string::npos);
    EXPECT_EQ(csv_escape("plain"), "plain");
    EXPECT_EQ(csv_escape("two\nlines"), "\"two\nlines\"");
}
