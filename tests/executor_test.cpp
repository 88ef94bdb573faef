#include "test_support.h"

#include "benchkit/detail/worker_codec.h"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>

#include <unistd.h>

using namespace benchkit;
using namespace benchkit::test_support;

namespace {

using Clock = std::chrono::steady_clock;

const InstancePtr &sample() {
    static const InstancePtr instance = qa("q1", "What is six times seven?", "42");
    return instance;
}

} // namespace

TEST(ProcessExecutor, ReturnsCallableOutput) {
    const ProcessExecutor executor{};
    const TimedResult     r = executor.execute(
        [](const Instance &instance) {
            return Output{std::string("42 for ") + instance.id(), UsageCounters{{"input_tokens", 12}, {"output_tokens", 3}}};
        },
        5.0, *sample());

    ASSERT_TRUE(r.is_success()) << r.error;
    ASSERT_TRUE(r.result.has_value());
    EXPECT_EQ(r.result->answer, std::optional<std::string>("42 for q1"));
    EXPECT_EQ(r.result->usage.at("input_tokens"), 12);
    EXPECT_EQ(r.result->usage.at("output_tokens"), 3);
    EXPECT_GE(r.runtime_s, 0.0);
}

TEST(ProcessExecutor, NullAnswerSurvivesTheRoundTrip) {
    const TimedResult r = timed_execute([](const Instance &) { return Output{}; }, std::nullopt, *sample());
    ASSERT_TRUE(r.is_success()) << r.error;
    EXPECT_FALSE(r.result->answer.has_value());
}

TEST(ProcessExecutor, ExceptionBecomesError) {
    const TimedResult r = timed_execute(
        [](const Instance &) -> Output { throw std::runtime_error("model unavailable"); }, 5.0, *sample());
    EXPECT_TRUE(r.is_error());
    EXPECT_FALSE(r.result.has_value());
    EXPECT_NE(r.error.find("model unavailable"), std::string::npos);
}

TEST(ProcessExecutor, TimeoutKillsTheWorker) {
    const auto        start = Clock::now();
    const TimedResult r     = timed_execute(
        [](const Instance &) {
            std::this_thread::sleep_for(std::chrono::seconds(10));
            return Output{std::string("late"), {}};
        },
        0.1, *sample());
    const double elapsed = std::chrono::duration<double>(Clock::now() - start).count();

    EXPECT_TRUE(r.is_timeout());
    EXPECT_FALSE(r.result.has_value());
    EXPECT_LT(elapsed, 5.0);
    EXPECT_GE(r.runtime_s, 0.1);
}

TEST(ProcessExecutor, HugeTimeoutMeansNoDeadline) {
    const TimedResult r = timed_execute([](const Instance &) { return Output{std::string("done"), {}}; }, 1e12, *sample());
    ASSERT_TRUE(r.is_success()) << r.error;
    EXPECT_EQ(r.result->answer, std::optional<std::string>("done"));
}

TEST(TimeoutBudget, ConvertsSecondsAndDropsUnrepresentableDeadlines) {
    EXPECT_EQ(detail::timeout_budget(0.5), std::optional<Clock::duration>(std::chrono::milliseconds(500)));
    EXPECT_FALSE(detail::timeout_budget(std::nullopt).has_value());
    EXPECT_FALSE(detail::timeout_budget(1e12).has_value());
    EXPECT_FALSE(detail::timeout_budget(1e300).has_value());
}

TEST(ProcessExecutor, CrashedWorkerIsAnError) {
    const TimedResult r = timed_execute(
        [](const Instance &) -> Output {
            ::raise(SIGKILL);
            return {};
        },
        5.0, *sample());
    EXPECT_TRUE(r.is_error());
    EXPECT_NE(r.error.find("signal"), std::string::npos);
}

TEST(ProcessExecutor, SilentExitIsAnError) {
    const TimedResult r = timed_execute(
        [](const Instance &) -> Output {
            ::_exit(7);
        },
        5.0, *sample());
    EXPECT_TRUE(r.is_error());
    EXPECT_NE(r.error.find("exit code 7"), std::string::npos);
}

TEST(ThreadExecutor, ReturnsCallableOutput) {
    const ThreadExecutor executor{};
    const TimedResult    r = executor.execute([](const Instance &) { return Output{std::string("42"), {}}; }, 1.0, *sample());
    ASSERT_TRUE(r.is_success()) << r.error;
    EXPECT_EQ(r.result->answer, std::optional<std::string>("42"));
}

TEST(ThreadExecutor, CooperativeCancellationOnDeadline) {
    const ThreadExecutor executor{};
    const auto           start = Clock::now();
    const TimedResult    r     = executor.execute(
        [](const Instance &) {
            while (!cancellation_requested())
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return Output{std::string("abandoned"), {}};
        },
        0.05, *sample());

    EXPECT_TRUE(r.is_timeout());
    EXPECT_FALSE(r.result.has_value());
    EXPECT_LT(std::chrono::duration<double>(Clock::now() - start).count(), 5.0);
    EXPECT_FALSE(cancellation_requested());
}

TEST(ThreadExecutor, HugeTimeoutMeansNoDeadline) {
    const ThreadExecutor executor{};
    const TimedResult    r = executor.execute([](const Instance &) { return Output{std::string("done"), {}}; }, 1e12, *sample());
    ASSERT_TRUE(r.is_success()) << r.error;
    EXPECT_EQ(r.result->answer, std::optional<std::string>("done"));
}

TEST(ThreadExecutor, ExceptionBecomesError) {
    const ThreadExecutor executor{};
    const TimedResult    r =
        executor.execute([](const Instance &) -> Output { throw std::invalid_argument("bad prompt"); }, std::nullopt, *sample());
    EXPECT_TRUE(r.is_error());
    EXPECT_NE(r.error.find("bad prompt"), std::string::npos);
}

TEST(WorkerCodec, RejectsEmptyReply) {
    const auto decoded = detail::decode_worker_message({});
    EXPECT_FALSE(decoded.ok);
}

TEST(WorkerCodec, CarriesErrorMessages) {
    const auto bytes   = detail::encode_worker_message(detail::make_error_message("kaboom"));
    const auto decoded = detail::decode_worker_message(bytes);
    ASSERT_TRUE(decoded.ok) << decoded.error;
    const auto *error = std::get_if<detail::MsgAttemptError>(&decoded.message.payload);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->message, "kaboom");
}
