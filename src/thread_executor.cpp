#include "benchkit/executor.h"

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

namespace benchkit {
namespace {

using Clock = std::chrono::steady_clock;

thread_local std::stop_token t_stop_token;

struct ThreadReply {
    std::optional<Output> output;
    std::string           error;
};

} // namespace

bool cancellation_requested() { return t_stop_token.stop_requested(); }

TimedResult ThreadExecutor::execute(const Callable &fn, std::optional<double> timeout_s, const Instance &instance) const {
    TimedResult result;
    const auto  start = Clock::now();

    std::promise<ThreadReply> promise;
    auto                      future = promise.get_future();

    std::jthread worker([&fn, &instance, p = std::move(promise)](std::stop_token token) mutable {
        t_stop_token = token;
        ThreadReply reply;
        try {
            reply.output = fn(instance);
        } catch (const std::exception &e) {
            reply.error = std::string("std::exception: ") + e.what();
        } catch (...) {
            reply.error = "unknown exception";
        }
        p.set_value(std::move(reply));
    });

    bool ready = true;
    if (const auto budget = detail::timeout_budget(timeout_s)) {
        ready = future.wait_for(*budget) == std::future_status::ready;
    } else {
        future.wait();
    }

    if (!ready) {
        worker.request_stop();
        worker.join();
        result.runtime_s = std::chrono::duration<double>(Clock::now() - start).count();
        result.outcome   = ExecOutcome::Timeout;
        result.error     = fmt::format("timed out after {}s", *timeout_s);
        return result;
    }

    ThreadReply reply = future.get();
    worker.join();
    result.runtime_s = std::chrono::duration<double>(Clock::now() - start).count();
    if (!reply.output) {
        result.outcome = ExecOutcome::Error;
        result.error   = std::move(reply.error);
        return result;
    }
    result.outcome = ExecOutcome::Success;
    result.result  = std::move(reply.output);
    return result;
}

} // namespace benchkit
