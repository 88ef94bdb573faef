#pragma once

#include "benchkit/instance.h"
#include "benchkit/types.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace benchkit {

// Callable under test. Extra arguments are bound by the caller.
using Callable = std::function<Output(const Instance &)>;

enum class ExecOutcome {
    Success,
    Timeout,
    Error,
};

std::string_view to_string(ExecOutcome outcome);

struct TimedResult {
    double                runtime_s = 0.0;
    std::optional<Output> result;
    ExecOutcome           outcome = ExecOutcome::Error;
    std::string           error; // set for Timeout and Error

    bool is_success() const { return outcome == ExecOutcome::Success; }
    bool is_timeout() const { return outcome == ExecOutcome::Timeout; }
    bool is_error() const { return outcome == ExecOutcome::Error; }
};

// Runs one unit of work under a deadline. `timeout_s` unset means an unbounded
// wait. Implementations never throw for failures of `fn`; they are reported
// through `TimedResult::outcome`.
class Executor {
  public:
    virtual ~Executor() = default;

    virtual TimedResult execute(const Callable &fn, std::optional<double> timeout_s, const Instance &instance) const = 0;
};

// Forks one worker process per call. The worker runs `fn`, sends a single
// CBOR reply over a pipe and exits; on deadline it is killed and reaped.
// Suitable for untrusted callables that may hang, crash or leak.
class ProcessExecutor final : public Executor {
  public:
    TimedResult execute(const Callable &fn, std::optional<double> timeout_s, const Instance &instance) const override;
};

// Runs `fn` on a dedicated thread. On deadline it requests cancellation and
// waits for the thread to return, discarding its result. Only for trusted
// callables that poll `cancellation_requested()`.
class ThreadExecutor final : public Executor {
  public:
    TimedResult execute(const Callable &fn, std::optional<double> timeout_s, const Instance &instance) const override;
};

// True inside a ThreadExecutor worker whose deadline has passed.
bool cancellation_requested();

namespace detail {
// Deadline budget for a timeout in seconds. Unset, or too large for the
// steady clock to represent, yields no deadline.
std::optional<std::chrono::steady_clock::duration> timeout_budget(std::optional<double> timeout_s);
} // namespace detail

// Convenience wrapper over ProcessExecutor.
TimedResult timed_execute(const Callable &fn, std::optional<double> timeout_s, const Instance &instance);

} // namespace benchkit
