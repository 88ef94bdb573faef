#include "benchkit/executor.h"

#include "benchkit/detail/worker_codec.h"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace benchkit {
namespace {

using Clock = std::chrono::steady_clock;

bool write_all(int fd, const std::byte *data, std::size_t size) {
    std::size_t written = 0;
    while (written < size) {
        const ssize_t n = ::write(fd, data + written, size - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        return false;
    }
    return true;
}

// Child side. Never returns.
[[noreturn]] void run_worker(int fd, const Callable &fn, const Instance &instance) {
    detail::WorkerMessage msg;
    try {
        msg = detail::make_result_message(fn(instance));
    } catch (const std::exception &e) {
        msg = detail::make_error_message(std::string("std::exception: ") + e.what());
    } catch (...) {
        msg = detail::make_error_message("unknown exception");
    }

    std::string encode_error;
    auto        bytes = detail::encode_worker_message(msg, &encode_error);
    if (bytes.empty())
        bytes = detail::encode_worker_message(detail::make_error_message("failed to encode worker reply: " + encode_error));

    const bool ok = write_all(fd, bytes.data(), bytes.size());
    ::close(fd);
    _exit(ok ? 0 : 3);
}

std::string describe_exit(int status) {
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        return fmt::format("worker terminated by signal {} ({})", sig, ::strsignal(sig));
    }
    if (WIFEXITED(status))
        return fmt::format("worker exited without returning data (exit code {})", WEXITSTATUS(status));
    return "worker exited without returning data";
}

double seconds_since(Clock::time_point start) { return std::chrono::duration<double>(Clock::now() - start).count(); }

} // namespace

TimedResult ProcessExecutor::execute(const Callable &fn, std::optional<double> timeout_s, const Instance &instance) const {
    TimedResult result;
    const auto  start = Clock::now();

    std::optional<Clock::time_point> deadline;
    if (const auto budget = detail::timeout_budget(timeout_s))
        deadline = start + *budget;

    int reply_pipe[2] = {-1, -1};
    if (::pipe2(reply_pipe, O_CLOEXEC) != 0) {
        result.error     = fmt::format("pipe failed: {}", std::strerror(errno));
        result.runtime_s = seconds_since(start);
        return result;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(reply_pipe[0]);
        ::close(reply_pipe[1]);
        result.error     = fmt::format("fork failed: {}", std::strerror(errno));
        result.runtime_s = seconds_since(start);
        return result;
    }

    if (pid == 0) {
        ::close(reply_pipe[0]);
        run_worker(reply_pipe[1], fn, instance);
    }

    ::close(reply_pipe[1]);

    std::vector<std::byte> reply;
    std::string            io_error;
    bool                   timed_out = false;
    bool                   eof       = false;

    while (!eof) {
        int wait_ms = -1;
        if (deadline) {
            const auto remaining = *deadline - Clock::now();
            if (remaining <= Clock::duration::zero()) {
                timed_out = true;
                break;
            }
            const auto ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
            wait_ms       = static_cast<int>(std::min<long long>(ms, 1000));
        }

        pollfd pfd{};
        pfd.fd     = reply_pipe[0];
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            io_error = fmt::format("poll failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0)
            continue;

        std::byte     buffer[4096];
        const ssize_t n = ::read(reply_pipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            reply.insert(reply.end(), buffer, buffer + n);
            continue;
        }
        if (n == 0) {
            eof = true;
            break;
        }
        if (errno == EINTR || errno == EAGAIN)
            continue;
        io_error = fmt::format("read failed: {}", std::strerror(errno));
        break;
    }
    ::close(reply_pipe[0]);

    // Reap. The worker may close its end early and keep running, so the
    // deadline still applies here.
    int  status = 0;
    bool killed = false;
    if (timed_out || !io_error.empty()) {
        ::kill(pid, SIGKILL);
        killed = true;
    }
    while (true) {
        const pid_t w = ::waitpid(pid, &status, (deadline && !killed) ? WNOHANG : 0);
        if (w == pid)
            break;
        if (w == 0) {
            if (Clock::now() >= *deadline) {
                timed_out = true;
                ::kill(pid, SIGKILL);
                killed = true;
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (w < 0 && errno == EINTR)
            continue;
        if (io_error.empty())
            io_error = fmt::format("waitpid failed: {}", std::strerror(errno));
        break;
    }
    result.runtime_s = seconds_since(start);

    if (timed_out) {
        result.outcome = ExecOutcome::Timeout;
        result.error   = fmt::format("timed out after {}s", *timeout_s);
        return result;
    }
    if (!io_error.empty()) {
        result.outcome = ExecOutcome::Error;
        result.error   = std::move(io_error);
        return result;
    }
    if (reply.empty()) {
        result.outcome = ExecOutcome::Error;
        result.error   = describe_exit(status);
        return result;
    }

    auto decoded = detail::decode_worker_message(reply);
    if (!decoded.ok) {
        result.outcome = ExecOutcome::Error;
        result.error   = "corrupt worker reply: " + decoded.error;
        return result;
    }
    if (const auto *err = std::get_if<detail::MsgAttemptError>(&decoded.message.payload)) {
        result.outcome = ExecOutcome::Error;
        result.error   = err->message;
        return result;
    }
    result.outcome = ExecOutcome::Success;
    result.result  = detail::to_output(std::get<detail::MsgAttemptResult>(decoded.message.payload));
    return result;
}

std::string_view to_string(ExecOutcome outcome) {
    switch (outcome) {
    case ExecOutcome::Success: return "success";
    case ExecOutcome::Timeout: return "timeout";
    case ExecOutcome::Error: return "error";
    }
    return "error";
}

namespace detail {

std::optional<Clock::duration> timeout_budget(std::optional<double> timeout_s) {
    // Half the clock range leaves room for adding the budget to now().
    static const double kLimit = std::chrono::duration<double>(Clock::duration::max() / 2).count();
    if (!timeout_s || !(*timeout_s < kLimit))
        return std::nullopt;
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(std::max(0.0, *timeout_s)));
}

} // namespace detail

TimedResult timed_execute(const Callable &fn, std::optional<double> timeout_s, const Instance &instance) {
    return ProcessExecutor{}.execute(fn, timeout_s, instance);
}

} // namespace benchkit
