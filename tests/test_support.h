#pragma once

#include "benchkit/benchkit.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace benchkit::test_support {

inline InstancePtr qa(std::string id, std::string question, std::string answer) {
    return std::make_shared<const QaInstance>(std::move(id), std::move(question), std::move(answer));
}

inline Attempt ok(std::string response, double runtime_s = 0.5, UsageCounters usage = {}) {
    return Attempt(std::move(response), runtime_s, AttemptStatus::Success, std::move(usage));
}

inline Attempt failed(std::string error = "boom") {
    return Attempt(std::nullopt, 0.01, AttemptStatus::Failure, {}, std::move(error));
}

inline Attempt timed_out() { return Attempt(std::nullopt, 1.0, AttemptStatus::Timeout, {}, std::string("timed out")); }

inline InstancePtr with_attempts(const InstancePtr &instance, std::vector<Attempt> attempts) {
    return instance->with_attempts(std::move(attempts));
}

inline InstancePtr with_scores(const InstancePtr &instance, std::map<std::string, Scores> scores) {
    return instance->with_scores(std::move(scores));
}

inline Scores booleans(std::initializer_list<int> pattern) {
    // 1 true, 0 false, -1 null
    Scores out;
    for (int v : pattern) {
        if (v < 0)
            out.emplace_back();
        else
            out.emplace_back(ScoreValue{v == 1});
    }
    return out;
}

// Captures log lines for the lifetime of the object.
class LogCapture {
  public:
    LogCapture() {
        previous_threshold_ = log::threshold();
        log::set_threshold(log::Level::Debug);
        previous_ = log::set_sink([this](log::Level level, std::string_view message) {
            lines.emplace_back(level, std::string(message));
        });
    }
    ~LogCapture() {
        log::set_sink(std::move(previous_));
        log::set_threshold(previous_threshold_);
    }

    LogCapture(const LogCapture &)            = delete;
    LogCapture &operator=(const LogCapture &) = delete;

    bool contains(log::Level level, std::string_view needle) const {
        for (const auto &[l, text] : lines) {
            if (l == level && text.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

    std::size_t count(log::Level level) const {
        std::size_t n = 0;
        for (const auto &entry : lines) {
            if (entry.first == level)
                ++n;
        }
        return n;
    }

    std::vector<std::pair<log::Level, std::string>> lines;

  private:
    log::Sink  previous_;
    log::Level previous_threshold_ = log::Level::Info;
};

} // namespace benchkit::test_support
