#include "benchkit/log.h"

#include <fmt/color.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <vector>

namespace benchkit::log {
namespace {

bool env_has_value(const char *name) {
    const char *value = std::getenv(name);
    return value != nullptr && value[0] != '\0';
}

bool env_no_color() { return env_has_value("NO_COLOR") || env_has_value("BENCHKIT_NO_COLOR"); }

Level level_from_env() {
    const char *value = std::getenv("BENCHKIT_LOG_LEVEL");
    Level       level = Level::Info;
    if (value != nullptr && !parse_level(value, level))
        level = Level::Info;
    return level;
}

struct LoggerState {
    std::mutex                  mtx;
    Level                       threshold = level_from_env();
    bool                        color     = !env_no_color();
    Sink                        sink;
    std::vector<std::ofstream*> mirrors;
};

LoggerState &state() {
    static LoggerState s;
    return s;
}

fmt::text_style level_style(Level level) {
    switch (level) {
    case Level::Debug: return fmt::fg(fmt::color::gray);
    case Level::Info: return fmt::fg(fmt::color::green);
    case Level::Warn: return fmt::fg(fmt::color::yellow);
    case Level::Error: return fmt::fg(fmt::color::red);
    case Level::Off: break;
    }
    return {};
}

void write_stderr(bool color, Level level, std::string_view message) {
    if (color) {
        fmt::print(stderr, "[benchkit] ");
        fmt::print(stderr, level_style(level), "{}", level_name(level));
        fmt::print(stderr, " {}\n", message);
    } else {
        fmt::print(stderr, "[benchkit] {} {}\n", level_name(level), message);
    }
}

} // namespace

std::string_view level_name(Level level) {
    switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
    }
    return "INFO";
}

bool parse_level(std::string_view text, Level &out) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>((ch >= 'A' && ch <= 'Z') ? ch - 'A' + 'a' : ch); });
    if (lowered == "debug") { out = Level::Debug; return true; }
    if (lowered == "info") { out = Level::Info; return true; }
    if (lowered == "warn" || lowered == "warning") { out = Level::Warn; return true; }
    if (lowered == "error") { out = Level::Error; return true; }
    if (lowered == "off") { out = Level::Off; return true; }
    return false;
}

Level threshold() {
    auto                       &s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.threshold;
}

void set_threshold(Level level) {
    auto                       &s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.threshold = level;
}

bool enabled(Level level) {
    if (level == Level::Off)
        return false;
    return static_cast<int>(level) >= static_cast<int>(threshold());
}

void set_color(bool enabled) {
    auto                       &s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.color = enabled;
}

Sink set_sink(Sink sink) {
    auto                       &s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    std::swap(s.sink, sink);
    return sink;
}

void write(Level level, std::string_view message) {
    auto &s = state();
    Sink  sink;
    {
        std::lock_guard<std::mutex> lock(s.mtx);
        for (std::ofstream *mirror : s.mirrors) {
            *mirror << level_name(level) << ' ' << message << '\n';
            mirror->flush();
        }
        if (!s.sink) {
            write_stderr(s.color, level, message);
            return;
        }
        sink = s.sink;
    }
    // Called unlocked so a sink may log in turn.
    sink(level, message);
}

struct FileScope::State {
    std::ofstream out;
};

FileScope::FileScope(const std::string &path) : state_(std::make_unique<State>()) {
    state_->out.open(path, std::ios::app);
    if (!state_->out) {
        warn("cannot open log file '{}'; logging to stderr only", path);
        return;
    }
    auto                       &s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.mirrors.push_back(&state_->out);
}

FileScope::~FileScope() {
    if (!state_->out.is_open())
        return;
    auto                       &s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.mirrors.erase(std::remove(s.mirrors.begin(), s.mirrors.end(), &state_->out), s.mirrors.end());
}

bool FileScope::is_open() const { return state_->out.is_open(); }

} // namespace benchkit::log
