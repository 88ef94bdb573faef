// Leveled stderr logging for benchkit.
#pragma once

#include <fmt/format.h>

#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace benchkit::log {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

using Sink = std::function<void(Level, std::string_view)>;

std::string_view level_name(Level level);
bool             parse_level(std::string_view text, Level &out);

// Threshold defaults to BENCHKIT_LOG_LEVEL (or Info when unset/invalid).
Level threshold();
void  set_threshold(Level level);
bool  enabled(Level level);

// Colored level tags default to on unless NO_COLOR or BENCHKIT_NO_COLOR is set.
void set_color(bool enabled);

// Replaces the sink used for every emitted line and returns the previous one.
// An empty sink restores the default stderr writer.
Sink set_sink(Sink sink);

void write(Level level, std::string_view message);

template <typename... Args>
void emit(Level level, fmt::format_string<Args...> format_string, Args &&...args) {
    if (!enabled(level))
        return;
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    write(level, std::string_view(buffer.data(), buffer.size()));
}

template <typename... Args>
void debug(fmt::format_string<Args...> format_string, Args &&...args) {
    emit(Level::Debug, format_string, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format_string, Args &&...args) {
    emit(Level::Info, format_string, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> format_string, Args &&...args) {
    emit(Level::Warn, format_string, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> format_string, Args &&...args) {
    emit(Level::Error, format_string, std::forward<Args>(args)...);
}

// Mirrors every line written while alive into `path` (appending). Used by the
// lifecycle transitions when the Spec names a logs file.
class FileScope {
  public:
    explicit FileScope(const std::string &path);
    ~FileScope();

    FileScope(const FileScope &)            = delete;
    FileScope &operator=(const FileScope &) = delete;

    bool is_open() const;

  private:
    struct State;
    std::unique_ptr<State> state_;
};

} // namespace benchkit::log
