#include "cli.h"

#include "benchkit/log.h"

#include <fmt/format.h>

#include <string_view>
#include <utility>

namespace benchkit::ctl {

void print_usage() {
    fmt::print(stderr, "usage: benchkitctl <command> <artifact> [options]\n"
                       "commands:\n"
                       "  show <artifact>                 print stage, spec, metric summaries and reports\n"
                       "  report <eval-artifact> -o FILE  aggregate an evaluated artifact into a report artifact\n"
                       "  csv <artifact> -o FILE          flatten an artifact into one CSV row per instance\n"
                       "options:\n"
                       "  -o, --output FILE   output path\n"
                       "  --log-level LEVEL   debug, info, warn, error or off\n"
                       "  --no-color          disable colored log tags\n"
                       "  -h, --help          show this help\n");
}

bool parse_cli(std::span<const char *> args, CliOptions &out_opt) {
    CliOptions opt{};

    bool wants_help = false;
    bool seen_command = false;

    enum class ValueMatch { No, Yes, Error };
    auto match_value = [&](std::size_t &i, std::string_view s, std::string_view opt_name, std::string_view &value) -> ValueMatch {
        if (s == opt_name) {
            if (i + 1 >= args.size() || !args[i + 1]) {
                fmt::print(stderr, "error: {} requires a value\n", opt_name);
                return ValueMatch::Error;
            }
            value = std::string_view(args[i + 1]);
            if (value.empty()) {
                fmt::print(stderr, "error: {} requires a non-empty value\n", opt_name);
                return ValueMatch::Error;
            }
            ++i;
            return ValueMatch::Yes;
        }
        if (s.rfind(opt_name, 0) == 0 && s.size() > opt_name.size() && s[opt_name.size()] == '=') {
            value = s.substr(opt_name.size() + 1);
            if (value.empty()) {
                fmt::print(stderr, "error: {} requires a non-empty value\n", opt_name);
                return ValueMatch::Error;
            }
            return ValueMatch::Yes;
        }
        return ValueMatch::No;
    };

    for (std::size_t i = 1; i < args.size(); ++i) {
        if (!args[i])
            continue;
        const std::string_view s(args[i]);
        std::string_view       value;

        if (s == "-h" || s == "--help") {
            wants_help = true;
            continue;
        }
        if (s == "--no-color") {
            opt.no_color = true;
            continue;
        }

        ValueMatch m = match_value(i, s, "--output", value);
        if (m == ValueMatch::No)
            m = match_value(i, s, "-o", value);
        if (m == ValueMatch::Error)
            return false;
        if (m == ValueMatch::Yes) {
            opt.output_path = std::string(value);
            continue;
        }

        m = match_value(i, s, "--log-level", value);
        if (m == ValueMatch::Error)
            return false;
        if (m == ValueMatch::Yes) {
            log::Level level = log::Level::Info;
            if (!log::parse_level(value, level)) {
                fmt::print(stderr, "error: unknown log level '{}'\n", value);
                return false;
            }
            opt.log_level = std::string(value);
            continue;
        }

        if (s.size() > 1 && s.front() == '-') {
            fmt::print(stderr, "error: unknown option '{}'\n", s);
            return false;
        }

        if (!seen_command) {
            seen_command = true;
            if (s == "show") {
                opt.command = Command::Show;
            } else if (s == "report") {
                opt.command = Command::Report;
            } else if (s == "csv") {
                opt.command = Command::Csv;
            } else if (s == "help") {
                wants_help = true;
            } else {
                fmt::print(stderr, "error: unknown command '{}'\n", s);
                return false;
            }
            continue;
        }
        if (opt.artifact_path.empty()) {
            opt.artifact_path = std::string(s);
            continue;
        }
        fmt::print(stderr, "error: unexpected argument '{}'\n", s);
        return false;
    }

    if (wants_help || !seen_command) {
        opt.command = Command::Help;
        out_opt     = std::move(opt);
        return true;
    }
    if (opt.artifact_path.empty()) {
        fmt::print(stderr, "error: missing artifact path\n");
        return false;
    }
    if ((opt.command == Command::Report || opt.command == Command::Csv) && opt.output_path.empty()) {
        fmt::print(stderr, "error: --output is required for this command\n");
        return false;
    }

    out_opt = std::move(opt);
    return true;
}

} // namespace benchkit::ctl
