#pragma once

#include <span>
#include <string>

namespace benchkit::ctl {

enum class Command {
    Help,
    Show,
    Report,
    Csv,
};

struct CliOptions {
    Command     command = Command::Help;
    std::string artifact_path;
    std::string output_path;

    bool        no_color  = false;
    std::string log_level; // empty: BENCHKIT_LOG_LEVEL or info
};

// Parses `benchkitctl <command> <artifact> [options]`. Prints a diagnostic to
// stderr and returns false on malformed input.
bool parse_cli(std::span<const char *> args, CliOptions &out_opt);

void print_usage();

} // namespace benchkit::ctl
