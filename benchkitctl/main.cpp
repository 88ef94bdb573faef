#include "cli.h"

#include "benchkit/benchkit.h"

#include <fmt/color.h>
#include <fmt/format.h>

#include <exception>
#include <string>
#include <type_traits>
#include <variant>

using namespace benchkit;

static std::string format_optional(const std::optional<double> &value, std::string_view unit = "") {
    if (!value)
        return "-";
    return fmt::format("{:.3f}{}", *value, unit);
}

static void print_stats(const MetricStats &stats) {
    std::visit(
        [](const auto &s) {
            using T = std::decay_t<decltype(s)>;
            fmt::print("  {:<24} valid {}/{}", s.metric_name, s.n_valid_attempts, s.n_attempts);
            if constexpr (std::is_same_v<T, BooleanStats>) {
                const auto [lo, hi] = s.confidence_interval();
                fmt::print("  p={:.4f} 95% CI [{:.4f}, {:.4f}]\n", s.proportion(), lo, hi);
            } else if constexpr (std::is_same_v<T, RegressionStats>) {
                fmt::print("  mean={:.4f} std={:.4f} min={:.4f} max={:.4f}\n", s.mean, s.stddev, s.min, s.max);
            } else {
                fmt::print("  mode={}", s.mode.value_or("-"));
                for (const auto &[label, count] : s.counts)
                    fmt::print(" {}={}", label, count);
                fmt::print("\n");
            }
        },
        stats);
}

static void print_stage(const StageBase &stage) {
    const Spec &spec = stage.spec();
    fmt::print(fmt::emphasis::bold, "{}\n", stage_name(stage.kind()));
    fmt::print("  name            {}\n", spec.name());
    fmt::print("  instances       {} ({})\n", stage.instances().size(), stage.instance_type().value_or("-"));
    fmt::print("  n_attempts      {}\n", spec.n_attempts());
    fmt::print("  timeout         {}\n", format_optional(spec.timeout(), "s"));
    fmt::print("  execution_time  {}\n", format_optional(spec.execution_time(), "s"));
    fmt::print("  evaluation_time {}\n", format_optional(spec.evaluation_time(), "s"));

    if (stage_rank(stage.kind()) >= stage_rank(StageKind::Evaluation) && !stage.metrics().empty()) {
        fmt::print("metrics\n");
        for (const auto &metric : stage.metrics()) {
            try {
                print_stats(summarize_metric(stage, metric->name()));
            } catch (const StatsInsufficientDataError &e) {
                fmt::print("  {:<24} {}\n", metric->name(), e.what());
            }
        }
    }

    if (const auto *report = dynamic_cast<const BenchmarkReport *>(&stage)) {
        fmt::print("reports\n");
        for (const auto &r : report->reports())
            fmt::print("  {:<32} {:.4f} ({} instances)\n", r.aggregator_name, r.outer, r.inner.size());
    }
}

static int handle_show(const ctl::CliOptions &opt) {
    const AnyStage stage = read_any_json(opt.artifact_path);
    print_stage(stage_of(stage));
    return 0;
}

static int handle_report(const ctl::CliOptions &opt) {
    const BenchmarkEval   eval   = read_json<BenchmarkEval>(opt.artifact_path);
    const BenchmarkReport report = eval.report();
    write_json(report, opt.output_path);
    return 0;
}

static int handle_csv(const ctl::CliOptions &opt) {
    const AnyStage stage = read_any_json(opt.artifact_path);
    write_csv(stage_of(stage), opt.output_path);
    return 0;
}

int main(int argc, char **argv) {
    ctl::CliOptions opt{};
    if (!ctl::parse_cli(std::span<const char *>(const_cast<const char **>(argv), static_cast<std::size_t>(argc)), opt)) {
        ctl::print_usage();
        return 2;
    }
    if (opt.no_color)
        log::set_color(false);
    if (!opt.log_level.empty()) {
        log::Level level = log::Level::Info;
        if (log::parse_level(opt.log_level, level))
            log::set_threshold(level);
    }

    try {
        switch (opt.command) {
        case ctl::Command::Show: return handle_show(opt);
        case ctl::Command::Report: return handle_report(opt);
        case ctl::Command::Csv: return handle_csv(opt);
        case ctl::Command::Help: break;
        }
    } catch (const benchkit::error &e) {
        log::error("{}", e.what());
        return 1;
    } catch (const std::exception &e) {
        log::error("{}", e.what());
        return 1;
    }
    ctl::print_usage();
    return 0;
}
