#include "cli.h"

#include <gtest/gtest.h>

#include <vector>

using benchkit::ctl::CliOptions;
using benchkit::ctl::Command;
using benchkit::ctl::parse_cli;

namespace {

bool parse(std::vector<const char *> args, CliOptions &out) {
    args.insert(args.begin(), "benchkitctl");
    return parse_cli(std::span<const char *>(args.data(), args.size()), out);
}

} // namespace

TEST(Cli, ShowTakesAnArtifact) {
    CliOptions opt;
    ASSERT_TRUE(parse({"show", "run.json"}, opt));
    EXPECT_EQ(opt.command, Command::Show);
    EXPECT_EQ(opt.artifact_path, "run.json");
    EXPECT_TRUE(opt.output_path.empty());
}

TEST(Cli, ReportAndCsvNeedAnOutput) {
    CliOptions opt;
    ASSERT_TRUE(parse({"report", "eval.json", "-o", "report.json"}, opt));
    EXPECT_EQ(opt.command, Command::Report);
    EXPECT_EQ(opt.output_path, "report.json");

    ASSERT_TRUE(parse({"csv", "--output=table.csv", "eval.json"}, opt));
    EXPECT_EQ(opt.command, Command::Csv);
    EXPECT_EQ(opt.artifact_path, "eval.json");
    EXPECT_EQ(opt.output_path, "table.csv");

    EXPECT_FALSE(parse({"csv", "eval.json"}, opt));
    EXPECT_FALSE(parse({"report", "eval.json", "-o"}, opt));
}

TEST(Cli, LoggingOptions) {
    CliOptions opt;
    ASSERT_TRUE(parse({"show", "run.json", "--log-level", "debug", "--no-color"}, opt));
    EXPECT_EQ(opt.log_level, "debug");
    EXPECT_TRUE(opt.no_color);
    EXPECT_FALSE(parse({"show", "run.json", "--log-level=chatty"}, opt));
}

TEST(Cli, HelpAndErrors) {
    CliOptions opt;
    ASSERT_TRUE(parse({}, opt));
    EXPECT_EQ(opt.command, Command::Help);
    ASSERT_TRUE(parse({"show", "--help"}, opt));
    EXPECT_EQ(opt.command, Command::Help);

    EXPECT_FALSE(parse({"launch", "run.json"}, opt));
    EXPECT_FALSE(parse({"show"}, opt));
    EXPECT_FALSE(parse({"show", "a.json", "b.json"}, opt));
    EXPECT_FALSE(parse({"show", "a.json", "--verbose"}, opt));
}
