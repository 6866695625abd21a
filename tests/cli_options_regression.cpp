#include "cli_options.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[cli-options-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

CliParseResult parse(const std::vector<std::string>& args, CliOverrides& out, std::string& error)
{
    out = CliOverrides{};
    error.clear();
    return parse_cli_args(args, out, error);
}

int test_all_options_parsed()
{
    int failures = 0;
    CliOverrides cli;
    std::string error;
    const auto result = parse({"--config", "run.yaml", "--input=in", "--outdir", "out",
                               "--mode", "indoor", "--guard-mode=strict", "--guard-report", "qa/report.json",
                               "--threads", "4", "--max-iterations=25", "--write-status"},
                              cli, error);

    failures += expect_true(result == CliParseResult::Ok, "full argument set accepted: " + error);
    failures += expect_true(cli.config_path == "run.yaml", "config path");
    failures += expect_true(cli.input_directory && *cli.input_directory == "in", "inline --input value");
    failures += expect_true(cli.output_directory && *cli.output_directory == "out", "separate --outdir value");
    failures += expect_true(cli.mode && *cli.mode == WbgtMode::Indoor, "indoor mode");
    failures += expect_true(cli.guard_mode && *cli.guard_mode == wbgt::GuardMode::Strict, "strict guard");
    failures += expect_true(cli.guard_report_path && *cli.guard_report_path == "qa/report.json", "report path");
    failures += expect_true(cli.threads && *cli.threads == 4, "thread count");
    failures += expect_true(cli.max_iterations && *cli.max_iterations == 25, "iteration cap");
    failures += expect_true(cli.write_status, "status flag");
    failures += expect_true(!cli.log_profile, "log profile left unset");

    failures += expect_true(parse({"-h"}, cli, error) == CliParseResult::Help, "short help");
    failures += expect_true(parse({"--input", "in", "--help"}, cli, error) == CliParseResult::Help, "help after options");
    failures += expect_true(parse({}, cli, error) == CliParseResult::Ok && !cli.input_directory, "no arguments");
    return failures;
}

int test_bad_arguments_rejected()
{
    int failures = 0;
    CliOverrides cli;
    std::string error;

    failures += expect_true(parse({"--threads"}, cli, error) == CliParseResult::Error, "dangling option");
    failures += expect_true(error.find("Missing value for --threads") != std::string::npos, "dangling option message");

    failures += expect_true(parse({"--frobnicate"}, cli, error) == CliParseResult::Error, "unknown option");
    failures += expect_true(error.find("Unknown argument: --frobnicate") != std::string::npos, "unknown option message");

    failures += expect_true(parse({"--threads", "-1"}, cli, error) == CliParseResult::Error, "negative threads");
    failures += expect_true(parse({"--max-iterations", "0"}, cli, error) == CliParseResult::Error, "zero iterations");
    failures += expect_true(parse({"--max-iterations=ten"}, cli, error) == CliParseResult::Error, "non-numeric iterations");
    failures += expect_true(parse({"--mode", "twilight"}, cli, error) == CliParseResult::Error, "unknown mode");
    failures += expect_true(parse({"--guard-mode", "loose"}, cli, error) == CliParseResult::Error, "unknown guard");
    failures += expect_true(parse({"--log-profile", "chatty"}, cli, error) == CliParseResult::Error, "unknown profile");
    failures += expect_true(error.find("chatty") != std::string::npos, "bad value echoed");
    return failures;
}

int test_cli_overrides_config_file()
{
    int failures = 0;
    const auto dir = std::filesystem::temp_directory_path() / "wbgt_cli_options_regression";
    std::filesystem::create_directories(dir);
    const auto config_path = dir / "run.yaml";
    {
        std::ofstream out(config_path);
        out << "wbgt:\n"
            << "  mode: indoor\n"
            << "solver:\n"
            << "  max_iterations: 30\n"
            << "  tolerance_k: 0.002\n"
            << "input:\n"
            << "  directory: from_config\n";
    }

    const LogProfile saved_profile = global_log_profile;
    global_log_profile = LogProfile::quiet;

    CliOverrides cli;
    std::string error;
    failures += expect_true(parse({"--config", config_path.string(), "--mode", "outdoor", "--max-iterations", "12"},
                                  cli, error) == CliParseResult::Ok, "override arguments accepted: " + error);

    WbgtRunConfig cfg;
    failures += expect_true(load_config(cli.config_path, cfg), "config file loaded");
    failures += expect_true(cfg.mode == WbgtMode::Indoor && cfg.solver.max_iterations == 30, "config values before overrides");

    apply_cli_overrides(cli, cfg);
    failures += expect_true(cfg.mode == WbgtMode::Outdoor, "CLI mode wins over config");
    failures += expect_true(cfg.solver.max_iterations == 12, "CLI iteration cap wins over config");
    failures += expect_true(cfg.input_directory == "from_config", "config value kept when CLI is silent");
    failures += expect_true(!cfg.write_status, "status stays off without flag");

    CliOverrides profile_only;
    profile_only.log_profile = LogProfile::debug;
    apply_cli_overrides(profile_only, cfg);
    failures += expect_true(global_log_profile == LogProfile::debug, "log profile applied globally");

    global_log_profile = saved_profile;

    WbgtRunConfig missing;
    failures += expect_true(!load_config((dir / "absent.yaml").string(), missing), "missing config file reported");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_all_options_parsed();
    failures += test_bad_arguments_rejected();
    failures += test_cli_overrides_config_file();

    if (failures > 0)
    {
        std::cerr << "[cli-options-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[cli-options-regression] all checks passed" << std::endl;
    return 0;
}
