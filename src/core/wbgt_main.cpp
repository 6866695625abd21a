/**
 * @file wbgt_main.cpp
 * @brief Command-line entry point for gridded WBGT computation.
 *
 * Resolves the run configuration from environment, config file and CLI
 * (in increasing priority) and hands it to the batch pipeline.
 * This file belongs to the primary src/core execution layer.
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "cli_options.hpp"
#include "headless_runtime.hpp"
#include "runtime_config.hpp"

/**
 * @brief Program entry point.
 * @param argc CLI argument count.
 * @param argv CLI argument vector.
 * @return Zero on success, non-zero on configuration/runtime failure.
 */
int main(int argc, char** argv)
{
    if (const char* env_log_profile = std::getenv("WBGT_LOG_PROFILE"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(env_log_profile, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid WBGT_LOG_PROFILE '" << env_log_profile
                      << "'. Valid values: quiet, normal, debug." << std::endl;
        }
    }

    CliOverrides cli;
    std::string error;
    switch (parse_cli_args(std::vector<std::string>(argv + 1, argv + argc), cli, error))
    {
        case CliParseResult::Help:
            print_usage(std::cout);
            return 0;
        case CliParseResult::Error:
            std::cerr << error << std::endl;
            print_usage(std::cerr);
            return 1;
        case CliParseResult::Ok:
            break;
    }

    // Applied early so config loading already logs at the requested level.
    if (cli.log_profile)
    {
        global_log_profile = *cli.log_profile;
    }

    WbgtRunConfig cfg;
    if (!load_config(cli.config_path, cfg))
    {
        return 1;
    }
    apply_cli_overrides(cli, cfg);

    if (global_log_profile == LogProfile::quiet)
    {
        std::cout.setstate(std::ios_base::failbit);
        std::clog.setstate(std::ios_base::failbit);
    }

    if (log_normal_enabled())
    {
        std::cout << "[RUN SETTINGS] log_profile=" << log_profile_name(global_log_profile);
        if (!cli.config_path.empty())
        {
            std::cout << ", config=" << cli.config_path;
        }
        std::cout << std::endl;
    }
    log_run_config(cfg);

    return run_wbgt_pipeline(cfg);
}
