/**
 * @file cli_options.cpp
 * @brief Implementation for the core module.
 *
 * Argument cursor and `wbgt_grid` option parsing.
 * This file belongs to the primary src/core execution layer.
 */

#include "cli_options.hpp"

bool CliArgCursor::next()
{
    if (index_ >= args_.size())
    {
        return false;
    }

    const std::string& token = args_[index_++];
    const std::size_t eq = token.find('=');
    has_inline_value_ = token.rfind("--", 0) == 0 && eq != std::string::npos;
    if (has_inline_value_)
    {
        name_ = token.substr(0, eq);
        inline_value_ = token.substr(eq + 1);
    }
    else
    {
        name_ = token;
        inline_value_.clear();
    }
    return true;
}

bool CliArgCursor::take_value(std::string& value, std::string& error)
{
    if (has_inline_value_)
    {
        value = inline_value_;
        return true;
    }
    if (index_ < args_.size())
    {
        value = args_[index_++];
        return true;
    }
    error = "Missing value for " + name_;
    return false;
}

CliParseResult parse_cli_args(const std::vector<std::string>& args, CliOverrides& out, std::string& error)
{
    CliArgCursor cursor(args);
    std::string value;

    while (cursor.next())
    {
        const std::string& arg = cursor.name();

        if (arg == "--help" || arg == "-h")
        {
            return CliParseResult::Help;
        }
        if (arg == "--write-status")
        {
            out.write_status = true;
            continue;
        }

        if (arg != "--config" && arg != "--input" && arg != "--outdir" && arg != "--log-profile" &&
            arg != "--guard-mode" && arg != "--guard-report" && arg != "--mode" && arg != "--threads" &&
            arg != "--max-iterations")
        {
            error = "Unknown argument: " + arg;
            return CliParseResult::Error;
        }
        if (!cursor.take_value(value, error))
        {
            return CliParseResult::Error;
        }

        if (arg == "--config")
        {
            out.config_path = value;
        }
        else if (arg == "--input")
        {
            out.input_directory = value;
        }
        else if (arg == "--outdir")
        {
            out.output_directory = value;
        }
        else if (arg == "--guard-report")
        {
            out.guard_report_path = value;
        }
        else if (arg == "--log-profile")
        {
            bool valid = false;
            const LogProfile parsed = parse_log_profile(value, &valid);
            if (!valid)
            {
                error = "Invalid --log-profile value '" + value + "'. Use quiet, normal, or debug.";
                return CliParseResult::Error;
            }
            out.log_profile = parsed;
        }
        else if (arg == "--guard-mode")
        {
            wbgt::GuardMode parsed = wbgt::GuardMode::Sanitize;
            if (!wbgt::parse_guard_mode(value, parsed))
            {
                error = "Invalid --guard-mode value '" + value + "'. Use off, sanitize, or strict.";
                return CliParseResult::Error;
            }
            out.guard_mode = parsed;
        }
        else if (arg == "--mode")
        {
            WbgtMode parsed = WbgtMode::Outdoor;
            if (!parse_wbgt_mode(value, parsed))
            {
                error = "Invalid --mode value '" + value + "'. Use outdoor or indoor.";
                return CliParseResult::Error;
            }
            out.mode = parsed;
        }
        else if (arg == "--threads")
        {
            int parsed = 0;
            if (!try_parse_non_negative_int_value(value, parsed))
            {
                error = "Invalid --threads value '" + value + "'. Expected a non-negative integer.";
                return CliParseResult::Error;
            }
            out.threads = parsed;
        }
        else
        {
            int parsed = 0;
            if (!try_parse_positive_int_value(value, parsed))
            {
                error = "Invalid --max-iterations value '" + value + "'. Expected a positive integer.";
                return CliParseResult::Error;
            }
            out.max_iterations = parsed;
        }
    }

    return CliParseResult::Ok;
}

void apply_cli_overrides(const CliOverrides& cli, WbgtRunConfig& cfg)
{
    if (cli.log_profile) global_log_profile = *cli.log_profile;
    if (cli.input_directory) cfg.input_directory = *cli.input_directory;
    if (cli.output_directory) cfg.output_directory = *cli.output_directory;
    if (cli.guard_mode) cfg.validation.mode = *cli.guard_mode;
    if (cli.guard_report_path) cfg.validation_report_path = *cli.guard_report_path;
    if (cli.mode) cfg.mode = *cli.mode;
    if (cli.threads) cfg.threads = *cli.threads;
    if (cli.max_iterations) cfg.solver.max_iterations = *cli.max_iterations;
    if (cli.write_status) cfg.write_status = true;
}

void print_usage(std::ostream& os)
{
    os << "WBGT grid solver\n"
       << "Usage:\n"
       << "  wbgt_grid [--config <path>] [--input <dir>] [--outdir <dir>]\n"
       << "            [--log-profile quiet|normal|debug] [--guard-mode off|sanitize|strict]\n"
       << "            [--guard-report <path>] [--mode outdoor|indoor] [--threads <n>]\n"
       << "            [--max-iterations <n>] [--write-status] [--help]\n"
       << "Environment:\n"
       << "  WBGT_LOG_PROFILE    quiet|normal|debug\n"
       << "  WBGT_DEBUG_EXPORTS  print ranges of exported fields\n";
}
