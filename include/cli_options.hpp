#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "field_validation.hpp"
#include "log_profile.hpp"
#include "runtime_config.hpp"
#include "wbgt_index.hpp"

/**
 * @file cli_options.hpp
 * @brief Command-line parsing for the WBGT executables.
 *
 * Arguments are parsed into plain structs so the programs' mains stay thin
 * and option handling can be exercised without spawning processes.
 */

enum class CliParseResult
{
    Ok,
    Help,
    Error,
};

/**
 * @brief Walks argument tokens, accepting both `--name value` and `--name=value`.
 */
class CliArgCursor
{
public:
    explicit CliArgCursor(const std::vector<std::string>& args) : args_(args) {}

    /**
     * @brief Advances to the next option token.
     * @return False once all tokens are consumed.
     */
    bool next();

    const std::string& name() const { return name_; }

    /**
     * @brief Fetches the option value, inline or from the following token.
     * @return False with `error` set when no value is available.
     */
    bool take_value(std::string& value, std::string& error);

private:
    const std::vector<std::string>& args_;
    std::size_t index_ = 0;
    std::string name_;
    std::string inline_value_;
    bool has_inline_value_ = false;
};

/**
 * @brief Values given on the command line of `wbgt_grid`; applied after the config file.
 */
struct CliOverrides
{
    std::string config_path;
    std::optional<std::string> input_directory;
    std::optional<std::string> output_directory;
    std::optional<LogProfile> log_profile;
    std::optional<wbgt::GuardMode> guard_mode;
    std::optional<std::string> guard_report_path;
    std::optional<WbgtMode> mode;
    std::optional<int> threads;
    std::optional<int> max_iterations;
    bool write_status = false;
};

/**
 * @brief Parses `wbgt_grid` arguments (program name excluded).
 * @param args Argument tokens.
 * @param out Receives the recognised options.
 * @param error Message for the first bad or unknown argument.
 */
CliParseResult parse_cli_args(const std::vector<std::string>& args, CliOverrides& out, std::string& error);

/**
 * @brief Layers command-line values over a loaded configuration.
 *
 * A given `--log-profile` also becomes the global log profile.
 */
void apply_cli_overrides(const CliOverrides& cli, WbgtRunConfig& cfg);

void print_usage(std::ostream& os);
