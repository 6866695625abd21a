#pragma once

#include <limits>
#include <string>
#include <vector>

#include "cli_options.hpp"
#include "field_validation.hpp"

/**
 * @file step_directory_validation.hpp
 * @brief Offline contract checks over a directory of `<step>_<field>.npy` files.
 *
 * Backs the `wbgt_field_validator` tool. Files are grouped by step; each step
 * gets one ValidationReport covering every recognised field plus two
 * structural checks: required inputs absent from a step that has any input,
 * and fields whose shape differs from the step's first field.
 */

namespace wbgt
{

struct FieldValidatorOptions
{
    std::string input_dir;
    bool strict = false;  // "report" mode counts only
    StrictGuardScope scope = StrictGuardScope::RequiredOnly;
    std::string json_path;
    float missing_value = std::numeric_limits<float>::quiet_NaN();
};

struct StepDirectoryResult
{
    std::vector<ValidationReport> reports;  // lexical step order
    bool failed = false;
};

/**
 * @brief Parses tool arguments (program name excluded).
 *
 * `--input` is mandatory; `--mode report|strict`, `--scope required|all`,
 * `--missing-value <v|nan>` and `--json <path>` are optional.
 */
CliParseResult parse_field_validator_args(const std::vector<std::string>& args,
                                          FieldValidatorOptions& out,
                                          std::string& error);

/**
 * @brief Validates every step found in `options.input_dir`.
 * @return False with `error` set when the directory is unusable or holds no step files.
 *
 * Unreadable files are recorded as critical violations in either mode.
 */
bool validate_step_directory(const FieldValidatorOptions& options,
                             StepDirectoryResult& out,
                             std::string& error);

std::string step_directory_result_to_json(const FieldValidatorOptions& options,
                                          const StepDirectoryResult& result);

/**
 * @brief Runs the tool: prints one summary line per step and writes the optional JSON.
 * @return 0 when every step passed, 1 on failure or I/O error.
 */
int run_field_validator(const FieldValidatorOptions& options);

} // namespace wbgt
