#pragma once

#include <limits>
#include <string>
#include <unordered_map>

#include "field_validation.hpp"
#include "globe_base.hpp"
#include "log_profile.hpp"
#include "wbgt_index.hpp"
#include "wetbulb_base.hpp"

/**
 * @file runtime_config.hpp
 * @brief Runtime configuration state and parsing helpers.
 *
 * Declares the run configuration consumed by the pipeline and the
 * parsing and conversion helpers used while reading YAML-like
 * configuration inputs.
 */

/**
 * @brief Complete configuration of one pipeline run.
 */
struct WbgtRunConfig
{
    GlobeConstants globe{};
    GlobeSolverConfig solver{};
    WetBulbConfig wetbulb{};
    WbgtMode mode = WbgtMode::Outdoor;

    std::string input_directory = "data/inputs";
    std::string output_directory = "data/outputs";
    float input_missing_value = std::numeric_limits<float>::quiet_NaN();
    float output_missing_value = std::numeric_limits<float>::quiet_NaN();
    bool write_status = false;
    int threads = 0;  // 0 keeps the OpenMP default

    wbgt::ValidationPolicy validation{};
    std::string validation_report_path;
};

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string.
 * @return Parsed boolean value.
 */
bool parse_bool_value(const std::string& value);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a non-negative integer value.
 * @return True on successful parse and non-negative result.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out);

/**
 * @brief Parses a strictly positive integer value.
 */
bool try_parse_positive_int_value(const std::string& value, int& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Parses a missing-value marker: a finite number, or `nan`/`none`.
 */
bool try_parse_missing_value(const std::string& value, float& out);

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected);

/**
 * @brief Parses validation override keys of form
 *        `validation.field_overrides.<field>.(min|max)`.
 */
bool parse_override_key(const std::string& key, std::string& field_id_out, bool& is_min_out);

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Parsed key-value map with dotted keys for nested sections.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Applies a parsed key map on top of the current configuration.
 *
 * Unknown keys are ignored; invalid values warn and keep the previous value.
 * `log.profile` updates `global_log_profile`.
 */
void apply_config_map(const std::unordered_map<std::string, std::string>& config, WbgtRunConfig& cfg);

/**
 * @brief Loads a YAML configuration file into `cfg`.
 * @return False when the file cannot be opened.
 */
bool load_config(const std::string& config_path, WbgtRunConfig& cfg);

/**
 * @brief Prints the effective configuration at normal log level.
 */
void log_run_config(const WbgtRunConfig& cfg);
