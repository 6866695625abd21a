/**
 * @file runtime_config.cpp
 * @brief Runtime configuration parsing for the WBGT pipeline.
 *
 * Reads the YAML-like configuration file into a WbgtRunConfig,
 * keeping defaults for invalid values.
 * This file belongs to the primary src/core execution layer.
 */

#include "runtime_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include "string_utils.hpp"

LogProfile global_log_profile = LogProfile::normal;

/**
 * @brief Parses common truthy boolean spellings.
 */
bool parse_bool_value(const std::string& value)
{
    return wbgt::strutil::parse_bool(value);
}

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a non-negative integer value.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed < 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a strictly positive integer value.
 */
bool try_parse_positive_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed <= 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool try_parse_missing_value(const std::string& value, float& out)
{
    const std::string normalized = wbgt::strutil::lower_copy(wbgt::strutil::trim_copy(value));
    if (normalized == "nan" || normalized == "none" || normalized == "null")
    {
        out = std::numeric_limits<float>::quiet_NaN();
        return true;
    }

    double parsed = 0.0;
    if (!try_parse_double_value(value, parsed) ||
        std::fabs(parsed) > static_cast<double>(std::numeric_limits<float>::max()))
    {
        return false;
    }
    out = static_cast<float>(parsed);
    return true;
}

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    std::cerr << "Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping previous/default value." << std::endl;
}

/**
 * @brief Returns string label for runtime logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = wbgt::strutil::lower_copy(wbgt::strutil::trim_copy(value));
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

/**
 * @brief Parses a YAML file.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::unordered_map<std::string, std::string> config;
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Could not open config file: " << filename << std::endl;
        return config;
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;

        const size_t indent_level = indent / 2;

        line = wbgt::strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            std::string section_name = line.substr(0, line.size() - 1);

            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            section_stack.push_back(section_name);

            continue;
        }

        size_t colon_pos = line.find(':');

        if (colon_pos != std::string::npos)
        {
            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            const std::string key = wbgt::strutil::trim_copy(line.substr(0, colon_pos));
            const std::string value =
                wbgt::strutil::strip_wrapping_quotes(wbgt::strutil::trim_copy(line.substr(colon_pos + 1)));

            std::string full_key;
            for (const auto& section : section_stack)
            {
                if (!full_key.empty()) full_key += ".";
                full_key += section;
            }
            if (!full_key.empty()) full_key += ".";
            full_key += key;
            config[full_key] = value;
        }
    }

    return config;
}

/**
 * @brief Parses validation override keys of form `field_overrides.<field>.(min|max)`.
 */
bool parse_override_key(const std::string& key, std::string& field_id_out, bool& is_min_out)
{
    const std::string prefix = "validation.field_overrides.";
    if (key.rfind(prefix, 0) != 0)
    {
        return false;
    }

    const std::string tail = key.substr(prefix.size());
    const std::size_t dot = tail.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= tail.size())
    {
        return false;
    }

    field_id_out = tail.substr(0, dot);
    const std::string bound_key = tail.substr(dot + 1);
    if (bound_key == "min")
    {
        is_min_out = true;
        return true;
    }
    if (bound_key == "max")
    {
        is_min_out = false;
        return true;
    }

    return false;
}

namespace
{

/**
 * @brief Reads a double key that must be strictly positive.
 */
void read_positive_double(const std::unordered_map<std::string, std::string>& config,
                          const std::string& key,
                          double& target)
{
    const auto it = config.find(key);
    if (it == config.end())
    {
        return;
    }

    double parsed = 0.0;
    if (try_parse_double_value(it->second, parsed) && parsed > 0.0)
    {
        target = parsed;
    }
    else
    {
        warn_invalid_config_value(key, it->second, "a positive finite number");
    }
}

/**
 * @brief Reads a coefficient restricted to [0, 1].
 */
void read_unit_interval_double(const std::unordered_map<std::string, std::string>& config,
                               const std::string& key,
                               double& target)
{
    const auto it = config.find(key);
    if (it == config.end())
    {
        return;
    }

    double parsed = 0.0;
    if (try_parse_double_value(it->second, parsed) && parsed >= 0.0 && parsed <= 1.0)
    {
        target = parsed;
    }
    else
    {
        warn_invalid_config_value(key, it->second, "a number in [0, 1]");
    }
}

void read_bool(const std::unordered_map<std::string, std::string>& config,
               const std::string& key,
               bool& target)
{
    const auto it = config.find(key);
    if (it == config.end())
    {
        return;
    }

    if (wbgt::strutil::is_bool_literal(it->second))
    {
        target = parse_bool_value(it->second);
    }
    else
    {
        warn_invalid_config_value(key, it->second, "true or false");
    }
}

void read_missing_value(const std::unordered_map<std::string, std::string>& config,
                        const std::string& key,
                        float& target)
{
    const auto it = config.find(key);
    if (it == config.end())
    {
        return;
    }

    float parsed = 0.0f;
    if (try_parse_missing_value(it->second, parsed))
    {
        target = parsed;
    }
    else
    {
        warn_invalid_config_value(key, it->second, "a finite number or nan");
    }
}

std::string format_missing_value(float value)
{
    return std::isnan(value) ? std::string("nan") : std::to_string(value);
}

} // namespace

/**
 * @brief Applies a parsed key map to the run configuration.
 */
void apply_config_map(const std::unordered_map<std::string, std::string>& config, WbgtRunConfig& cfg)
{
    const auto value_of = [&config](const std::string& key) -> const std::string* {
        const auto it = config.find(key);
        return it == config.end() ? nullptr : &it->second;
    };

    if (const std::string* v = value_of("log.profile"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(*v, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid log.profile '" << *v
                      << "'. Valid values: quiet, normal, debug. Keeping "
                      << log_profile_name(global_log_profile) << "." << std::endl;
        }
    }

    read_positive_double(config, "globe.diameter_m", cfg.globe.diameter_m);
    read_positive_double(config, "globe.air_conductivity_wmk", cfg.globe.air_conductivity_wmk);
    read_positive_double(config, "globe.kinematic_viscosity_m2s", cfg.globe.kinematic_viscosity_m2s);
    read_unit_interval_double(config, "globe.solar_absorptivity", cfg.globe.solar_absorptivity);
    read_unit_interval_double(config, "globe.emissivity", cfg.globe.emissivity);
    read_unit_interval_double(config, "globe.atmospheric_emissivity", cfg.globe.atmospheric_emissivity);
    read_positive_double(config, "globe.stefan_boltzmann_wm2k4", cfg.globe.stefan_boltzmann_wm2k4);
    if (cfg.globe.emissivity <= 0.0)
    {
        std::cerr << "Warning: globe.emissivity must be positive; restoring default "
                  << physical_constants::globe_longwave_emissivity << "." << std::endl;
        cfg.globe.emissivity = physical_constants::globe_longwave_emissivity;
    }

    if (const std::string* v = value_of("solver.max_iterations"))
    {
        int parsed = 0;
        if (try_parse_positive_int_value(*v, parsed))
        {
            cfg.solver.max_iterations = parsed;
        }
        else
        {
            warn_invalid_config_value("solver.max_iterations", *v, "a positive integer");
        }
    }
    read_positive_double(config, "solver.tolerance_k", cfg.solver.tolerance_k);
    read_positive_double(config, "solver.derivative_floor", cfg.solver.derivative_floor);
    if (const std::string* v = value_of("solver.threads"))
    {
        int parsed = 0;
        if (try_parse_non_negative_int_value(*v, parsed))
        {
            cfg.threads = parsed;
        }
        else
        {
            warn_invalid_config_value("solver.threads", *v, "a non-negative integer");
        }
    }

    if (const std::string* v = value_of("wetbulb.scheme"))
    {
        const std::string scheme = wbgt::strutil::lower_copy(*v);
        try
        {
            create_wetbulb_scheme(scheme);
            cfg.wetbulb.scheme_id = scheme;
        }
        catch (const std::runtime_error&)
        {
            warn_invalid_config_value("wetbulb.scheme", *v, "a known wet-bulb scheme (stull)");
        }
    }
    read_bool(config, "wetbulb.rh_is_fraction", cfg.wetbulb.rh_is_fraction);
    read_bool(config, "wetbulb.restrict_to_valid_range", cfg.wetbulb.restrict_to_valid_range);
    read_bool(config, "wetbulb.cap_at_air_temperature", cfg.wetbulb.cap_at_air_temperature);

    if (const std::string* v = value_of("wbgt.mode"))
    {
        WbgtMode mode = cfg.mode;
        if (parse_wbgt_mode(*v, mode))
        {
            cfg.mode = mode;
        }
        else
        {
            warn_invalid_config_value("wbgt.mode", *v, "outdoor or indoor");
        }
    }

    if (const std::string* v = value_of("input.directory"))
    {
        cfg.input_directory = *v;
    }
    read_missing_value(config, "input.missing_value", cfg.input_missing_value);

    if (const std::string* v = value_of("output.directory"))
    {
        cfg.output_directory = *v;
    }
    read_bool(config, "output.write_status", cfg.write_status);
    read_missing_value(config, "output.missing_value", cfg.output_missing_value);

    if (const std::string* v = value_of("validation.mode"))
    {
        wbgt::GuardMode mode = cfg.validation.mode;
        if (wbgt::parse_guard_mode(*v, mode))
        {
            cfg.validation.mode = mode;
        }
        else
        {
            std::cerr << "Warning: Invalid validation.mode '" << *v
                      << "'. Valid values: off, sanitize, strict." << std::endl;
        }
    }
    if (const std::string* v = value_of("validation.fail_on"))
    {
        wbgt::GuardFailOn fail_on = cfg.validation.fail_on;
        if (wbgt::parse_guard_fail_on(*v, fail_on))
        {
            cfg.validation.fail_on = fail_on;
        }
        else
        {
            std::cerr << "Warning: Invalid validation.fail_on '" << *v
                      << "'. Valid values: nonfinite, bounds, both." << std::endl;
        }
    }
    if (const std::string* v = value_of("validation.scope"))
    {
        wbgt::StrictGuardScope scope = cfg.validation.strict_scope;
        if (wbgt::parse_strict_guard_scope(*v, scope))
        {
            cfg.validation.strict_scope = scope;
        }
        else
        {
            std::cerr << "Warning: Invalid validation.scope '" << *v
                      << "'. Valid values: required, all." << std::endl;
        }
    }
    if (const std::string* v = value_of("validation.report_path"))
    {
        cfg.validation_report_path = *v;
    }

    for (const auto& [key, value] : config)
    {
        std::string field_id;
        bool is_min = false;
        if (!parse_override_key(key, field_id, is_min))
        {
            continue;
        }

        const wbgt::FieldContract* contract = wbgt::find_field_contract(field_id);
        if (contract == nullptr)
        {
            std::cerr << "Warning: Unknown field in " << key << "; ignoring override." << std::endl;
            continue;
        }

        double parsed = 0.0;
        if (!try_parse_double_value(value, parsed))
        {
            warn_invalid_config_value(key, value, "a finite number");
            continue;
        }

        auto [it, inserted] = cfg.validation.field_overrides.emplace(contract->id, contract->default_bounds);
        (void)inserted;
        if (is_min)
        {
            it->second.has_min = true;
            it->second.min_value = parsed;
        }
        else
        {
            it->second.has_max = true;
            it->second.max_value = parsed;
        }
    }
}

/**
 * @brief Loads the configuration from a YAML file.
 */
bool load_config(const std::string& config_path, WbgtRunConfig& cfg)
{
    if (config_path.empty())
    {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path, ec))
    {
        std::cerr << "Could not open config file: " << config_path << std::endl;
        return false;
    }

    const auto config = parse_yaml_simple(config_path);
    apply_config_map(config, cfg);

    if (log_normal_enabled())
    {
        std::cout << "Loaded config with " << config.size() << " keys" << std::endl;
    }
    return true;
}

/**
 * @brief Prints the effective configuration at normal log level.
 */
void log_run_config(const WbgtRunConfig& cfg)
{
    if (!log_normal_enabled())
    {
        return;
    }

    std::cout << "[WBGT CONFIG] mode=" << to_string(cfg.mode)
              << " input=" << cfg.input_directory
              << " outdir=" << cfg.output_directory << std::endl;
    std::cout << "[WBGT CONFIG] globe: D=" << cfg.globe.diameter_m << " m"
              << ", k_air=" << cfg.globe.air_conductivity_wmk << " W/(m K)"
              << ", nu=" << cfg.globe.kinematic_viscosity_m2s << " m2/s"
              << ", alpha_sw=" << cfg.globe.solar_absorptivity
              << ", eps=" << cfg.globe.emissivity
              << ", eps_atm=" << cfg.globe.atmospheric_emissivity << std::endl;
    std::cout << "[WBGT CONFIG] solver: max_iterations=" << cfg.solver.max_iterations
              << ", tolerance=" << cfg.solver.tolerance_k << " K"
              << ", derivative_floor=" << cfg.solver.derivative_floor
              << ", threads=" << (cfg.threads > 0 ? std::to_string(cfg.threads) : std::string("default"))
              << std::endl;
    std::cout << "[WBGT CONFIG] wetbulb: scheme=" << cfg.wetbulb.scheme_id
              << ", rh_is_fraction=" << (cfg.wetbulb.rh_is_fraction ? "true" : "false")
              << ", restrict_to_valid_range=" << (cfg.wetbulb.restrict_to_valid_range ? "true" : "false")
              << ", cap_at_air_temperature=" << (cfg.wetbulb.cap_at_air_temperature ? "true" : "false")
              << std::endl;
    std::cout << "[WBGT CONFIG] missing: input=" << format_missing_value(cfg.input_missing_value)
              << ", output=" << format_missing_value(cfg.output_missing_value)
              << ", write_status=" << (cfg.write_status ? "true" : "false") << std::endl;
    std::cout << "[WBGT CONFIG] validation: mode=" << wbgt::to_string(cfg.validation.mode)
              << ", fail_on=" << wbgt::to_string(cfg.validation.fail_on)
              << ", scope=" << wbgt::to_string(cfg.validation.strict_scope)
              << ", overrides=" << cfg.validation.field_overrides.size();
    if (!cfg.validation_report_path.empty())
    {
        std::cout << ", report=" << cfg.validation_report_path;
    }
    std::cout << std::endl;
}
