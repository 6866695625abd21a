/**
 * @file headless_runtime.cpp
 * @brief Batch pipeline implementation for gridded WBGT computation.
 *
 * Loads per-step input fields, guards them against their contracts,
 * solves globe temperature, wet-bulb temperature and WBGT, and writes
 * the output fields with a run summary.
 * This file belongs to the primary src/core execution layer.
 */

#include "headless_runtime.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "field_contract.hpp"
#include "field_validation.hpp"
#include "globe/globe_solver.hpp"
#include "npy_io.hpp"
#include "string_utils.hpp"

namespace
{

constexpr const char* kAirTemperatureSuffix = "_ta.npy";

struct FieldRange
{
    bool has_value = false;
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
};

struct StepSummary
{
    std::string step;
    int ny = 0;
    int nx = 0;
    GlobeSolveStats globe;
    FieldRange wbgt;
    std::size_t wetbulb_missing = 0;
    double elapsed_ms = 0.0;
};

/**
 * @brief Range of non-missing values in a field.
 */
FieldRange field_range(const Field2D& field)
{
    FieldRange out;
    double sum = 0.0;
    std::size_t count = 0;
    const float* values = field.data();
    for (std::size_t i = 0; i < field.size(); ++i)
    {
        const float v = values[i];
        if (field.is_missing_value(v) || !std::isfinite(v))
        {
            continue;
        }
        if (count == 0)
        {
            out.min_value = v;
            out.max_value = v;
        }
        out.min_value = std::min(out.min_value, static_cast<double>(v));
        out.max_value = std::max(out.max_value, static_cast<double>(v));
        sum += v;
        ++count;
    }
    out.has_value = count > 0;
    if (out.has_value)
    {
        out.mean_value = sum / static_cast<double>(count);
    }
    return out;
}

std::string step_file(const std::string& directory, const std::string& step, const std::string& suffix)
{
    return (std::filesystem::path(directory) / (step + suffix)).string();
}

/**
 * @brief Validates a set of bound fields and appends per-field reports.
 */
void validate_bindings(const std::vector<std::pair<const wbgt::FieldContract*, Field2D*>>& bindings,
                       const wbgt::ValidationPolicy& policy,
                       bool include_percentiles,
                       wbgt::ValidationReport& report)
{
    for (const auto& binding : bindings)
    {
        wbgt::FieldValidationReport field_report;
        field_report.field_id = binding.first->id;
        field_report.role = wbgt::to_string(binding.first->role);
        field_report.requirement = wbgt::to_string(binding.first->requirement);
        field_report.result = wbgt::validate_field2d_inplace(*binding.second, *binding.first, policy,
                                                             include_percentiles);

        if (field_report.result.failed)
        {
            report.failed = true;
        }

        if (log_normal_enabled())
        {
            for (const auto& violation : field_report.result.violations)
            {
                std::cerr << "[VALIDATION] " << report.context << " step=" << report.step_index
                          << " field=" << violation.field_id << " " << violation.reason
                          << " count=" << violation.count
                          << (violation.critical ? " (critical)" : "") << std::endl;
            }
        }

        report.fields.push_back(std::move(field_report));
    }
}

void print_export_range(const std::string& step, const char* label, const Field2D& field)
{
    const FieldRange range = field_range(field);
    std::cout << "[EXPORT DEBUG] " << step << " " << label << ": ";
    if (range.has_value)
    {
        std::cout << "range=[" << range.min_value << ", " << range.max_value << "]"
                  << " mean=" << range.mean_value;
    }
    else
    {
        std::cout << "all missing";
    }
    std::cout << " missing=" << field.missing_count() << "/" << field.size() << std::endl;
}

bool write_run_summary(const std::filesystem::path& path,
                       const WbgtRunConfig& cfg,
                       const std::vector<StepSummary>& steps,
                       double total_elapsed_ms,
                       std::string& error)
{
    std::ofstream out(path);
    if (!out)
    {
        error = "failed to open run summary: " + path.string();
        return false;
    }

    out << "{\n";
    out << "  \"context\": \"run_summary\",\n";
    out << "  \"wbgt_mode\": \"" << to_string(cfg.mode) << "\",\n";
    out << "  \"wetbulb_scheme\": \"" << wbgt::strutil::json_escape(cfg.wetbulb.scheme_id) << "\",\n";
    out << "  \"guard_mode\": \"" << wbgt::to_string(cfg.validation.mode) << "\",\n";
    out << "  \"solver\": {\"max_iterations\": " << cfg.solver.max_iterations
        << ", \"tolerance_k\": " << cfg.solver.tolerance_k
        << ", \"derivative_floor\": " << cfg.solver.derivative_floor << "},\n";
    out << "  \"step_count\": " << steps.size() << ",\n";
    out << std::fixed << std::setprecision(3);
    out << "  \"elapsed_ms\": " << total_elapsed_ms << ",\n";
    out << "  \"steps\": [\n";
    for (std::size_t i = 0; i < steps.size(); ++i)
    {
        const StepSummary& s = steps[i];
        out << "    {\n";
        out << "      \"step\": \"" << wbgt::strutil::json_escape(s.step) << "\",\n";
        out << "      \"shape\": [" << s.ny << ", " << s.nx << "],\n";
        out << "      \"elapsed_ms\": " << s.elapsed_ms << ",\n";
        out << "      \"globe\": {"
            << "\"total_cells\": " << s.globe.total_cells
            << ", \"converged\": " << s.globe.converged
            << ", \"best_effort\": " << s.globe.best_effort
            << ", \"missing_input\": " << s.globe.missing_input
            << ", \"degenerate_derivative\": " << s.globe.degenerate_derivative
            << ", \"non_finite\": " << s.globe.non_finite
            << ", \"max_iterations_used\": " << s.globe.max_iterations_used
            << ", \"mean_iterations\": " << s.globe.mean_iterations << "},\n";
        out << "      \"wetbulb_missing\": " << s.wetbulb_missing << ",\n";
        out << "      \"wbgt\": {\"has_value\": " << (s.wbgt.has_value ? "true" : "false")
            << ", \"min\": " << s.wbgt.min_value
            << ", \"max\": " << s.wbgt.max_value
            << ", \"mean\": " << s.wbgt.mean_value << "}\n";
        out << "    }" << (i + 1 < steps.size() ? "," : "") << "\n";
    }
    out << "  ]\n";
    out << "}\n";

    if (!out.good())
    {
        error = "failed to write run summary: " + path.string();
        return false;
    }
    return true;
}

} // namespace

/**
 * @brief Lists steps with an air temperature file in lexical order.
 */
std::vector<std::string> discover_pipeline_steps(const std::string& input_directory, std::string& error)
{
    std::vector<std::string> steps;
    std::error_code ec;
    if (!std::filesystem::is_directory(input_directory, ec))
    {
        error = "input directory does not exist: " + input_directory;
        return steps;
    }

    const std::string suffix = kAirTemperatureSuffix;
    for (std::filesystem::directory_iterator it(input_directory, ec), end; !ec && it != end; it.increment(ec))
    {
        if (!it->is_regular_file())
        {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0)
        {
            steps.push_back(name.substr(0, name.size() - suffix.size()));
        }
    }
    if (ec)
    {
        error = "failed to list input directory '" + input_directory + "': " + ec.message();
        return {};
    }

    std::sort(steps.begin(), steps.end());
    return steps;
}

/**
 * @brief Executes the pipeline over every step of the input directory.
 * @param cfg Effective run configuration from config file and CLI.
 * @return Zero on success, non-zero on I/O or validation failure.
 */
int run_wbgt_pipeline(const WbgtRunConfig& cfg)
{
    const auto run_start = std::chrono::steady_clock::now();
    const bool verbose_export_debug = log_debug_enabled() || (std::getenv("WBGT_DEBUG_EXPORTS") != nullptr);
    const bool include_percentiles = log_debug_enabled() || !cfg.validation_report_path.empty();
    std::vector<wbgt::ValidationReport> validation_reports;

    auto flush_validation_reports = [&]() -> bool
    {
        if (cfg.validation_report_path.empty())
        {
            return true;
        }
        std::string write_error;
        if (!wbgt::write_validation_reports_json(validation_reports, cfg.validation_report_path, write_error))
        {
            std::cerr << "[WBGT] ERROR " << write_error << std::endl;
            return false;
        }
        return true;
    };

    try
    {
        validate_solver_config(cfg.solver);
        validate_globe_constants(cfg.globe);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "[WBGT] ERROR invalid solver configuration: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<WetBulbSchemeBase> wetbulb_scheme;
    try
    {
        wetbulb_scheme = initialize_wetbulb(cfg.wetbulb);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "[WBGT] ERROR " << e.what() << std::endl;
        return 1;
    }

    std::string discover_error;
    const std::vector<std::string> steps = discover_pipeline_steps(cfg.input_directory, discover_error);
    if (!discover_error.empty())
    {
        std::cerr << "[WBGT] ERROR " << discover_error << std::endl;
        return 1;
    }
    if (steps.empty())
    {
        std::cerr << "[WBGT] ERROR no *" << kAirTemperatureSuffix << " files in "
                  << cfg.input_directory << std::endl;
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(cfg.output_directory, ec);
    if (ec)
    {
        std::cerr << "[WBGT] ERROR failed to create output directory '" << cfg.output_directory
                  << "': " << ec.message() << std::endl;
        return 1;
    }

#ifdef _OPENMP
    if (cfg.threads > 0)
    {
        omp_set_num_threads(cfg.threads);
    }
    if (log_normal_enabled())
    {
        std::cout << "[WBGT] OpenMP threads: " << omp_get_max_threads() << std::endl;
    }
#endif

    if (log_normal_enabled())
    {
        std::cout << "[WBGT] " << steps.size() << " step(s) in " << cfg.input_directory << std::endl;
    }

    const wbgt::FieldContract* ta_contract = wbgt::find_field_contract("ta");
    const wbgt::FieldContract* rh_contract = wbgt::find_field_contract("rh");
    const wbgt::FieldContract* sw_contract = wbgt::find_field_contract("sw");
    const wbgt::FieldContract* ws_contract = wbgt::find_field_contract("ws");
    const wbgt::FieldContract* tg_contract = wbgt::find_field_contract("tg");
    const wbgt::FieldContract* tw_contract = wbgt::find_field_contract("tw");
    const wbgt::FieldContract* wbgt_contract = wbgt::find_field_contract("wbgt");

    std::vector<StepSummary> summaries;
    summaries.reserve(steps.size());

    for (std::size_t step_index = 0; step_index < steps.size(); ++step_index)
    {
        const std::string& step = steps[step_index];
        const auto step_start = std::chrono::steady_clock::now();

        Field2D ta;
        Field2D rh;
        Field2D sw;
        Field2D ws;
        const std::vector<std::pair<const wbgt::FieldContract*, Field2D*>> inputs =
        {
            {ta_contract, &ta},
            {rh_contract, &rh},
            {sw_contract, &sw},
            {ws_contract, &ws},
        };

        for (const auto& binding : inputs)
        {
            const std::string path = step_file(cfg.input_directory, step, binding.first->file_suffix);
            if (!std::filesystem::is_regular_file(path, ec))
            {
                std::cerr << "[WBGT] ERROR step " << step << ": missing input file " << path << std::endl;
                return 1;
            }
            std::string load_error;
            if (!wbgt::load_npy_field(path, *binding.second, cfg.input_missing_value, load_error))
            {
                std::cerr << "[WBGT] ERROR step " << step << ": " << load_error << std::endl;
                return 1;
            }
        }

        if (!ta.same_shape(rh) || !ta.same_shape(sw) || !ta.same_shape(ws))
        {
            std::cerr << "[WBGT] ERROR step " << step << ": input shapes differ (ta "
                      << ta.size_y() << "x" << ta.size_x() << ", rh " << rh.size_y() << "x" << rh.size_x()
                      << ", sw " << sw.size_y() << "x" << sw.size_x() << ", ws " << ws.size_y() << "x"
                      << ws.size_x() << ")" << std::endl;
            return 1;
        }

        wbgt::ValidationReport input_report =
            wbgt::make_validation_report("step_inputs:" + step, static_cast<int>(step_index), cfg.validation);
        validate_bindings(inputs, cfg.validation, include_percentiles, input_report);
        const bool input_failed = input_report.failed;
        validation_reports.push_back(std::move(input_report));

        if (input_failed && cfg.validation.mode == wbgt::GuardMode::Strict)
        {
            std::cerr << "[VALIDATION] strict guard failure in context='step_inputs:" << step
                      << "' step=" << step_index << std::endl;
            flush_validation_reports();
            return 2;
        }

        GlobeFieldResult globe = globe_solver::solve_field(ta, sw, ws, cfg.globe, cfg.solver);
        globe_solver::log_solve_summary(globe, step);

        Field2D tw = compute_wetbulb_field(*wetbulb_scheme, ta, rh);
        Field2D wbgt_field = wbgt_index::combine_field(tw, globe.globe_c, ta, cfg.mode);

        // Outputs are reported on copies so sanitize never alters exported values.
        Field2D tg_copy = globe.globe_c;
        Field2D tw_copy = tw;
        Field2D wbgt_copy = wbgt_field;
        wbgt::ValidationReport output_report =
            wbgt::make_validation_report("step_outputs:" + step, static_cast<int>(step_index), cfg.validation);
        validate_bindings({{tg_contract, &tg_copy}, {tw_contract, &tw_copy}, {wbgt_contract, &wbgt_copy}},
                          cfg.validation, include_percentiles, output_report);
        const bool output_failed = output_report.failed;
        validation_reports.push_back(std::move(output_report));

        if (output_failed && cfg.validation.mode == wbgt::GuardMode::Strict)
        {
            std::cerr << "[VALIDATION] strict guard failure in context='step_outputs:" << step
                      << "' step=" << step_index << std::endl;
            flush_validation_reports();
            return 2;
        }

        StepSummary summary;
        summary.step = step;
        summary.ny = ta.size_y();
        summary.nx = ta.size_x();
        summary.globe = globe.stats;
        summary.wbgt = field_range(wbgt_field);
        summary.wetbulb_missing = tw.missing_count();

        if (verbose_export_debug)
        {
            print_export_range(step, "tg", globe.globe_c);
            print_export_range(step, "tw", tw);
            print_export_range(step, "wbgt", wbgt_field);
        }

        globe.globe_c.remap_missing(cfg.output_missing_value);
        tw.remap_missing(cfg.output_missing_value);
        wbgt_field.remap_missing(cfg.output_missing_value);

        std::vector<std::pair<const Field2D*, std::string>> outputs =
        {
            {&globe.globe_c, tg_contract->file_suffix},
            {&tw, tw_contract->file_suffix},
            {&wbgt_field, wbgt_contract->file_suffix},
        };
        Field2D status;
        if (cfg.write_status)
        {
            status = status_field(globe);
            outputs.emplace_back(&status, "_tg_status.npy");
        }

        for (const auto& output : outputs)
        {
            const std::string path = step_file(cfg.output_directory, step, output.second);
            std::string write_error;
            if (!wbgt::write_npy_field(*output.first, path, write_error))
            {
                std::cerr << "[WBGT] ERROR step " << step << ": " << write_error << std::endl;
                return 1;
            }
        }

        summary.elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - step_start).count();

        if (log_normal_enabled())
        {
            std::cout << "[WBGT] step " << step << " (" << summary.ny << "x" << summary.nx << ")"
                      << " converged=" << summary.globe.converged
                      << " missing=" << summary.globe.missing_input;
            if (summary.wbgt.has_value)
            {
                std::cout << " wbgt=[" << summary.wbgt.min_value << ", " << summary.wbgt.max_value << "]";
            }
            std::cout << " " << std::fixed << std::setprecision(1) << summary.elapsed_ms << " ms"
                      << std::defaultfloat << std::endl;
        }

        summaries.push_back(std::move(summary));
    }

    const double total_elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - run_start).count();

    std::string summary_error;
    const std::filesystem::path summary_path = std::filesystem::path(cfg.output_directory) / "run_summary.json";
    if (!write_run_summary(summary_path, cfg, summaries, total_elapsed_ms, summary_error))
    {
        std::cerr << "[WBGT] ERROR " << summary_error << std::endl;
        return 1;
    }

    if (!flush_validation_reports())
    {
        return 1;
    }

    if (log_normal_enabled())
    {
        std::cout << "[WBGT] wrote " << summaries.size() << " step(s) to " << cfg.output_directory
                  << " in " << std::fixed << std::setprecision(1) << total_elapsed_ms / 1000.0 << " s"
                  << std::defaultfloat << std::endl;
    }

    return 0;
}
