#include "globe/globe_solver.hpp"
#include "headless_runtime.hpp"
#include "npy_io.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace
{

namespace fs = std::filesystem;

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[pipeline-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[pipeline-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

fs::path scratch_root()
{
    return fs::temp_directory_path() / "wbgt_pipeline_regression";
}

bool write_input(const fs::path& dir, const std::string& step, const std::string& suffix, const Field2D& field)
{
    std::string error;
    if (!wbgt::write_npy_field(field, dir / (step + suffix), error))
    {
        std::cerr << "[pipeline-regression] setup: " << error << std::endl;
        return false;
    }
    return true;
}

/**
 * @brief Writes one 2x3 step: a hot sunny row and a mild row with one missing cell.
 */
bool write_step(const fs::path& dir, const std::string& step, float wind_speed)
{
    const Field2D ta = Field2D::from_values(2, 3, {35.0f, 30.0f, 25.0f, 20.0f, kNaN, 15.0f});
    const Field2D rh = Field2D::from_values(2, 3, {40.0f, 50.0f, 60.0f, 70.0f, 80.0f, 90.0f});
    const Field2D sw = Field2D::from_values(2, 3, {1000.0f, 800.0f, 600.0f, 400.0f, 200.0f, 0.0f});
    const Field2D ws(2, 3, wind_speed);
    return write_input(dir, step, "_ta.npy", ta) &&
           write_input(dir, step, "_rh.npy", rh) &&
           write_input(dir, step, "_sw.npy", sw) &&
           write_input(dir, step, "_ws.npy", ws);
}

WbgtRunConfig make_config(const fs::path& input, const fs::path& output)
{
    WbgtRunConfig cfg;
    cfg.input_directory = input.string();
    cfg.output_directory = output.string();
    cfg.write_status = true;
    cfg.threads = 1;
    return cfg;
}

Field2D load_output(const fs::path& path, int& failures)
{
    Field2D field;
    std::string error;
    if (!wbgt::load_npy_field(path, field, kNaN, error))
    {
        std::cerr << "[pipeline-regression] FAIL: " << error << std::endl;
        ++failures;
    }
    return field;
}

int test_full_run()
{
    int failures = 0;
    const fs::path input = scratch_root() / "full" / "inputs";
    const fs::path output = scratch_root() / "full" / "outputs";
    fs::create_directories(input);
    failures += expect_true(write_step(input, "t001", 2.0f), "write step t001");
    failures += expect_true(write_step(input, "t000", 1.0f), "write step t000");

    std::string error;
    const std::vector<std::string> steps = discover_pipeline_steps(input.string(), error);
    failures += expect_true(steps.size() == 2 && steps[0] == "t000" && steps[1] == "t001",
                            "steps discovered in lexical order");

    const WbgtRunConfig cfg = make_config(input, output);
    failures += expect_true(run_wbgt_pipeline(cfg) == 0, "pipeline succeeds");

    for (const std::string& step : steps)
    {
        for (const char* suffix : {"_tg.npy", "_tw.npy", "_wbgt.npy", "_tg_status.npy"})
        {
            failures += expect_true(fs::exists(output / (step + suffix)), "output written: " + step + suffix);
        }
    }
    failures += expect_true(fs::exists(output / "run_summary.json"), "run summary written");

    const Field2D tg = load_output(output / "t000_tg.npy", failures);
    const Field2D tw = load_output(output / "t000_tw.npy", failures);
    const Field2D wbgt_field = load_output(output / "t000_wbgt.npy", failures);
    const Field2D status = load_output(output / "t000_tg_status.npy", failures);
    if (failures > 0)
    {
        return failures;
    }

    failures += expect_true(tg.size_y() == 2 && tg.size_x() == 3, "output shape matches inputs");

    const CellSolution expected = globe_solver::solve_cell(35.0, 1000.0, 1.0, cfg.globe, cfg.solver);
    failures += expect_true(expected.has_value(), "reference cell solves");
    failures += expect_close(tg(0, 0), expected.value_c, "exported globe temperature", 1.0e-3);

    const double ta_values[2][3] = {{35.0, 30.0, 25.0}, {20.0, 0.0, 15.0}};
    for (int i = 0; i < 2; ++i)
    {
        for (int j = 0; j < 3; ++j)
        {
            if (i == 1 && j == 1)
            {
                continue;
            }
            const double combined = 0.7 * tw(i, j) + 0.2 * tg(i, j) + 0.1 * ta_values[i][j];
            failures += expect_close(wbgt_field(i, j), combined, "outdoor WBGT from exported components", 1.0e-3);
            failures += expect_true(tw(i, j) <= ta_values[i][j] + 1.0e-4, "wet-bulb capped at air temperature");
        }
    }

    failures += expect_true(std::isnan(tg(1, 1)) && std::isnan(tw(1, 1)) && std::isnan(wbgt_field(1, 1)),
                            "missing air temperature propagates to every output");
    failures += expect_close(status(0, 0), static_cast<double>(static_cast<int>(CellStatus::Converged)),
                             "converged status code");
    failures += expect_close(status(1, 1), static_cast<double>(static_cast<int>(CellStatus::MissingInput)),
                             "missing-input status code");

    const Field2D tg_windy = load_output(output / "t001_tg.npy", failures);
    failures += expect_true(tg_windy(0, 0) < tg(0, 0), "stronger wind cools the globe");
    return failures;
}

int test_sentinel_output_marker()
{
    int failures = 0;
    const fs::path input = scratch_root() / "sentinel" / "inputs";
    const fs::path output = scratch_root() / "sentinel" / "outputs";
    fs::create_directories(input);
    failures += expect_true(write_step(input, "t000", 1.0f), "write step");

    WbgtRunConfig cfg = make_config(input, output);
    cfg.output_missing_value = -9999.0f;
    cfg.mode = WbgtMode::Indoor;
    failures += expect_true(run_wbgt_pipeline(cfg) == 0, "pipeline with sentinel succeeds");

    const Field2D tg = load_output(output / "t000_tg.npy", failures);
    const Field2D tw = load_output(output / "t000_tw.npy", failures);
    const Field2D wbgt_field = load_output(output / "t000_wbgt.npy", failures);
    if (failures > 0)
    {
        return failures;
    }
    failures += expect_close(wbgt_field(1, 1), -9999.0, "missing cell written with sentinel");
    failures += expect_close(wbgt_field(0, 2), 0.7 * tw(0, 2) + 0.3 * tg(0, 2), "indoor WBGT", 1.0e-3);
    return failures;
}

int test_missing_input_file()
{
    int failures = 0;
    const fs::path input = scratch_root() / "missing" / "inputs";
    const fs::path output = scratch_root() / "missing" / "outputs";
    fs::create_directories(input);
    failures += expect_true(write_step(input, "t000", 1.0f), "write step");
    fs::remove(input / "t000_rh.npy");

    failures += expect_true(run_wbgt_pipeline(make_config(input, output)) == 1, "missing humidity file is an error");

    const fs::path empty_dir = scratch_root() / "missing" / "empty";
    fs::create_directories(empty_dir);
    failures += expect_true(run_wbgt_pipeline(make_config(empty_dir, output)) == 1, "no steps is an error");
    return failures;
}

int test_strict_guard_failure()
{
    int failures = 0;
    const fs::path input = scratch_root() / "strict" / "inputs";
    const fs::path output = scratch_root() / "strict" / "outputs";
    fs::create_directories(input);
    failures += expect_true(write_step(input, "t000", 120.0f), "write step with implausible wind");

    WbgtRunConfig cfg = make_config(input, output);
    cfg.validation.mode = wbgt::GuardMode::Strict;
    cfg.validation_report_path = (output / "guard.json").string();
    failures += expect_true(run_wbgt_pipeline(cfg) == 2, "strict guard stops the run");
    failures += expect_true(fs::exists(output / "guard.json"), "validation report flushed on failure");
    failures += expect_true(!fs::exists(output / "t000_wbgt.npy"), "no outputs after strict failure");

    cfg.validation.mode = wbgt::GuardMode::Sanitize;
    failures += expect_true(run_wbgt_pipeline(cfg) == 0, "sanitize mode clamps and continues");
    return failures;
}

int test_invalid_solver_config()
{
    int failures = 0;
    const fs::path input = scratch_root() / "full" / "inputs";
    WbgtRunConfig cfg = make_config(input, scratch_root() / "invalid");
    cfg.solver.max_iterations = 0;
    failures += expect_true(run_wbgt_pipeline(cfg) == 1, "invalid solver config rejected");
    return failures;
}

}

int main()
{
    global_log_profile = LogProfile::quiet;

    std::error_code ec;
    fs::remove_all(scratch_root(), ec);

    int failures = 0;
    failures += test_full_run();
    failures += test_sentinel_output_marker();
    failures += test_missing_input_file();
    failures += test_strict_guard_failure();
    failures += test_invalid_solver_config();

    fs::remove_all(scratch_root(), ec);

    if (failures > 0)
    {
        std::cerr << "[pipeline-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[pipeline-regression] all checks passed" << std::endl;
    return 0;
}
