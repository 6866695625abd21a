#include "npy_io.hpp"
#include "step_directory_validation.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace
{

namespace fs = std::filesystem;

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[field-validator-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

fs::path scratch_root()
{
    return fs::temp_directory_path() / "wbgt_field_validator_regression";
}

/**
 * @brief Fresh directory holding one step of the four input fields, all in bounds.
 */
fs::path make_step_dir(const std::string& name, float wind_speed = 3.0f)
{
    const fs::path dir = scratch_root() / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);

    std::string error;
    wbgt::write_npy_field(Field2D(2, 2, 28.0f), dir / "t000_ta.npy", error);
    wbgt::write_npy_field(Field2D(2, 2, 55.0f), dir / "t000_rh.npy", error);
    wbgt::write_npy_field(Field2D(2, 2, 600.0f), dir / "t000_sw.npy", error);
    wbgt::write_npy_field(Field2D(2, 2, wind_speed), dir / "t000_ws.npy", error);
    return dir;
}

wbgt::FieldValidatorOptions options_for(const fs::path& dir, bool strict)
{
    wbgt::FieldValidatorOptions options;
    options.input_dir = dir.string();
    options.strict = strict;
    return options;
}

const wbgt::FieldValidationReport* field_in(const wbgt::ValidationReport& report, const std::string& id)
{
    for (const auto& field : report.fields)
    {
        if (field.field_id == id)
        {
            return &field;
        }
    }
    return nullptr;
}

bool has_reason(const wbgt::FieldValidationReport* field, const std::string& reason)
{
    return field != nullptr &&
           std::any_of(field->result.violations.begin(), field->result.violations.end(),
                       [&reason](const wbgt::FieldViolation& v) { return v.reason.rfind(reason, 0) == 0; });
}

int test_argument_parsing()
{
    int failures = 0;
    wbgt::FieldValidatorOptions options;
    std::string error;

    const auto ok = wbgt::parse_field_validator_args(
        {"--input=data/steps", "--mode", "strict", "--scope", "all", "--missing-value", "-9999", "--json", "qa.json"},
        options, error);
    failures += expect_true(ok == CliParseResult::Ok, "full argument set accepted: " + error);
    failures += expect_true(options.input_dir == "data/steps" && options.strict, "input and strict mode");
    failures += expect_true(options.scope == wbgt::StrictGuardScope::AllFields, "all-fields scope");
    failures += expect_true(options.missing_value == -9999.0f && options.json_path == "qa.json", "sentinel and json");

    wbgt::FieldValidatorOptions fresh;
    failures += expect_true(wbgt::parse_field_validator_args({"--mode", "strict"}, fresh, error) == CliParseResult::Error,
                            "--input is mandatory");
    failures += expect_true(error == "--input is required", "missing input message");
    failures += expect_true(wbgt::parse_field_validator_args({"--input", "d", "--mode", "lenient"}, fresh, error) ==
                            CliParseResult::Error, "unknown mode rejected");
    failures += expect_true(wbgt::parse_field_validator_args({"--input", "d", "--scope", "most"}, fresh, error) ==
                            CliParseResult::Error, "unknown scope rejected");
    failures += expect_true(wbgt::parse_field_validator_args({"--input", "d", "--missing-value", "inf"}, fresh, error) ==
                            CliParseResult::Error, "infinite sentinel rejected");
    failures += expect_true(wbgt::parse_field_validator_args({"--input"}, fresh, error) == CliParseResult::Error,
                            "dangling --input rejected");
    failures += expect_true(wbgt::parse_field_validator_args({"--help"}, fresh, error) == CliParseResult::Help,
                            "help requested");
    return failures;
}

int test_clean_step_passes()
{
    int failures = 0;
    const fs::path dir = make_step_dir("clean");

    wbgt::StepDirectoryResult result;
    std::string error;
    failures += expect_true(wbgt::validate_step_directory(options_for(dir, true), result, error), "clean dir: " + error);
    failures += expect_true(!result.failed && result.reports.size() == 1, "one passing step");
    if (!result.reports.empty())
    {
        const auto& report = result.reports.front();
        failures += expect_true(report.context == "t000" && report.fields.size() == 4, "step name and four fields");
        failures += expect_true(report.missing_required.empty(), "no missing inputs");
        failures += expect_true(report.fields.front().field_id == "rh", "fields ordered by id");
    }
    failures += expect_true(wbgt::run_field_validator(options_for(dir, true)) == 0, "tool exit code 0");
    return failures;
}

int test_out_of_bounds_input()
{
    int failures = 0;
    const fs::path dir = make_step_dir("gale", 120.0f);
    std::string error;

    wbgt::StepDirectoryResult strict;
    failures += expect_true(wbgt::validate_step_directory(options_for(dir, true), strict, error), "strict run: " + error);
    failures += expect_true(strict.failed, "strict fails on required input above bounds");
    if (!strict.reports.empty())
    {
        failures += expect_true(has_reason(field_in(strict.reports.front(), "ws"), "out_of_bounds"), "wind flagged");
    }

    wbgt::StepDirectoryResult report_only;
    failures += expect_true(wbgt::validate_step_directory(options_for(dir, false), report_only, error), "report run");
    failures += expect_true(!report_only.failed, "report mode only counts");
    if (!report_only.reports.empty())
    {
        const auto* ws = field_in(report_only.reports.front(), "ws");
        failures += expect_true(ws != nullptr && ws->result.stats.above_max_count == 4, "four windy cells counted");
    }

    auto options = options_for(dir, true);
    options.json_path = (scratch_root() / "json" / "gale.json").string();
    failures += expect_true(wbgt::run_field_validator(options) == 1, "tool exit code 1 on strict failure");
    std::ifstream in(options.json_path);
    const std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    failures += expect_true(json.find("\"failed\": true") != std::string::npos, "JSON records failure");
    failures += expect_true(json.find("\"mode\": \"strict\"") != std::string::npos, "JSON records mode");
    failures += expect_true(json.find("\"out_of_bounds\"") != std::string::npos, "JSON lists the violation");
    return failures;
}

int test_structural_checks()
{
    int failures = 0;
    std::string error;

    const fs::path missing = make_step_dir("missing_rh");
    fs::remove(missing / "t000_rh.npy");
    wbgt::StepDirectoryResult strict;
    failures += expect_true(wbgt::validate_step_directory(options_for(missing, true), strict, error), "missing rh run");
    failures += expect_true(strict.failed, "missing required input fails strict");
    if (!strict.reports.empty())
    {
        const auto& absent = strict.reports.front().missing_required;
        failures += expect_true(absent.size() == 1 && absent.front() == "rh", "rh listed as missing");
    }
    wbgt::StepDirectoryResult lenient;
    wbgt::validate_step_directory(options_for(missing, false), lenient, error);
    failures += expect_true(!lenient.failed, "missing input only reported outside strict");

    const fs::path mismatch = make_step_dir("mismatch");
    wbgt::write_npy_field(Field2D(3, 3, 600.0f), mismatch / "t000_sw.npy", error);
    wbgt::StepDirectoryResult shapes;
    failures += expect_true(wbgt::validate_step_directory(options_for(mismatch, true), shapes, error), "mismatch run");
    failures += expect_true(shapes.failed, "shape mismatch fails strict");
    if (!shapes.reports.empty())
    {
        failures += expect_true(has_reason(field_in(shapes.reports.front(), "sw"), "shape_mismatch"), "sw flagged");
    }

    const fs::path corrupt = make_step_dir("corrupt");
    {
        std::ofstream out(corrupt / "t000_ta.npy", std::ios::binary | std::ios::trunc);
        out << "not an npy file";
    }
    wbgt::StepDirectoryResult unreadable;
    failures += expect_true(wbgt::validate_step_directory(options_for(corrupt, false), unreadable, error), "corrupt run");
    failures += expect_true(unreadable.failed, "unreadable file fails even in report mode");
    if (!unreadable.reports.empty())
    {
        failures += expect_true(has_reason(field_in(unreadable.reports.front(), "ta"), "Failed to load"), "load failure");
    }
    return failures;
}

int test_unusable_directories()
{
    int failures = 0;
    std::string error;
    wbgt::StepDirectoryResult result;

    failures += expect_true(!wbgt::validate_step_directory(options_for(scratch_root() / "nowhere", true), result, error),
                            "absent directory rejected");

    const fs::path empty = scratch_root() / "empty";
    std::error_code ec;
    fs::remove_all(empty, ec);
    fs::create_directories(empty);
    std::ofstream(empty / "notes.txt") << "no fields here";
    failures += expect_true(!wbgt::validate_step_directory(options_for(empty, true), result, error),
                            "directory without step files rejected");
    failures += expect_true(error.find("No <step>_<field>.npy files") != std::string::npos, "empty dir message");
    failures += expect_true(wbgt::run_field_validator(options_for(empty, false)) == 1, "tool exit code 1 on empty dir");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_argument_parsing();
    failures += test_clean_step_passes();
    failures += test_out_of_bounds_input();
    failures += test_structural_checks();
    failures += test_unusable_directories();

    std::error_code ec;
    fs::remove_all(scratch_root(), ec);

    if (failures > 0)
    {
        std::cerr << "[field-validator-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[field-validator-regression] all checks passed" << std::endl;
    return 0;
}
