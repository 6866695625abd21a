/**
 * @file step_directory_validation.cpp
 * @brief Implementation for the validation module.
 *
 * Groups pipeline files by step, runs the field guard on each one and adds
 * the per-step structural checks used by the standalone validator.
 * This file is part of the src/validation subsystem.
 */

#include "step_directory_validation.hpp"
#include "field_contract.hpp"
#include "npy_io.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

namespace wbgt {
namespace {

namespace fs = std::filesystem;

struct StepFile {
    const FieldContract* contract = nullptr;
    fs::path path;
};

using StepFiles = std::map<std::string, std::vector<StepFile>>;

ValidationPolicy policy_for(const FieldValidatorOptions& options) {
    ValidationPolicy policy;
    policy.mode = options.strict ? GuardMode::Strict : GuardMode::Off;
    policy.fail_on = GuardFailOn::Both;
    policy.strict_scope = options.scope;
    return policy;
}

bool collect_step_files(const fs::path& root, StepFiles& steps, std::string& error) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        error = "Input path is not a directory: " + root.string();
        return false;
    }

    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) {
            continue;
        }
        const std::string name = it->path().filename().string();
        const FieldContract* contract = find_field_contract_for_file(name);
        if (contract == nullptr || name.size() == contract->file_suffix.size()) {
            continue;
        }
        steps[name.substr(0, name.size() - contract->file_suffix.size())].push_back({contract, it->path()});
    }
    if (ec) {
        error = "Failed listing " + root.string() + ": " + ec.message();
        return false;
    }
    if (steps.empty()) {
        error = "No <step>_<field>.npy files found in " + root.string();
        return false;
    }
    return true;
}

FieldValidationReport blank_field_report(const FieldContract& contract) {
    FieldValidationReport field_report;
    field_report.field_id = contract.id;
    field_report.role = to_string(contract.role);
    field_report.requirement = to_string(contract.requirement);
    return field_report;
}

void flag(FieldValidationReport& field_report, std::string reason, bool critical) {
    FieldViolation violation;
    violation.field_id = field_report.field_id;
    violation.reason = std::move(reason);
    violation.count = 1;
    violation.critical = critical;
    field_report.result.violations.push_back(std::move(violation));
    field_report.result.failed = field_report.result.failed || critical;
}

ValidationReport validate_step(const std::string& step,
                               int step_index,
                               std::vector<StepFile>& files,
                               const FieldValidatorOptions& options) {
    const ValidationPolicy policy = policy_for(options);
    ValidationReport report = make_validation_report(step, step_index, policy);

    std::sort(files.begin(), files.end(), [](const StepFile& a, const StepFile& b) {
        return a.contract->id < b.contract->id;
    });

    const auto has_contract = [&files](const FieldContract* contract) {
        return std::any_of(files.begin(), files.end(), [contract](const StepFile& f) { return f.contract == contract; });
    };
    const auto inputs = contracts_with_role(FieldRole::Input);
    if (std::any_of(inputs.begin(), inputs.end(), has_contract)) {
        for (const FieldContract* contract : inputs) {
            if (contract->requirement == FieldRequirementTier::RequiredNow && !has_contract(contract)) {
                report.missing_required.push_back(contract->id);
            }
        }
    }

    int ref_ny = -1;
    int ref_nx = -1;

    for (const StepFile& file : files) {
        FieldValidationReport field_report = blank_field_report(*file.contract);

        Field2D field;
        std::string load_error;
        if (!load_npy_field(file.path, field, options.missing_value, load_error)) {
            flag(field_report, "Failed to load " + file.path.string() + ": " + load_error, true);
            report.fields.push_back(std::move(field_report));
            continue;
        }

        field_report.result = validate_field2d_inplace(field, *file.contract, policy, true);
        if (ref_ny < 0) {
            ref_ny = field.size_y();
            ref_nx = field.size_x();
        } else if (field.size_y() != ref_ny || field.size_x() != ref_nx) {
            flag(field_report, "shape_mismatch", options.strict);
        }
        report.fields.push_back(std::move(field_report));
    }

    report.failed = options.strict && !report.missing_required.empty();
    for (const FieldValidationReport& field_report : report.fields) {
        report.failed = report.failed || field_report.result.failed;
    }
    return report;
}

void print_step_summary(const ValidationReport& report, const FieldValidatorOptions& options) {
    std::size_t nonfinite = 0;
    std::size_t out_of_bounds = 0;
    std::size_t missing_cells = 0;
    for (const FieldValidationReport& field : report.fields) {
        nonfinite += field.result.stats.inf_count;
        out_of_bounds += field.result.stats.below_min_count + field.result.stats.above_max_count;
        missing_cells += field.result.stats.missing_count;
    }

    std::cout << "[field-validator] " << report.context
              << " fields=" << report.fields.size()
              << " missing_cells=" << missing_cells
              << " nonfinite=" << nonfinite
              << " bounds=" << out_of_bounds
              << " missing_required=" << report.missing_required.size()
              << " scope=" << to_string(options.scope)
              << " failed=" << (report.failed ? "yes" : "no")
              << "\n";
}

}

CliParseResult parse_field_validator_args(const std::vector<std::string>& args,
                                          FieldValidatorOptions& out,
                                          std::string& error) {
    CliArgCursor cursor(args);
    std::string value;

    while (cursor.next()) {
        const std::string& arg = cursor.name();
        if (arg == "--help" || arg == "-h") {
            return CliParseResult::Help;
        }
        if (arg != "--input" && arg != "--mode" && arg != "--scope" && arg != "--missing-value" && arg != "--json") {
            error = "Unknown argument: " + arg;
            return CliParseResult::Error;
        }
        if (!cursor.take_value(value, error)) {
            return CliParseResult::Error;
        }

        if (arg == "--input") {
            out.input_dir = value;
        } else if (arg == "--json") {
            out.json_path = value;
        } else if (arg == "--mode") {
            const std::string mode = strutil::lower_copy(value);
            if (mode != "report" && mode != "strict") {
                error = "--mode must be report or strict";
                return CliParseResult::Error;
            }
            out.strict = mode == "strict";
        } else if (arg == "--scope") {
            if (!parse_strict_guard_scope(value, out.scope)) {
                error = "--scope must be required or all";
                return CliParseResult::Error;
            }
        } else if (!try_parse_missing_value(value, out.missing_value)) {
            error = "--missing-value must be a finite number or nan";
            return CliParseResult::Error;
        }
    }

    if (out.input_dir.empty()) {
        error = "--input is required";
        return CliParseResult::Error;
    }
    return CliParseResult::Ok;
}

bool validate_step_directory(const FieldValidatorOptions& options,
                             StepDirectoryResult& out,
                             std::string& error) {
    StepFiles steps;
    if (!collect_step_files(options.input_dir, steps, error)) {
        return false;
    }

    out = StepDirectoryResult{};
    int step_index = 0;
    for (auto& [step, files] : steps) {
        out.reports.push_back(validate_step(step, step_index++, files, options));
        out.failed = out.failed || out.reports.back().failed;
    }
    return true;
}

std::string step_directory_result_to_json(const FieldValidatorOptions& options,
                                          const StepDirectoryResult& result) {
    std::ostringstream os;
    os << "{\n"
       << "  \"input_dir\": \"" << strutil::json_escape(options.input_dir) << "\",\n"
       << "  \"mode\": \"" << (options.strict ? "strict" : "report") << "\",\n"
       << "  \"scope\": \"" << to_string(options.scope) << "\",\n"
       << "  \"failed\": " << (result.failed ? "true" : "false") << ",\n"
       << "  \"reports\": [";
    for (std::size_t k = 0; k < result.reports.size(); ++k) {
        os << (k == 0 ? "\n" : ",\n") << validation_report_to_json(result.reports[k]);
    }
    os << "\n  ]\n}\n";
    return os.str();
}

int run_field_validator(const FieldValidatorOptions& options) {
    StepDirectoryResult result;
    std::string error;
    if (!validate_step_directory(options, result, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    for (const ValidationReport& report : result.reports) {
        print_step_summary(report, options);
    }

    if (!options.json_path.empty()) {
        const fs::path out_path(options.json_path);
        std::error_code ec;
        if (out_path.has_parent_path()) {
            fs::create_directories(out_path.parent_path(), ec);
        }
        std::ofstream out(out_path);
        if (ec || !out) {
            std::cerr << "Failed opening JSON output path: " << options.json_path << "\n";
            return 1;
        }
        out << step_directory_result_to_json(options, result);
        if (!out.good()) {
            std::cerr << "Failed writing JSON output path: " << options.json_path << "\n";
            return 1;
        }
    }

    return result.failed ? 1 : 0;
}

}
