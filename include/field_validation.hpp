#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "field2d.hpp"
#include "field_contract.hpp"

/**
 * @file field_validation.hpp
 * @brief Contract checks for 2D pipeline fields.
 *
 * A field is scanned against the bounds of its contract (or a per-field
 * override). Missing cells, NaN or the field's own sentinel, are counted
 * and never flagged. Infinities and out-of-bounds values are violations:
 *  - off: counted only;
 *  - sanitize: infinities become missing, out-of-bounds values are clamped;
 *  - strict: values are left alone and in-scope violations fail the field.
 */

namespace wbgt
{

enum class GuardMode
{
    Off,
    Sanitize,
    Strict,
};

// Violation kinds that make a strict-mode field fail.
enum class GuardFailOn
{
    NonFinite,
    Bounds,
    Both,
};

// Contracts whose violations are critical in strict mode.
enum class StrictGuardScope
{
    RequiredOnly,
    AllFields,
};

struct ValidationPolicy
{
    GuardMode mode = GuardMode::Sanitize;
    GuardFailOn fail_on = GuardFailOn::Both;
    StrictGuardScope strict_scope = StrictGuardScope::RequiredOnly;
    std::unordered_map<std::string, FieldBounds> field_overrides;  // keyed by canonical field id
};

// Counts refer to the field as read; min/max/mean cover finite non-missing cells.
struct FieldStats
{
    std::size_t total_count = 0;
    std::size_t missing_count = 0;
    std::size_t finite_count = 0;
    std::size_t inf_count = 0;
    std::size_t below_min_count = 0;
    std::size_t above_max_count = 0;
    std::size_t sanitized_nonfinite_count = 0;
    std::size_t sanitized_bounds_count = 0;
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
    double p01 = 0.0;
    double p50 = 0.0;
    double p99 = 0.0;
    bool has_finite = false;
};

struct FieldViolation
{
    std::string field_id;
    std::string reason;  // "non_finite", "out_of_bounds" or a structural reason
    std::size_t count = 0;
    bool critical = false;
};

struct FieldValidationResult
{
    FieldStats stats;
    std::vector<FieldViolation> violations;
    bool failed = false;
};

struct FieldValidationReport
{
    std::string field_id;
    std::string role;
    std::string requirement;
    FieldValidationResult result;
};

// One report per pipeline context, e.g. "step_inputs:<step>".
struct ValidationReport
{
    std::string context;
    int step_index = -1;
    std::string guard_mode;
    std::string guard_fail_on;
    std::string guard_scope;
    bool failed = false;
    std::vector<FieldValidationReport> fields;
    std::vector<std::string> missing_required;
};

/**
 * @brief Case-insensitive parsers; return false and leave `out` unchanged on unknown text.
 *
 * Accepted spellings: off|none|sanitize|strict, nonfinite|bounds|both,
 * required|required_only|inputs|all|all_fields.
 */
bool parse_guard_mode(const std::string& value, GuardMode& out);
bool parse_guard_fail_on(const std::string& value, GuardFailOn& out);
bool parse_strict_guard_scope(const std::string& value, StrictGuardScope& out);

const char* to_string(GuardMode mode);
const char* to_string(GuardFailOn fail_on);
const char* to_string(StrictGuardScope scope);

/**
 * @brief Scans a field against its contract, sanitizing in place when the policy says so.
 * @param field Field to check; written only in sanitize mode.
 * @param contract Contract supplying bounds and requirement tier.
 * @param policy Guard policy.
 * @param include_percentiles Also estimate p01/p50/p99 from a strided sample.
 */
FieldValidationResult validate_field2d_inplace(Field2D& field,
                                               const FieldContract& contract,
                                               const ValidationPolicy& policy,
                                               bool include_percentiles);

ValidationReport make_validation_report(const std::string& context,
                                        int step_index,
                                        const ValidationPolicy& policy);

std::string validation_report_to_json(const ValidationReport& report);

/**
 * @brief Writes reports as a JSON array, creating parent directories.
 * @return False with `error` set when the file cannot be written.
 */
bool write_validation_reports_json(const std::vector<ValidationReport>& reports,
                                   const std::filesystem::path& path,
                                   std::string& error);

} // namespace wbgt
