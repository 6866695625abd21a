/**
 * @file field_validation.cpp
 * @brief Implementation for the validation module.
 *
 * Row-wise contract scan of Field2D values with missing-aware counting,
 * sanitization and JSON reporting.
 * This file is part of the src/validation subsystem.
 */

#include "field_validation.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace wbgt {
namespace {

template <typename Enum>
struct Spelling {
    const char* text;
    Enum value;
};

// The first spelling listed for a value is its canonical label.
constexpr Spelling<GuardMode> kGuardModeSpellings[] = {
    {"off", GuardMode::Off},
    {"none", GuardMode::Off},
    {"sanitize", GuardMode::Sanitize},
    {"strict", GuardMode::Strict},
};

constexpr Spelling<GuardFailOn> kFailOnSpellings[] = {
    {"nonfinite", GuardFailOn::NonFinite},
    {"bounds", GuardFailOn::Bounds},
    {"both", GuardFailOn::Both},
};

constexpr Spelling<StrictGuardScope> kScopeSpellings[] = {
    {"required_only", StrictGuardScope::RequiredOnly},
    {"required", StrictGuardScope::RequiredOnly},
    {"inputs", StrictGuardScope::RequiredOnly},
    {"all_fields", StrictGuardScope::AllFields},
    {"all", StrictGuardScope::AllFields},
};

template <typename Enum, std::size_t N>
bool parse_spelling(const Spelling<Enum> (&table)[N], const std::string& text, Enum& out) {
    const std::string key = strutil::lower_copy(strutil::trim_copy(text));
    for (const auto& entry : table) {
        if (key == entry.text) {
            out = entry.value;
            return true;
        }
    }
    return false;
}

template <typename Enum, std::size_t N>
const char* canonical_spelling(const Spelling<Enum> (&table)[N], Enum value) {
    for (const auto& entry : table) {
        if (entry.value == value) {
            return entry.text;
        }
    }
    return "unknown";
}

/**
 * @brief Per-row counters, merged in row order so totals do not depend on thread count.
 */
struct RowTally {
    std::size_t missing = 0;
    std::size_t finite = 0;
    std::size_t infinite = 0;
    std::size_t below = 0;
    std::size_t above = 0;
    std::size_t cleared = 0;
    std::size_t clamped = 0;
    double sum = 0.0;
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();

    void merge(const RowTally& other) {
        missing += other.missing;
        finite += other.finite;
        infinite += other.infinite;
        below += other.below;
        above += other.above;
        cleared += other.cleared;
        clamped += other.clamped;
        sum += other.sum;
        lo = std::min(lo, other.lo);
        hi = std::max(hi, other.hi);
    }
};

struct ScanRules {
    FieldBounds bounds;
    bool check_bounds = false;
    bool check_nonfinite = false;
    bool sanitize = false;
};

RowTally scan_row(Field2D& field, int i, const ScanRules& rules) {
    RowTally tally;
    const float marker = field.missing_value();

    for (int j = 0; j < field.size_x(); ++j) {
        float& cell = field(i, j);
        if (field.is_missing_value(cell)) {
            ++tally.missing;
            continue;
        }
        if (!std::isfinite(cell)) {
            ++tally.infinite;
            if (rules.sanitize && rules.check_nonfinite) {
                cell = marker;
                ++tally.cleared;
            }
            continue;
        }

        const double v = cell;
        ++tally.finite;
        tally.sum += v;
        tally.lo = std::min(tally.lo, v);
        tally.hi = std::max(tally.hi, v);

        if (!rules.check_bounds) {
            continue;
        }
        double target = v;
        if (rules.bounds.has_min && v < rules.bounds.min_value) {
            ++tally.below;
            target = rules.bounds.min_value;
        } else if (rules.bounds.has_max && v > rules.bounds.max_value) {
            ++tally.above;
            target = rules.bounds.max_value;
        }
        if (rules.sanitize && target != v) {
            cell = static_cast<float>(target);
            ++tally.clamped;
        }
    }
    return tally;
}

/**
 * @brief Strided sample of finite, non-missing values.
 */
std::vector<float> sample_values(const Field2D& field) {
    constexpr std::size_t kSampleTarget = 4096;
    const std::size_t stride = std::max<std::size_t>(1, field.size() / kSampleTarget);
    std::vector<float> samples;
    const float* values = field.data();
    for (std::size_t n = 0; n < field.size(); n += stride) {
        if (!field.is_missing_value(values[n]) && std::isfinite(values[n])) {
            samples.push_back(values[n]);
        }
    }
    std::sort(samples.begin(), samples.end());
    return samples;
}

// Nearest-rank quantile of a sorted, non-empty sample.
double nearest_rank(const std::vector<float>& sorted, double q) {
    const double rank = std::ceil(q * static_cast<double>(sorted.size()));
    const std::size_t idx = rank < 1.0 ? 0 : static_cast<std::size_t>(rank) - 1;
    return sorted[std::min(idx, sorted.size() - 1)];
}

FieldBounds resolve_bounds(const FieldContract& contract, const ValidationPolicy& policy) {
    const auto it = policy.field_overrides.find(contract.id);
    return it == policy.field_overrides.end() ? contract.default_bounds : it->second;
}

bool strict_applies(const FieldContract& contract, const ValidationPolicy& policy) {
    if (policy.mode != GuardMode::Strict) {
        return false;
    }
    return policy.strict_scope == StrictGuardScope::AllFields ||
           contract.requirement == FieldRequirementTier::RequiredNow;
}

FieldViolation make_violation(const FieldContract& contract, const char* reason, std::size_t count, bool critical) {
    FieldViolation violation;
    violation.field_id = contract.id;
    violation.reason = reason;
    violation.count = count;
    violation.critical = critical;
    return violation;
}

void write_quoted(std::ostream& os, const std::string& text) {
    os << '"' << strutil::json_escape(text) << '"';
}

void write_stats_json(std::ostream& os, const FieldStats& s) {
    os << "{\"total_count\": " << s.total_count
       << ", \"missing_count\": " << s.missing_count
       << ", \"finite_count\": " << s.finite_count
       << ", \"inf_count\": " << s.inf_count
       << ", \"below_min_count\": " << s.below_min_count
       << ", \"above_max_count\": " << s.above_max_count
       << ", \"sanitized_nonfinite_count\": " << s.sanitized_nonfinite_count
       << ", \"sanitized_bounds_count\": " << s.sanitized_bounds_count
       << ", \"has_finite\": " << (s.has_finite ? "true" : "false");
    if (s.has_finite) {
        os << std::setprecision(7)
           << ", \"min\": " << s.min_value
           << ", \"max\": " << s.max_value
           << ", \"mean\": " << s.mean_value
           << ", \"p01\": " << s.p01
           << ", \"p50\": " << s.p50
           << ", \"p99\": " << s.p99;
    }
    os << "}";
}

void write_field_json(std::ostream& os, const FieldValidationReport& field) {
    os << "    {\"field_id\": ";
    write_quoted(os, field.field_id);
    os << ", \"role\": ";
    write_quoted(os, field.role);
    os << ", \"requirement\": ";
    write_quoted(os, field.requirement);
    os << ", \"failed\": " << (field.result.failed ? "true" : "false") << ",\n";
    os << "     \"stats\": ";
    write_stats_json(os, field.result.stats);
    os << ",\n     \"violations\": [";
    const auto& violations = field.result.violations;
    for (std::size_t k = 0; k < violations.size(); ++k) {
        os << (k == 0 ? "" : ", ") << "{\"reason\": ";
        write_quoted(os, violations[k].reason);
        os << ", \"count\": " << violations[k].count
           << ", \"critical\": " << (violations[k].critical ? "true" : "false") << "}";
    }
    os << "]}";
}

}

bool parse_guard_mode(const std::string& value, GuardMode& out) {
    return parse_spelling(kGuardModeSpellings, value, out);
}

bool parse_guard_fail_on(const std::string& value, GuardFailOn& out) {
    return parse_spelling(kFailOnSpellings, value, out);
}

bool parse_strict_guard_scope(const std::string& value, StrictGuardScope& out) {
    return parse_spelling(kScopeSpellings, value, out);
}

const char* to_string(GuardMode mode) {
    return canonical_spelling(kGuardModeSpellings, mode);
}

const char* to_string(GuardFailOn fail_on) {
    return canonical_spelling(kFailOnSpellings, fail_on);
}

const char* to_string(StrictGuardScope scope) {
    return canonical_spelling(kScopeSpellings, scope);
}

/**
 * @brief Scans rows in parallel, then merges tallies and derives violations.
 */
FieldValidationResult validate_field2d_inplace(Field2D& field,
                                               const FieldContract& contract,
                                               const ValidationPolicy& policy,
                                               bool include_percentiles) {
    ScanRules rules;
    rules.bounds = resolve_bounds(contract, policy);
    rules.check_bounds = contract.severity.check_bounds && (rules.bounds.has_min || rules.bounds.has_max);
    rules.check_nonfinite = contract.severity.check_nonfinite;
    rules.sanitize = policy.mode == GuardMode::Sanitize;

    // Percentiles describe the field as read, before any clamping.
    std::vector<float> samples;
    if (include_percentiles) {
        samples = sample_values(field);
    }

    const int ny = field.size_y();
    std::vector<RowTally> rows(static_cast<std::size_t>(std::max(ny, 0)));

    #pragma omp parallel for schedule(static)
    for (int i = 0; i < ny; ++i) {
        rows[static_cast<std::size_t>(i)] = scan_row(field, i, rules);
    }

    RowTally total;
    for (const RowTally& row : rows) {
        total.merge(row);
    }

    FieldValidationResult out;
    FieldStats& stats = out.stats;
    stats.total_count = field.size();
    stats.missing_count = total.missing;
    stats.finite_count = total.finite;
    stats.inf_count = total.infinite;
    stats.below_min_count = total.below;
    stats.above_max_count = total.above;
    stats.sanitized_nonfinite_count = total.cleared;
    stats.sanitized_bounds_count = total.clamped;
    stats.has_finite = total.finite > 0;
    if (stats.has_finite) {
        stats.min_value = total.lo;
        stats.max_value = total.hi;
        stats.mean_value = total.sum / static_cast<double>(total.finite);
    }
    if (!samples.empty()) {
        stats.p01 = nearest_rank(samples, 0.01);
        stats.p50 = nearest_rank(samples, 0.50);
        stats.p99 = nearest_rank(samples, 0.99);
    }

    const bool strict = strict_applies(contract, policy);
    const bool fail_nonfinite = policy.fail_on != GuardFailOn::Bounds;
    const bool fail_bounds = policy.fail_on != GuardFailOn::NonFinite;

    if (rules.check_nonfinite && total.infinite > 0) {
        out.violations.push_back(make_violation(contract, "non_finite", total.infinite, strict && fail_nonfinite));
    }
    if (rules.check_bounds && total.below + total.above > 0) {
        out.violations.push_back(make_violation(contract, "out_of_bounds", total.below + total.above,
                                                strict && fail_bounds));
    }

    for (const FieldViolation& v : out.violations) {
        out.failed = out.failed || v.critical;
    }
    return out;
}

ValidationReport make_validation_report(const std::string& context,
                                        int step_index,
                                        const ValidationPolicy& policy) {
    ValidationReport report;
    report.context = context;
    report.step_index = step_index;
    report.guard_mode = to_string(policy.mode);
    report.guard_fail_on = to_string(policy.fail_on);
    report.guard_scope = to_string(policy.strict_scope);
    return report;
}

std::string validation_report_to_json(const ValidationReport& report) {
    std::ostringstream os;
    os << "{\n  \"context\": ";
    write_quoted(os, report.context);
    os << ",\n  \"step_index\": " << report.step_index;
    os << ",\n  \"guard_mode\": ";
    write_quoted(os, report.guard_mode);
    os << ",\n  \"guard_fail_on\": ";
    write_quoted(os, report.guard_fail_on);
    os << ",\n  \"guard_scope\": ";
    write_quoted(os, report.guard_scope);
    os << ",\n  \"failed\": " << (report.failed ? "true" : "false");

    os << ",\n  \"missing_required\": [";
    for (std::size_t k = 0; k < report.missing_required.size(); ++k) {
        os << (k == 0 ? "" : ", ");
        write_quoted(os, report.missing_required[k]);
    }
    os << "],\n  \"fields\": [";
    for (std::size_t k = 0; k < report.fields.size(); ++k) {
        os << (k == 0 ? "\n" : ",\n");
        write_field_json(os, report.fields[k]);
    }
    os << (report.fields.empty() ? "]" : "\n  ]") << "\n}";
    return os.str();
}

bool write_validation_reports_json(const std::vector<ValidationReport>& reports,
                                   const std::filesystem::path& path,
                                   std::string& error) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "cannot create report directory " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream out(path);
    if (!out) {
        error = "cannot open report file " + path.string();
        return false;
    }

    out << "[";
    for (std::size_t k = 0; k < reports.size(); ++k) {
        out << (k == 0 ? "\n" : ",\n") << validation_report_to_json(reports[k]);
    }
    out << "\n]\n";

    if (!out.good()) {
        error = "failed writing report file " + path.string();
        return false;
    }
    return true;
}

}
