#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * @file field_contract.hpp
 * @brief Field metadata contract used by validation and reporting systems.
 *
 * Captures field identity, units, pipeline role, file suffix, plausible
 * bounds and requirement tier for runtime QA checks.
 */

namespace wbgt
{

enum class FieldRole
{
    Input,
    Output,
};

enum class FieldRequirementTier
{
    RequiredNow,
    ReportOnly,
};

struct FieldBounds
{
    bool has_min = false;
    bool has_max = false;
    double min_value = 0.0;
    double max_value = 0.0;
};

struct SeverityPolicy
{
    bool check_nonfinite = true;
    bool check_bounds = true;
};

struct FieldContract
{
    std::string id;
    std::string units;
    std::string description;
    FieldRole role = FieldRole::Input;
    std::string file_suffix;  // "<step><suffix>" in pipeline directories
    FieldBounds default_bounds{};
    SeverityPolicy severity{};
    std::vector<std::string> aliases;
    FieldRequirementTier requirement = FieldRequirementTier::ReportOnly;
};

/**
 * @brief Returns the heat-stress field contract table.
 */
const std::vector<FieldContract>& heat_stress_field_contracts();

/**
 * @brief Finds a contract by canonical id or alias (case-insensitive).
 * @return Pointer to matched contract, or null if not found.
 */
const FieldContract* find_field_contract(std::string_view id_or_alias);

/**
 * @brief Finds the contract whose file suffix ends `filename`.
 * @return Pointer to matched contract, or null if no suffix matches.
 */
const FieldContract* find_field_contract_for_file(std::string_view filename);

/**
 * @brief Filters contracts by pipeline role.
 */
std::vector<const FieldContract*> contracts_with_role(FieldRole role);

const char* to_string(FieldRole value);

const char* to_string(FieldRequirementTier value);

} // namespace wbgt
