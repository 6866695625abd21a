/**
 * @file field_contract.cpp
 * @brief Implementation for the validation module.
 *
 * Holds the contract table of pipeline inputs and outputs and the
 * lookup helpers used by the guard, the pipeline and the validator tool.
 * This file is part of the src/validation subsystem.
 */

#include "field_contract.hpp"
#include "string_utils.hpp"

#include <algorithm>

namespace wbgt {
namespace {

/**
 * @brief Builds an inclusive min/max bounds descriptor.
 */
FieldBounds bounds(double min_value, double max_value) {
    FieldBounds out;
    out.has_min = true;
    out.has_max = true;
    out.min_value = min_value;
    out.max_value = max_value;
    return out;
}

/**
 * @brief Builds an upper-bound-only descriptor.
 */
FieldBounds upper_bound(double max_value) {
    FieldBounds out;
    out.has_max = true;
    out.max_value = max_value;
    return out;
}

// Shortwave and wind keep no lower bound: the solver uses SW as given and clamps negative wind.
const std::vector<FieldContract> kContracts = {
    {"ta", "degC", "Near-surface air temperature", FieldRole::Input, "_ta.npy",
     bounds(-90.0, 60.0), {}, {"t2m", "air_temperature", "tas"}, FieldRequirementTier::RequiredNow},
    {"rh", "%", "Relative humidity", FieldRole::Input, "_rh.npy",
     bounds(0.0, 100.0), {}, {"relative_humidity", "hurs"}, FieldRequirementTier::RequiredNow},
    {"sw", "W/m^2", "Incoming shortwave radiation", FieldRole::Input, "_sw.npy",
     upper_bound(1500.0), {}, {"ssrd", "rsds", "shortwave"}, FieldRequirementTier::RequiredNow},
    {"ws", "m/s", "Wind speed", FieldRole::Input, "_ws.npy",
     upper_bound(75.0), {}, {"wind_speed", "sfcwind", "si10"}, FieldRequirementTier::RequiredNow},

    {"tg", "degC", "Globe temperature", FieldRole::Output, "_tg.npy",
     bounds(-100.0, 200.0), {}, {"globe_temperature"}, FieldRequirementTier::ReportOnly},
    {"tw", "degC", "Wet-bulb temperature", FieldRole::Output, "_tw.npy",
     bounds(-100.0, 60.0), {}, {"wetbulb", "wet_bulb_temperature"}, FieldRequirementTier::ReportOnly},
    {"wbgt", "degC", "Wet-bulb globe temperature", FieldRole::Output, "_wbgt.npy",
     bounds(-100.0, 100.0), {}, {"wet_bulb_globe_temperature"}, FieldRequirementTier::ReportOnly},
};

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}

/**
 * @brief Returns the canonical contract table.
 */
const std::vector<FieldContract>& heat_stress_field_contracts() {
    return kContracts;
}

/**
 * @brief Finds a contract by canonical id or alias.
 */
const FieldContract* find_field_contract(std::string_view id_or_alias) {
    const std::string needle = strutil::lower_copy(id_or_alias);
    for (const auto& contract : kContracts) {
        if (contract.id == needle) {
            return &contract;
        }
        const bool alias_match = std::any_of(contract.aliases.begin(), contract.aliases.end(),
                                             [&needle](const std::string& alias) { return alias == needle; });
        if (alias_match) {
            return &contract;
        }
    }
    return nullptr;
}

/**
 * @brief Finds the contract matching a pipeline file name.
 */
const FieldContract* find_field_contract_for_file(std::string_view filename) {
    for (const auto& contract : kContracts) {
        if (!contract.file_suffix.empty() && ends_with(filename, contract.file_suffix)) {
            return &contract;
        }
    }
    return nullptr;
}

/**
 * @brief Returns all contracts with the given role.
 */
std::vector<const FieldContract*> contracts_with_role(FieldRole role) {
    std::vector<const FieldContract*> out;
    out.reserve(kContracts.size());

    for (const auto& contract : kContracts) {
        if (contract.role == role) {
            out.push_back(&contract);
        }
    }

    return out;
}

/**
 * @brief Converts field role enum to stable string id.
 */
const char* to_string(FieldRole value) {
    switch (value) {
        case FieldRole::Input:
            return "input";
        case FieldRole::Output:
            return "output";
        default:
            return "unknown";
    }
}

/**
 * @brief Converts requirement-tier enum to stable string id.
 */
const char* to_string(FieldRequirementTier value) {
    switch (value) {
        case FieldRequirementTier::RequiredNow:
            return "required_now";
        case FieldRequirementTier::ReportOnly:
            return "report_only";
        default:
            return "unknown";
    }
}

}
