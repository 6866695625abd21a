/**
 * @file factory.cpp
 * @brief Implementation for the wet-bulb module.
 *
 * Maps scheme names to implementations.
 * This file is part of the src/wetbulb subsystem.
 */

#include "factory.hpp"
#include "schemes/stull/stull.hpp"

#include <stdexcept>

/**
 * @brief Creates the wet-bulb scheme.
 */
std::unique_ptr<WetBulbSchemeBase> create_wetbulb_scheme(const std::string& scheme_name)
{
    if (scheme_name == "stull" || scheme_name == "stull2011")
    {
        return std::make_unique<StullWetBulbScheme>();
    }
    else
    {
        throw std::runtime_error("Unknown wet-bulb scheme: " + scheme_name);
    }
}

/**
 * @brief Gets the available wet-bulb schemes.
 */
std::vector<std::string> get_available_wetbulb_schemes()
{
    return {"stull"};
}
