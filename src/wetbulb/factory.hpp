/**
 * @file factory.hpp
 * @brief Declarations for the wet-bulb module.
 *
 * Scheme lookup by configured name.
 * This file is part of the src/wetbulb subsystem.
 */

#pragma once
#include <memory>
#include <string>
#include "wetbulb_base.hpp"

class StullWetBulbScheme;

/**
 * @brief Creates a wet-bulb scheme by configured name.
 */
std::unique_ptr<WetBulbSchemeBase> create_wetbulb_scheme(const std::string& scheme_name);

/**
 * @brief Returns names of available wet-bulb schemes.
 */
std::vector<std::string> get_available_wetbulb_schemes();
