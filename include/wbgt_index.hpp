#pragma once

#include <string>

#include "field2d.hpp"

/**
 * @file wbgt_index.hpp
 * @brief WBGT combination of wet-bulb, globe and air temperature.
 *
 * Uses the ISO 7243 weights: outdoors with solar load
 * 0.7 Tw + 0.2 Tg + 0.1 Ta, indoors or in shade 0.7 Tw + 0.3 Tg.
 */

enum class WbgtMode
{
    Outdoor,
    Indoor,
};

namespace wbgt_index
{

/**
 * @brief Combines one point.
 * @param wetbulb_c Natural wet-bulb temperature [C].
 * @param globe_c Globe temperature [C].
 * @param air_c Air temperature [C]; unused indoors.
 */
inline double combine(double wetbulb_c, double globe_c, double air_c, WbgtMode mode)
{
    if (mode == WbgtMode::Indoor)
    {
        return 0.7 * wetbulb_c + 0.3 * globe_c;
    }
    return 0.7 * wetbulb_c + 0.2 * globe_c + 0.1 * air_c;
}

/**
 * @brief Combines whole fields; a cell missing in any input is missing (NaN).
 * @throws std::invalid_argument on shape mismatch.
 */
Field2D combine_field(const Field2D& wetbulb_c,
                      const Field2D& globe_c,
                      const Field2D& air_c,
                      WbgtMode mode);

} // namespace wbgt_index

/**
 * @brief Parses outdoor/indoor aliases.
 */
bool parse_wbgt_mode(const std::string& value, WbgtMode& out_mode);

/**
 * @brief Converts a WBGT mode to text.
 */
const char* to_string(WbgtMode mode);
