/**
 * @file wbgt_index.cpp
 * @brief Core runtime implementation for the heat-stress pipeline.
 *
 * Field-level WBGT combination and mode parsing.
 * This file belongs to the primary src/core execution layer.
 */

#include "wbgt_index.hpp"
#include "string_utils.hpp"

#include <stdexcept>

namespace wbgt_index
{

/**
 * @brief Combines wet-bulb, globe and air temperature fields.
 */
Field2D combine_field(const Field2D& wetbulb_c,
                      const Field2D& globe_c,
                      const Field2D& air_c,
                      WbgtMode mode)
{
    if (!wetbulb_c.same_shape(globe_c) || !wetbulb_c.same_shape(air_c))
    {
        throw std::invalid_argument("WBGT input shape mismatch between wet-bulb, globe and air temperature");
    }

    const int ny = wetbulb_c.size_y();
    const int nx = wetbulb_c.size_x();
    Field2D out = Field2D::missing_like(wetbulb_c);

    #pragma omp parallel for collapse(2) schedule(static)
    for (int i = 0; i < ny; ++i)
    {
        for (int j = 0; j < nx; ++j)
        {
            const bool air_needed = mode == WbgtMode::Outdoor;
            if (wetbulb_c.is_missing(i, j) || globe_c.is_missing(i, j) ||
                (air_needed && air_c.is_missing(i, j)))
            {
                continue;
            }
            out(i, j) = static_cast<float>(combine(wetbulb_c(i, j), globe_c(i, j), air_c(i, j), mode));
        }
    }

    return out;
}

} // namespace wbgt_index

/**
 * @brief Parses WBGT mode aliases.
 */
bool parse_wbgt_mode(const std::string& value, WbgtMode& out_mode)
{
    const std::string v = wbgt::strutil::lower_copy(value);
    if (v == "outdoor" || v == "outside" || v == "solar")
    {
        out_mode = WbgtMode::Outdoor;
        return true;
    }
    if (v == "indoor" || v == "inside" || v == "shade")
    {
        out_mode = WbgtMode::Indoor;
        return true;
    }
    return false;
}

/**
 * @brief Converts WBGT mode enum to stable string id.
 */
const char* to_string(WbgtMode mode)
{
    switch (mode)
    {
        case WbgtMode::Indoor:
            return "indoor";
        case WbgtMode::Outdoor:
        default:
            return "outdoor";
    }
}
