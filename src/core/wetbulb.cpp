/**
 * @file wetbulb.cpp
 * @brief Core runtime implementation for the heat-stress pipeline.
 *
 * Creates the configured wet-bulb scheme and maps it over 2D fields.
 * This file belongs to the primary src/core execution layer.
 */

#include "wetbulb_base.hpp"
#include "wetbulb/factory.hpp"
#include "log_profile.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

/**
 * @brief Initializes the wet-bulb scheme.
 */
std::unique_ptr<WetBulbSchemeBase> initialize_wetbulb(const WetBulbConfig& cfg)
{
    std::unique_ptr<WetBulbSchemeBase> scheme = create_wetbulb_scheme(cfg.scheme_id);
    scheme->initialize(cfg);
    if (log_debug_enabled())
    {
        std::cout << "[WETBULB] scheme=" << scheme->name() << std::endl;
    }
    return scheme;
}

/**
 * @brief Computes the wet-bulb field cell by cell.
 */
Field2D compute_wetbulb_field(const WetBulbSchemeBase& scheme,
                              const Field2D& air_temperature_c,
                              const Field2D& relative_humidity)
{
    if (!air_temperature_c.same_shape(relative_humidity))
    {
        throw std::invalid_argument("wet-bulb input shape mismatch between air temperature and relative humidity");
    }

    const int ny = air_temperature_c.size_y();
    const int nx = air_temperature_c.size_x();
    Field2D out = Field2D::missing_like(air_temperature_c);

    #pragma omp parallel for collapse(2) schedule(static)
    for (int i = 0; i < ny; ++i)
    {
        for (int j = 0; j < nx; ++j)
        {
            if (air_temperature_c.is_missing(i, j) || relative_humidity.is_missing(i, j))
            {
                continue;
            }
            const double tw = scheme.compute_point(air_temperature_c(i, j), relative_humidity(i, j));
            if (std::isfinite(tw))
            {
                out(i, j) = static_cast<float>(tw);
            }
        }
    }

    return out;
}
