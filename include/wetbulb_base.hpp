#pragma once
#include <memory>
#include <string>
#include <vector>

#include "field2d.hpp"

/*This header file contains the base classes and structures for the wet-bulb module.
The wet-bulb module turns air temperature and relative humidity into a wet-bulb
temperature for the WBGT combination. The scheme is chosen by the user in the
configuration file.*/

// Configuration for wet-bulb schemes
struct WetBulbConfig
{
    std::string scheme_id = "stull";
    bool rh_is_fraction = false;           // RH supplied in [0,1] instead of percent
    bool restrict_to_valid_range = false;  // cells outside the fit range become missing
    bool cap_at_air_temperature = true;    // Tw never exceeds Ta
};

// Abstract base class for wet-bulb schemes
class WetBulbSchemeBase
{
public:
    virtual ~WetBulbSchemeBase() = default;

    virtual std::string name() const = 0;

    virtual void initialize(const WetBulbConfig& cfg) = 0;

    /**
     * @brief Computes wet-bulb temperature for one point.
     * @param air_temperature_c Air temperature [C].
     * @param relative_humidity Relative humidity in the units selected by the config.
     * @return Wet-bulb temperature [C], or NaN when the point is rejected.
     */
    virtual double compute_point(double air_temperature_c, double relative_humidity) const = 0;
};

/**
 * @brief Creates a wet-bulb scheme by configured name.
 * @throws std::runtime_error for unknown names.
 */
std::unique_ptr<WetBulbSchemeBase> create_wetbulb_scheme(const std::string& scheme_name);

/**
 * @brief Returns names of available wet-bulb schemes.
 */
std::vector<std::string> get_available_wetbulb_schemes();

/**
 * @brief Creates and initializes a scheme from its configuration.
 */
std::unique_ptr<WetBulbSchemeBase> initialize_wetbulb(const WetBulbConfig& cfg);

/**
 * @brief Maps a scheme over air temperature and relative humidity fields.
 *
 * Missing cells in either input, and points the scheme rejects, are NaN in
 * the output.
 *
 * @throws std::invalid_argument on shape mismatch.
 */
Field2D compute_wetbulb_field(const WetBulbSchemeBase& scheme,
                              const Field2D& air_temperature_c,
                              const Field2D& relative_humidity);
