#pragma once

/// @file celestial_object.hpp
/// @brief Read-only descriptor of one body in a star system, as delivered by the loader.

#include "core/types.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <string_view>

namespace orrery::catalog
{
    /// @brief Coarse classification supplied by the system data.
    enum class Classification : u8
    {
        Star,
        Planet,
        Moon,
        Belt,
        Other,
    };

    [[nodiscard]] inline const char* classification_name(Classification c)
    {
        switch (c)
        {
            case Classification::Star:   return "star";
            case Classification::Planet: return "planet";
            case Classification::Moon:   return "moon";
            case Classification::Belt:   return "belt";
            default:                     return "other";
        }
    }

    /// @brief Physical magnitudes.
    ///
    /// Units: mass in Earth masses, radius in Earth radii, temperature in Kelvin,
    /// luminosity in solar luminosities.
    struct CelestialProperties
    {
        f64 mass        = 0.0;
        f64 radius      = 0.0;
        f64 temperature = 0.0;
        std::optional<f64> luminosity;
    };

    /// @brief Orbit around a parent body.
    ///
    /// `parent` may name the parent by id or by display name (either case).
    /// The semi-major axis (AU) is optional because upstream data is not always
    /// complete; see has_orbit_data().
    struct OrbitData
    {
        std::string parent;
        std::optional<f64> semi_major_axis;
        f64 eccentricity = 0.0;
        f64 inclination  = 0.0;   ///< Degrees
    };

    struct CelestialObject
    {
        std::string id;                 ///< Unique within a system
        std::string name;
        std::optional<Classification> classification;   ///< Absent when the data omits it
        CelestialProperties properties;
        std::optional<OrbitData> orbit;

        /// True when the orbit names a parent, whatever the orbit's completeness.
        [[nodiscard]] bool has_parent() const
        {
            return orbit.has_value() && !orbit->parent.empty();
        }

        /// True when the orbit can take part in distance calculations.
        [[nodiscard]] bool has_orbit_data() const
        {
            return has_parent()
                && orbit->semi_major_axis.has_value()
                && std::isfinite(*orbit->semi_major_axis)
                && *orbit->semi_major_axis >= 0.0;
        }

        /// Semi-major axis in AU, or 0 when there is no usable orbit.
        [[nodiscard]] f64 orbit_radius() const
        {
            return has_orbit_data() ? *orbit->semi_major_axis : 0.0;
        }
    };

    /// @brief ASCII case-insensitive string comparison.
    [[nodiscard]] bool iequals(std::string_view a, std::string_view b);

    /// @brief True when `reference` names `object` by id or by name (case-insensitive).
    [[nodiscard]] inline bool references(const CelestialObject& object, std::string_view reference)
    {
        return !reference.empty()
            && (iequals(object.id, reference) || iequals(object.name, reference));
    }

} // namespace orrery::catalog
