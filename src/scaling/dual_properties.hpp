#pragma once

/// @file dual_properties.hpp
/// @brief Real-to-visual magnitude resolution for one object under one view mode.

#include "catalog/celestial_object.hpp"
#include "core/types.hpp"
#include "view/view_mode_registry.hpp"

#include <optional>
#include <string_view>

namespace orrery::scaling
{
    /// @brief Real magnitudes (copied verbatim) alongside their visual counterparts.
    ///
    /// Invariant: optimal_view_distance == visual_radius * camera.radius_multiplier
    /// unless that value falls outside [min_view_distance, max_view_distance], in
    /// which case it is clamped to the nearer bound. The object type plays no part.
    struct DualProperties
    {
        f64 real_radius       = 0.0;
        f64 real_orbit_radius = 0.0;
        f64 real_mass         = 0.0;
        view::ObjectType object_type = view::ObjectType::Planet;

        f64 visual_radius         = 0.0;
        f64 visual_orbit_radius   = 0.0;
        f64 optimal_view_distance = 0.0;
        f64 min_view_distance     = 0.0;
        f64 max_view_distance     = 0.0;
    };

    /// @brief Camera distance band for a given visual radius.
    struct ViewDistances
    {
        f64 optimal = 0.0;
        f64 min     = 0.0;
        f64 max     = 0.0;
    };

    /// @brief Stateless resolver; all tunables come from the registry.
    class DualPropertiesResolver
    {
    public:
        explicit DualPropertiesResolver(const view::ViewModeRegistry& registry);

        /// @brief Resolve one object's visual magnitudes for `mode`.
        /// @param classification Authoritative when supplied; otherwise the type is inferred.
        [[nodiscard]] DualProperties resolve(f64 real_radius,
                                             f64 real_orbit_radius,
                                             f64 real_mass,
                                             std::string_view name,
                                             std::string_view mode,
                                             f64 system_scale = 1.0,
                                             std::optional<catalog::Classification> classification = std::nullopt) const;

        /// @brief Convenience overload reading magnitudes from a descriptor.
        [[nodiscard]] DualProperties resolve(const catalog::CelestialObject& object,
                                             std::string_view mode,
                                             f64 system_scale = 1.0) const;

        /// @brief Camera distances for a visual radius, identical for every object type.
        [[nodiscard]] static ViewDistances view_distances(f64 visual_radius,
                                                          const view::CameraConfig& camera);

        /// @brief Pick the scale category for an object.
        ///
        /// An explicit classification wins (planets are refined into gas giants by
        /// size); without one, name patterns are tried, then mass/radius thresholds,
        /// and finally "planet".
        [[nodiscard]] static view::ObjectType determine_object_type(
            std::string_view name,
            f64 mass,
            f64 radius,
            std::optional<catalog::Classification> classification = std::nullopt);

        [[nodiscard]] const view::ViewModeRegistry& registry() const { return m_registry; }

    private:
        const view::ViewModeRegistry& m_registry;
    };

} // namespace orrery::scaling
