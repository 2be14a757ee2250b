#pragma once

/// @file view_mode_config.hpp
/// @brief Per-view-mode tunables: object scaling, orbit scaling, camera and diagram spacing.

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace orrery::view
{
    /// @brief Visual object category used to pick a scale factor.
    enum class ObjectType : u8
    {
        Star,
        Planet,
        GasGiant,
        Moon,
        Asteroid,
    };

    [[nodiscard]] inline const char* object_type_name(ObjectType t)
    {
        switch (t)
        {
            case ObjectType::Star:     return "star";
            case ObjectType::Planet:   return "planet";
            case ObjectType::GasGiant: return "gasGiant";
            case ObjectType::Moon:     return "moon";
            case ObjectType::Asteroid: return "asteroid";
            default:                   return "unknown";
        }
    }

    enum class EasingFunction : u8
    {
        Linear,
        EaseOut,
        EaseInOut,
        Leap,
    };

    /// @brief Scale factor per object type. All factors must be > 0.
    struct ObjectScaling
    {
        f64 star          = 1.0;
        f64 planet        = 1.0;
        f64 gas_giant     = 1.0;
        f64 moon          = 1.0;
        f64 asteroid      = 1.0;
        f64 default_scale = 1.0;   ///< Used for any type without a dedicated factor

        [[nodiscard]] f64 factor_for(ObjectType type) const
        {
            switch (type)
            {
                case ObjectType::Star:     return star;
                case ObjectType::Planet:   return planet;
                case ObjectType::GasGiant: return gas_giant;
                case ObjectType::Moon:     return moon;
                case ObjectType::Asteroid: return asteroid;
                default:                   return default_scale;
            }
        }
    };

    struct ViewingAngles
    {
        f64 default_elevation  = 30.0;   ///< Degrees above the orbital plane
        f64 birds_eye_elevation = 40.0;  ///< Degrees, overview framing
    };

    struct CameraAnimation
    {
        f64 focus_duration     = 800.0;   ///< Milliseconds
        f64 birds_eye_duration = 1200.0;  ///< Milliseconds
        EasingFunction easing  = EasingFunction::Leap;
    };

    struct CameraConfig
    {
        f64 radius_multiplier       = 4.0;
        f64 min_distance_multiplier = 2.5;
        f64 max_distance_multiplier = 15.0;
        f64 absolute_min_distance   = 0.3;
        f64 absolute_max_distance   = 100.0;

        // Hierarchy framing: distance = max(span * layout_multiplier, single_object_fallback_distance)
        f64 layout_multiplier               = 1.2;
        f64 single_object_fallback_distance = 15.0;

        ViewingAngles viewing_angles;
        CameraAnimation animation;
    };

    /// @brief Diagram layout: the nth child of a parent sits at
    /// base_spacing * (1 + n * spacing_multiplier), independent of its real orbit.
    struct EquidistantSpacing
    {
        f64 base_spacing       = 3.0;
        f64 spacing_multiplier = 1.0;
    };

    struct ViewModeConfig
    {
        std::string id;
        std::string name;

        ObjectScaling object_scaling;
        f64 orbit_scaling_factor = 1.0;   ///< Scene units per AU
        f64 min_visual_size      = 0.1;
        f64 max_visual_size      = 6.0;

        CameraConfig camera;

        bool diagrammatic            = false;   ///< Equidistant spacing instead of scaled orbits
        bool hierarchical_navigation = false;   ///< Planet drill-down with a back breadcrumb
        EquidistantSpacing equidistant_spacing;

        f64 safety_factor       = 2.0;   ///< Parent clearance, in parent visual radii
        f64 min_orbit_clearance = 0.5;   ///< Gap between neighbouring orbits (scene units)
    };

    [[nodiscard]] EasingFunction parse_easing(std::string_view name);
    [[nodiscard]] const char* easing_name(EasingFunction easing);

    /// @brief Evaluate an easing curve at t in [0, 1] (t is clamped).
    [[nodiscard]] f64 apply_easing(EasingFunction easing, f64 t);

} // namespace orrery::view
