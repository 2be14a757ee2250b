/// @file view_modes.cpp
/// @brief Built-in view-mode definitions.
///
/// Real radii are in Earth radii and orbits in AU, so object scale factors map
/// Earth radii to scene units and orbit_scaling_factor maps AU to scene units.

#include "view/view_mode_registry.hpp"

namespace orrery::view
{

// -----------------------------------------------------------------
// Explorational: logarithm-free proportional scaling, comfortable distances
// -----------------------------------------------------------------

ViewModeConfig explorational_mode()
{
    return ViewModeConfig{
        .id   = "explorational",
        .name = "Explorational",
        .object_scaling = {
            .star          = 0.05,
            .planet        = 1.8,
            .gas_giant     = 0.4,
            .moon          = 1.8,
            .asteroid      = 1.8,
            .default_scale = 1.0,
        },
        .orbit_scaling_factor = 50.0,
        .min_visual_size      = 0.05,
        .max_visual_size      = 6.0,
        .camera = {
            .radius_multiplier       = 4.0,
            .min_distance_multiplier = 2.5,
            .max_distance_multiplier = 15.0,
            .absolute_min_distance   = 0.3,
            .absolute_max_distance   = 100.0,
            .viewing_angles = {.default_elevation = 30.0, .birds_eye_elevation = 40.0},
            .animation      = {.focus_duration = 800.0, .birds_eye_duration = 1200.0,
                               .easing = EasingFunction::Leap},
        },
        .safety_factor       = 2.5,
        .min_orbit_clearance = 0.5,
    };
}

// -----------------------------------------------------------------
// Navigational: larger, more uniform bodies and closer camera
// -----------------------------------------------------------------

ViewModeConfig navigational_mode()
{
    return ViewModeConfig{
        .id   = "navigational",
        .name = "Navigational",
        .object_scaling = {
            .star          = 1.8,
            .planet        = 1.5,
            .gas_giant     = 0.3,
            .moon          = 1.0,
            .asteroid      = 0.6,
            .default_scale = 1.0,
        },
        .orbit_scaling_factor = 40.0,
        .min_visual_size      = 0.2,
        .max_visual_size      = 6.0,
        .camera = {
            .radius_multiplier       = 3.5,
            .min_distance_multiplier = 2.0,
            .max_distance_multiplier = 12.0,
            .absolute_min_distance   = 0.2,
            .absolute_max_distance   = 80.0,
            .viewing_angles = {.default_elevation = 35.0, .birds_eye_elevation = 45.0},
            .animation      = {.focus_duration = 600.0, .birds_eye_duration = 1000.0,
                               .easing = EasingFunction::EaseOut},
        },
        .safety_factor       = 3.0,
        .min_orbit_clearance = 1.0,
    };
}

// -----------------------------------------------------------------
// Profile: diagrammatic, equidistant spacing, planet drill-down
// -----------------------------------------------------------------

ViewModeConfig profile_mode()
{
    return ViewModeConfig{
        .id   = "profile",
        .name = "Profile",
        .object_scaling = {
            .star          = 1.5,
            .planet        = 1.0,
            .gas_giant     = 1.2,
            .moon          = 0.8,
            .asteroid      = 0.5,
            .default_scale = 1.0,
        },
        .orbit_scaling_factor = 0.3,
        .min_visual_size      = 0.03,
        .max_visual_size      = 1.5,
        .camera = {
            .radius_multiplier       = 2.5,
            .min_distance_multiplier = 1.8,
            .max_distance_multiplier = 8.0,
            .absolute_min_distance   = 0.15,
            .absolute_max_distance   = 60.0,
            .viewing_angles = {.default_elevation = 0.0, .birds_eye_elevation = 0.0},
            .animation      = {.focus_duration = 400.0, .birds_eye_duration = 600.0,
                               .easing = EasingFunction::EaseInOut},
        },
        .diagrammatic            = true,
        .hierarchical_navigation = true,
        // Neighbours are 3.5 apart, enough to clear two bodies at max_visual_size
        .equidistant_spacing = {.base_spacing = 3.5, .spacing_multiplier = 1.0},
        .safety_factor       = 3.5,
        .min_orbit_clearance = 0.3,
    };
}

// -----------------------------------------------------------------
// Scientific: unscaled proportions, wide camera range
// -----------------------------------------------------------------

ViewModeConfig scientific_mode()
{
    return ViewModeConfig{
        .id   = "scientific",
        .name = "Scientific",
        .object_scaling = {},
        .orbit_scaling_factor = 80.0,
        .min_visual_size      = 0.1,
        .max_visual_size      = 40.0,
        .camera = {
            .radius_multiplier       = 10.0,
            .min_distance_multiplier = 2.0,
            .max_distance_multiplier = 1000.0,
            .absolute_min_distance   = 0.01,
            .absolute_max_distance   = 10000.0,
            .viewing_angles = {.default_elevation = 15.0, .birds_eye_elevation = 25.0},
            .animation      = {.focus_duration = 1500.0, .birds_eye_duration = 2000.0,
                               .easing = EasingFunction::EaseInOut},
        },
        .safety_factor       = 1.1,
        .min_orbit_clearance = 0.1,
    };
}

// -----------------------------------------------------------------
// Cinematic: oversized bodies, dramatic angles
// -----------------------------------------------------------------

ViewModeConfig cinematic_mode()
{
    return ViewModeConfig{
        .id   = "cinematic",
        .name = "Cinematic",
        .object_scaling = {
            .star          = 2.5,
            .planet        = 2.0,
            .gas_giant     = 0.3,
            .moon          = 1.5,
            .asteroid      = 1.0,
            .default_scale = 1.5,
        },
        .orbit_scaling_factor = 20.0,
        .min_visual_size      = 0.1,
        .max_visual_size      = 3.0,
        .camera = {
            .radius_multiplier       = 3.0,
            .min_distance_multiplier = 1.5,
            .max_distance_multiplier = 8.0,
            .absolute_min_distance   = 0.2,
            .absolute_max_distance   = 150.0,
            .viewing_angles = {.default_elevation = 25.0, .birds_eye_elevation = 35.0},
            .animation      = {.focus_duration = 1200.0, .birds_eye_duration = 1800.0,
                               .easing = EasingFunction::Leap},
        },
        .safety_factor       = 2.0,
        .min_orbit_clearance = 1.0,
    };
}

} // namespace orrery::view
