/// @file view_mode_registry.cpp
/// @brief View-mode registration, validation and lookup.

#include "view/view_mode_registry.hpp"

#include "core/logger.hpp"

#include <utility>

namespace orrery::view
{

ViewModeRegistry::ViewModeRegistry()
    : m_fallback(explorational_mode())
{
}

ViewModeRegistry ViewModeRegistry::create_builtin()
{
    ViewModeRegistry registry;
    registry.register_mode(explorational_mode());
    registry.register_mode(navigational_mode());
    registry.register_mode(profile_mode());
    registry.register_mode(scientific_mode());
    registry.register_mode(cinematic_mode());
    ORR_CORE_INFO("ViewModeRegistry: {} built-in modes registered", registry.ids().size());
    return registry;
}

// -----------------------------------------------------------------
// Validation
// -----------------------------------------------------------------

ViewModeValidation ViewModeRegistry::validate(const ViewModeConfig& config)
{
    ViewModeValidation result;

    if (config.id.empty())
    {
        result.errors.emplace_back("mode id must not be empty");
    }
    if (config.name.empty())
    {
        result.warnings.emplace_back("mode has no display name");
    }

    const ObjectScaling& s = config.object_scaling;
    if (s.star <= 0.0 || s.planet <= 0.0 || s.gas_giant <= 0.0 ||
        s.moon <= 0.0 || s.asteroid <= 0.0 || s.default_scale <= 0.0)
    {
        result.errors.emplace_back("object scale factors must be positive");
    }
    if (config.orbit_scaling_factor <= 0.0)
    {
        result.errors.emplace_back("orbit_scaling_factor must be positive");
    }
    if (config.min_visual_size <= 0.0)
    {
        result.errors.emplace_back("min_visual_size must be positive");
    }
    if (config.max_visual_size <= config.min_visual_size)
    {
        result.errors.emplace_back("max_visual_size must exceed min_visual_size");
    }

    const CameraConfig& cam = config.camera;
    if (cam.radius_multiplier <= 0.0)
    {
        result.errors.emplace_back("camera.radius_multiplier must be positive");
    }
    if (cam.max_distance_multiplier <= cam.min_distance_multiplier)
    {
        result.errors.emplace_back("camera.max_distance_multiplier must exceed min_distance_multiplier");
    }
    if (cam.absolute_max_distance <= cam.absolute_min_distance)
    {
        result.errors.emplace_back("camera.absolute_max_distance must exceed absolute_min_distance");
    }
    if (cam.radius_multiplier < cam.min_distance_multiplier ||
        cam.radius_multiplier > cam.max_distance_multiplier)
    {
        result.warnings.emplace_back("radius_multiplier lies outside [min, max] multipliers; "
                                     "optimal distances will be clamped");
    }
    if (cam.animation.focus_duration < 0.0 || cam.animation.birds_eye_duration < 0.0)
    {
        result.errors.emplace_back("animation durations must not be negative");
    }

    if (config.safety_factor <= 0.0)
    {
        result.errors.emplace_back("safety_factor must be positive");
    }

    if (config.diagrammatic)
    {
        // Span of K children is base * (1 + (K - 1) * mult); it stays under
        // kDiagramSpanPerChild * K for every K >= 1 iff both conditions hold.
        const EquidistantSpacing& eq = config.equidistant_spacing;
        if (eq.base_spacing <= 0.0 || eq.spacing_multiplier < 0.0)
        {
            result.errors.emplace_back("equidistant spacing must be positive");
        }
        else if (eq.base_spacing >= kDiagramSpanPerChild ||
                 eq.base_spacing * eq.spacing_multiplier > kDiagramSpanPerChild)
        {
            result.errors.emplace_back("equidistant spacing exceeds the diagram span bound");
        }
        else if (eq.base_spacing < 2.0 * config.max_visual_size)
        {
            result.warnings.emplace_back("base_spacing cannot clear two bodies at max_visual_size");
        }
    }

    return result;
}

// -----------------------------------------------------------------
// Registration
// -----------------------------------------------------------------

bool ViewModeRegistry::register_mode(ViewModeConfig config, bool replace)
{
    const ViewModeValidation validation = validate(config);
    if (!validation.is_valid())
    {
        for (const auto& error : validation.errors)
        {
            ORR_CORE_ERROR("ViewModeRegistry: rejecting '{}': {}", config.id, error);
        }
        return false;
    }
    for (const auto& warning : validation.warnings)
    {
        ORR_CORE_WARN("ViewModeRegistry: '{}': {}", config.id, warning);
    }

    const bool exists = m_modes.find(config.id) != m_modes.end();
    if (exists && !replace)
    {
        ORR_CORE_ERROR("ViewModeRegistry: mode '{}' already registered", config.id);
        return false;
    }

    if (!exists)
    {
        m_order.push_back(config.id);
    }
    ORR_CORE_TRACE("ViewModeRegistry: registered '{}'", config.id);
    std::string id = config.id;
    m_modes.insert_or_assign(std::move(id), std::move(config));
    return true;
}

// -----------------------------------------------------------------
// Lookup
// -----------------------------------------------------------------

const ViewModeConfig& ViewModeRegistry::get_config(std::string_view mode) const
{
    if (auto it = m_modes.find(std::string(mode)); it != m_modes.end())
    {
        return it->second;
    }
    if (auto it = m_modes.find(std::string(kFallbackModeId)); it != m_modes.end())
    {
        return it->second;
    }
    return m_fallback;
}

bool ViewModeRegistry::has(std::string_view mode) const
{
    return m_modes.find(std::string(mode)) != m_modes.end();
}

} // namespace orrery::view
