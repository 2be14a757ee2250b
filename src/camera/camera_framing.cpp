/// @file camera_framing.cpp
/// @brief Hierarchy-aware camera framing.

#include "camera/camera_framing.hpp"

#include "core/logger.hpp"

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>

namespace orrery::camera
{

const char* framing_kind_name(FramingKind kind)
{
    switch (kind)
    {
        case FramingKind::Hierarchy:     return "hierarchy";
        case FramingKind::ParentContext: return "parent-context";
        case FramingKind::SingleObject:  return "single-object";
        case FramingKind::Overview:      return "overview";
        default:                         return "unknown";
    }
}

CameraFramingCalculator::CameraFramingCalculator(const scaling::DualPropertiesResolver& resolver,
                                                 const navigation::HierarchyNavigator& navigator)
    : m_resolver(resolver)
    , m_navigator(navigator)
{
}

// -----------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------

Vec3d CameraFramingCalculator::camera_position(const Vec3d& look_at, f64 distance, f64 elevation_rad)
{
    return look_at
         + distance * std::sin(elevation_rad) * world_axes::kUp
         + distance * std::cos(elevation_rad) * world_axes::kForward;
}

void CameraFramingCalculator::finalize(CameraFramingTarget& target, f64 elevation_rad)
{
    target.elevation       = elevation_rad;
    target.look_at         = target.layout_midpoint;
    target.camera_position = camera_position(target.look_at, target.distance, elevation_rad);
}

std::optional<Vec3d> CameraFramingCalculator::outermost_child(std::string_view parent_id,
                                                              const Vec3d& center,
                                                              const PositionLookup& world_position_of) const
{
    std::optional<Vec3d> outermost;
    f64 best = -1.0;

    for (const catalog::CelestialObject* child : m_navigator.children_of(parent_id))
    {
        // Children without usable orbit data take no part in framing
        if (!child->has_orbit_data())
        {
            continue;
        }
        const std::optional<Vec3d> position = world_position_of(child->id);
        if (!position.has_value())
        {
            continue;
        }
        const f64 d = glm::distance(center, *position);
        if (d > best)
        {
            best = d;
            outermost = position;
        }
    }
    return outermost;
}

// -----------------------------------------------------------------
// frame
// -----------------------------------------------------------------

CameraFramingTarget CameraFramingCalculator::frame(std::string_view focal_id,
                                                   std::string_view mode,
                                                   const PositionLookup& world_position_of,
                                                   f64 system_scale) const
{
    const view::ViewModeConfig& config = m_resolver.registry().get_config(mode);
    const view::CameraConfig& camera   = config.camera;
    const f64 elevation = glm::radians(camera.viewing_angles.default_elevation);
    const f64 hierarchy_floor = camera.single_object_fallback_distance;

    CameraFramingTarget target;

    const catalog::CelestialObject* focal = m_navigator.find(focal_id);
    const std::optional<Vec3d> focal_position =
        focal != nullptr ? world_position_of(focal->id) : std::nullopt;

    if (!focal_position.has_value())
    {
        ORR_CORE_WARN("Camera framing: no position for '{}', using default target", focal_id);
        target.kind     = FramingKind::Unknown;
        target.distance = hierarchy_floor;
        finalize(target, elevation);
        return target;
    }

    target.center_id    = focal->id;
    target.focal_center = *focal_position;

    bool in_hierarchy = true;

    // 1. Own children
    if (auto outermost = outermost_child(focal->id, target.focal_center, world_position_of))
    {
        target.kind             = FramingKind::Hierarchy;
        target.outermost_center = *outermost;
    }
    else
    {
        const catalog::CelestialObject* parent = m_navigator.parent_of(focal->id);
        const std::optional<Vec3d> parent_position =
            parent != nullptr ? world_position_of(parent->id) : std::nullopt;

        // 2. Parent context, while the parent's family fits inside the floor distance
        std::optional<Vec3d> context_outermost;
        if (parent_position.has_value())
        {
            context_outermost =
                outermost_child(parent->id, *parent_position, world_position_of).value_or(*parent_position);
            if (glm::distance(*parent_position, *context_outermost) * camera.layout_multiplier > hierarchy_floor)
            {
                context_outermost.reset();
            }
        }

        if (context_outermost.has_value())
        {
            target.kind             = FramingKind::ParentContext;
            target.center_id        = parent->id;
            target.focal_center     = *parent_position;
            target.outermost_center = *context_outermost;
        }
        else
        {
            // 3. The object alone
            target.kind             = FramingKind::SingleObject;
            target.outermost_center = target.focal_center;
            in_hierarchy            = parent_position.has_value();
        }
    }

    target.layout_midpoint = (target.focal_center + target.outermost_center) * 0.5;
    target.layout_span     = glm::distance(target.focal_center, target.outermost_center);

    if (!in_hierarchy)
    {
        target.distance = m_resolver.resolve(*focal, mode, system_scale).optimal_view_distance;
    }
    else
    {
        target.distance = std::max(target.layout_span * camera.layout_multiplier, hierarchy_floor);
    }

    finalize(target, elevation);

    ORR_CORE_TRACE("Camera framing: '{}' in '{}' -> {} (span {:.2f}, distance {:.2f})",
                   focal->id, config.id, framing_kind_name(target.kind), target.layout_span, target.distance);
    return target;
}

// -----------------------------------------------------------------
// frame_overview
// -----------------------------------------------------------------

CameraFramingTarget CameraFramingCalculator::frame_overview(std::string_view mode, f64 max_orbit_radius) const
{
    const view::ViewModeConfig& config = m_resolver.registry().get_config(mode);

    CameraFramingTarget target;
    target.kind = FramingKind::Overview;

    if (std::isfinite(max_orbit_radius) && max_orbit_radius > 0.0)
    {
        target.distance = config.diagrammatic ? max_orbit_radius * kDiagramOverviewMultiplier
                                              : max_orbit_radius;
    }
    else
    {
        target.distance = kDefaultOverviewDistance;
    }

    finalize(target, glm::radians(config.camera.viewing_angles.birds_eye_elevation));
    return target;
}

} // namespace orrery::camera
