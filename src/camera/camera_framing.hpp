#pragma once

/// @file camera_framing.hpp
/// @brief Camera placement for a focal object and its hierarchy.

#include "core/types.hpp"
#include "navigation/hierarchy_navigator.hpp"
#include "scaling/dual_properties.hpp"
#include "view/view_mode_registry.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace orrery::camera
{
    /// @brief Which branch of the framing rules produced a target.
    enum class FramingKind : u8
    {
        Hierarchy,       ///< Focal object framed with its own children
        ParentContext,   ///< No children: framed with the parent and siblings
        SingleObject,    ///< Framed alone: fallback distance, or optimal when it has no parent
        Overview,        ///< Birds-eye view of the whole system
        Unknown,         ///< Focal id not found; default target
    };

    [[nodiscard]] const char* framing_kind_name(FramingKind kind);

    struct CameraFramingTarget
    {
        FramingKind kind = FramingKind::Unknown;
        std::string center_id;   ///< Object the layout is centred on (parent for ParentContext)

        Vec3d focal_center{0.0};
        Vec3d outermost_center{0.0};
        Vec3d layout_midpoint{0.0};
        f64 layout_span = 0.0;

        f64 distance  = 0.0;
        f64 elevation = 0.0;   ///< Radians above the orbital plane

        Vec3d camera_position{0.0};
        Vec3d look_at{0.0};
    };

    /// @brief World position lookup; nullopt for ids without a scene node.
    using PositionLookup = std::function<std::optional<Vec3d>(std::string_view)>;

    /// @brief Pure framing calculator.
    ///
    /// frame() is the only framing path: focus requests and view-mode switches
    /// both go through it, so equal inputs always give the same target.
    ///
    /// Rules:
    /// 1. children of the focal object present: frame focal + farthest child,
    /// 2. otherwise frame the parent with its children (the focal's siblings)
    ///    when that family fits within single_object_fallback_distance,
    /// 3. otherwise frame the object alone: at single_object_fallback_distance
    ///    when it has a parent, at its optimal view distance when it has none.
    /// Hierarchy distances are max(span * layout_multiplier, single_object_fallback_distance).
    class CameraFramingCalculator
    {
    public:
        CameraFramingCalculator(const scaling::DualPropertiesResolver& resolver,
                                const navigation::HierarchyNavigator& navigator);

        [[nodiscard]] CameraFramingTarget frame(std::string_view focal_id,
                                                std::string_view mode,
                                                const PositionLookup& world_position_of,
                                                f64 system_scale = 1.0) const;

        /// @brief Birds-eye framing of the system origin.
        /// @param max_orbit_radius Largest visual orbit distance; <= 0 selects a default.
        [[nodiscard]] CameraFramingTarget frame_overview(std::string_view mode, f64 max_orbit_radius) const;

        /// @brief look_at + distance * (sin(e) * up + cos(e) * forward).
        [[nodiscard]] static Vec3d camera_position(const Vec3d& look_at, f64 distance, f64 elevation_rad);

    private:
        /// Farthest child position from `center`, considering only children with usable orbits.
        [[nodiscard]] std::optional<Vec3d> outermost_child(std::string_view parent_id,
                                                           const Vec3d& center,
                                                           const PositionLookup& world_position_of) const;

        static void finalize(CameraFramingTarget& target, f64 elevation_rad);

        const scaling::DualPropertiesResolver& m_resolver;
        const navigation::HierarchyNavigator& m_navigator;

        static constexpr f64 kDefaultOverviewDistance   = 50.0;
        static constexpr f64 kDiagramOverviewMultiplier = 1.5;
    };

} // namespace orrery::camera
