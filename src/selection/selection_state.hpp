#pragma once

/// @file selection_state.hpp
/// @brief Plain selection / focus state owned by the SelectionController.

#include "catalog/celestial_object.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace orrery::selection
{
    /// @brief What the user sees as selected, hovered and focused.
    struct SelectionSnapshot
    {
        std::optional<std::string> selected_id;
        std::optional<catalog::CelestialObject> selected_data;
        std::optional<std::string> hovered_id;

        std::optional<SceneRef> focused_ref;
        std::optional<std::string> focused_name;
        std::optional<f64> focused_visual_size;
        std::optional<f64> focused_radius;
        std::optional<f64> focused_mass;
        std::optional<f64> focused_orbit_radius;

        void clear_focus()
        {
            focused_ref.reset();
            focused_name.reset();
            focused_visual_size.reset();
            focused_radius.reset();
            focused_mass.reset();
            focused_orbit_radius.reset();
        }
    };

    struct SelectionState
    {
        SelectionSnapshot view;
        std::optional<SelectionSnapshot> previous;   ///< One-level drill-down breadcrumb

        std::unordered_map<std::string, SceneRef> object_refs;

        u32 outstanding_pauses   = 0;       ///< Pauses taken by select() and not yet released
        bool awaiting_animation  = false;
        f64 fallback_elapsed     = 0.0;     ///< Seconds spent awaiting animation completion
    };

} // namespace orrery::selection
