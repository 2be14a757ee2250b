#pragma once

/// @file system_viewer.hpp
/// @brief Viewer session facade: system loading, view modes, focus and camera.

#include "camera/camera_animator.hpp"
#include "camera/camera_framing.hpp"
#include "catalog/system_source.hpp"
#include "core/task_queue.hpp"
#include "core/types.hpp"
#include "navigation/hierarchy_navigator.hpp"
#include "scaling/dual_properties.hpp"
#include "scaling/orbital_mechanics.hpp"
#include "scene/scene_index.hpp"
#include "selection/selection_controller.hpp"
#include "view/view_mode_registry.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace orrery::viewer
{
    /// @brief Session tunables.
    struct ViewerConfig
    {
        std::string initial_view_mode = std::string(view::kFallbackModeId);
        f64 system_scale = 1.0;
        f64 pause_fallback_seconds = selection::SelectionController::kDefaultFallbackSeconds;
    };

    /// @brief Sizing answer for the rendering layer.
    struct ObjectSizing
    {
        f64 visual_size = 1.0;
    };

    /// @brief Owns every subsystem of one viewer and wires them together.
    ///
    /// Lifecycle: construct, load_system(), then drive the TaskQueue and tick()
    /// once per frame. The viewer must outlive any queue drain, since pending
    /// pipeline tasks refer back to it.
    class SystemViewer
    {
    public:
        /// @brief ok=false carries the loader's error; not invoked if superseded by a newer request.
        using LoadCallback = std::function<void(bool ok, const std::string& error)>;

        SystemViewer(catalog::SystemSource& source,
                     core::TaskQueue& queue,
                     selection::SimulationClock& clock,
                     ViewerConfig config = {});

        SystemViewer(const SystemViewer&) = delete;
        SystemViewer& operator=(const SystemViewer&) = delete;

        /// @brief Load a system and compute its mechanics for the current mode.
        ///
        /// Cached results for `system_id` are dropped before the request starts.
        /// On failure the previously active system stays active and untouched.
        /// A view-mode switch while the load is pending reissues it in the new mode.
        void load_system(const std::string& system_id, LoadCallback done = {});

        /// @brief Switch view mode; recomputes mechanics and re-frames the focus.
        /// Unknown names fall back to the explorational mode.
        void set_view_mode(std::string_view mode);

        /// @brief Visual size of an object in the active mode (1.0 if unknown).
        [[nodiscard]] ObjectSizing get_object_sizing(std::string_view object_id) const;

        /// @brief Framing target in the active mode.
        [[nodiscard]] camera::CameraFramingTarget frame(std::string_view focal_id) const;
        [[nodiscard]] camera::CameraFramingTarget frame(std::string_view focal_id, std::string_view mode) const;

        /// @brief Select, focus and animate to an object. @return false for unknown ids.
        bool focus_object(std::string_view object_id);

        /// @brief focus_object() for a scene node reported by the renderer's pick.
        bool focus_ref(SceneRef ref);

        /// @brief Animate to the birds-eye view of the active system.
        void show_overview();

        /// @brief Return to the drill-down breadcrumb and re-frame it.
        bool back();

        void stop_following();
        void hover(std::optional<std::string_view> object_id);

        /// @brief Per-frame update: camera animation and the pause fallback timer.
        void tick(f64 dt_seconds);

        // -----------------------------------------------------------------
        // Accessors
        // -----------------------------------------------------------------
        [[nodiscard]] const std::optional<std::string>& active_system() const { return m_active_system; }
        [[nodiscard]] bool load_pending() const { return m_pending_load.has_value(); }
        [[nodiscard]] const std::string& view_mode() const { return m_view_mode; }
        [[nodiscard]] const view::ViewModeConfig& mode_config() const { return m_registry.get_config(m_view_mode); }
        [[nodiscard]] const selection::SelectionState& selection_state() const { return m_selection.state(); }
        [[nodiscard]] selection::SelectionController& selection() { return m_selection; }
        [[nodiscard]] const camera::CameraAnimator& animator() const { return m_animator; }
        [[nodiscard]] const scene::SceneIndex& scene() const { return m_scene; }
        [[nodiscard]] const navigation::HierarchyNavigator& navigator() const { return m_navigator; }
        [[nodiscard]] const scaling::OrbitalMechanicsPipeline& pipeline() const { return m_pipeline; }
        [[nodiscard]] const scaling::OrbitalMechanicsResult& placements() const { return m_placements; }
        [[nodiscard]] const view::ViewModeRegistry& registry() const { return m_registry; }
        [[nodiscard]] const std::optional<camera::CameraFramingTarget>& last_target() const { return m_last_target; }

    private:
        struct PendingLoad
        {
            std::string system_id;
            LoadCallback done;
        };

        void issue_pending_load();
        void apply_mechanics(const scaling::CalculationOutcome& outcome);
        void animate_to(const camera::CameraFramingTarget& target, f64 duration_ms);
        void reframe();
        [[nodiscard]] camera::PositionLookup position_lookup() const;

        ViewerConfig m_config;

        view::ViewModeRegistry m_registry;
        scaling::DualPropertiesResolver m_resolver;
        scaling::OrbitalMechanicsPipeline m_pipeline;
        navigation::HierarchyNavigator m_navigator;
        scene::SceneIndex m_scene;
        camera::CameraFramingCalculator m_framing;
        camera::CameraAnimator m_animator;
        selection::SelectionController m_selection;

        std::string m_view_mode;
        std::optional<std::string> m_active_system;
        std::optional<PendingLoad> m_pending_load;
        scaling::OrbitalMechanicsResult m_placements;
        std::optional<camera::CameraFramingTarget> m_last_target;
    };

} // namespace orrery::viewer
