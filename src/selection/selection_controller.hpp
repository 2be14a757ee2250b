#pragma once

/// @file selection_controller.hpp
/// @brief Hover / select / focus / pause state machine.

#include "catalog/celestial_object.hpp"
#include "selection/selection_state.hpp"
#include "selection/simulation_clock.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace orrery::selection
{
    enum class SelectionEventKind : u8
    {
        Hovered,
        Selected,
        Resumed,          ///< Same object re-selected while paused
        Focused,
        FocusCleared,
        Back,
        Released,         ///< Pause released after the focus animation
        SystemChanged,
    };

    [[nodiscard]] const char* selection_event_name(SelectionEventKind kind);

    struct SelectionEvent
    {
        SelectionEventKind kind;
        std::optional<std::string> object_id;
    };

    enum class SelectOutcome : u8
    {
        NewSelection,
        Resumed,
        Unchanged,
    };

    /// @brief Optional display metadata for focus(); absent values never erase known ones.
    struct FocusMetadata
    {
        std::optional<f64> visual_size;
        std::optional<f64> radius;
        std::optional<f64> mass;
        std::optional<f64> orbit_radius;
    };

    /// @brief Owner of SelectionState; every mutation goes through here.
    ///
    /// Pause ownership: select() pauses the clock only if it was running and then
    /// owns that pause until animation_complete() (or the fallback timer) releases
    /// it. A pause someone else took is never released by animation_complete().
    ///
    /// Focus fields are keyed by scene ref. select() and focus() for the same ref
    /// merge into the same record in either order; a new ref starts a fresh one.
    class SelectionController
    {
    public:
        using Listener = std::function<void(const SelectionEvent&, const SelectionState&)>;

        static constexpr f64 kDefaultFallbackSeconds = 3.0;

        explicit SelectionController(SimulationClock& clock, f64 fallback_seconds = kDefaultFallbackSeconds);

        void set_listener(Listener listener) { m_listener = std::move(listener); }

        /// @brief Enables the drill-down breadcrumb on select().
        void set_hierarchical_navigation(bool enabled) { m_hierarchical = enabled; }
        [[nodiscard]] bool hierarchical_navigation() const { return m_hierarchical; }

        void register_object(const std::string& id, SceneRef ref);
        [[nodiscard]] std::optional<SceneRef> ref_of(std::string_view id) const;

        /// @brief Set or clear the hovered object. Repeating the current value is a no-op.
        void hover(std::optional<std::string_view> id);

        /// @param descriptor Optional snapshot source; missing fields are tolerated.
        SelectOutcome select(std::string_view id,
                             SceneRef ref,
                             std::string_view name,
                             const catalog::CelestialObject* descriptor = nullptr);

        void focus(SceneRef ref, std::string_view name, const FocusMetadata& metadata = {});

        /// @brief Release the pause taken by select(); no-op without one.
        void animation_complete();

        /// @brief Advance the fallback timer that releases a pause if no completion arrives.
        void update(f64 dt_seconds);

        /// @brief Restore the drill-down breadcrumb. @return false if there was none.
        bool back();

        /// @brief Drop the focus fields (the camera stops following).
        void stop_following();

        /// @brief Forget per-system references. Does not unpause.
        void on_system_changed();

        [[nodiscard]] const SelectionState& state() const { return m_state; }
        [[nodiscard]] bool can_go_back() const { return m_state.previous.has_value(); }

    private:
        void emit(SelectionEventKind kind, std::optional<std::string> object_id = std::nullopt);
        void begin_transition(SceneRef ref);

        SimulationClock& m_clock;
        f64 m_fallback_seconds;
        bool m_hierarchical = false;

        SelectionState m_state;
        Listener m_listener;
    };

} // namespace orrery::selection
