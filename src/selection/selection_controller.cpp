/// @file selection_controller.cpp
/// @brief Selection state machine implementation.

#include "selection/selection_controller.hpp"

#include "core/logger.hpp"

namespace orrery::selection
{

namespace
{

/// Overwrite `field` only when `value` carries something.
void merge(std::optional<f64>& field, const std::optional<f64>& value)
{
    if (value.has_value())
    {
        field = value;
    }
}

} // anonymous namespace

const char* selection_event_name(SelectionEventKind kind)
{
    switch (kind)
    {
        case SelectionEventKind::Hovered:       return "hovered";
        case SelectionEventKind::Selected:      return "selected";
        case SelectionEventKind::Resumed:       return "resumed";
        case SelectionEventKind::Focused:       return "focused";
        case SelectionEventKind::FocusCleared:  return "focus-cleared";
        case SelectionEventKind::Back:          return "back";
        case SelectionEventKind::Released:      return "released";
        case SelectionEventKind::SystemChanged: return "system-changed";
        default:                                return "unknown";
    }
}

SelectionController::SelectionController(SimulationClock& clock, f64 fallback_seconds)
    : m_clock(clock)
    , m_fallback_seconds(fallback_seconds > 0.0 ? fallback_seconds : kDefaultFallbackSeconds)
{
}

// -----------------------------------------------------------------
// Object references
// -----------------------------------------------------------------

void SelectionController::register_object(const std::string& id, SceneRef ref)
{
    m_state.object_refs[id] = ref;
}

std::optional<SceneRef> SelectionController::ref_of(std::string_view id) const
{
    const auto it = m_state.object_refs.find(std::string(id));
    if (it == m_state.object_refs.end())
    {
        return std::nullopt;
    }
    return it->second;
}

// -----------------------------------------------------------------
// hover
// -----------------------------------------------------------------

void SelectionController::hover(std::optional<std::string_view> id)
{
    auto& hovered = m_state.view.hovered_id;

    const bool unchanged = id.has_value() ? (hovered.has_value() && *hovered == *id)
                                          : !hovered.has_value();
    if (unchanged)
    {
        return;
    }

    if (id.has_value())
    {
        hovered = std::string(*id);
    }
    else
    {
        hovered.reset();
    }
    emit(SelectionEventKind::Hovered, hovered);
}

// -----------------------------------------------------------------
// select
// -----------------------------------------------------------------

void SelectionController::begin_transition(SceneRef ref)
{
    SelectionSnapshot& view = m_state.view;
    if (view.focused_ref != ref)
    {
        view.clear_focus();
        view.focused_ref = ref;
    }
}

SelectOutcome SelectionController::select(std::string_view id,
                                          SceneRef ref,
                                          std::string_view name,
                                          const catalog::CelestialObject* descriptor)
{
    SelectionSnapshot& view = m_state.view;

    if (view.selected_id.has_value() && *view.selected_id == id)
    {
        // Toggle: re-selecting while paused resumes instead of pausing again
        if (!m_clock.is_paused())
        {
            return SelectOutcome::Unchanged;
        }
        m_clock.unpause();
        m_state.outstanding_pauses = 0;
        m_state.awaiting_animation = false;
        m_state.fallback_elapsed   = 0.0;
        emit(SelectionEventKind::Resumed, std::string(id));
        return SelectOutcome::Resumed;
    }

    // Drill-down into a child body keeps a breadcrumb to the current view
    if (m_hierarchical && descriptor != nullptr && descriptor->has_parent() && view.selected_id.has_value())
    {
        m_state.previous = view;
    }

    begin_transition(ref);
    view.selected_id = std::string(id);
    if (!name.empty())
    {
        view.focused_name = std::string(name);
    }

    if (descriptor != nullptr)
    {
        view.selected_data = *descriptor;
        if (descriptor->properties.radius > 0.0)
        {
            view.focused_radius = descriptor->properties.radius;
        }
        if (descriptor->properties.mass > 0.0)
        {
            view.focused_mass = descriptor->properties.mass;
        }
        if (descriptor->has_orbit_data())
        {
            view.focused_orbit_radius = descriptor->orbit_radius();
        }
    }
    else
    {
        view.selected_data.reset();
    }

    if (!m_clock.is_paused())
    {
        m_clock.pause();
        ++m_state.outstanding_pauses;
        m_state.awaiting_animation = true;
        m_state.fallback_elapsed   = 0.0;
    }

    emit(SelectionEventKind::Selected, std::string(id));
    return SelectOutcome::NewSelection;
}

// -----------------------------------------------------------------
// focus
// -----------------------------------------------------------------

void SelectionController::focus(SceneRef ref, std::string_view name, const FocusMetadata& metadata)
{
    SelectionSnapshot& view = m_state.view;

    begin_transition(ref);
    if (!name.empty())
    {
        view.focused_name = std::string(name);
    }
    merge(view.focused_visual_size, metadata.visual_size);
    merge(view.focused_radius, metadata.radius);
    merge(view.focused_mass, metadata.mass);
    merge(view.focused_orbit_radius, metadata.orbit_radius);

    emit(SelectionEventKind::Focused, view.focused_name);
}

// -----------------------------------------------------------------
// Pause release
// -----------------------------------------------------------------

void SelectionController::animation_complete()
{
    if (m_state.outstanding_pauses == 0)
    {
        return;
    }

    --m_state.outstanding_pauses;
    m_state.awaiting_animation = m_state.outstanding_pauses > 0;
    m_state.fallback_elapsed   = 0.0;
    if (m_state.outstanding_pauses == 0 && m_clock.is_paused())
    {
        m_clock.unpause();
    }
    emit(SelectionEventKind::Released, m_state.view.selected_id);
}

void SelectionController::update(f64 dt_seconds)
{
    if (!m_state.awaiting_animation || dt_seconds <= 0.0)
    {
        return;
    }

    m_state.fallback_elapsed += dt_seconds;
    if (m_state.fallback_elapsed >= m_fallback_seconds)
    {
        ORR_CORE_WARN("Selection: no animation completion after {:.1f}s, releasing pause",
                      m_state.fallback_elapsed);
        animation_complete();
    }
}

// -----------------------------------------------------------------
// Navigation
// -----------------------------------------------------------------

bool SelectionController::back()
{
    if (!m_state.previous.has_value())
    {
        return false;
    }

    // Hover is live pointer state, not part of the breadcrumb
    std::optional<std::string> hovered = std::move(m_state.view.hovered_id);
    m_state.view = std::move(*m_state.previous);
    m_state.view.hovered_id = std::move(hovered);
    m_state.previous.reset();

    emit(SelectionEventKind::Back, m_state.view.selected_id);
    return true;
}

void SelectionController::stop_following()
{
    if (!m_state.view.focused_ref.has_value() && !m_state.view.focused_name.has_value())
    {
        return;
    }
    m_state.view.clear_focus();
    emit(SelectionEventKind::FocusCleared);
}

void SelectionController::on_system_changed()
{
    m_state.object_refs.clear();
    m_state.previous.reset();

    // Descriptors of the old system are meaningless now; pause ownership is kept
    m_state.view = SelectionSnapshot{};

    emit(SelectionEventKind::SystemChanged);
}

void SelectionController::emit(SelectionEventKind kind, std::optional<std::string> object_id)
{
    ORR_CORE_TRACE("Selection: {} {}", selection_event_name(kind), object_id.value_or("-"));
    if (m_listener)
    {
        m_listener(SelectionEvent{kind, std::move(object_id)}, m_state);
    }
}

} // namespace orrery::selection
