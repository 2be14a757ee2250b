/// @file system_viewer.cpp
/// @brief Viewer session wiring.

#include "viewer/system_viewer.hpp"

#include "core/logger.hpp"

#include <utility>

namespace orrery::viewer
{

namespace
{

std::optional<f64> positive(f64 value)
{
    return value > 0.0 ? std::optional<f64>(value) : std::nullopt;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

SystemViewer::SystemViewer(catalog::SystemSource& source,
                           core::TaskQueue& queue,
                           selection::SimulationClock& clock,
                           ViewerConfig config)
    : m_config(std::move(config))
    , m_registry(view::ViewModeRegistry::create_builtin())
    , m_resolver(m_registry)
    , m_pipeline(m_resolver, source, queue)
    , m_framing(m_resolver, m_navigator)
    , m_selection(clock, m_config.pause_fallback_seconds)
{
    const view::ViewModeConfig& initial = m_registry.get_config(m_config.initial_view_mode);
    if (!m_registry.has(m_config.initial_view_mode))
    {
        ORR_WARN("Unknown initial view mode '{}', using '{}'", m_config.initial_view_mode, initial.id);
    }
    m_view_mode = initial.id;
    m_selection.set_hierarchical_navigation(initial.hierarchical_navigation);
    m_pipeline.set_system_scale(m_config.system_scale);

    ORR_INFO("SystemViewer ready (mode '{}', {} view modes)", m_view_mode, m_registry.ids().size());
}

// -----------------------------------------------------------------
// System loading
// -----------------------------------------------------------------

void SystemViewer::load_system(const std::string& system_id, LoadCallback done)
{
    // Fresh data for the target system must not be satisfied from old entries
    m_pipeline.invalidate(system_id);

    // A newer load supersedes the pending one; its callback is never invoked
    m_pending_load = PendingLoad{.system_id = system_id, .done = std::move(done)};
    issue_pending_load();
}

void SystemViewer::issue_pending_load()
{
    ORR_INFO("Loading system '{}' in mode '{}'", m_pending_load->system_id, m_view_mode);
    m_pipeline.load_and_calculate(m_pending_load->system_id, m_view_mode,
                                  [this](const scaling::CalculationOutcome& outcome) {
        LoadCallback done;
        if (m_pending_load.has_value())
        {
            done = std::move(m_pending_load->done);
            m_pending_load.reset();
        }

        if (!outcome.ok())
        {
            ORR_ERROR("Could not load system '{}': {}", outcome.system_id, outcome.error);
            if (done)
            {
                done(false, outcome.error);
            }
            return;
        }

        const bool switched = !m_active_system.has_value() || *m_active_system != outcome.system_id;
        apply_mechanics(outcome);
        if (switched)
        {
            show_overview();
        }
        else
        {
            reframe();
        }

        ORR_INFO("System '{}' loaded: {} objects", outcome.system_id, outcome.objects.size());
        if (done)
        {
            done(true, {});
        }
    });
}

void SystemViewer::apply_mechanics(const scaling::CalculationOutcome& outcome)
{
    if (!m_active_system.has_value() || *m_active_system != outcome.system_id)
    {
        m_selection.on_system_changed();
        m_active_system = outcome.system_id;
    }

    m_navigator.set_objects(outcome.objects);
    m_placements = outcome.result;
    m_scene.rebuild_linear_layout(m_navigator.objects(), m_placements);

    for (const auto& object : m_navigator.objects())
    {
        if (const scene::SceneNode* node = m_scene.node(object.id))
        {
            m_selection.register_object(object.id, node->ref);
        }
    }
}

// -----------------------------------------------------------------
// View modes
// -----------------------------------------------------------------

void SystemViewer::set_view_mode(std::string_view mode)
{
    const view::ViewModeConfig& config = m_registry.get_config(mode);
    if (!m_registry.has(mode))
    {
        ORR_WARN("Unknown view mode '{}', using '{}'", mode, config.id);
    }
    if (config.id == m_view_mode)
    {
        return;
    }

    m_view_mode = config.id;
    m_selection.set_hierarchical_navigation(config.hierarchical_navigation);
    ORR_INFO("View mode -> '{}'", m_view_mode);

    // The pending load is reissued in the new mode so the system switch still lands
    if (m_pending_load.has_value())
    {
        issue_pending_load();
        return;
    }
    if (!m_active_system.has_value())
    {
        return;
    }

    m_pipeline.calculate(*m_active_system, m_navigator.objects(), m_view_mode,
                         [this](const scaling::CalculationOutcome& outcome) {
        apply_mechanics(outcome);
        reframe();
    });
}

// -----------------------------------------------------------------
// Sizing and framing
// -----------------------------------------------------------------

ObjectSizing SystemViewer::get_object_sizing(std::string_view object_id) const
{
    auto it = m_placements.find(std::string(object_id));
    if (it == m_placements.end())
    {
        // Accept display names as well as ids
        if (const catalog::CelestialObject* object = m_navigator.find(object_id))
        {
            it = m_placements.find(object->id);
        }
    }
    if (it == m_placements.end())
    {
        return ObjectSizing{};
    }
    return ObjectSizing{.visual_size = it->second.visual_radius};
}

camera::PositionLookup SystemViewer::position_lookup() const
{
    return [this](std::string_view id) { return m_scene.world_position_of(id); };
}

camera::CameraFramingTarget SystemViewer::frame(std::string_view focal_id) const
{
    return frame(focal_id, m_view_mode);
}

camera::CameraFramingTarget SystemViewer::frame(std::string_view focal_id, std::string_view mode) const
{
    return m_framing.frame(focal_id, mode, position_lookup(), m_config.system_scale);
}

// -----------------------------------------------------------------
// Focus and navigation
// -----------------------------------------------------------------

bool SystemViewer::focus_object(std::string_view object_id)
{
    const catalog::CelestialObject* object = m_navigator.find(object_id);
    if (object == nullptr)
    {
        ORR_WARN("focus_object: unknown object '{}'", object_id);
        return false;
    }

    const SceneRef ref = m_selection.ref_of(object->id).value_or(0);
    const selection::SelectOutcome outcome = m_selection.select(object->id, ref, object->name, object);
    if (outcome != selection::SelectOutcome::NewSelection)
    {
        return true;
    }

    ORR_INFO("Focusing '{}' ({})", object->name,
             object->classification.has_value() ? catalog::classification_name(*object->classification)
                                                : "unclassified");
    m_selection.focus(ref, object->name, selection::FocusMetadata{
        .visual_size  = get_object_sizing(object->id).visual_size,
        .radius       = positive(object->properties.radius),
        .mass         = positive(object->properties.mass),
        .orbit_radius = object->has_orbit_data() ? std::optional<f64>(object->orbit_radius()) : std::nullopt,
    });

    animate_to(frame(object->id), mode_config().camera.animation.focus_duration);
    return true;
}

bool SystemViewer::focus_ref(SceneRef ref)
{
    const std::optional<std::string> id = m_scene.id_of(ref);
    if (!id.has_value())
    {
        ORR_WARN("focus_ref: no scene node with ref {}", ref);
        return false;
    }
    return focus_object(*id);
}

void SystemViewer::show_overview()
{
    const camera::CameraFramingTarget target = m_framing.frame_overview(m_view_mode, m_scene.max_extent());
    animate_to(target, mode_config().camera.animation.birds_eye_duration);
}

bool SystemViewer::back()
{
    if (!m_selection.back())
    {
        return false;
    }
    reframe();
    return true;
}

void SystemViewer::stop_following()
{
    m_selection.stop_following();
}

void SystemViewer::hover(std::optional<std::string_view> object_id)
{
    m_selection.hover(object_id);
}

void SystemViewer::reframe()
{
    const auto& selected = m_selection.state().view.selected_id;
    if (selected.has_value() && m_navigator.find(*selected) != nullptr)
    {
        animate_to(frame(*selected), mode_config().camera.animation.focus_duration);
    }
    else
    {
        show_overview();
    }
}

void SystemViewer::animate_to(const camera::CameraFramingTarget& target, f64 duration_ms)
{
    m_last_target = target;
    // animation_complete() is a no-op unless a select() pause is outstanding
    m_animator.start(target, duration_ms, mode_config().camera.animation.easing,
                     [this]() { m_selection.animation_complete(); });
}

void SystemViewer::tick(f64 dt_seconds)
{
    m_animator.tick(dt_seconds);
    m_selection.update(dt_seconds);
}

} // namespace orrery::viewer
