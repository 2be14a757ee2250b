// src/main.cpp - Orrery headless viewer session
//
// Demonstrates the scaling / framing / selection core:
//  1. Load the built-in Sol system
//  2. Compare visual sizes across view modes
//  3. Frame Jupiter with its moons and Mercury on its own
//  4. Run a select -> animate -> complete cycle
//  5. Switch to profile mode and drill down / back

#include "catalog/builtin_systems.hpp"
#include "core/logger.hpp"
#include "core/task_queue.hpp"
#include "selection/simulation_clock.hpp"
#include "viewer/system_viewer.hpp"

#include <string>

using namespace orrery;

namespace
{

constexpr f64 kFrameSeconds = 1.0 / 60.0;

/// Drive the event loop and per-frame updates until the camera settles.
void run_frames(core::TaskQueue& queue, viewer::SystemViewer& session, selection::SteppedClock& clock, u32 frames)
{
    for (u32 i = 0; i < frames; ++i)
    {
        queue.run_pending();
        session.tick(kFrameSeconds);
        clock.advance(kFrameSeconds);
    }
}

void log_target(const char* label, const camera::CameraFramingTarget& t)
{
    ORR_INFO("  {:<10} {:<14} center ({:.2f}, {:.2f}, {:.2f})  span {:.2f}  distance {:.2f}",
             label, camera::framing_kind_name(t.kind),
             t.layout_midpoint.x, t.layout_midpoint.y, t.layout_midpoint.z,
             t.layout_span, t.distance);
}

} // anonymous namespace

int main()
{
    core::Logger::init(core::LoggerConfig{
        .file_path     = "orrery.log",
        .console_level = spdlog::level::info,
    });
    ORR_INFO("================================================================");
    ORR_INFO("  ORRERY v0.1 - Star system scaling and framing session");
    ORR_INFO("================================================================");

    core::TaskQueue queue;
    catalog::BuiltinSystemSource source(queue);
    selection::SteppedClock clock(/*days_per_second=*/10.0);

    viewer::SystemViewer session(source, queue, clock, viewer::ViewerConfig{
        .initial_view_mode      = "explorational",
        .system_scale           = 1.0,
        .pause_fallback_seconds = 3.0,
    });

    // -----------------------------------------------------------------------
    // 1. Load Sol
    // -----------------------------------------------------------------------
    bool loaded = false;
    session.load_system("sol", [&](bool ok, const std::string& error) {
        loaded = ok;
        if (!ok)
        {
            ORR_ERROR("Load failed: {}", error);
        }
    });
    queue.run_until_idle();
    if (!loaded)
    {
        core::Logger::shutdown();
        return 1;
    }

    // -----------------------------------------------------------------------
    // 2. Earth across view modes
    // -----------------------------------------------------------------------
    ORR_INFO("Earth across view modes:");
    for (const auto& mode : session.registry().ids())
    {
        session.set_view_mode(mode);
        queue.run_until_idle();

        const f64 size = session.get_object_sizing("earth").visual_size;
        const f64 ratio = session.frame("earth").distance / size;
        ORR_INFO("  {:<14} visual {:.3f}  orbit {:.2f}  earth frame/size {:.2f}",
                 mode, size, session.placements().at("earth").orbit_distance, ratio);
    }

    // -----------------------------------------------------------------------
    // 3. Framing
    // -----------------------------------------------------------------------
    session.set_view_mode("explorational");
    queue.run_until_idle();

    ORR_INFO("Framing in '{}':", session.view_mode());
    log_target("Jupiter", session.frame("jupiter"));
    log_target("Mercury", session.frame("mercury"));
    log_target("Sun", session.frame("sol"));
    log_target("Pluto", session.frame("pluto"));

    // -----------------------------------------------------------------------
    // 4. Select -> animate -> complete
    // -----------------------------------------------------------------------
    session.focus_object("Jupiter");
    ORR_INFO("Focused Jupiter: clock {}", clock.is_paused() ? "paused" : "running");
    run_frames(queue, session, clock, 120);
    ORR_INFO("After animation: clock {}, camera at ({:.2f}, {:.2f}, {:.2f})",
             clock.is_paused() ? "paused" : "running",
             session.animator().pose().position.x,
             session.animator().pose().position.y,
             session.animator().pose().position.z);

    // -----------------------------------------------------------------------
    // 5. Profile mode drill-down
    // -----------------------------------------------------------------------
    session.set_view_mode("profile");
    run_frames(queue, session, clock, 60);
    session.focus_object("sol");
    run_frames(queue, session, clock, 60);
    session.focus_object("saturn");
    run_frames(queue, session, clock, 60);
    ORR_INFO("Drilled into '{}', breadcrumb {}",
             session.selection_state().view.selected_id.value_or("-"),
             session.selection().can_go_back() ? "available" : "none");
    session.back();
    run_frames(queue, session, clock, 60);
    ORR_INFO("Back at '{}' after {:.1f} simulated days",
             session.selection_state().view.selected_id.value_or("-"), clock.days());

    core::Logger::shutdown();
    return 0;
}
