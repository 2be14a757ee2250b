/// @file test_system_viewer.cpp
/// @brief Integration tests for orrery::viewer::SystemViewer.
///
/// Drives a viewer over the built-in systems through the task queue:
/// loading, mode switches, focus cycles, drill-down and system switches.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "catalog/builtin_systems.hpp"
#include "core/logger.hpp"
#include "core/task_queue.hpp"
#include "selection/simulation_clock.hpp"
#include "viewer/system_viewer.hpp"

#include <string>
#include <vector>

using namespace orrery;
using namespace orrery::viewer;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    orrery::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    orrery::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helpers
// =================================================================

namespace
{

struct Session
{
    core::TaskQueue queue;
    catalog::BuiltinSystemSource source{queue};
    selection::SteppedClock clock;
    SystemViewer viewer;

    explicit Session(ViewerConfig config = {})
        : viewer(source, queue, clock, std::move(config))
    {
    }

    bool load(const std::string& system_id)
    {
        bool ok = false;
        viewer.load_system(system_id, [&](bool success, const std::string&) { ok = success; });
        queue.run_until_idle();
        return ok;
    }

    void run_seconds(f64 seconds)
    {
        constexpr f64 kStep = 0.05;
        for (f64 t = 0.0; t < seconds; t += kStep)
        {
            queue.run_pending();
            viewer.tick(kStep);
        }
    }
};

} // anonymous namespace

// =================================================================
// Loading
// =================================================================

TEST_CASE("Loading Sol computes placements and registers scene references")
{
    Session s;
    REQUIRE(s.load("sol"));

    REQUIRE(s.viewer.active_system().has_value());
    CHECK(*s.viewer.active_system() == "sol");
    CHECK(s.viewer.placements().size() == 18);
    CHECK(s.viewer.scene().size() == 18);
    CHECK(s.viewer.selection_state().object_refs.size() == 18);
    CHECK((s.viewer.last_target()->kind == camera::FramingKind::Overview));
}

TEST_CASE("Object sizing answers by id or name and defaults to 1.0")
{
    Session s;
    CHECK(s.viewer.get_object_sizing("earth").visual_size == doctest::Approx(1.0));

    REQUIRE(s.load("sol"));
    CHECK(s.viewer.get_object_sizing("earth").visual_size == doctest::Approx(1.8));
    CHECK(s.viewer.get_object_sizing("Moon").visual_size == doctest::Approx(0.273 * 1.8));
    CHECK(s.viewer.get_object_sizing("pluto").visual_size == doctest::Approx(1.0));
    CHECK(s.viewer.get_object_sizing("").visual_size == doctest::Approx(1.0));
}

TEST_CASE("A failed load keeps the previous system and its cached results")
{
    Session s;
    REQUIRE(s.load("sol"));

    std::string error;
    bool called = false;
    s.viewer.load_system("andromeda", [&](bool ok, const std::string& message) {
        called = true;
        CHECK_FALSE(ok);
        error = message;
    });
    s.queue.run_until_idle();

    REQUIRE(called);
    CHECK_FALSE(error.empty());
    CHECK(*s.viewer.active_system() == "sol");
    CHECK(s.viewer.placements().size() == 18);
    CHECK(s.viewer.pipeline().cached("sol", "explorational") != nullptr);
}

TEST_CASE("Only the latest of overlapping loads is applied")
{
    Session s;
    std::vector<std::string> completed;

    s.viewer.load_system("sol", [&](bool, const std::string&) { completed.emplace_back("sol"); });
    s.viewer.load_system("alpha-centauri", [&](bool, const std::string&) { completed.emplace_back("alpha"); });
    s.queue.run_until_idle();

    REQUIRE(completed.size() == 1);
    CHECK(completed[0] == "alpha");
    CHECK(*s.viewer.active_system() == "alpha-centauri");
    CHECK(s.viewer.placements().size() == 4);
}

TEST_CASE("A mode switch during a pending load still switches the system")
{
    Session s;
    REQUIRE(s.load("sol"));

    bool called = false;
    bool succeeded = false;
    s.viewer.load_system("alpha-centauri", [&](bool ok, const std::string&) {
        called = true;
        succeeded = ok;
    });
    CHECK(s.viewer.load_pending());
    s.viewer.set_view_mode("profile");
    s.queue.run_until_idle();

    CHECK(called);
    CHECK(succeeded);
    CHECK_FALSE(s.viewer.load_pending());
    CHECK(*s.viewer.active_system() == "alpha-centauri");
    CHECK(s.viewer.view_mode() == "profile");
    CHECK(s.viewer.placements().size() == 4);
    CHECK(s.viewer.pipeline().cached("alpha-centauri", "profile") != nullptr);
}

TEST_CASE("Switching systems resets selection but leaves other systems cached")
{
    Session s;
    REQUIRE(s.load("sol"));
    REQUIRE(s.viewer.focus_object("jupiter"));
    s.run_seconds(1.0);

    REQUIRE(s.load("alpha-centauri"));

    const auto& state = s.viewer.selection_state();
    CHECK_FALSE(state.view.selected_id.has_value());
    CHECK_FALSE(state.previous.has_value());
    CHECK(state.object_refs.size() == 4);

    const auto* sol   = s.viewer.pipeline().cached("sol", "explorational");
    const auto* alpha = s.viewer.pipeline().cached("alpha-centauri", "explorational");
    REQUIRE(alpha != nullptr);
    CHECK(sol != alpha);
    CHECK(s.viewer.get_object_sizing("jupiter").visual_size == doctest::Approx(1.0));
}

TEST_CASE("Reloading the active system keeps the selection")
{
    Session s;
    REQUIRE(s.load("sol"));
    s.viewer.focus_object("saturn");
    s.run_seconds(1.0);

    REQUIRE(s.load("sol"));
    CHECK(s.viewer.selection_state().view.selected_id == std::optional<std::string>("saturn"));
    CHECK(s.viewer.last_target()->center_id == "saturn");
}

// =================================================================
// View modes
// =================================================================

TEST_CASE("Switching view mode recomputes placements")
{
    Session s;
    REQUIRE(s.load("sol"));

    s.viewer.set_view_mode("profile");
    s.queue.run_until_idle();

    CHECK(s.viewer.view_mode() == "profile");
    CHECK(s.viewer.mode_config().diagrammatic);
    CHECK(s.viewer.placements().at("earth").orbit_distance == doctest::Approx(10.5));
    CHECK(s.viewer.get_object_sizing("earth").visual_size == doctest::Approx(1.0));
    CHECK(s.viewer.selection().hierarchical_navigation());
}

TEST_CASE("Unknown view modes fall back to explorational")
{
    Session s(ViewerConfig{.initial_view_mode = "profile"});
    CHECK(s.viewer.view_mode() == "profile");

    s.viewer.set_view_mode("tourist");
    CHECK(s.viewer.view_mode() == "explorational");
}

TEST_CASE("A mode switch re-frames the focus with the same framing path")
{
    Session s;
    REQUIRE(s.load("sol"));
    s.viewer.focus_object("jupiter");
    s.run_seconds(1.0);

    s.viewer.set_view_mode("profile");
    s.queue.run_until_idle();

    const auto expected = s.viewer.frame("jupiter");
    REQUIRE(s.viewer.last_target().has_value());
    const auto& reframed = *s.viewer.last_target();
    CHECK((reframed.kind == camera::FramingKind::Hierarchy));
    CHECK(reframed.distance == doctest::Approx(expected.distance));
    CHECK(reframed.look_at.x == doctest::Approx(expected.look_at.x));
    CHECK(reframed.camera_position.y == doctest::Approx(expected.camera_position.y));

    s.run_seconds(1.0);
    CHECK(s.viewer.animator().pose().position.x == doctest::Approx(expected.camera_position.x));
}

// =================================================================
// Focus cycle
// =================================================================

TEST_CASE("Focusing pauses the clock until the camera arrives")
{
    Session s;
    REQUIRE(s.load("sol"));

    REQUIRE(s.viewer.focus_object("Jupiter"));
    CHECK(s.clock.is_paused());
    CHECK(s.viewer.animator().is_animating());

    const auto& view = s.viewer.selection_state().view;
    CHECK(view.selected_id == std::optional<std::string>("jupiter"));
    REQUIRE(view.focused_visual_size.has_value());
    CHECK(*view.focused_visual_size == doctest::Approx(s.viewer.get_object_sizing("jupiter").visual_size));
    CHECK(view.focused_ref == s.viewer.selection().ref_of("jupiter"));

    s.run_seconds(1.0);
    CHECK_FALSE(s.clock.is_paused());
    CHECK((s.viewer.animator().state() == camera::AnimationState::Framed));
}

TEST_CASE("Focusing the same object again while paused resumes immediately")
{
    Session s;
    REQUIRE(s.load("sol"));

    s.viewer.focus_object("jupiter");
    REQUIRE(s.clock.is_paused());
    s.viewer.focus_object("jupiter");
    CHECK_FALSE(s.clock.is_paused());
}

TEST_CASE("Focusing an unknown object is rejected")
{
    Session s;
    REQUIRE(s.load("sol"));
    CHECK_FALSE(s.viewer.focus_object("pluto"));
    CHECK_FALSE(s.clock.is_paused());
}

TEST_CASE("Picking a scene reference focuses the object behind it")
{
    Session s;
    REQUIRE(s.load("sol"));

    const auto ref = s.viewer.selection().ref_of("saturn");
    REQUIRE(ref.has_value());
    CHECK(s.viewer.focus_ref(*ref));
    CHECK(s.viewer.selection_state().view.selected_id == std::optional<std::string>("saturn"));
    CHECK(s.viewer.last_target()->center_id == "saturn");

    CHECK_FALSE(s.viewer.focus_ref(9999));
}

TEST_CASE("Profile drill-down and back re-frame the restored object")
{
    Session s;
    REQUIRE(s.load("sol"));
    s.viewer.set_view_mode("profile");
    s.queue.run_until_idle();

    s.viewer.focus_object("sol");
    s.run_seconds(1.0);
    s.viewer.focus_object("saturn");
    s.run_seconds(1.0);
    REQUIRE(s.viewer.selection().can_go_back());

    CHECK(s.viewer.back());
    CHECK(s.viewer.selection_state().view.selected_id == std::optional<std::string>("sol"));
    CHECK(s.viewer.last_target()->center_id == "sol");
    CHECK_FALSE(s.viewer.back());
}

TEST_CASE("Stop following keeps the selection")
{
    Session s;
    REQUIRE(s.load("sol"));
    s.viewer.focus_object("mars");
    s.run_seconds(1.0);

    s.viewer.stop_following();
    const auto& view = s.viewer.selection_state().view;
    CHECK_FALSE(view.focused_ref.has_value());
    CHECK(view.selected_id == std::optional<std::string>("mars"));
}

TEST_CASE("System scale enlarges visual sizes")
{
    Session s(ViewerConfig{.system_scale = 2.0});
    REQUIRE(s.load("sol"));
    CHECK(s.viewer.get_object_sizing("earth").visual_size == doctest::Approx(3.6));
}

// =================================================================
// Framing on the built-in data
// =================================================================

TEST_CASE("Mercury is framed on its own at the fallback distance in every mode")
{
    Session s;
    REQUIRE(s.load("sol"));

    for (const char* mode : {"explorational", "profile", "cinematic"})
    {
        CAPTURE(mode);
        s.viewer.set_view_mode(mode);
        s.queue.run_until_idle();

        const auto target = s.viewer.frame("mercury");
        const auto mercury = s.viewer.scene().world_position_of("mercury");
        REQUIRE(mercury.has_value());

        CHECK((target.kind == camera::FramingKind::SingleObject));
        CHECK(target.center_id == "mercury");
        CHECK(target.distance == doctest::Approx(s.viewer.mode_config().camera.single_object_fallback_distance));
        CHECK(target.look_at.x == doctest::Approx(mercury->x));
    }
}
