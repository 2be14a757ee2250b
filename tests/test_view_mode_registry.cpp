/// @file test_view_mode_registry.cpp
/// @brief Unit tests for orrery::view::ViewModeRegistry.
///
/// Verifies the built-in modes, unknown-mode fallback, registration rules
/// and configuration validation.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "view/view_mode_registry.hpp"

#include <algorithm>
#include <string>

using namespace orrery;
using namespace orrery::view;

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
// Built-in modes
// =================================================================

TEST_CASE("Built-in registry holds the five modes in order")
{
    const auto registry = ViewModeRegistry::create_builtin();
    const auto& ids = registry.ids();

    REQUIRE(ids.size() == 5);
    CHECK(ids[0] == "explorational");
    CHECK(ids[1] == "navigational");
    CHECK(ids[2] == "profile");
    CHECK(ids[3] == "scientific");
    CHECK(ids[4] == "cinematic");
}

TEST_CASE("Every built-in mode passes validation")
{
    for (const auto& config : {explorational_mode(), navigational_mode(), profile_mode(),
                               scientific_mode(), cinematic_mode()})
    {
        CAPTURE(config.id);
        const auto validation = ViewModeRegistry::validate(config);
        CHECK(validation.is_valid());
        CHECK(validation.warnings.empty());
    }
}

TEST_CASE("Explorational camera tunables")
{
    const auto registry = ViewModeRegistry::create_builtin();
    const auto& cam = registry.get_config("explorational").camera;

    CHECK(cam.radius_multiplier == doctest::Approx(4.0));
    CHECK(cam.min_distance_multiplier == doctest::Approx(2.5));
    CHECK(cam.max_distance_multiplier == doctest::Approx(15.0));
    CHECK(cam.layout_multiplier == doctest::Approx(1.2));
    CHECK(cam.single_object_fallback_distance == doctest::Approx(15.0));
}

TEST_CASE("Only profile is diagrammatic with hierarchical navigation")
{
    const auto registry = ViewModeRegistry::create_builtin();
    for (const auto& id : registry.ids())
    {
        CAPTURE(id);
        const auto& config = registry.get_config(id);
        CHECK(config.diagrammatic == (id == "profile"));
        CHECK(config.hierarchical_navigation == (id == "profile"));
    }
}

// =================================================================
// Lookup
// =================================================================

TEST_CASE("Unknown mode names fall back to explorational")
{
    const auto registry = ViewModeRegistry::create_builtin();

    CHECK(registry.get_config("does-not-exist").id == "explorational");
    CHECK(registry.get_config("").id == "explorational");
    CHECK_FALSE(registry.has("does-not-exist"));
    CHECK(registry.has("profile"));
}

TEST_CASE("Empty registry still answers with the explorational config")
{
    const ViewModeRegistry registry;
    CHECK(registry.ids().empty());
    CHECK(registry.get_config("profile").id == "explorational");
}

TEST_CASE("Lookup is case-sensitive on mode ids")
{
    const auto registry = ViewModeRegistry::create_builtin();
    CHECK(registry.get_config("Profile").id == "explorational");
}

// =================================================================
// Registration
// =================================================================

TEST_CASE("Duplicate registration is rejected unless replacing")
{
    auto registry = ViewModeRegistry::create_builtin();

    auto custom = profile_mode();
    custom.orbit_scaling_factor = 0.5;

    CHECK_FALSE(registry.register_mode(custom));
    CHECK(registry.get_config("profile").orbit_scaling_factor == doctest::Approx(0.3));

    CHECK(registry.register_mode(custom, /*replace=*/true));
    CHECK(registry.get_config("profile").orbit_scaling_factor == doctest::Approx(0.5));
    CHECK(registry.ids().size() == 5);
}

TEST_CASE("New modes are appended and resolvable")
{
    auto registry = ViewModeRegistry::create_builtin();

    auto overview = explorational_mode();
    overview.id   = "overview";
    overview.name = "Overview";
    REQUIRE(registry.register_mode(overview));

    CHECK(registry.ids().back() == "overview");
    CHECK(registry.get_config("overview").name == "Overview");
}

TEST_CASE("Invalid modes are not registered")
{
    auto registry = ViewModeRegistry::create_builtin();

    auto broken = explorational_mode();
    broken.id = "broken";
    broken.object_scaling.moon = 0.0;

    CHECK_FALSE(registry.register_mode(broken));
    CHECK_FALSE(registry.has("broken"));
}

// =================================================================
// Validation
// =================================================================

TEST_CASE("Validation catches each camera invariant")
{
    auto config = explorational_mode();

    SUBCASE("max multiplier must exceed min multiplier")
    {
        config.camera.max_distance_multiplier = config.camera.min_distance_multiplier;
        CHECK_FALSE(ViewModeRegistry::validate(config).is_valid());
    }
    SUBCASE("absolute max must exceed absolute min")
    {
        config.camera.absolute_max_distance = 0.1;
        CHECK_FALSE(ViewModeRegistry::validate(config).is_valid());
    }
    SUBCASE("visual size range must be non-empty")
    {
        config.max_visual_size = config.min_visual_size;
        CHECK_FALSE(ViewModeRegistry::validate(config).is_valid());
    }
    SUBCASE("negative durations are rejected")
    {
        config.camera.animation.focus_duration = -1.0;
        CHECK_FALSE(ViewModeRegistry::validate(config).is_valid());
    }
    SUBCASE("empty id is rejected")
    {
        config.id.clear();
        CHECK_FALSE(ViewModeRegistry::validate(config).is_valid());
    }
}

TEST_CASE("Radius multiplier outside the distance band only warns")
{
    auto config = explorational_mode();
    config.camera.radius_multiplier = 20.0;

    const auto validation = ViewModeRegistry::validate(config);
    CHECK(validation.is_valid());
    CHECK(validation.warnings.size() == 1);
}

TEST_CASE("Diagram spacing must respect the per-child span bound")
{
    auto config = profile_mode();

    SUBCASE("base spacing at the bound")
    {
        config.equidistant_spacing.base_spacing = kDiagramSpanPerChild;
        CHECK_FALSE(ViewModeRegistry::validate(config).is_valid());
    }
    SUBCASE("multiplier growth beyond the bound")
    {
        config.equidistant_spacing.base_spacing       = 3.0;
        config.equidistant_spacing.spacing_multiplier = 2.0;
        CHECK_FALSE(ViewModeRegistry::validate(config).is_valid());
    }
    SUBCASE("small spacing is valid")
    {
        config.equidistant_spacing.base_spacing       = 0.5;
        config.equidistant_spacing.spacing_multiplier = 1.0;
        const auto validation = ViewModeRegistry::validate(config);
        CHECK(validation.is_valid());
        // 0.5 cannot separate two bodies of max_visual_size 1.5
        CHECK_FALSE(validation.warnings.empty());
    }
    SUBCASE("non-diagrammatic modes ignore spacing")
    {
        config.diagrammatic = false;
        config.equidistant_spacing.base_spacing = 50.0;
        CHECK(ViewModeRegistry::validate(config).is_valid());
    }
}
