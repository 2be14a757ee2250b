/// @file test_hierarchy_navigator.cpp
/// @brief Unit tests for orrery::navigation::HierarchyNavigator.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "catalog/builtin_systems.hpp"
#include "navigation/hierarchy_navigator.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

using namespace orrery;
using namespace orrery::navigation;

namespace
{

HierarchyNavigator sol_navigator()
{
    auto sol = catalog::BuiltinSystemSource::load("sol");
    REQUIRE(sol.has_value());
    return HierarchyNavigator(std::move(*sol));
}

std::vector<std::string> ids(const std::vector<const catalog::CelestialObject*>& objects)
{
    std::vector<std::string> out;
    std::transform(objects.begin(), objects.end(), std::back_inserter(out),
                   [](const catalog::CelestialObject* o) { return o->id; });
    return out;
}

} // anonymous namespace

TEST_CASE("Children are listed in system order")
{
    const auto nav = sol_navigator();
    CHECK(ids(nav.children_of("jupiter")) == std::vector<std::string>{"io", "europa", "ganymede", "callisto"});
}

TEST_CASE("Parents may be referenced by display name in either case")
{
    const auto nav = sol_navigator();

    // Luna names its parent "Earth", Titan names "Saturn"
    CHECK(ids(nav.children_of("earth")) == std::vector<std::string>{"luna"});
    CHECK(ids(nav.children_of("EARTH")) == std::vector<std::string>{"luna"});
    CHECK(ids(nav.children_of("saturn")) == std::vector<std::string>{"enceladus", "titan"});
}

TEST_CASE("Lookups accept ids and names")
{
    const auto nav = sol_navigator();

    REQUIRE(nav.find("Moon") != nullptr);
    CHECK(nav.find("Moon")->id == "luna");
    CHECK(nav.find("luna")->name == "Moon");
    CHECK(nav.find("pluto") == nullptr);
}

TEST_CASE("parent_of resolves one level up")
{
    const auto nav = sol_navigator();

    REQUIRE(nav.parent_of("titan") != nullptr);
    CHECK(nav.parent_of("titan")->id == "saturn");
    REQUIRE(nav.parent_of("earth") != nullptr);
    CHECK(nav.parent_of("earth")->id == "sol");
    CHECK(nav.parent_of("sol") == nullptr);
    CHECK(nav.parent_of("pluto") == nullptr);
}

TEST_CASE("Leaf and unknown objects have no children")
{
    const auto nav = sol_navigator();
    CHECK(nav.children_of("mercury").empty());
    CHECK(nav.children_of("pluto").empty());
    CHECK(nav.children_of("").empty());
}

TEST_CASE("root is the first object without a parent")
{
    const auto nav = sol_navigator();
    REQUIRE(nav.root() != nullptr);
    CHECK(nav.root()->id == "sol");

    const HierarchyNavigator empty;
    CHECK(empty.root() == nullptr);
}

TEST_CASE("Children without orbit distances are still structural children")
{
    catalog::CelestialObject star;
    star.id = "star";
    star.name = "Star";

    catalog::CelestialObject drifter;
    drifter.id = "drifter";
    drifter.name = "Drifter";
    drifter.orbit = catalog::OrbitData{.parent = "Star"};

    const HierarchyNavigator nav({star, drifter});
    CHECK(ids(nav.children_of("star")) == std::vector<std::string>{"drifter"});
    CHECK_FALSE(drifter.has_orbit_data());
}

TEST_CASE("An object never counts as its own child or parent")
{
    catalog::CelestialObject loop;
    loop.id = "loop";
    loop.name = "Loop";
    loop.orbit = catalog::OrbitData{.parent = "loop", .semi_major_axis = 1.0};

    const HierarchyNavigator nav({loop});
    CHECK(nav.children_of("loop").empty());
    CHECK(nav.parent_of("loop") == nullptr);
}
