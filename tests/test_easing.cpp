/// @file test_easing.cpp
/// @brief Unit tests for the camera easing curves.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "view/view_mode_config.hpp"

using namespace orrery;
using namespace orrery::view;

static constexpr EasingFunction kAll[] = {
    EasingFunction::Linear, EasingFunction::EaseOut, EasingFunction::EaseInOut, EasingFunction::Leap,
};

TEST_CASE("Every curve starts at 0 and ends at 1")
{
    for (const auto easing : kAll)
    {
        CAPTURE(easing_name(easing));
        CHECK(apply_easing(easing, 0.0) == doctest::Approx(0.0));
        CHECK(apply_easing(easing, 1.0) == doctest::Approx(1.0));
    }
}

TEST_CASE("Inputs outside [0, 1] are clamped")
{
    for (const auto easing : kAll)
    {
        CAPTURE(easing_name(easing));
        CHECK(apply_easing(easing, -0.5) == doctest::Approx(0.0));
        CHECK(apply_easing(easing, 3.0) == doctest::Approx(1.0));
    }
}

TEST_CASE("Every curve is monotonic")
{
    for (const auto easing : kAll)
    {
        CAPTURE(easing_name(easing));
        f64 previous = 0.0;
        for (int i = 1; i <= 100; ++i)
        {
            const f64 value = apply_easing(easing, i / 100.0);
            CHECK(value >= previous - 1e-12);
            previous = value;
        }
    }
}

TEST_CASE("Reference values")
{
    CHECK(apply_easing(EasingFunction::Linear, 0.25) == doctest::Approx(0.25));
    CHECK(apply_easing(EasingFunction::EaseOut, 0.5) == doctest::Approx(0.875));
    CHECK(apply_easing(EasingFunction::EaseInOut, 0.25) == doctest::Approx(0.125));
    CHECK(apply_easing(EasingFunction::EaseInOut, 0.5) == doctest::Approx(0.5));
    CHECK(apply_easing(EasingFunction::EaseInOut, 0.75) == doctest::Approx(0.9375));
}

TEST_CASE("Leap reaches a third of the way at 30% of the time")
{
    CHECK(apply_easing(EasingFunction::Leap, 0.3) == doctest::Approx(0.33));
    CHECK(apply_easing(EasingFunction::Leap, 0.15) == doctest::Approx(0.0825));
}

TEST_CASE("Easing names round-trip and unknown names default to easeOut")
{
    for (const auto easing : kAll)
    {
        CHECK((parse_easing(easing_name(easing)) == easing));
    }
    CHECK((parse_easing("bounce") == EasingFunction::EaseOut));
    CHECK((parse_easing("") == EasingFunction::EaseOut));
}
