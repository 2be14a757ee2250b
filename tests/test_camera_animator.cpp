/// @file test_camera_animator.cpp
/// @brief Unit tests for orrery::camera::CameraAnimator.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "camera/camera_animator.hpp"
#include "core/logger.hpp"

using namespace orrery;
using namespace orrery::camera;
using orrery::view::EasingFunction;

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

namespace
{

const CameraPose kDestination{.position = Vec3d{10.0, 0.0, 1.0}, .look_at = Vec3d{4.0, 0.0, 0.0}};

} // anonymous namespace

TEST_CASE("Animator starts idle")
{
    const CameraAnimator animator;
    CHECK((animator.state() == AnimationState::Idle));
    CHECK_FALSE(animator.is_animating());
    CHECK(animator.progress() == 1.0);
}

TEST_CASE("Linear animation interpolates and completes exactly once")
{
    CameraAnimator animator;
    int completions = 0;

    animator.start(kDestination, 1000.0, EasingFunction::Linear, [&]() { ++completions; });
    CHECK((animator.state() == AnimationState::Animating));

    animator.tick(0.5);
    CHECK(animator.progress() == doctest::Approx(0.5));
    CHECK(animator.pose().position.x == doctest::Approx(5.0));
    CHECK(animator.pose().look_at.x == doctest::Approx(2.0));
    CHECK(completions == 0);

    animator.tick(0.6);
    CHECK((animator.state() == AnimationState::Framed));
    CHECK(animator.pose().position.x == doctest::Approx(10.0));
    CHECK(completions == 1);

    animator.tick(1.0);
    animator.tick(1.0);
    CHECK(completions == 1);
}

TEST_CASE("Easing shapes the interpolation")
{
    CameraAnimator animator;
    animator.start(kDestination, 1000.0, EasingFunction::EaseOut);
    animator.tick(0.5);
    CHECK(animator.pose().position.x == doctest::Approx(8.75));
}

TEST_CASE("A new request mid-animation restarts from the current pose")
{
    CameraAnimator animator;
    int first = 0;
    int second = 0;

    animator.start(kDestination, 1000.0, EasingFunction::Linear, [&]() { ++first; });
    animator.tick(0.5);
    const Vec3d midway = animator.pose().position;

    const CameraPose back_home{.position = Vec3d{0.0, 0.0, 1.0}, .look_at = Vec3d{0.0}};
    animator.start(back_home, 1000.0, EasingFunction::Linear, [&]() { ++second; });
    CHECK(animator.progress() == 0.0);
    CHECK(animator.pose().position.x == doctest::Approx(midway.x));

    animator.tick(0.5);
    CHECK(animator.pose().position.x == doctest::Approx(midway.x * 0.5));

    animator.tick(1.0);
    CHECK(first == 0);
    CHECK(second == 1);
    CHECK(animator.pose().position.x == doctest::Approx(0.0));
}

TEST_CASE("Non-positive durations snap and complete immediately")
{
    CameraAnimator animator;
    int completions = 0;

    animator.start(kDestination, 0.0, EasingFunction::Leap, [&]() { ++completions; });
    CHECK(completions == 1);
    CHECK((animator.state() == AnimationState::Framed));
    CHECK(animator.pose().position.x == doctest::Approx(10.0));
}

TEST_CASE("cancel stops in place and discards the callback")
{
    CameraAnimator animator;
    int completions = 0;

    animator.start(kDestination, 1000.0, EasingFunction::Linear, [&]() { ++completions; });
    animator.tick(0.25);
    animator.cancel();

    CHECK((animator.state() == AnimationState::Framed));
    CHECK(animator.pose().position.x == doctest::Approx(2.5));

    animator.tick(2.0);
    CHECK(completions == 0);
    CHECK(animator.pose().position.x == doctest::Approx(2.5));
}

TEST_CASE("Framing targets animate to their camera position and look-at")
{
    CameraFramingTarget target;
    target.camera_position = Vec3d{1.0, 2.0, 3.0};
    target.look_at = Vec3d{1.0, 0.0, 0.0};

    CameraAnimator animator;
    animator.start(target, 100.0, EasingFunction::EaseInOut);
    animator.tick(0.2);

    CHECK((animator.state() == AnimationState::Framed));
    CHECK(animator.pose().position.y == doctest::Approx(2.0));
    CHECK(animator.pose().look_at.x == doctest::Approx(1.0));
}

TEST_CASE("A completion callback may start the next animation")
{
    CameraAnimator animator;
    int chained = 0;

    animator.start(kDestination, 100.0, EasingFunction::Linear, [&]() {
        animator.start(CameraPose{}, 100.0, EasingFunction::Linear, [&]() { ++chained; });
    });

    animator.tick(0.2);
    CHECK(animator.is_animating());
    animator.tick(0.2);
    CHECK(chained == 1);
    CHECK_FALSE(animator.is_animating());
}
