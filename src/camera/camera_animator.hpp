#pragma once

/// @file camera_animator.hpp
/// @brief Eased interpolation of the camera towards a framing target.

#include "camera/camera_framing.hpp"
#include "core/types.hpp"
#include "view/view_mode_config.hpp"

#include <functional>

namespace orrery::camera
{
    enum class AnimationState : u8
    {
        Idle,        ///< Nothing framed yet
        Animating,   ///< Interpolating towards m_to
        Framed,      ///< Resting on the last target
    };

    struct CameraPose
    {
        Vec3d position{0.0, 0.0, 1.0};
        Vec3d look_at{0.0};
    };

    /// @brief Per-frame camera transition driver.
    ///
    /// A start() during an animation cancels it and begins a new one from the
    /// current interpolated pose; the superseded completion callback is dropped.
    /// The active callback fires exactly once, when the animation reaches its end.
    class CameraAnimator
    {
    public:
        using CompletionCallback = std::function<void()>;

        CameraAnimator() = default;

        /// @param duration_ms Non-positive durations snap and complete immediately.
        void start(const CameraFramingTarget& target,
                   f64 duration_ms,
                   view::EasingFunction easing,
                   CompletionCallback on_complete = {});

        void start(const CameraPose& destination,
                   f64 duration_ms,
                   view::EasingFunction easing,
                   CompletionCallback on_complete = {});

        /// @brief Advance by `dt_seconds` of wall time.
        void tick(f64 dt_seconds);

        /// @brief Stop where the camera is; the pending callback is discarded.
        void cancel();

        [[nodiscard]] AnimationState state() const { return m_state; }
        [[nodiscard]] bool is_animating() const { return m_state == AnimationState::Animating; }
        [[nodiscard]] const CameraPose& pose() const { return m_pose; }
        [[nodiscard]] const CameraPose& destination() const { return m_to; }

        /// @brief Linear progress in [0, 1] of the current animation (1 when not animating).
        [[nodiscard]] f64 progress() const;

    private:
        void complete();

        AnimationState m_state = AnimationState::Idle;
        CameraPose m_pose;
        CameraPose m_from;
        CameraPose m_to;

        f64 m_elapsed_ms  = 0.0;
        f64 m_duration_ms = 0.0;
        view::EasingFunction m_easing = view::EasingFunction::EaseOut;
        CompletionCallback m_on_complete;
    };

} // namespace orrery::camera
