/// @file camera_animator.cpp
/// @brief Camera transition state machine.

#include "camera/camera_animator.hpp"

#include "core/logger.hpp"

#include <glm/common.hpp>

#include <algorithm>
#include <utility>

namespace orrery::camera
{

void CameraAnimator::start(const CameraFramingTarget& target,
                           f64 duration_ms,
                           view::EasingFunction easing,
                           CompletionCallback on_complete)
{
    start(CameraPose{.position = target.camera_position, .look_at = target.look_at},
          duration_ms, easing, std::move(on_complete));
}

void CameraAnimator::start(const CameraPose& destination,
                           f64 duration_ms,
                           view::EasingFunction easing,
                           CompletionCallback on_complete)
{
    if (m_state == AnimationState::Animating)
    {
        ORR_CORE_TRACE("CameraAnimator: superseding animation at {:.0f}%", progress() * 100.0);
    }

    m_from        = m_pose;
    m_to          = destination;
    m_elapsed_ms  = 0.0;
    m_duration_ms = duration_ms;
    m_easing      = easing;
    m_on_complete = std::move(on_complete);
    m_state       = AnimationState::Animating;

    if (!(duration_ms > 0.0))
    {
        complete();
    }
}

void CameraAnimator::tick(f64 dt_seconds)
{
    if (m_state != AnimationState::Animating || dt_seconds <= 0.0)
    {
        return;
    }

    m_elapsed_ms += dt_seconds * 1000.0;
    if (m_elapsed_ms >= m_duration_ms)
    {
        complete();
        return;
    }

    const f64 eased = view::apply_easing(m_easing, progress());
    m_pose.position = glm::mix(m_from.position, m_to.position, eased);
    m_pose.look_at  = glm::mix(m_from.look_at, m_to.look_at, eased);
}

void CameraAnimator::cancel()
{
    if (m_state == AnimationState::Animating)
    {
        m_state = AnimationState::Framed;
        m_on_complete = nullptr;
    }
}

f64 CameraAnimator::progress() const
{
    if (m_state != AnimationState::Animating || m_duration_ms <= 0.0)
    {
        return 1.0;
    }
    return std::clamp(m_elapsed_ms / m_duration_ms, 0.0, 1.0);
}

void CameraAnimator::complete()
{
    m_pose  = m_to;
    m_state = AnimationState::Framed;

    // Move out first: the callback may start another animation
    CompletionCallback callback = std::move(m_on_complete);
    m_on_complete = nullptr;
    if (callback)
    {
        callback();
    }
}

} // namespace orrery::camera
