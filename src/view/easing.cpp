/// @file easing.cpp
/// @brief Camera easing curves.

#include "view/view_mode_config.hpp"

#include <algorithm>
#include <cmath>

namespace orrery::view
{

EasingFunction parse_easing(std::string_view name)
{
    if (name == "linear")    return EasingFunction::Linear;
    if (name == "easeOut")   return EasingFunction::EaseOut;
    if (name == "easeInOut") return EasingFunction::EaseInOut;
    if (name == "leap")      return EasingFunction::Leap;
    return EasingFunction::EaseOut;
}

const char* easing_name(EasingFunction easing)
{
    switch (easing)
    {
        case EasingFunction::Linear:    return "linear";
        case EasingFunction::EaseOut:   return "easeOut";
        case EasingFunction::EaseInOut: return "easeInOut";
        case EasingFunction::Leap:      return "leap";
        default:                        return "easeOut";
    }
}

// -----------------------------------------------------------------
// Curves
//
// easeOut:   1 - (1 - t)^3
// easeInOut: 2t^2 below 0.5, 1 - (2 - 2t)^3 / 2 above
// leap:      quadratic launch to 33% at t = 0.3, then a cubic settle
// -----------------------------------------------------------------

f64 apply_easing(EasingFunction easing, f64 t)
{
    t = std::clamp(t, 0.0, 1.0);

    switch (easing)
    {
        case EasingFunction::Linear:
            return t;

        case EasingFunction::EaseInOut:
            return (t < 0.5) ? 2.0 * t * t
                             : 1.0 - std::pow(-2.0 * t + 2.0, 3.0) / 2.0;

        case EasingFunction::Leap:
        {
            constexpr f64 kLaunchEnd      = 0.3;
            constexpr f64 kLaunchProgress = 0.33;
            if (t < kLaunchEnd)
            {
                const f64 u = t / kLaunchEnd;
                return kLaunchProgress * u * u;
            }
            const f64 settle = (t - kLaunchEnd) / (1.0 - kLaunchEnd);
            return kLaunchProgress + (1.0 - kLaunchProgress) * (1.0 - std::pow(1.0 - settle, 3.0));
        }

        case EasingFunction::EaseOut:
        default:
            return 1.0 - std::pow(1.0 - t, 3.0);
    }
}

} // namespace orrery::view
