#pragma once

/// @file simulation_clock.hpp
/// @brief Pausable simulation time source driven by the selection controller.

#include "core/types.hpp"

namespace orrery::selection
{
    /// @brief Clock interface the selection controller pauses and resumes.
    class SimulationClock
    {
    public:
        virtual ~SimulationClock() = default;

        [[nodiscard]] virtual bool is_paused() const = 0;
        virtual void pause() = 0;
        virtual void unpause() = 0;
    };

    /// @brief Simple clock advancing simulated days at a fixed rate.
    class SteppedClock final : public SimulationClock
    {
    public:
        explicit SteppedClock(f64 days_per_second = 1.0)
            : m_days_per_second(days_per_second)
        {
        }

        [[nodiscard]] bool is_paused() const override { return m_paused; }
        void pause() override { m_paused = true; }
        void unpause() override { m_paused = false; }

        /// @brief Advance by `dt_seconds` of wall time unless paused.
        void advance(f64 dt_seconds)
        {
            if (!m_paused)
            {
                m_days += dt_seconds * m_days_per_second;
            }
        }

        [[nodiscard]] f64 days() const { return m_days; }

    private:
        f64 m_days_per_second;
        f64 m_days = 0.0;
        bool m_paused = false;
    };

} // namespace orrery::selection
