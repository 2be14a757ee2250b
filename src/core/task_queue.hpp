#pragma once

/// @file task_queue.hpp
/// @brief Single-threaded cooperative task queue (the viewer's event loop).

#include "core/types.hpp"

#include <deque>
#include <functional>

namespace orrery::core
{
    /// @brief FIFO of deferred callbacks drained from the UI thread.
    ///
    /// Asynchronous collaborators (the system loader, the mechanics pipeline)
    /// complete by posting a task. Nothing here is thread-safe: post() and the
    /// run functions must all be called from the same thread.
    class TaskQueue
    {
    public:
        using Task = std::function<void()>;

        TaskQueue() = default;

        TaskQueue(const TaskQueue&) = delete;
        TaskQueue& operator=(const TaskQueue&) = delete;

        /// @brief Enqueue a task to run on a later drain.
        void post(Task task);

        /// @brief Run the tasks that were queued before this call.
        ///
        /// Tasks posted while draining are left for the next call, so a task
        /// that re-posts itself cannot starve the frame.
        /// @return Number of tasks executed.
        u32 run_pending();

        /// @brief Drain repeatedly until the queue is empty.
        /// @param max_rounds Upper bound on drain rounds (guards self-reposting tasks).
        /// @return Number of tasks executed.
        u32 run_until_idle(u32 max_rounds = kDefaultMaxRounds);

        [[nodiscard]] bool empty() const { return m_tasks.empty(); }
        [[nodiscard]] std::size_t pending() const { return m_tasks.size(); }

    private:
        static constexpr u32 kDefaultMaxRounds = 1000;

        std::deque<Task> m_tasks;
    };

} // namespace orrery::core
