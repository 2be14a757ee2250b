/// @file task_queue.cpp
/// @brief Cooperative task queue implementation.

#include "core/task_queue.hpp"

#include "core/logger.hpp"

#include <utility>

namespace orrery::core
{

void TaskQueue::post(Task task)
{
    if (!task)
    {
        return;
    }
    m_tasks.push_back(std::move(task));
}

u32 TaskQueue::run_pending()
{
    // Snapshot the current batch; tasks posted during execution wait a round
    std::deque<Task> batch;
    batch.swap(m_tasks);

    u32 executed = 0;
    while (!batch.empty())
    {
        Task task = std::move(batch.front());
        batch.pop_front();
        task();
        ++executed;
    }
    return executed;
}

u32 TaskQueue::run_until_idle(u32 max_rounds)
{
    u32 executed = 0;
    for (u32 round = 0; round < max_rounds && !m_tasks.empty(); ++round)
    {
        executed += run_pending();
    }

    if (!m_tasks.empty())
    {
        ORR_CORE_WARN("TaskQueue: {} task(s) still pending after {} rounds",
                      m_tasks.size(), max_rounds);
    }
    return executed;
}

} // namespace orrery::core
