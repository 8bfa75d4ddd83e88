#include "cad/core/scheduler.hpp"

#include <dpp/dpp.h>

#include <utility>

namespace cad {

dpp_scheduler::dpp_scheduler(dpp::cluster& cluster)
    : m_cluster(cluster)
{
}

dpp_scheduler::~dpp_scheduler()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, handle] : m_timers) {
        (void)id;
        m_cluster.stop_timer(handle);
    }
    m_timers.clear();
}

std::uint64_t dpp_scheduler::timer_seconds(std::chrono::milliseconds delay)
{
    if (delay.count() <= 1000) {
        return 1;
    }
    return static_cast<std::uint64_t>((delay.count() - 1) / 1000 + 1);
}

// dpp::oneshot_timer touches itself after its callback returns, so it cannot
// be released from inside the callback the way m_timers entries are.
scheduler::task_id dpp_scheduler::schedule(std::chrono::milliseconds delay,
                                           std::function<void()> task)
{
    const std::uint64_t seconds = timer_seconds(delay);

    std::lock_guard<std::mutex> lock(m_mutex);
    const task_id id = m_next_id++;

    // D++ timers repeat; the first tick stops the timer and runs the task once.
    const dpp::timer handle = m_cluster.start_timer(
        [this, id, task = std::move(task)](dpp::timer t) {
            m_cluster.stop_timer(t);
            {
                std::lock_guard<std::mutex> guard(m_mutex);
                if (m_timers.erase(id) == 0) {
                    return; // cancelled between tick and here
                }
            }
            task();
        },
        seconds
    );

    m_timers.emplace(id, handle);
    return id;
}

void dpp_scheduler::cancel(task_id id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_timers.find(id);
    if (it == m_timers.end()) {
        return;
    }
    m_cluster.stop_timer(it->second);
    m_timers.erase(it);
}

} // namespace cad
