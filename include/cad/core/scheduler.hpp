#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>

#include <dpp/timer.h>

namespace dpp {
class cluster;
}

namespace cad {

/// Delayed, cancellable one-shot tasks. Reconnect backoff, connect
/// timeouts and idle timeouts all go through here so that tests can drive
/// time by hand.
class scheduler {
public:
    using task_id = std::uint64_t;
    using clock   = std::chrono::steady_clock;

    virtual ~scheduler() = default;

    // Returns a non-zero id usable with cancel().
    virtual task_id schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;

    // Cancelling an unknown or already fired id is a no-op.
    virtual void cancel(task_id id) = 0;

    virtual clock::time_point now() const { return clock::now(); }
};

/// Scheduler backed by D++ cluster timers. D++ ticks in whole seconds, so
/// delays are rounded up to the next second and a zero delay waits one
/// second. Callers must not rely on a shorter delay.
class dpp_scheduler : public scheduler {
public:
    explicit dpp_scheduler(dpp::cluster& cluster);
    ~dpp_scheduler() override;

    // Timer period used for `delay`: whole seconds, never less than one.
    static std::uint64_t timer_seconds(std::chrono::milliseconds delay);

    task_id schedule(std::chrono::milliseconds delay, std::function<void()> task) override;
    void cancel(task_id id) override;

private:
    dpp::cluster& m_cluster;

    std::mutex m_mutex;
    task_id    m_next_id = 1;
    std::unordered_map<task_id, dpp::timer> m_timers;
};

} // namespace cad
