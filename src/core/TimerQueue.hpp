#pragma once

/**
 * TimerQueue.hpp
 *
 * Cancelable delayed execution. Retry backoff is the only wait in the
 * transfer core, and it must never block the thread that drives state
 * transitions, so waits are expressed as timers that fire a callback.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace courier::core {

/**
 * Handle to a scheduled callback. A default-constructed handle refers to
 * nothing.
 */
struct TimerHandle {
    uint64_t id{0};

    bool valid() const { return id != 0; }

    bool operator==(const TimerHandle& other) const { return id == other.id; }
    bool operator!=(const TimerHandle& other) const { return id != other.id; }
};

/**
 * DelayScheduler - runs a callback once after a delay
 */
class DelayScheduler {
public:
    virtual ~DelayScheduler() = default;

    /**
     * Schedule a callback
     * @param delay Time to wait before running the callback
     * @param callback Callback to run
     * @return Handle usable with cancel()
     */
    virtual TimerHandle schedule(std::chrono::milliseconds delay,
                                 std::function<void()> callback) = 0;

    /**
     * Cancel a pending callback
     * @return true if the callback was pending and will now never run
     */
    virtual bool cancel(TimerHandle handle) = 0;

    /**
     * Discard pending callbacks and wait for a running one to return.
     * Later schedule() calls return an invalid handle.
     */
    virtual void stop() = 0;
};

/**
 * TimerQueue - DelayScheduler backed by a single timer thread
 *
 * Callbacks run on the timer thread in deadline order; callbacks with
 * equal deadlines run in scheduling order. The queue may be destroyed
 * from one of its own callbacks: the thread then detaches and exits on
 * its own, since it shares ownership of the timer state.
 */
class TimerQueue : public DelayScheduler {
public:
    TimerQueue();
    ~TimerQueue() override;

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerHandle schedule(std::chrono::milliseconds delay,
                         std::function<void()> callback) override;

    bool cancel(TimerHandle handle) override;

    /**
     * Get number of timers that have not fired or been canceled
     */
    size_t pendingCount() const;

    /**
     * Stop the timer thread. Pending callbacks are discarded; a callback
     * that is running is waited for, unless stop() is called from it.
     */
    void stop() override;

private:
    using Clock = std::chrono::steady_clock;
    using Key = std::pair<Clock::time_point, uint64_t>;

    struct State {
        std::mutex mutex;
        std::condition_variable condition;
        std::map<Key, std::function<void()>> timers;
        std::unordered_map<uint64_t, Clock::time_point> deadlines;
        uint64_t nextId{1};
        bool stopping{false};
    };

    static void run(const std::shared_ptr<State>& state);

    std::shared_ptr<State> m_state;
    std::mutex m_threadMutex;
    std::thread m_thread;
};

} // namespace courier::core
