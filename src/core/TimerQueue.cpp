/**
 * TimerQueue.cpp
 *
 * Single-threaded timer wheel for retry backoff.
 */

#include "TimerQueue.hpp"
#include "Logger.hpp"

namespace courier::core {

TimerQueue::TimerQueue()
    : m_state(std::make_shared<State>())
    , m_thread([state = m_state] { run(state); }) {
}

TimerQueue::~TimerQueue() {
    stop();

    std::lock_guard<std::mutex> lock(m_threadMutex);
    if (m_thread.joinable()) {
        // Destroyed from a callback; the thread still owns the state
        m_thread.detach();
    }
}

TimerHandle TimerQueue::schedule(std::chrono::milliseconds delay,
                                 std::function<void()> callback) {
    TimerHandle handle;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->stopping) {
            Logger::instance().warn("Timer scheduled after shutdown; ignoring");
            return handle;
        }

        handle.id = m_state->nextId++;
        auto deadline = Clock::now() + delay;
        m_state->timers.emplace(Key{deadline, handle.id}, std::move(callback));
        m_state->deadlines.emplace(handle.id, deadline);
    }

    m_state->condition.notify_one();
    return handle;
}

bool TimerQueue::cancel(TimerHandle handle) {
    std::lock_guard<std::mutex> lock(m_state->mutex);

    auto it = m_state->deadlines.find(handle.id);
    if (it == m_state->deadlines.end()) {
        return false;
    }

    m_state->timers.erase(Key{it->second, handle.id});
    m_state->deadlines.erase(it);
    return true;
}

size_t TimerQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->timers.size();
}

void TimerQueue::stop() {
    std::map<Key, std::function<void()>> discarded;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopping = true;
        discarded.swap(m_state->timers);
        m_state->deadlines.clear();
    }
    m_state->condition.notify_all();

    // Callbacks may own the last reference to their targets; release them unlocked
    discarded.clear();

    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_threadMutex);
        if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
            worker = std::move(m_thread);
        }
    }
    if (worker.joinable()) {
        worker.join();
    }
}

void TimerQueue::run(const std::shared_ptr<State>& state) {
    std::unique_lock<std::mutex> lock(state->mutex);

    while (!state->stopping) {
        if (state->timers.empty()) {
            state->condition.wait(lock);
            continue;
        }

        auto next = state->timers.begin();
        if (Clock::now() < next->first.first) {
            state->condition.wait_until(lock, next->first.first);
            continue;
        }

        auto callback = std::move(next->second);
        state->deadlines.erase(next->first.second);
        state->timers.erase(next);

        // Callbacks may schedule or cancel timers, or destroy the queue
        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            Logger::instance().error("Timer callback failed: {}", e.what());
        }
        callback = nullptr;
        lock.lock();
    }
}

} // namespace courier::core
