#pragma once

/**
 * ThreadPool.hpp
 *
 * Fixed set of workers serving one FIFO job queue. Used for event
 * dispatch and for running transfers.
 */

#include "Logger.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace courier::core {

/**
 * ThreadPool - fire-and-forget jobs on named workers
 *
 * Jobs still queued at destruction are run before the workers exit.
 * An exception escaping a job is logged with the pool's name.
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     * @param name Label used in log messages
     */
    explicit ThreadPool(size_t numThreads, std::string name = "pool")
        : m_name(std::move(name)) {

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 2;
        }

        m_workers.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_wakeup.notify_all();

        for (auto& worker : m_workers) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a job
     * @return false if the pool is stopping and the job was not queued
     */
    bool post(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                return false;
            }
            m_jobs.push(std::move(job));
        }
        m_wakeup.notify_one();
        return true;
    }

    size_t size() const { return m_workers.size(); }

    const std::string& name() const { return m_name; }

private:
    void workerLoop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wakeup.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
                if (m_jobs.empty()) {
                    return;
                }
                job = std::move(m_jobs.front());
                m_jobs.pop();
            }

            try {
                job();
            } catch (const std::exception& e) {
                Logger::instance().error("[{}] job failed: {}", m_name, e.what());
            }
        }
    }

    const std::string m_name;

    std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::queue<std::function<void()>> m_jobs;
    bool m_stopping{false};

    std::vector<std::thread> m_workers;
};

} // namespace courier::core
