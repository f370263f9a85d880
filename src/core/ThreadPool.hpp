#pragma once

/**
 * ThreadPool.hpp
 *
 * Fixed-size thread pool used as the scheduling context for background
 * download dispatches (recovered tasks, CLI batch submissions).
 */

#include "Logger.hpp"

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <stdexcept>
#include <type_traits>

namespace aniflow::core {

/**
 * ThreadPool - FIFO thread pool
 *
 * Jobs run in submission order on the first free worker. A job that
 * throws is logged and its exception is stored in the returned future.
 * The destructor drains the queue before joining the workers.
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 0)
        : m_stop(false), m_activeJobs(0) {

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4;
        }

        m_workers.reserve(numThreads);

        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] {
                workerLoop();
            });
        }
    }

    /**
     * Destructor - waits for all queued jobs to complete
     */
    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Submit a job for execution
     * @param f Callable to execute
     * @return Future for the result
     * @throws std::runtime_error if the pool is shutting down
     */
    template<class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto job = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = job->get_future();

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped ThreadPool");
            }

            m_jobs.emplace([job]() { (*job)(); });
        }

        m_condition.notify_one();
        return result;
    }

    /**
     * Get number of worker threads
     */
    size_t size() const {
        return m_workers.size();
    }

    /**
     * Get number of queued jobs not yet picked up by a worker
     */
    size_t pendingJobs() const {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        return m_jobs.size();
    }

    /**
     * Get number of jobs currently running
     */
    size_t activeJobs() const {
        return m_activeJobs.load();
    }

    /**
     * Block until the queue is empty and no job is running
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_idleCondition.wait(lock, [this] {
            return m_jobs.empty() && m_activeJobs == 0;
        });
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> job;

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);

                m_condition.wait(lock, [this] {
                    return m_stop || !m_jobs.empty();
                });

                if (m_stop && m_jobs.empty()) {
                    return;
                }

                job = std::move(m_jobs.front());
                m_jobs.pop();
                ++m_activeJobs;
            }

            // packaged_task stores the job's own exceptions in its future;
            // anything escaping here comes from the pool machinery itself
            try {
                job();
            } catch (const std::exception& e) {
                Logger::instance().error("ThreadPool job error: {}", e.what());
            }

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                --m_activeJobs;
                if (m_jobs.empty() && m_activeJobs == 0) {
                    m_idleCondition.notify_all();
                }
            }
        }
    }

private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    bool m_stop;
    std::atomic<size_t> m_activeJobs;
};

} // namespace aniflow::core
