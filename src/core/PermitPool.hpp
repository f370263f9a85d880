#pragma once

/**
 * PermitPool.hpp
 *
 * Fixed-capacity concurrency gate (counting semaphore).
 */

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

namespace aniflow::core {

/**
 * PermitPool - bounds how many callers run a section at once
 *
 * Callers beyond the capacity block in acquire() until a permit is
 * released. Use PermitPool::Guard to hold a permit for a scope.
 */
class PermitPool {
public:
    /**
     * Constructor
     * @param capacity Number of permits, must be positive
     */
    explicit PermitPool(size_t capacity)
        : m_capacity(capacity), m_available(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("PermitPool capacity must be positive");
        }
    }

    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait(lock, [this] { return m_available > 0; });
        --m_available;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_available;
        }
        m_condition.notify_one();
    }

    size_t capacity() const { return m_capacity; }

    size_t available() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_available;
    }

    /**
     * RAII permit holder
     */
    class Guard {
    public:
        explicit Guard(PermitPool& pool) : m_pool(pool) { m_pool.acquire(); }
        ~Guard() { m_pool.release(); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        PermitPool& m_pool;
    };

private:
    const size_t m_capacity;
    size_t m_available;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
};

} // namespace aniflow::core
