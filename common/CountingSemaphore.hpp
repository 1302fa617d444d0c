#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace netsweep::common
{
    class CountingSemaphore
    {
    public:
        explicit CountingSemaphore(std::size_t slots) : m_available(slots), m_capacity(slots) {}

        CountingSemaphore(const CountingSemaphore &) = delete;
        CountingSemaphore &operator=(const CountingSemaphore &) = delete;

        void Acquire()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return m_available > 0; });
            --m_available;
        }

        bool TryAcquireFor(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_cv.wait_for(lock, timeout, [this]
                               { return m_available > 0; }))
                return false;
            --m_available;
            return true;
        }

        void Release()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_available < m_capacity)
                    ++m_available;
            }
            m_cv.notify_one();
        }

        std::size_t Available() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_available;
        }

        std::size_t Capacity() const { return m_capacity; }

    private:
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::size_t m_available;
        const std::size_t m_capacity;
    };
}
