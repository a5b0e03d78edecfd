#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace axe_fleet::common
{
    // Multi-producer queue. After Shutdown(), Pop drains what is left and then
    // returns nullopt; Push after Shutdown is dropped.
    template <typename T>
    class ThreadSafeQueue
    {
    private:
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_shutdown = false;

    public:
        bool Push(T value)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_shutdown)
                    return false;
                m_queue.push(std::move(value));
            }
            m_cv.notify_one();
            return true;
        }

        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return !m_queue.empty() || m_shutdown; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        template <typename Rep, typename Period>
        std::optional<T> PopFor(std::chrono::duration<Rep, Period> timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_cv.wait_for(lock, timeout, [this]
                               { return !m_queue.empty() || m_shutdown; }))
                return std::nullopt;

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        std::optional<T> TryPop()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_queue.empty())
                return std::nullopt;
            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        void Shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_shutdown = true;
            }
            m_cv.notify_all();
        }

        bool IsShutdown() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_shutdown;
        }

        bool Empty() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.empty();
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }
    };
}
