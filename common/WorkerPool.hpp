#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "ThreadSafeQueue.hpp"

namespace axe_fleet::common
{
    // Fixed number of threads pulling jobs from one shared queue.
    class WorkerPool
    {
    public:
        using Job = std::function<void()>;

        explicit WorkerPool(std::size_t workers);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        void Start();
        // Lets queued jobs finish, then joins every thread.
        void Stop();

        bool Submit(Job job);
        // Blocks until every submitted job has run.
        void Wait();

        std::size_t WorkerCount() const { return m_worker_count; }

    private:
        void ProcessLoop();

        std::size_t m_worker_count;
        std::vector<std::thread> m_threads;
        ThreadSafeQueue<Job> m_jobs;
        std::atomic<bool> m_running;

        std::mutex m_idle_mutex;
        std::condition_variable m_idle_cv;
        std::size_t m_outstanding = 0;
    };

    // Runs work(i) for i in [0, count) on at most max_parallel threads. Once
    // *cancel is set, items that have not started go to skipped(i) instead.
    void ForEachBounded(std::size_t count,
                        std::size_t max_parallel,
                        const std::function<void(std::size_t)> &work,
                        const std::function<void(std::size_t)> &skipped = nullptr,
                        const std::atomic<bool> *cancel = nullptr);
}
