#include "WorkerPool.hpp"
#include <algorithm>
#include <iostream>

namespace axe_fleet::common
{
    WorkerPool::WorkerPool(std::size_t workers)
        : m_worker_count(std::max<std::size_t>(1, workers)), m_running(false)
    {
    }

    WorkerPool::~WorkerPool()
    {
        Stop();
    }

    void WorkerPool::Start()
    {
        if (m_running)
            return;
        m_running = true;

        m_threads.reserve(m_worker_count);
        for (std::size_t i = 0; i < m_worker_count; ++i)
        {
            m_threads.emplace_back(&WorkerPool::ProcessLoop, this);
        }
    }

    void WorkerPool::Stop()
    {
        if (!m_running)
            return;

        m_running = false;
        m_jobs.Shutdown();

        for (auto &t : m_threads)
        {
            if (t.joinable())
                t.join();
        }
        m_threads.clear();
    }

    bool WorkerPool::Submit(Job job)
    {
        {
            std::lock_guard<std::mutex> lock(m_idle_mutex);
            ++m_outstanding;
        }

        if (!m_jobs.Push(std::move(job)))
        {
            std::lock_guard<std::mutex> lock(m_idle_mutex);
            --m_outstanding;
            m_idle_cv.notify_all();
            return false;
        }
        return true;
    }

    void WorkerPool::Wait()
    {
        std::unique_lock<std::mutex> lock(m_idle_mutex);
        m_idle_cv.wait(lock, [this]
                       { return m_outstanding == 0; });
    }

    void WorkerPool::ProcessLoop()
    {
        while (true)
        {
            auto job = m_jobs.Pop();
            if (!job.has_value())
                break;

            try
            {
                (*job)();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[WorkerPool] Error processing job: " << e.what() << "\n";
            }

            {
                std::lock_guard<std::mutex> lock(m_idle_mutex);
                --m_outstanding;
            }
            m_idle_cv.notify_all();
        }
    }

    void ForEachBounded(std::size_t count,
                        std::size_t max_parallel,
                        const std::function<void(std::size_t)> &work,
                        const std::function<void(std::size_t)> &skipped,
                        const std::atomic<bool> *cancel)
    {
        if (count == 0)
            return;

        WorkerPool pool(std::min(count, std::max<std::size_t>(1, max_parallel)));
        pool.Start();

        for (std::size_t i = 0; i < count; ++i)
        {
            pool.Submit([i, &work, &skipped, cancel]()
                        {
                            if (cancel && cancel->load())
                            {
                                if (skipped)
                                    skipped(i);
                                return;
                            }
                            work(i); });
        }

        pool.Wait();
        pool.Stop();
    }
}
