#include "WorkerPool.hpp"
#include "../common/Log.hpp"

#include <stdexcept>
#include <system_error>

namespace net_watch::probe
{
    WorkerPool::WorkerPool(size_t width)
    {
        if (width == 0)
            throw std::invalid_argument("WorkerPool width must be positive");

        m_threads.reserve(width);
        try
        {
            for (size_t i = 0; i < width; ++i)
            {
                m_threads.emplace_back(&WorkerPool::ProcessLoop, this);
            }
        }
        catch (const std::system_error &e)
        {
            common::LogError("WorkerPool", "Started " + std::to_string(m_threads.size()) + " of " +
                                               std::to_string(width) + " threads: " + e.what());
            m_jobs.Close();
            for (auto &t : m_threads)
                t.join();
            throw;
        }
    }

    WorkerPool::~WorkerPool()
    {
        m_jobs.Close();
        for (auto &t : m_threads)
        {
            if (t.joinable())
                t.join();
        }
    }

    void WorkerPool::Submit(Job job)
    {
        m_jobs.Push(std::move(job));
    }

    void WorkerPool::Wait()
    {
        m_jobs.WaitIdle();
    }

    void WorkerPool::ProcessLoop()
    {
        while (true)
        {
            std::optional<Job> job = m_jobs.Pop();
            if (!job.has_value())
                break;

            try
            {
                (*job)();
            }
            catch (const std::exception &e)
            {
                common::LogError("WorkerPool", std::string("Job failed: ") + e.what());
            }
            catch (...)
            {
                common::LogError("WorkerPool", "Job failed with a non-standard exception");
            }
            m_jobs.Done();
        }
    }
}
