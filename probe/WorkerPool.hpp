#pragma once

#include <functional>
#include <thread>
#include <vector>
#include "../common/WorkQueue.hpp"

namespace net_watch::probe
{
    // Fixed number of threads draining a shared job queue. At most Width()
    // jobs run at any moment.
    class WorkerPool
    {
    public:
        using Job = std::function<void()>;

        explicit WorkerPool(size_t width);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        void Submit(Job job);

        // Blocks until every submitted job has finished.
        void Wait();

        size_t Width() const { return m_threads.size(); }

    private:
        void ProcessLoop();

        std::vector<std::thread> m_threads;
        common::WorkQueue<Job> m_jobs;
    };
}
