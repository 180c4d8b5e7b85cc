#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>

namespace net_watch::common
{
    // Blocking FIFO that also counts unfinished items. Every item returned
    // by Pop must be acknowledged with Done; WaitIdle returns once all
    // pushed items have been acknowledged.
    template <typename T>
    class WorkQueue
    {
    private:
        std::queue<T> m_items;
        mutable std::mutex m_mutex;
        std::condition_variable m_ready_cv;
        std::condition_variable m_idle_cv;
        size_t m_unfinished = 0;
        bool m_closed = false;

    public:
        void Push(T item)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_items.push(std::move(item));
                ++m_unfinished;
            }
            m_ready_cv.notify_one();
        }

        // nullopt once the queue is closed and empty.
        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_ready_cv.wait(lock, [this]
                            { return !m_items.empty() || m_closed; });

            if (m_items.empty())
                return std::nullopt;

            T item = std::move(m_items.front());
            m_items.pop();
            return item;
        }

        void Done()
        {
            bool idle = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_unfinished > 0)
                    idle = (--m_unfinished == 0);
            }
            if (idle)
                m_idle_cv.notify_all();
        }

        void WaitIdle()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_idle_cv.wait(lock, [this]
                           { return m_unfinished == 0; });
        }

        void Close()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_ready_cv.notify_all();
        }
    };
}
