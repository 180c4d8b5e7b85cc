#pragma once

#include <thread>
#include <atomic>
#include <cstdint>
#include "../common/WorkQueue.hpp"
#include "../common/protocol.hpp"

namespace net_watch::server
{
    class Router;

    // Receives finished responses; implemented by NetworkCore.
    class ResponseSink
    {
    public:
        virtual ~ResponseSink() = default;
        virtual void QueueResponse(uint64_t connection_id, net_watch::protocol::Response response) = 0;
    };

    struct Job
    {
        uint64_t connection_id;
        net_watch::protocol::Request request;
    };

    class Worker
    {
    private:
        std::thread worker_thread_;
        net_watch::common::WorkQueue<Job> jobs_;
        std::atomic<bool> running_;

        Router &router_;
        ResponseSink *response_sink_;

        void ProcessLoop();

    public:
        explicit Worker(Router &router);
        ~Worker();

        Worker(const Worker &) = delete;
        Worker &operator=(const Worker &) = delete;

        void Start();

        // Finishes queued jobs, then joins the thread.
        void Stop();

        void SetResponseSink(ResponseSink *sink) { response_sink_ = sink; }

        void AddJob(uint64_t connection_id, net_watch::protocol::Request request);
    };
}
