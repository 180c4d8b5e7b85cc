#include "Worker.hpp"
#include "Router.hpp"
#include "../common/Log.hpp"

namespace net_watch::server
{
    Worker::Worker(Router &router) : running_(false), router_(router), response_sink_(nullptr) {}

    Worker::~Worker()
    {
        Stop();
    }

    void Worker::Start()
    {
        running_ = true;
        worker_thread_ = std::thread(&Worker::ProcessLoop, this);
    }

    void Worker::Stop()
    {
        if (!running_.exchange(false))
            return;

        jobs_.Close();
        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
    }

    void Worker::AddJob(uint64_t connection_id, net_watch::protocol::Request request)
    {
        jobs_.Push({connection_id, std::move(request)});
    }

    void Worker::ProcessLoop()
    {
        while (auto job = jobs_.Pop())
        {
            net_watch::protocol::Response response;
            try
            {
                response = router_.Handle(job->request);
            }
            catch (const std::exception &e)
            {
                common::LogError("Worker", std::string("Error processing request: ") + e.what());
                response.status = 500;
                response.body = "{\"error\":\"internal error\"}";
            }

            common::LogInfo("Worker", std::string(net_watch::protocol::MethodName(job->request.method)) + " " +
                                          job->request.path + " -> " + std::to_string(response.status));

            if (response_sink_)
            {
                response_sink_->QueueResponse(job->connection_id, std::move(response));
            }
            jobs_.Done();
        }
    }
}
