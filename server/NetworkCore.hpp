#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "Worker.hpp"
#include "../common/ByteBuffer.hpp"
#include "../common/protocol.hpp"

namespace net_watch::server
{
    struct ClientContext
    {
        int socketfd = -1;
        uint64_t connection_id = 0;
        SSL *ssl_handle = nullptr;
        net_watch::common::ByteBuffer buff;
        bool is_handshake_complete = false;
        bool request_dispatched = false;
        std::string outbox;
        size_t out_offset = 0;
    };

    // epoll loop serving one HTTP request per connection. Requests are
    // handed to Workers; their responses come back through QueueResponse
    // and an eventfd wakeup.
    class NetworkCore : public ResponseSink
    {
    private:
        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        int m_port;
        std::atomic<bool> m_running;
        std::map<int, ClientContext> registry;
        std::unordered_map<uint64_t, int> m_fd_by_connection;
        uint64_t m_next_connection_id;

        std::string m_cert_path;
        std::string m_key_path;
        SSL_CTX *m_ssl_ctx;

        std::vector<Worker *> m_workers;
        size_t m_next_worker;

        std::mutex m_pending_mutex;
        std::vector<std::pair<uint64_t, net_watch::protocol::Response>> m_pending_responses;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd, uint32_t events);
        void EpollControlModify(int fd, uint32_t events);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd, uint32_t events);
        void HandleWakeup();

        bool ContinueHandshake(ClientContext &ctx);
        bool ReadAvailable(ClientContext &ctx);
        void TryDispatch(ClientContext &ctx);
        void StartResponse(ClientContext &ctx, const net_watch::protocol::Response &response);
        void FlushOutbox(int fd);

    public:
        explicit NetworkCore(int port, std::string tls_cert = "", std::string tls_key = "");

        ~NetworkCore() override;

        NetworkCore(const NetworkCore &) = delete;
        NetworkCore &operator=(const NetworkCore &) = delete;

        void AddWorker(Worker *worker);

        void Init();
        void Run();

        // Safe to call from other threads and from a signal handler.
        void Stop();

        void QueueResponse(uint64_t connection_id, net_watch::protocol::Response response) override;

        int Port() const { return m_port; }
        bool TlsEnabled() const { return m_ssl_ctx != nullptr; }
    };
}
