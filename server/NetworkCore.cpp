#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <netinet/in.h>

#include "NetworkCore.hpp"
#include "../common/Log.hpp"

namespace net_watch::server
{

    void NetworkCore::LogOpenSSLErrors()
    {
        unsigned long err;
        while ((err = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            common::LogError("Server", std::string("OpenSSL: ") + buf);
        }
    }

    void NetworkCore::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        {
            throw std::runtime_error("Failed to set O_NONBLOCK.");
        }
    }

    void NetworkCore::EpollControlAdd(int fd, uint32_t events)
    {
        struct epoll_event event;

        std::memset(&event, 0, sizeof(event));

        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void NetworkCore::EpollControlModify(int fd, uint32_t events)
    {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));
        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1)
        {
            common::LogError("Server", "Warning: Failed to modify FD in epoll");
        }
    }

    void NetworkCore::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            common::LogError("Server", "Warning: Failed to remove FD from epoll");
        }
    }

    void NetworkCore::DisconnectClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        EpollControlRemove(fd);
        if (it->second.ssl_handle)
        {
            SSL_shutdown(it->second.ssl_handle);
            SSL_free(it->second.ssl_handle);
        }
        close(fd);
        m_fd_by_connection.erase(it->second.connection_id);
        registry.erase(it);
    }

    void NetworkCore::HandleNewConnection()
    {
        while (true)
        {
            struct sockaddr_storage clientAddress;
            socklen_t clientAddressLength = sizeof(clientAddress);
            int client_fd = accept(m_server_fd, reinterpret_cast<struct sockaddr *>(&clientAddress), &clientAddressLength);
            if (client_fd == -1)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    return;
                common::LogError("Server", std::string("accept failed: ") + std::strerror(errno));
                return;
            }

            NonBlockingMode(client_fd);

            ClientContext &ctx = registry[client_fd];
            ctx.socketfd = client_fd;
            ctx.connection_id = m_next_connection_id++;
            m_fd_by_connection[ctx.connection_id] = client_fd;

            if (m_ssl_ctx)
            {
                SSL *ssl_handle = SSL_new(m_ssl_ctx);
                if (!ssl_handle)
                {
                    LogOpenSSLErrors();
                    m_fd_by_connection.erase(ctx.connection_id);
                    registry.erase(client_fd);
                    close(client_fd);
                    continue;
                }
                SSL_set_fd(ssl_handle, client_fd);
                ctx.ssl_handle = ssl_handle;
            }
            else
            {
                ctx.is_handshake_complete = true;
            }

            EpollControlAdd(client_fd, EPOLLIN);
            common::LogDebug("Server", "New connection accepted: " + std::to_string(client_fd));

            if (ctx.ssl_handle && !ContinueHandshake(ctx))
            {
                DisconnectClient(client_fd);
            }
        }
    }

    // Returns false if the handshake failed for good.
    bool NetworkCore::ContinueHandshake(ClientContext &ctx)
    {
        int ret = SSL_accept(ctx.ssl_handle);
        if (ret == 1)
        {
            ctx.is_handshake_complete = true;
            common::LogDebug("Server", "TLS Handshake complete for client " + std::to_string(ctx.socketfd));
            return true;
        }

        int err = SSL_get_error(ctx.ssl_handle, ret);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            return true;

        common::LogError("Server", "SSL Handshake Failed. Error: " + std::to_string(err));
        LogOpenSSLErrors();
        return false;
    }

    // Returns false if the peer closed or the read failed.
    bool NetworkCore::ReadAvailable(ClientContext &ctx)
    {
        uint8_t temp_buffer[4096];

        while (true)
        {
            if (ctx.ssl_handle)
            {
                int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));
                if (count > 0)
                {
                    ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                    continue;
                }

                int err = SSL_get_error(ctx.ssl_handle, count);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    return true;
                return false;
            }

            ssize_t count = recv(ctx.socketfd, temp_buffer, sizeof(temp_buffer), 0);
            if (count > 0)
            {
                ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                continue;
            }
            if (count == 0)
                return false;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return true;
            if (errno == EINTR)
                continue;
            return false;
        }
    }

    void NetworkCore::TryDispatch(ClientContext &ctx)
    {
        using net_watch::protocol::Response;

        try
        {
            if (!ctx.buff.HasHeader())
            {
                if (ctx.buff.Size() > net_watch::protocol::MAX_HEAD_LENGTH)
                {
                    throw net_watch::protocol::ParseError(413, "Request head too large");
                }
                return;
            }

            auto head = ctx.buff.PeekHeader();
            if (!ctx.buff.HasCompleteMessage(head))
                return;

            net_watch::protocol::Request request = ctx.buff.ExtractRequest(head);
            ctx.buff.Consume(head.head_length + head.content_length);
            ctx.request_dispatched = true;

            if (m_workers.empty())
            {
                StartResponse(ctx, Response{500, "application/json", "{\"error\":\"no workers\"}"});
                return;
            }

            Worker *worker = m_workers[m_next_worker++ % m_workers.size()];
            worker->AddJob(ctx.connection_id, std::move(request));

            // Input is ignored until the response is written; only errors
            // and hangups are still reported.
            EpollControlModify(ctx.socketfd, 0);
        }
        catch (const net_watch::protocol::ParseError &e)
        {
            common::LogInfo("Server", std::string("Rejected request: ") + e.what());
            ctx.request_dispatched = true;
            Response response;
            response.status = e.Status();
            response.body = std::string("{\"error\":\"") + net_watch::protocol::ReasonPhrase(e.Status()) + "\"}";
            StartResponse(ctx, response);
        }
    }

    void NetworkCore::HandleClientData(int fd, uint32_t events)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;
        ClientContext &ctx = it->second;

        if (!ctx.outbox.empty() && (events & EPOLLOUT))
        {
            FlushOutbox(fd);
            return;
        }

        if (ctx.request_dispatched)
        {
            if (events & (EPOLLERR | EPOLLHUP))
                DisconnectClient(fd);
            return;
        }

        if (!ctx.is_handshake_complete)
        {
            if (!ContinueHandshake(ctx))
            {
                DisconnectClient(fd);
                return;
            }
            if (!ctx.is_handshake_complete)
                return;
        }

        bool open = ReadAvailable(ctx);
        TryDispatch(ctx);

        // TryDispatch may have answered and closed the connection already.
        auto after = registry.find(fd);
        if (after == registry.end())
            return;

        // A peer that half-closed after a complete request still gets its
        // response.
        if (!open && !after->second.request_dispatched)
        {
            DisconnectClient(fd);
        }
    }

    void NetworkCore::StartResponse(ClientContext &ctx, const net_watch::protocol::Response &response)
    {
        ctx.outbox = net_watch::protocol::SerializeResponse(response);
        ctx.out_offset = 0;
        FlushOutbox(ctx.socketfd);
    }

    void NetworkCore::FlushOutbox(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;
        ClientContext &ctx = it->second;

        while (ctx.out_offset < ctx.outbox.size())
        {
            const char *data = ctx.outbox.data() + ctx.out_offset;
            size_t remaining = ctx.outbox.size() - ctx.out_offset;

            if (ctx.ssl_handle)
            {
                int written = SSL_write(ctx.ssl_handle, data, static_cast<int>(remaining));
                if (written > 0)
                {
                    ctx.out_offset += static_cast<size_t>(written);
                    continue;
                }
                int err = SSL_get_error(ctx.ssl_handle, written);
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                {
                    EpollControlModify(fd, EPOLLOUT);
                    return;
                }
                DisconnectClient(fd);
                return;
            }

            ssize_t written = send(fd, data, remaining, MSG_NOSIGNAL);
            if (written >= 0)
            {
                ctx.out_offset += static_cast<size_t>(written);
                continue;
            }
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                EpollControlModify(fd, EPOLLOUT);
                return;
            }
            DisconnectClient(fd);
            return;
        }

        DisconnectClient(fd);
    }

    void NetworkCore::HandleWakeup()
    {
        uint64_t counter = 0;
        if (read(m_wake_fd, &counter, sizeof(counter)) < 0 && errno != EAGAIN)
        {
            common::LogError("Server", std::string("eventfd read failed: ") + std::strerror(errno));
        }

        std::vector<std::pair<uint64_t, net_watch::protocol::Response>> ready;
        {
            std::lock_guard<std::mutex> lock(m_pending_mutex);
            ready.swap(m_pending_responses);
        }

        for (auto &entry : ready)
        {
            auto fd_it = m_fd_by_connection.find(entry.first);
            if (fd_it == m_fd_by_connection.end())
            {
                common::LogDebug("Server", "Dropping response for closed connection " + std::to_string(entry.first));
                continue;
            }
            StartResponse(registry[fd_it->second], entry.second);
        }
    }

    void NetworkCore::QueueResponse(uint64_t connection_id, net_watch::protocol::Response response)
    {
        {
            std::lock_guard<std::mutex> lock(m_pending_mutex);
            m_pending_responses.emplace_back(connection_id, std::move(response));
        }
        uint64_t one = 1;
        if (write(m_wake_fd, &one, sizeof(one)) < 0)
        {
            common::LogError("Server", std::string("eventfd write failed: ") + std::strerror(errno));
        }
    }

    NetworkCore::NetworkCore(int port, std::string tls_cert, std::string tls_key)
    {
        m_port = port;
        m_server_fd = -1;
        m_epoll_fd = -1;
        m_wake_fd = -1;
        m_running = false;
        m_next_connection_id = 1;
        m_cert_path = std::move(tls_cert);
        m_key_path = std::move(tls_key);
        m_ssl_ctx = nullptr;
        m_next_worker = 0;
    }

    NetworkCore::~NetworkCore()
    {

        for (auto &it : registry)
        {
            if (it.second.ssl_handle)
                SSL_free(it.second.ssl_handle);
            close(it.first);
        }
        registry.clear();

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void NetworkCore::AddWorker(Worker *worker)
    {
        if (worker)
        {
            worker->SetResponseSink(this);
            m_workers.push_back(worker);
        }
    }

    void NetworkCore::Init()
    {
        if (!m_cert_path.empty() || !m_key_path.empty())
        {
            m_ssl_ctx = SSL_CTX_new(TLS_server_method());
            if (m_ssl_ctx == nullptr)
            {
                throw std::runtime_error("Failed to create SSL Context. Is OpenSSL installed?");
            }

            SSL_CTX_set_mode(m_ssl_ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

            if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to load '" + m_cert_path + "'. Check your paths!");
            }

            if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
            {
                LogOpenSSLErrors();
                throw std::runtime_error("Failed to load '" + m_key_path + "'.");
            }

            if (!SSL_CTX_check_private_key(m_ssl_ctx))
            {
                throw std::runtime_error("Private Key does not match the Certificate!");
            }
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(static_cast<uint16_t>(m_port));
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, (struct sockaddr *)&serverAddress, sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind server socket. Is the port taken?");
        }

        socklen_t addressLength = sizeof(serverAddress);
        if (getsockname(m_server_fd, (struct sockaddr *)&serverAddress, &addressLength) == 0)
        {
            m_port = ntohs(serverAddress.sin_port);
        }

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen server socket.");
        }

        m_epoll_fd = epoll_create1(EPOLL_CLOEXEC);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        m_wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create eventfd.");
        }

        EpollControlAdd(m_server_fd, EPOLLIN);
        EpollControlAdd(m_wake_fd, EPOLLIN);

        m_running = true;
    }

    void NetworkCore::Stop()
    {
        m_running = false;
        if (m_wake_fd != -1)
        {
            // No logging here: Stop may run inside a signal handler. A full
            // counter already guarantees a pending wakeup.
            uint64_t one = 1;
            if (write(m_wake_fd, &one, sizeof(one)) < 0)
                return;
        }
    }

    void NetworkCore::Run()
    {

        common::LogInfo("Server", std::string("Listening on port ") + std::to_string(m_port) +
                                      (m_ssl_ctx ? " (HTTPS)" : " (HTTP)"));

        struct epoll_event ev[128];
        int count = 0;
        while (m_running)
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, -1)) == -1)
            {
                if (errno == EINTR)
                    continue;
                else
                    break;
            }

            for (int i = 0; i < count; i++)
            {
                int m_current_fd = ev[i].data.fd;
                if (m_current_fd == m_server_fd)
                    HandleNewConnection();
                else if (m_current_fd == m_wake_fd)
                    HandleWakeup();
                else
                    HandleClientData(m_current_fd, ev[i].events);
            }
        }

        common::LogInfo("Server", "Stopped");
    }
}
