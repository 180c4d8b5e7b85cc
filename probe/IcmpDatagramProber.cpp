#include "IcmpDatagramProber.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <tins/tins.h>

#include <cerrno>
#include <cstring>
#include <random>
#include <vector>

namespace net_watch::probe
{
    namespace
    {
        class SocketHandle
        {
        public:
            explicit SocketHandle(int fd) : m_fd(fd) {}
            ~SocketHandle()
            {
                if (m_fd >= 0)
                    ::close(m_fd);
            }
            SocketHandle(const SocketHandle &) = delete;
            SocketHandle &operator=(const SocketHandle &) = delete;

            int Get() const { return m_fd; }
            bool Valid() const { return m_fd >= 0; }

        private:
            int m_fd;
        };

        int OpenPingSocket()
        {
            return ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
        }

        std::vector<uint8_t> MakeToken(uint16_t sequence)
        {
            static thread_local std::mt19937 rng{std::random_device{}()};
            std::string text = "netwatch:" + std::to_string(sequence) + ":" + std::to_string(rng());
            return std::vector<uint8_t>(text.begin(), text.end());
        }

        bool IsUnreachableErrno(int err)
        {
            return err == ENETUNREACH || err == EHOSTUNREACH || err == ECONNREFUSED || err == EHOSTDOWN;
        }
    }

    IcmpDatagramProber::IcmpDatagramProber()
    {
        std::random_device rd;
        m_next_sequence = static_cast<uint16_t>(rd());
    }

    bool IcmpDatagramProber::IsSupported()
    {
        SocketHandle probe(OpenPingSocket());
        return probe.Valid();
    }

    ProbeOutcome IcmpDatagramProber::Probe(const std::string &address, std::chrono::milliseconds timeout)
    {
        sockaddr_in target{};
        target.sin_family = AF_INET;
        if (::inet_pton(AF_INET, address.c_str(), &target.sin_addr) != 1)
        {
            return ProbeOutcome::Down(ProbeStatus::InvalidAddress, "not an IPv4 address: " + address);
        }

        SocketHandle sock(OpenPingSocket());
        if (!sock.Valid())
        {
            return ProbeOutcome::Down(ProbeStatus::ToolError, std::string("socket: ") + std::strerror(errno));
        }

        uint16_t sequence = m_next_sequence++;
        std::vector<uint8_t> token = MakeToken(sequence);

        Tins::PDU::serialization_type packet;
        try
        {
            Tins::ICMP echo(Tins::ICMP::ECHO_REQUEST);
            echo.sequence(sequence);
            Tins::ICMP request = echo / Tins::RawPDU(token.begin(), token.end());
            packet = request.serialize();
        }
        catch (const Tins::exception_base &e)
        {
            return ProbeOutcome::Down(ProbeStatus::ToolError, std::string("packet build: ") + e.what());
        }

        ssize_t sent = ::sendto(sock.Get(), packet.data(), packet.size(), 0,
                                reinterpret_cast<const sockaddr *>(&target), sizeof(target));
        if (sent < 0)
        {
            int err = errno;
            ProbeStatus status = IsUnreachableErrno(err) ? ProbeStatus::Unreachable : ProbeStatus::ToolError;
            return ProbeOutcome::Down(status, std::string("sendto: ") + std::strerror(err));
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        uint8_t buffer[1500];

        while (true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                return ProbeOutcome::Down(ProbeStatus::TimedOut, "no echo reply");
            }

            pollfd pfd{};
            pfd.fd = sock.Get();
            pfd.events = POLLIN;
            int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready == 0)
            {
                return ProbeOutcome::Down(ProbeStatus::TimedOut, "no echo reply");
            }
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                return ProbeOutcome::Down(ProbeStatus::ToolError, std::string("poll: ") + std::strerror(errno));
            }

            sockaddr_in from{};
            socklen_t from_len = sizeof(from);
            ssize_t n = ::recvfrom(sock.Get(), buffer, sizeof(buffer), 0,
                                   reinterpret_cast<sockaddr *>(&from), &from_len);
            if (n < 0)
            {
                int err = errno;
                if (err == EINTR || err == EAGAIN)
                    continue;
                ProbeStatus status = IsUnreachableErrno(err) ? ProbeStatus::Unreachable : ProbeStatus::ToolError;
                return ProbeOutcome::Down(status, std::string("recvfrom: ") + std::strerror(err));
            }

            if (from.sin_addr.s_addr != target.sin_addr.s_addr)
                continue;

            try
            {
                Tins::ICMP reply(buffer, static_cast<uint32_t>(n));
                if (reply.type() != Tins::ICMP::ECHO_REPLY || reply.sequence() != sequence)
                    continue; // keep waiting

                const Tins::RawPDU *inner = reply.find_pdu<Tins::RawPDU>();
                if (inner && inner->payload() == token)
                    return ProbeOutcome::Up();
            }
            catch (const Tins::malformed_packet &)
            {
                continue;
            }
        }
    }
}
