#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include "protocol.hpp"

namespace net_watch::common
{

    // Accumulates raw bytes read from a connection until a complete HTTP
    // request (head plus Content-Length body) is available.
    class ByteBuffer
    {
    private:
        std::string m_buffer;

    public:
        ByteBuffer() = default;
        void Append(const uint8_t *data, size_t size);
        bool HasHeader() const;
        net_watch::protocol::RequestHead PeekHeader() const;
        bool HasCompleteMessage(const net_watch::protocol::RequestHead &head) const;
        net_watch::protocol::Request ExtractRequest(const net_watch::protocol::RequestHead &head) const;
        void Consume(size_t bytes);
        size_t Size() const { return m_buffer.size(); }
    };

}
