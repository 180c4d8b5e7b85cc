#include "ByteBuffer.hpp"
#include <stdexcept>

namespace net_watch::common
{
    void ByteBuffer::Append(const uint8_t *data, size_t size)
    {
        m_buffer.append(reinterpret_cast<const char *>(data), size);
    }

    bool ByteBuffer::HasHeader() const
    {
        return m_buffer.find(net_watch::protocol::HEAD_TERMINATOR) != std::string::npos;
    }

    net_watch::protocol::RequestHead ByteBuffer::PeekHeader() const
    {
        size_t end = m_buffer.find(net_watch::protocol::HEAD_TERMINATOR);
        if (end == std::string::npos)
            throw std::runtime_error("ByteBuffer::PeekHeader - Not enough bytes");

        size_t head_length = end + net_watch::protocol::HEAD_TERMINATOR.size();
        if (head_length > net_watch::protocol::MAX_HEAD_LENGTH)
            throw net_watch::protocol::ParseError(413, "Request head too large");

        return net_watch::protocol::ParseRequestHead(std::string_view(m_buffer).substr(0, head_length));
    }

    bool ByteBuffer::HasCompleteMessage(const net_watch::protocol::RequestHead &head) const
    {
        if (head.content_length > net_watch::protocol::MAX_BODY_LENGTH) {
            return false;
        }

        return m_buffer.size() >= (head.head_length + head.content_length);
    }

    net_watch::protocol::Request ByteBuffer::ExtractRequest(const net_watch::protocol::RequestHead &head) const
    {
        if (!HasCompleteMessage(head)) {
            throw std::runtime_error("ByteBuffer::ExtractRequest - Buffer underflow");
        }

        net_watch::protocol::Request request;
        request.method = head.method;
        request.headers = head.headers;
        request.body = m_buffer.substr(head.head_length, head.content_length);

        size_t query = head.target.find('?');
        request.path = head.target.substr(0, query);
        if (query != std::string::npos)
            request.query = head.target.substr(query + 1);

        return request;
    }

    void ByteBuffer::Consume(size_t bytes)
    {
        if (bytes > m_buffer.size()) {
             m_buffer.clear();
             return;
        }
        m_buffer.erase(0, bytes);
    }
}
