#include <gtest/gtest.h>

#include <string>

#include "common/ByteBuffer.hpp"

using namespace net_watch;

namespace
{
    void Feed(common::ByteBuffer &buffer, const std::string &text)
    {
        buffer.Append(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    }
}

TEST(ByteBuffer, WaitsForCompleteHead)
{
    common::ByteBuffer buffer;
    Feed(buffer, "GET /api/devices HTTP/1.1\r\nHost: x\r\n");
    EXPECT_FALSE(buffer.HasHeader());

    Feed(buffer, "\r\n");
    ASSERT_TRUE(buffer.HasHeader());

    auto head = buffer.PeekHeader();
    EXPECT_EQ(protocol::Method::Get, head.method);
    EXPECT_EQ("/api/devices", head.target);
    EXPECT_EQ("x", head.headers.at("host"));
    EXPECT_TRUE(buffer.HasCompleteMessage(head));
}

TEST(ByteBuffer, WaitsForContentLengthBody)
{
    common::ByteBuffer buffer;
    Feed(buffer, "POST /api/devices HTTP/1.1\r\nContent-Type: application/json\r\nContent-Length: 30\r\n\r\n");
    Feed(buffer, "{\"name\":\"NAS\",");

    auto head = buffer.PeekHeader();
    EXPECT_EQ(30u, head.content_length);
    EXPECT_FALSE(buffer.HasCompleteMessage(head));

    Feed(buffer, "\"ip\":\"10.0.0.2\"}");
    ASSERT_TRUE(buffer.HasCompleteMessage(head));

    protocol::Request request = buffer.ExtractRequest(head);
    EXPECT_EQ(protocol::Method::Post, request.method);
    EXPECT_EQ("/api/devices", request.path);
    EXPECT_EQ("{\"name\":\"NAS\",\"ip\":\"10.0.0.2\"}", request.body);

    buffer.Consume(head.head_length + head.content_length);
    EXPECT_EQ(0u, buffer.Size());
}

TEST(ByteBuffer, SplitsQueryFromPath)
{
    common::ByteBuffer buffer;
    Feed(buffer, "DELETE /api/devices/abc?force=1 HTTP/1.1\r\n\r\n");

    auto head = buffer.PeekHeader();
    protocol::Request request = buffer.ExtractRequest(head);
    EXPECT_EQ(protocol::Method::Delete, request.method);
    EXPECT_EQ("/api/devices/abc", request.path);
    EXPECT_EQ("force=1", request.query);
}

TEST(ByteBuffer, MalformedRequestsCarryStatus)
{
    auto status_of = [](const std::string &text) -> int
    {
        common::ByteBuffer buffer;
        buffer.Append(reinterpret_cast<const uint8_t *>(text.data()), text.size());
        try
        {
            buffer.PeekHeader();
        }
        catch (const protocol::ParseError &e)
        {
            return e.Status();
        }
        return 0;
    };

    EXPECT_EQ(400, status_of("GARBAGE\r\n\r\n"));
    EXPECT_EQ(400, status_of("GET nopath HTTP/1.1\r\n\r\n"));
    EXPECT_EQ(505, status_of("GET / HTTP/2.0\r\n\r\n"));
    EXPECT_EQ(501, status_of("BREW /pot HTTP/1.1\r\n\r\n"));
    EXPECT_EQ(400, status_of("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n"));
    EXPECT_EQ(400, status_of("POST / HTTP/1.1\r\nContent-Length: ten\r\n\r\n"));
    EXPECT_EQ(413, status_of("POST / HTTP/1.1\r\nContent-Length: 99999999\r\n\r\n"));
    EXPECT_EQ(501, status_of("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"));
    EXPECT_EQ(0, status_of("GET / HTTP/1.0\r\n\r\n"));
}

TEST(Protocol, SerializedResponseHasLengthAndCloses)
{
    protocol::Response response;
    response.status = 409;
    response.body = "{\"error\":\"dup\"}";

    std::string wire = protocol::SerializeResponse(response);

    EXPECT_EQ(0u, wire.find("HTTP/1.1 409 Conflict\r\n"));
    EXPECT_NE(std::string::npos, wire.find("Content-Type: application/json\r\n"));
    EXPECT_NE(std::string::npos, wire.find("Content-Length: 15\r\n"));
    EXPECT_NE(std::string::npos, wire.find("Connection: close\r\n"));
    EXPECT_EQ(wire.size() - 15, wire.find("{\"error\":\"dup\"}"));
}
