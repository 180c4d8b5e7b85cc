#pragma once

#include <cstdint>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace net_watch::protocol
{

    inline constexpr size_t MAX_HEAD_LENGTH = 16 * 1024;
    inline constexpr size_t MAX_BODY_LENGTH = 1024 * 1024; // 1MB
    inline constexpr std::string_view HEAD_TERMINATOR = "\r\n\r\n";

    enum class Method : std::uint8_t
    {
        Get,
        Post,
        Put,
        Delete,
        Head,
        Options,
        Patch,
        Unknown
    };

    // Thrown while framing a request; carries the status the client gets.
    class ParseError : public std::runtime_error
    {
    public:
        ParseError(int status, const std::string &what) : std::runtime_error(what), m_status(status) {}
        int Status() const { return m_status; }

    private:
        int m_status;
    };

    struct RequestHead
    {
        Method method = Method::Unknown;
        std::string target;
        std::string version;
        std::map<std::string, std::string> headers; // lowercase names
        size_t head_length = 0;                     // including the terminator
        size_t content_length = 0;
    };

    struct Request
    {
        Method method = Method::Unknown;
        std::string path;
        std::string query;
        std::map<std::string, std::string> headers;
        std::string body;
    };

    struct Response
    {
        int status = 200;
        std::string content_type = "application/json";
        std::string body;
    };

    Method ParseMethod(std::string_view token);
    const char *MethodName(Method method);
    const char *ReasonPhrase(int status);

    // Parses the request line and header fields. `head` must end with the
    // blank line terminator. Throws ParseError on malformed input.
    RequestHead ParseRequestHead(std::string_view head);

    std::string SerializeResponse(const Response &response);

}
