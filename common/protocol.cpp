#include "protocol.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace net_watch::protocol
{
    namespace
    {
        std::string ToLower(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::string_view Trim(std::string_view s)
        {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
                s.remove_suffix(1);
            return s;
        }

        size_t ParseContentLength(const std::string &value)
        {
            if (value.empty() || !std::all_of(value.begin(), value.end(),
                                              [](unsigned char c)
                                              { return std::isdigit(c); }))
            {
                throw ParseError(400, "Invalid Content-Length");
            }
            if (value.size() > 9)
            {
                throw ParseError(413, "Request body too large");
            }
            size_t length = std::stoul(value);
            if (length > MAX_BODY_LENGTH)
            {
                throw ParseError(413, "Request body too large");
            }
            return length;
        }
    }

    Method ParseMethod(std::string_view token)
    {
        if (token == "GET")
            return Method::Get;
        if (token == "POST")
            return Method::Post;
        if (token == "PUT")
            return Method::Put;
        if (token == "DELETE")
            return Method::Delete;
        if (token == "HEAD")
            return Method::Head;
        if (token == "OPTIONS")
            return Method::Options;
        if (token == "PATCH")
            return Method::Patch;
        return Method::Unknown;
    }

    const char *MethodName(Method method)
    {
        switch (method)
        {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Put: return "PUT";
        case Method::Delete: return "DELETE";
        case Method::Head: return "HEAD";
        case Method::Options: return "OPTIONS";
        case Method::Patch: return "PATCH";
        case Method::Unknown: break;
        }
        return "UNKNOWN";
    }

    const char *ReasonPhrase(int status)
    {
        switch (status)
        {
        case 200: return "OK";
        case 201: return "Created";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
        }
    }

    RequestHead ParseRequestHead(std::string_view head)
    {
        if (head.size() < HEAD_TERMINATOR.size() ||
            head.substr(head.size() - HEAD_TERMINATOR.size()) != HEAD_TERMINATOR)
        {
            throw ParseError(400, "Incomplete request head");
        }

        RequestHead result;
        result.head_length = head.size();

        size_t line_end = head.find("\r\n");
        std::string_view request_line = head.substr(0, line_end);

        size_t first_space = request_line.find(' ');
        size_t last_space = request_line.rfind(' ');
        if (first_space == std::string_view::npos || first_space == last_space)
        {
            throw ParseError(400, "Malformed request line");
        }

        std::string_view method_token = request_line.substr(0, first_space);
        result.target = std::string(Trim(request_line.substr(first_space + 1, last_space - first_space - 1)));
        result.version = std::string(request_line.substr(last_space + 1));

        if (result.target.empty() || result.target.front() != '/')
        {
            throw ParseError(400, "Malformed request target");
        }
        if (result.version != "HTTP/1.1" && result.version != "HTTP/1.0")
        {
            throw ParseError(505, "Unsupported HTTP version: " + result.version);
        }

        result.method = ParseMethod(method_token);
        if (result.method == Method::Unknown)
        {
            throw ParseError(501, "Unsupported method: " + std::string(method_token));
        }

        size_t pos = line_end + 2;
        size_t fields_end = head.size() - HEAD_TERMINATOR.size() + 2;
        while (pos < fields_end)
        {
            size_t eol = head.find("\r\n", pos);
            std::string_view line = head.substr(pos, eol - pos);
            pos = eol + 2;
            if (line.empty())
                break;

            size_t colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
            {
                throw ParseError(400, "Malformed header field");
            }
            result.headers[ToLower(Trim(line.substr(0, colon)))] = std::string(Trim(line.substr(colon + 1)));
        }

        if (result.headers.count("transfer-encoding"))
        {
            throw ParseError(501, "Transfer-Encoding is not supported");
        }

        auto it = result.headers.find("content-length");
        if (it != result.headers.end())
        {
            result.content_length = ParseContentLength(it->second);
        }

        return result;
    }

    std::string SerializeResponse(const Response &response)
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << response.status << " " << ReasonPhrase(response.status) << "\r\n";
        out << "Content-Type: " << response.content_type << "\r\n";
        out << "Content-Length: " << response.body.size() << "\r\n";
        out << "Connection: close\r\n";
        out << "\r\n";
        out << response.body;
        return out.str();
    }
}
