#include "Uuid.hpp"

#include <openssl/rand.h>
#include <openssl/err.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace net_watch::common
{
    std::string GenerateUuid()
    {
        std::array<uint8_t, 16> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
        {
            throw std::runtime_error("OpenSSL RNG failed: " + std::to_string(ERR_get_error()));
        }

        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        static const char *hex = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                out += '-';
            out += hex[(bytes[i] >> 4) & 0x0F];
            out += hex[bytes[i] & 0x0F];
        }
        return out;
    }

    bool IsCanonicalUuid(const std::string &text)
    {
        if (text.size() != 36)
            return false;

        for (size_t i = 0; i < text.size(); ++i)
        {
            char c = text[i];
            if (i == 8 || i == 13 || i == 18 || i == 23)
            {
                if (c != '-')
                    return false;
            }
            else if (!std::isxdigit(static_cast<unsigned char>(c)) || std::isupper(static_cast<unsigned char>(c)))
            {
                return false;
            }
        }
        return true;
    }
}
