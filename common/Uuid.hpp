#pragma once

#include <string>

namespace net_watch::common
{
    // Random (version 4) UUID in canonical 8-4-4-4-12 lowercase hex form.
    // Throws std::runtime_error if the OpenSSL RNG cannot deliver bytes.
    std::string GenerateUuid();

    bool IsCanonicalUuid(const std::string &text);
}
