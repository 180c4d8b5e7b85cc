#pragma once

#include <string>
#include <vector>

namespace net_watch::common
{
    struct Device
    {
        std::string id;
        std::string name;
        std::string ip;
    };

    inline bool operator==(const Device &a, const Device &b)
    {
        return a.id == b.id && a.name == b.name && a.ip == b.ip;
    }

    inline bool operator!=(const Device &a, const Device &b)
    {
        return !(a == b);
    }

    // Derived view of one device after a probe round. Never persisted.
    struct ProbeResult
    {
        std::string device_id;
        std::string name;
        std::string ip;
        bool online = false;
    };

    inline bool operator==(const ProbeResult &a, const ProbeResult &b)
    {
        return a.device_id == b.device_id && a.name == b.name && a.ip == b.ip && a.online == b.online;
    }

    using DeviceList = std::vector<Device>;
    using ProbeReport = std::vector<ProbeResult>;
}
