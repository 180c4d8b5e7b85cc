#pragma once

#include <nlohmann/json.hpp>

#include "Device.hpp"

namespace net_watch::common
{
    inline void to_json(nlohmann::json &j, const Device &d)
    {
        j = nlohmann::json{{"id", d.id}, {"name", d.name}, {"ip", d.ip}};
    }

    // Missing keys decode to empty strings; callers decide whether that is
    // an error (request bodies) or a correctable record (imported ids).
    inline void from_json(const nlohmann::json &j, Device &d)
    {
        d.id = j.contains("id") && j.at("id").is_string() ? j.at("id").get<std::string>() : std::string();
        d.name = j.contains("name") && j.at("name").is_string() ? j.at("name").get<std::string>() : std::string();
        d.ip = j.contains("ip") && j.at("ip").is_string() ? j.at("ip").get<std::string>() : std::string();
    }

    inline void to_json(nlohmann::json &j, const ProbeResult &r)
    {
        j = nlohmann::json{{"id", r.device_id}, {"name", r.name}, {"ip", r.ip}, {"online", r.online}};
    }
}
