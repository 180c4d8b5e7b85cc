#include "Registry.hpp"
#include "../common/Codec.hpp"
#include "../common/Log.hpp"
#include "../common/Uuid.hpp"

#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace net_watch::server
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            const char *ws = " \t\r\n\f\v";
            size_t begin = s.find_first_not_of(ws);
            if (begin == std::string::npos)
                return "";
            size_t end = s.find_last_not_of(ws);
            return s.substr(begin, end - begin + 1);
        }

        bool HasIp(const common::DeviceList &devices, const std::string &ip)
        {
            return std::any_of(devices.begin(), devices.end(), [&ip](const common::Device &d)
                               { return d.ip == ip; });
        }
    }

    Registry::Registry(DeviceStore &store) : m_store(store)
    {
    }

    const common::DeviceList &Registry::DefaultDevices()
    {
        static const common::DeviceList defaults = {
            {"", "Google DNS", "8.8.8.8"},
            {"", "Cloudflare DNS", "1.1.1.1"}};
        return defaults;
    }

    void Registry::Open(bool seed_defaults)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_store.IsFresh() || !seed_defaults)
            return;

        if (!m_store.Load().empty())
            return;

        common::DeviceList seeded = DefaultDevices();
        for (auto &d : seeded)
            d.id = common::GenerateUuid();
        m_store.Save(seeded);
        common::LogInfo("Registry", "Seeded " + std::to_string(seeded.size()) + " default devices");
    }

    common::DeviceList Registry::LoadLocked()
    {
        common::DeviceList devices = m_store.Load();

        std::unordered_set<std::string> seen;
        bool repaired = false;
        for (auto &d : devices)
        {
            if (d.id.empty() || seen.count(d.id))
            {
                d.id = common::GenerateUuid();
                repaired = true;
            }
            seen.insert(d.id);
        }

        if (repaired)
        {
            common::LogInfo("Registry", "Assigned ids to stored devices that lacked a unique one");
            m_store.Save(devices);
        }
        return devices;
    }

    common::DeviceList Registry::Load()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return LoadLocked();
    }

    void Registry::Save(const common::DeviceList &devices)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_store.Save(devices);
    }

    common::Device Registry::Add(const std::string &name, const std::string &ip)
    {
        common::Device device;
        device.name = Trim(name);
        device.ip = Trim(ip);
        if (device.name.empty() || device.ip.empty())
        {
            throw ValidationError("name and ip are required");
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        common::DeviceList devices = LoadLocked();
        if (HasIp(devices, device.ip))
        {
            throw DuplicateError("device with this IP already exists");
        }

        device.id = common::GenerateUuid();
        devices.push_back(device);
        m_store.Save(devices);

        common::LogInfo("Registry", "Added " + device.name + " (" + device.ip + ") as " + device.id);
        return device;
    }

    bool Registry::Remove(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        common::DeviceList devices = LoadLocked();

        auto it = std::find_if(devices.begin(), devices.end(), [&id](const common::Device &d)
                               { return d.id == id; });
        if (it == devices.end())
            return false;

        common::LogInfo("Registry", "Removed " + it->name + " (" + it->ip + ")");
        devices.erase(it);
        m_store.Save(devices);
        return true;
    }

    size_t Registry::Import(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open import file '" + path + "'");
        }

        nlohmann::json document;
        try
        {
            document = nlohmann::json::parse(in);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("Import file '" + path + "' is not valid JSON: " + e.what());
        }
        if (!document.is_array())
        {
            throw std::runtime_error("Import file '" + path + "' must hold a JSON array of devices");
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        common::DeviceList devices = LoadLocked();
        std::unordered_set<std::string> ids;
        for (const auto &d : devices)
            ids.insert(d.id);

        size_t added = 0;
        for (const auto &entry : document)
        {
            if (!entry.is_object())
                continue;

            common::Device device = entry.get<common::Device>();
            device.name = Trim(device.name);
            device.ip = Trim(device.ip);
            if (device.name.empty() || device.ip.empty())
            {
                common::LogInfo("Registry", "Import skipped a record without name or ip");
                continue;
            }
            if (HasIp(devices, device.ip))
            {
                common::LogInfo("Registry", "Import skipped duplicate ip " + device.ip);
                continue;
            }
            if (device.id.empty() || ids.count(device.id))
                device.id = common::GenerateUuid();

            ids.insert(device.id);
            devices.push_back(device);
            ++added;
        }

        if (added > 0)
            m_store.Save(devices);

        common::LogInfo("Registry", "Imported " + std::to_string(added) + " devices from " + path);
        return added;
    }
}
