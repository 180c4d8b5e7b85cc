#pragma once

#include <mutex>
#include <stdexcept>
#include <string>
#include "DeviceStore.hpp"
#include "../common/Device.hpp"

namespace net_watch::server
{
    class RegistryError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Empty or whitespace-only name or ip.
    class ValidationError : public RegistryError
    {
    public:
        using RegistryError::RegistryError;
    };

    // Another device already uses the ip.
    class DuplicateError : public RegistryError
    {
    public:
        using RegistryError::RegistryError;
    };

    // The device list, backed by a DeviceStore. Every mutation is a
    // read-modify-write of the whole collection, serialized by one mutex.
    class Registry
    {
    public:
        explicit Registry(DeviceStore &store);

        static const common::DeviceList &DefaultDevices();

        // Seeds DefaultDevices() into a store that had no prior state.
        void Open(bool seed_defaults);

        common::DeviceList Load();
        void Save(const common::DeviceList &devices);

        common::Device Add(const std::string &name, const std::string &ip);
        bool Remove(const std::string &id);

        // Immutable copy for a probe round.
        common::DeviceList Snapshot() { return Load(); }

        // Merges a JSON array of {id?, name, ip} records. Returns how many
        // records were added.
        size_t Import(const std::string &path);

    private:
        common::DeviceList LoadLocked();

        DeviceStore &m_store;
        std::mutex m_mutex;
    };
}
