#pragma once

#include <mutex>
#include <stdexcept>
#include <string>
#include <sqlite3.h>
#include "../common/Device.hpp"

namespace net_watch::server
{
    class StorageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Durable home of the device collection. The collection is always read
    // and written as a whole.
    class DeviceStore
    {
    public:
        virtual ~DeviceStore() = default;

        virtual common::DeviceList Load() = 0;

        // Replaces the stored collection atomically. On failure the previous
        // collection is left intact and StorageError is thrown.
        virtual void Save(const common::DeviceList &devices) = 0;

        // True if no durable state existed when the store was opened.
        virtual bool IsFresh() const = 0;
    };

    class SqliteDeviceStore : public DeviceStore
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;
        bool fresh_;

        void Execute(const char *sql);

    public:
        explicit SqliteDeviceStore(const std::string &db_path);
        ~SqliteDeviceStore() override;

        SqliteDeviceStore(const SqliteDeviceStore &) = delete;
        SqliteDeviceStore &operator=(const SqliteDeviceStore &) = delete;

        common::DeviceList Load() override;
        void Save(const common::DeviceList &devices) override;
        bool IsFresh() const override { return fresh_; }
    };
}
