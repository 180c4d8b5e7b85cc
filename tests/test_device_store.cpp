#include <gtest/gtest.h>

#include <cstdio>
#include <sqlite3.h>

#include "server/DeviceStore.hpp"
#include "server/Registry.hpp"
#include "common/Uuid.hpp"

using namespace net_watch;

namespace
{
    class SqliteDeviceStoreTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            path = ::testing::TempDir() + "netwatch_store_" +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".db";
            RemoveFiles();
        }

        void TearDown() override { RemoveFiles(); }

        void RemoveFiles()
        {
            std::remove(path.c_str());
            std::remove((path + "-wal").c_str());
            std::remove((path + "-shm").c_str());
        }

        void ExecuteRaw(const char *sql)
        {
            sqlite3 *db = nullptr;
            ASSERT_EQ(SQLITE_OK, sqlite3_open(path.c_str(), &db));
            ASSERT_EQ(SQLITE_OK, sqlite3_exec(db, sql, nullptr, nullptr, nullptr));
            sqlite3_close(db);
        }

        std::string path;
    };
}

TEST_F(SqliteDeviceStoreTest, NewDatabaseIsFreshAndEmpty)
{
    server::SqliteDeviceStore store(path);

    EXPECT_TRUE(store.IsFresh());
    EXPECT_TRUE(store.Load().empty());
}

TEST_F(SqliteDeviceStoreTest, SavedCollectionSurvivesReopenInOrder)
{
    common::DeviceList devices = {
        {"b-id", "Zulu", "10.0.0.2"},
        {"a-id", "alpha", "10.0.0.1"},
        {"c-id", "Mike", "10.0.0.3"}};
    {
        server::SqliteDeviceStore store(path);
        store.Save(devices);
    }

    server::SqliteDeviceStore reopened(path);
    EXPECT_FALSE(reopened.IsFresh());
    EXPECT_EQ(devices, reopened.Load());
}

TEST_F(SqliteDeviceStoreTest, SaveReplacesWholeCollection)
{
    server::SqliteDeviceStore store(path);
    store.Save({{"1", "one", "10.0.0.1"}, {"2", "two", "10.0.0.2"}});
    store.Save({{"3", "three", "10.0.0.3"}});

    common::DeviceList expected = {{"3", "three", "10.0.0.3"}};
    EXPECT_EQ(expected, store.Load());

    store.Save({});
    EXPECT_TRUE(store.Load().empty());
}

TEST_F(SqliteDeviceStoreTest, RowsWithoutIdAreRepairedByRegistry)
{
    {
        server::SqliteDeviceStore store(path);
    }
    ExecuteRaw("INSERT INTO devices (position, id, name, ip) VALUES (0, NULL, 'Legacy', '10.9.9.9');");

    server::SqliteDeviceStore store(path);
    ASSERT_EQ(1u, store.Load().size());
    EXPECT_TRUE(store.Load()[0].id.empty());

    server::Registry registry(store);
    common::DeviceList loaded = registry.Load();
    ASSERT_EQ(1u, loaded.size());
    EXPECT_TRUE(common::IsCanonicalUuid(loaded[0].id));

    server::SqliteDeviceStore reopened(path);
    EXPECT_EQ(loaded, reopened.Load());
}

TEST_F(SqliteDeviceStoreTest, RegistrySeedsFreshDatabaseOnce)
{
    {
        server::SqliteDeviceStore store(path);
        server::Registry registry(store);
        registry.Open(true);
        EXPECT_EQ(2u, registry.Load().size());
        registry.Remove(registry.Load()[0].id);
    }

    server::SqliteDeviceStore store(path);
    server::Registry registry(store);
    registry.Open(true);
    EXPECT_EQ(1u, registry.Load().size());
}

TEST_F(SqliteDeviceStoreTest, UnopenableDatabaseThrows)
{
    EXPECT_THROW(server::SqliteDeviceStore("/nonexistent-dir/netwatch/devices.db"), server::StorageError);
}

TEST_F(SqliteDeviceStoreTest, FailedSaveRollsBackAndLeavesStoreWritable)
{
    server::SqliteDeviceStore store(path);
    common::DeviceList original = {{"1", "one", "10.0.0.1"}};
    store.Save(original);

    ExecuteRaw("CREATE TRIGGER reject_bad BEFORE INSERT ON devices WHEN NEW.ip = 'bad' "
               "BEGIN SELECT RAISE(ABORT, 'rejected'); END;");

    EXPECT_THROW(store.Save({{"1", "one", "10.0.0.1"}, {"2", "two", "bad"}}), server::StorageError);
    EXPECT_EQ(original, store.Load());

    common::DeviceList next = {{"3", "three", "10.0.0.3"}};
    store.Save(next);
    EXPECT_EQ(next, store.Load());
}
