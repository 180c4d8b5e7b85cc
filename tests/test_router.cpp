#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "server/Router.hpp"
#include "TestSupport.hpp"

using namespace net_watch;

namespace
{
    class RouterTest : public ::testing::Test
    {
    protected:
        RouterTest()
            : store({{"id-g", "Google DNS", "8.8.8.8"}, {"id-c", "Cloudflare DNS", "1.1.1.1"}}),
              registry(store),
              prober({{"1.1.1.1", true}}),
              coordinator(prober),
              router(registry, coordinator)
        {
        }

        protocol::Response Call(protocol::Method method, const std::string &path, const std::string &body = "")
        {
            protocol::Request request;
            request.method = method;
            request.path = path;
            request.body = body;
            return router.Handle(request);
        }

        test::MemoryDeviceStore store;
        server::Registry registry;
        test::ScriptedProber prober;
        probe::ProbeCoordinator coordinator;
        server::Router router;
    };
}

TEST_F(RouterTest, ListDevicesReturnsStoredArray)
{
    protocol::Response response = Call(protocol::Method::Get, "/api/devices");

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("application/json", response.content_type);
    auto body = nlohmann::json::parse(response.body);
    ASSERT_TRUE(body.is_array());
    ASSERT_EQ(2u, body.size());
    EXPECT_EQ("id-g", body[0]["id"]);
    EXPECT_EQ("Google DNS", body[0]["name"]);
    EXPECT_EQ("8.8.8.8", body[0]["ip"]);
}

TEST_F(RouterTest, CreateDeviceReturns201WithRecord)
{
    protocol::Response response = Call(protocol::Method::Post, "/api/devices", R"({"name":" NAS ","ip":"10.0.0.20"})");

    EXPECT_EQ(201, response.status);
    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ("NAS", body["name"]);
    EXPECT_EQ("10.0.0.20", body["ip"]);
    EXPECT_FALSE(body["id"].get<std::string>().empty());
    EXPECT_EQ(3u, store.Stored().size());
}

TEST_F(RouterTest, CreateDeviceWithMissingFieldsIs400)
{
    EXPECT_EQ(400, Call(protocol::Method::Post, "/api/devices", R"({"name":"NAS"})").status);
    EXPECT_EQ(400, Call(protocol::Method::Post, "/api/devices", R"({"name":"","ip":"1.2.3.4"})").status);
    EXPECT_EQ(400, Call(protocol::Method::Post, "/api/devices", R"({"name":5,"ip":"1.2.3.4"})").status);
    EXPECT_EQ(400, Call(protocol::Method::Post, "/api/devices", "not json").status);
    EXPECT_EQ(400, Call(protocol::Method::Post, "/api/devices", "[1,2]").status);

    auto body = nlohmann::json::parse(Call(protocol::Method::Post, "/api/devices", "{}").body);
    EXPECT_EQ("name and ip are required", body["error"]);
    EXPECT_EQ(0, store.saves.load());
}

TEST_F(RouterTest, CreateDeviceWithDuplicateIpIs409)
{
    protocol::Response response = Call(protocol::Method::Post, "/api/devices", R"({"name":"X","ip":"1.1.1.1"})");

    EXPECT_EQ(409, response.status);
    EXPECT_EQ("device with this IP already exists", nlohmann::json::parse(response.body)["error"]);
    EXPECT_EQ(2u, store.Stored().size());
}

TEST_F(RouterTest, DeleteDevice)
{
    protocol::Response response = Call(protocol::Method::Delete, "/api/devices/id-g");
    EXPECT_EQ(200, response.status);
    EXPECT_EQ(true, nlohmann::json::parse(response.body)["ok"]);
    EXPECT_EQ(1u, store.Stored().size());

    protocol::Response missing = Call(protocol::Method::Delete, "/api/devices/id-g");
    EXPECT_EQ(404, missing.status);
    EXPECT_EQ("not found", nlohmann::json::parse(missing.body)["error"]);
}

TEST_F(RouterTest, StatusReturnsSortedReport)
{
    protocol::Response response = Call(protocol::Method::Get, "/api/status");

    EXPECT_EQ(200, response.status);
    auto expected = nlohmann::json::parse(R"([
        {"id":"id-c","name":"Cloudflare DNS","ip":"1.1.1.1","online":true},
        {"id":"id-g","name":"Google DNS","ip":"8.8.8.8","online":false}
    ])");
    EXPECT_EQ(expected, nlohmann::json::parse(response.body));
}

TEST_F(RouterTest, StatusOfEmptyRegistryIsEmptyArray)
{
    Call(protocol::Method::Delete, "/api/devices/id-g");
    Call(protocol::Method::Delete, "/api/devices/id-c");

    protocol::Response response = Call(protocol::Method::Get, "/api/status");
    EXPECT_EQ(200, response.status);
    EXPECT_EQ("[]", response.body);
    EXPECT_EQ(0, prober.calls.load());
}

TEST_F(RouterTest, ExportReturnsStoredCollection)
{
    protocol::Response response = Call(protocol::Method::Get, "/devices.json");

    EXPECT_EQ(200, response.status);
    EXPECT_EQ(2u, nlohmann::json::parse(response.body).size());
}

TEST_F(RouterTest, UnknownRoutesAndMethods)
{
    EXPECT_EQ(404, Call(protocol::Method::Get, "/nope").status);
    EXPECT_EQ(404, Call(protocol::Method::Delete, "/api/devices/").status);
    EXPECT_EQ(404, Call(protocol::Method::Delete, "/api/devices/a/b").status);
    EXPECT_EQ(405, Call(protocol::Method::Put, "/api/devices").status);
    EXPECT_EQ(405, Call(protocol::Method::Get, "/api/devices/id-g").status);
    EXPECT_EQ(405, Call(protocol::Method::Post, "/api/status").status);
}

TEST_F(RouterTest, StorageFailureIs500)
{
    store.fail_saves = true;

    protocol::Response response = Call(protocol::Method::Post, "/api/devices", R"({"name":"NAS","ip":"10.0.0.20"})");

    EXPECT_EQ(500, response.status);
    EXPECT_EQ(2u, store.Stored().size());
}
