#include <catch2/catch.hpp>
#include "../storage/SqliteDeviceStorage.hpp"
#include "utils/FakeNetwork.hpp"
#include <algorithm>
#include <cstdio>

using namespace netsweep;
using netsweep::testing::MakeDevice;

TEST_CASE("Devices survive a save and load", "[storage]")
{
    storage::SqliteDeviceStorage store;
    REQUIRE(store.Open(":memory:"));
    CHECK(store.LoadDevices().empty());

    auto nas = MakeDevice("192.168.1.20", true, "AA:BB:CC:DD:EE:20");
    nas.name = "NAS";
    nas.type = "Linux Server (HTTP)";
    nas.response_time = std::chrono::milliseconds(12);
    auto printer = MakeDevice("192.168.1.9", false);

    REQUIRE(store.SaveDevices({nas, printer}));
    auto loaded = store.LoadDevices();
    REQUIRE(loaded.size() == 2);

    auto it = std::find_if(loaded.begin(), loaded.end(), [](const core::Device &d)
                           { return d.address == "192.168.1.20"; });
    REQUIRE(it != loaded.end());
    CHECK(it->name == "NAS");
    CHECK(it->type == "Linux Server (HTTP)");
    CHECK(it->mac_address == "AA:BB:CC:DD:EE:20");
    CHECK(it->is_online);
    CHECK(it->response_time == std::chrono::milliseconds(12));
    CHECK(std::chrono::duration_cast<std::chrono::milliseconds>(it->last_seen - nas.last_seen).count() == 0);
}

TEST_CASE("Saving replaces the stored set", "[storage]")
{
    storage::SqliteDeviceStorage store;
    REQUIRE(store.Open(":memory:"));

    REQUIRE(store.SaveDevices({MakeDevice("10.0.0.1", true), MakeDevice("10.0.0.2", true)}));
    REQUIRE(store.SaveDevices({MakeDevice("10.0.0.3", false)}));

    auto loaded = store.LoadDevices();
    REQUIRE(loaded.size() == 1);
    CHECK(loaded[0].address == "10.0.0.3");

    REQUIRE(store.SaveDevices({}));
    CHECK(store.LoadDevices().empty());
}

TEST_CASE("Settings are written key by key", "[storage]")
{
    storage::SqliteDeviceStorage store;
    REQUIRE(store.Open(":memory:"));

    REQUIRE(store.SaveSettings({{"LastConnectedDeviceIp", "10.0.0.5"}, {"Theme", "dark"}}));
    REQUIRE(store.SaveSettings({{"LastConnectedDeviceIp", "10.0.0.6"}}));

    auto settings = store.LoadSettings();
    CHECK(settings.size() == 2);
    CHECK(settings["LastConnectedDeviceIp"] == "10.0.0.6");
    CHECK(settings["Theme"] == "dark");
}

TEST_CASE("Stores sharing a file keep their device tables apart", "[storage]")
{
    std::string path = "netsweep_test_storage.db";
    std::remove(path.c_str());

    {
        storage::SqliteDeviceStorage roster("discovered_devices");
        storage::SqliteDeviceStorage known("known_devices");
        REQUIRE(roster.Open(path));
        REQUIRE(known.Open(path));

        REQUIRE(roster.SaveDevices({MakeDevice("10.0.0.1", true), MakeDevice("10.0.0.2", true)}));
        REQUIRE(known.SaveDevices({MakeDevice("10.0.0.9", false)}));
        REQUIRE(known.SaveSettings({{"LastConnectedDeviceIp", "10.0.0.9"}}));

        CHECK(roster.LoadDevices().size() == 2);
        CHECK(known.LoadDevices().size() == 1);
        CHECK(roster.LoadSettings().at("LastConnectedDeviceIp") == "10.0.0.9");
    }

    storage::SqliteDeviceStorage reopened("known_devices");
    REQUIRE(reopened.Open(path));
    auto devices = reopened.LoadDevices();
    REQUIRE(devices.size() == 1);
    CHECK(devices[0].address == "10.0.0.9");
    reopened.Close();

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST_CASE("A closed store reports failure", "[storage]")
{
    storage::SqliteDeviceStorage store;
    CHECK_FALSE(store.IsOpen());
    CHECK_FALSE(store.SaveDevices({MakeDevice("10.0.0.1", true)}));
    CHECK_FALSE(store.SaveSettings({{"k", "v"}}));
    CHECK(store.LoadDevices().empty());
    CHECK(store.LoadSettings().empty());

    CHECK_THROWS_AS(storage::SqliteDeviceStorage("devices; DROP TABLE x"), std::invalid_argument);
}
