#include <catch2/catch.hpp>
#include "../core/NetworkScanner.hpp"
#include "../common/Log.hpp"
#include "utils/FakeNetwork.hpp"
#include <algorithm>

using namespace netsweep;
using namespace netsweep::testing;

namespace
{
    struct SingleDeviceFixture
    {
        std::shared_ptr<FakePinger> pinger = std::make_shared<FakePinger>();
        std::shared_ptr<FakeHostnameResolver> names = std::make_shared<FakeHostnameResolver>();
        std::shared_ptr<FakeMacResolver> macs = std::make_shared<FakeMacResolver>();
        std::shared_ptr<FakeDetector> detector = std::make_shared<FakeDetector>("ssh", 40, std::string("Ubuntu Linux (SSH)"));
        std::unique_ptr<core::NetworkScanner> scanner;

        std::mutex mutex;
        std::vector<std::string> progress;
        std::atomic<int> discovered{0};

        SingleDeviceFixture()
        {
            common::SetLogLevel(common::LogLevel::Error);

            core::ScanOptions options;
            options.probe_settle_delay = std::chrono::milliseconds(0);
            options.enable_continuous_scanning = false;

            core::ScannerDependencies deps;
            deps.subnet_provider = std::make_shared<FakeSubnetProvider>(std::vector<std::string>{"192.168.1"});
            deps.pinger = pinger;
            deps.hostname_resolver = names;
            deps.mac_resolver = macs;
            deps.detection_chain = std::make_shared<detection::DetectionChain>(
                std::vector<std::shared_ptr<detection::DeviceTypeDetector>>{detector});

            scanner = std::make_unique<core::NetworkScanner>(options, deps);
            scanner->Events().progress.Connect([this](const std::string &msg)
                                               {
                std::lock_guard<std::mutex> lock(mutex);
                progress.push_back(msg); });
            scanner->Events().device_discovered.Connect([this](const core::Device &)
                                                        { ++discovered; });
        }

        bool SawProgress(const std::string &text)
        {
            std::lock_guard<std::mutex> lock(mutex);
            return std::find(progress.begin(), progress.end(), text) != progress.end();
        }
    };
}

TEST_CASE("Single device scan of a responsive host", "[single]")
{
    SingleDeviceFixture f;
    f.pinger->SetOnline("192.168.1.20", std::chrono::milliseconds(9));
    f.names->Set("192.168.1.20", "BUILDBOX (office)");
    f.macs->Set("192.168.1.20", "AA:BB:CC:00:00:20");

    auto result = f.scanner->ScanSingleDevice("192.168.1.20");

    REQUIRE(result.size() == 1);
    CHECK(result[0].is_online);
    CHECK(result[0].name == "BUILDBOX (office)");
    CHECK(result[0].type == "Ubuntu Linux (SSH)");
    CHECK(result[0].mac_address == "AA:BB:CC:00:00:20");
    CHECK(result[0].response_time == std::chrono::milliseconds(9));
    CHECK(f.SawProgress("Scanning device at 192.168.1.20..."));
    CHECK(f.SawProgress("Scan complete - Device found"));
}

TEST_CASE("Single device scan leaves the roster alone", "[single]")
{
    SingleDeviceFixture f;
    f.pinger->SetOnline("192.168.1.20");
    f.scanner->Registry().Upsert(MakeDevice("192.168.1.50", true, "AA:AA:AA:AA:AA:50"));

    f.scanner->ScanSingleDevice("192.168.1.20");
    f.scanner->ScanSingleDevice("192.168.1.50");

    auto roster = f.scanner->DiscoveredDevices();
    REQUIRE(roster.size() == 1);
    CHECK(roster[0].address == "192.168.1.50");
    CHECK(roster[0].is_online);
    CHECK(f.discovered == 0);
}

TEST_CASE("Single device scan of a silent host", "[single]")
{
    SingleDeviceFixture f;
    f.names->Set("192.168.1.30", "OLDPC");

    auto result = f.scanner->ScanSingleDevice("192.168.1.30");

    REQUIRE(result.size() == 1);
    CHECK_FALSE(result[0].is_online);
    CHECK(result[0].name == "OLDPC");
    CHECK(result[0].type == "Unknown");
    CHECK(result[0].mac_address == "Unknown");
    CHECK(f.detector->Calls() == 0);
    CHECK(f.SawProgress("Scan complete - No device found"));
}

TEST_CASE("Single device scan rejects malformed input", "[single]")
{
    SingleDeviceFixture f;

    auto bad = GENERATE(as<std::string>{}, "", "999.1.1.1", "hello", "10.0.0", "10.0.0.1.5", " 10.0.0.1");
    CAPTURE(bad);

    CHECK(f.scanner->ScanSingleDevice(bad).empty());
    CHECK(f.SawProgress("Error: Invalid IP address format"));
    CHECK(f.pinger->CallCount() == 0);
}

TEST_CASE("Single device scan rejects IPv6", "[single]")
{
    SingleDeviceFixture f;

    CHECK(f.scanner->ScanSingleDevice("fe80::1").empty());
    CHECK(f.SawProgress("Error: Only IPv4 addresses are supported"));
    CHECK(f.pinger->CallCount() == 0);
}

TEST_CASE("Single device scan reports probe failures as an error entry", "[single]")
{
    SingleDeviceFixture f;
    f.pinger->ThrowFor("192.168.1.77");

    auto result = f.scanner->ScanSingleDevice("192.168.1.77");

    REQUIRE(result.size() == 1);
    CHECK_FALSE(result[0].is_online);
    CHECK(result[0].name == "ERROR_77");
    CHECK(result[0].type == "Error");
    CHECK(f.SawProgress("Scan error: simulated socket failure"));
}

TEST_CASE("Single device scan can run while a sweep is in progress", "[single][concurrency]")
{
    SingleDeviceFixture f;
    f.pinger->SetLatency(std::chrono::milliseconds(5));
    f.pinger->SetOnline("192.168.1.99");

    auto sweep = f.scanner->ScanNetworkAsync();
    REQUIRE(WaitUntil([&]
                      { return f.scanner->IsScanning(); }));

    auto result = f.scanner->ScanSingleDevice("192.168.1.99");
    REQUIRE(result.size() == 1);
    CHECK(result[0].is_online);

    sweep.get();
}
