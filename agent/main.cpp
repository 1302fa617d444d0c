#include "CommandLine.hpp"
#include "ConsoleReporter.hpp"
#include "../common/Log.hpp"
#include "../config/AppConfig.hpp"
#include "../core/NetworkScanner.hpp"
#include "../net/ArpTableResolver.hpp"
#include "../net/DnsHostnameResolver.hpp"
#include "../net/IcmpPinger.hpp"
#include "../net/LocalSubnetProvider.hpp"
#include "../net/StaticSubnetProvider.hpp"
#include "../storage/KnownDeviceService.hpp"
#include "../storage/SqliteDeviceStorage.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace
{
    volatile std::sig_atomic_t g_stopRequested = 0;

    void OnSignal(int)
    {
        g_stopRequested = 1;
    }

    netsweep::core::ScannerDependencies BuildDependencies(const netsweep::config::AppConfig &cfg)
    {
        using namespace netsweep;

        core::ScannerDependencies deps;
        if (cfg.subnets.empty())
            deps.subnet_provider = std::make_shared<net::LocalSubnetProvider>();
        else
            deps.subnet_provider = std::make_shared<net::StaticSubnetProvider>(cfg.subnets);

        deps.pinger = std::make_shared<net::IcmpPinger>();
        deps.hostname_resolver = std::make_shared<net::DnsHostnameResolver>();
        deps.mac_resolver = std::make_shared<net::ArpTableResolver>();
        deps.detection_chain = detection::CreateDetectionChain(cfg.ports, cfg.detectors);
        return deps;
    }

    // Known devices seen in this sweep get their latest state.
    void RefreshKnownDevices(netsweep::storage::KnownDeviceService &known, const netsweep::core::DeviceRegistry &registry)
    {
        for (const auto &ip : known.GetKnownDeviceIps())
        {
            auto current = registry.FindByAddress(ip);
            if (!current)
                continue;
            known.UpdateDevice(*current);
            if (!current->is_online)
                netsweep::common::LogWarn("Agent", "Known device " + current->name + " (" + ip + ") is offline");
        }
    }

    int RunSingleDevice(netsweep::core::NetworkScanner &scanner, netsweep::storage::KnownDeviceService &known,
                        const netsweep::agent::CommandLine &cli)
    {
        auto result = scanner.ScanSingleDevice(*cli.single_ip);
        if (result.empty())
            return 2;

        netsweep::agent::PrintRoster(std::cout, result);

        if (cli.remember)
        {
            if (!known.AddDevice(result.front()))
                return 1;
            if (!known.SetLastConnectedDevice(result.front().address))
                netsweep::common::LogWarn("Agent", "Could not store the last connected device");
        }
        return result.front().is_online ? 0 : 1;
    }
}

int main(int argc, char *argv[])
{
    using namespace netsweep;

    agent::CommandLine cli;
    std::vector<std::string> args(argv + 1, argv + argc);
    if (auto error = agent::ParseCommandLine(args, cli))
    {
        std::cerr << "[Agent] " << *error << "\n"
                  << agent::Usage(argv[0]);
        return 2;
    }
    if (cli.help)
    {
        std::cout << agent::Usage(argv[0]);
        return 0;
    }

    config::AppConfig cfg;
    try
    {
        if (!cli.config_path.empty())
            cfg = config::LoadAppConfig(cli.config_path);
    }
    catch (const config::ConfigError &e)
    {
        std::cerr << "[Agent] Configuration error: " << e.what() << "\n";
        return 1;
    }

    common::SetLogLevel(cli.verbose ? common::LogLevel::Debug : cfg.log_level);

    try
    {
        auto rosterStore = std::make_shared<storage::SqliteDeviceStorage>("discovered_devices");
        auto knownStore = std::make_shared<storage::SqliteDeviceStorage>("known_devices");
        if (!rosterStore->Open(cfg.storage.database) || !knownStore->Open(cfg.storage.database))
            common::LogWarn("Agent", "Continuing without persistence (" + cfg.storage.database + ")");

        storage::KnownDeviceService known(knownStore);
        known.status_changed.Connect([](const std::string &status)
                                     { common::LogDebug("Known", status); });

        core::NetworkScanner scanner(cfg.scanner, BuildDependencies(cfg));
        agent::ConsoleReporter reporter(scanner.Events());

        if (cli.single_ip)
            return RunSingleDevice(scanner, known, cli);

        scanner.Registry().Load(rosterStore->LoadDevices());
        common::LogInfo("Agent", "Restored " + std::to_string(scanner.Registry().Size()) + " devices, " +
                                     std::to_string(known.GetDevices().size()) + " known");

        scanner.Events().last_scan_time_changed.Connect([&](const core::OptionalTime &)
                                                        {
            if (!rosterStore->SaveDevices(scanner.DiscoveredDevices()))
                common::LogWarn("Agent", "Could not persist the device roster");
            RefreshKnownDevices(known, scanner.Registry()); });

        if (cli.once || !cfg.scanner.enable_continuous_scanning)
        {
            agent::PrintRoster(std::cout, scanner.ScanNetwork());
            return 0;
        }

        std::signal(SIGINT, OnSignal);
        std::signal(SIGTERM, OnSignal);

        scanner.StartScanning();
        common::LogInfo("Agent", "Scanning every " +
                                     std::to_string(std::chrono::duration_cast<std::chrono::minutes>(cfg.scanner.scan_interval).count()) +
                                     " min. Ctrl+C to stop.");

        while (!g_stopRequested)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        common::LogInfo("Agent", "Stopping");
        scanner.PauseScanning();
        // A sweep still finishing saves again from the last-scan handler before the scanner goes away.
        if (!rosterStore->SaveDevices(scanner.DiscoveredDevices()))
            common::LogWarn("Agent", "Could not persist the device roster");
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Agent] Fatal error: " << e.what() << "\n";
        return -1;
    }

    return 0;
}
