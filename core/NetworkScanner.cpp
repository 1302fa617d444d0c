#include "NetworkScanner.hpp"
#include "../common/CountingSemaphore.hpp"
#include "../common/Ipv4.hpp"
#include "../common/Log.hpp"
#include <exception>
#include <system_error>
#include <utility>

namespace netsweep::core
{
    namespace
    {
        const std::string kTag = "Scanner";

        struct SlotGuard
        {
            explicit SlotGuard(common::CountingSemaphore &semaphore) : m_semaphore(semaphore) {}
            ~SlotGuard() { m_semaphore.Release(); }

            SlotGuard(const SlotGuard &) = delete;
            SlotGuard &operator=(const SlotGuard &) = delete;

            common::CountingSemaphore &m_semaphore;
        };

        struct ProbeJoiner
        {
            explicit ProbeJoiner(std::vector<std::thread> &threads) : m_threads(threads) {}
            ~ProbeJoiner()
            {
                for (auto &t : m_threads)
                {
                    if (t.joinable())
                        t.join();
                }
            }

            ProbeJoiner(const ProbeJoiner &) = delete;
            ProbeJoiner &operator=(const ProbeJoiner &) = delete;

            std::vector<std::thread> &m_threads;
        };

        ScanOptions Normalized(ScanOptions options)
        {
            for (const auto &fix : NormalizeScanOptions(options))
                common::LogWarn(kTag, fix);
            return options;
        }

        void JoinOrDetach(std::thread &t)
        {
            if (!t.joinable())
                return;
            if (t.get_id() == std::this_thread::get_id())
                t.detach();
            else
                t.join();
        }
    }

    const char *ToString(ScanState state)
    {
        switch (state)
        {
        case ScanState::Stopped:
            return "Stopped";
        case ScanState::Armed:
            return "Armed";
        case ScanState::Sweeping:
            return "Sweeping";
        }
        return "Unknown";
    }

    NetworkScanner::NetworkScanner(ScanOptions options, ScannerDependencies dependencies)
        : m_options(Normalized(std::move(options))), m_deps(std::move(dependencies)),
          m_shouldScan(false), m_sweeping(false), m_pauseGeneration(0), m_dispatchedProbes(0)
    {
    }

    NetworkScanner::~NetworkScanner()
    {
        m_shouldScan = false;
        ++m_pauseGeneration;
        RetireTimerThreads();
        JoinRetiredThreads();
    }

    void NetworkScanner::StartScanning()
    {
        bool expected = false;
        if (!m_shouldScan.compare_exchange_strong(expected, true))
            return;

        common::LogInfo(kTag, "Starting continuous scanning");
        if (m_options.enable_continuous_scanning)
            StartContinuousScanning();
    }

    void NetworkScanner::PauseScanning()
    {
        common::LogInfo(kTag, "Pausing continuous scanning");
        m_shouldScan = false;
        ++m_pauseGeneration;

        StopContinuousScanning();

        if (m_sweeping)
            common::LogInfo(kTag, "Scan is currently running - it will stop on next check");
    }

    void NetworkScanner::ResumeScanning()
    {
        bool expected = false;
        if (!m_shouldScan.compare_exchange_strong(expected, true))
            return;

        common::LogInfo(kTag, "Resuming continuous scanning");
        if (m_options.enable_continuous_scanning)
            StartContinuousScanning();
    }

    std::vector<Device> NetworkScanner::ScanNetwork()
    {
        return RunSweep(m_pauseGeneration);
    }

    std::future<std::vector<Device>> NetworkScanner::ScanNetworkAsync()
    {
        return std::async(std::launch::async, [this]
                          { return ScanNetwork(); });
    }

    std::future<std::vector<Device>> NetworkScanner::ScanSingleDeviceAsync(const std::string &address)
    {
        return std::async(std::launch::async, [this, address]
                          { return ScanSingleDevice(address); });
    }

    ScanState NetworkScanner::State() const
    {
        if (m_sweeping)
            return ScanState::Sweeping;
        return m_shouldScan ? ScanState::Armed : ScanState::Stopped;
    }

    OptionalTime NetworkScanner::LastScanTime() const
    {
        std::lock_guard<std::mutex> lock(m_timeMutex);
        return m_lastScanTime;
    }

    OptionalTime NetworkScanner::NextScanTime() const
    {
        std::lock_guard<std::mutex> lock(m_timeMutex);
        return m_nextScanTime;
    }

    std::vector<Device> NetworkScanner::RunSweep(std::uint64_t pauseGeneration)
    {
        bool expected = false;
        if (!m_sweeping.compare_exchange_strong(expected, true))
        {
            common::LogDebug(kTag, "Sweep already in progress, returning current roster");
            return m_registry.Snapshot();
        }

        m_events.scanning_state_changed.Emit(true);

        try
        {
            common::LogInfo(kTag, std::string("Starting network scan (shouldScan: ") + (m_shouldScan ? "true" : "false") + ")");
            if (PausedSince(pauseGeneration))
                common::LogInfo(kTag, "Scan cancelled - scanning is paused");
            else
                SweepSubnets(pauseGeneration);
        }
        catch (const std::exception &e)
        {
            common::LogError(kTag, std::string("Error during network scan: ") + e.what());
            m_events.progress.Emit(std::string("Scan error: ") + e.what());
        }

        m_sweeping = false;
        m_events.scanning_state_changed.Emit(false);

        return m_registry.Snapshot();
    }

    void NetworkScanner::SweepSubnets(std::uint64_t pauseGeneration)
    {
        m_events.progress.Emit("Starting network scan...");

        std::vector<std::string> subnets;
        if (m_deps.subnet_provider)
            subnets = m_deps.subnet_provider->GetSubnetsToScan();

        if (subnets.empty())
        {
            common::LogWarn(kTag, "No subnets to scan");
            m_events.progress.Emit("Error: Could not determine network to scan");
            return;
        }

        // Anything that does not answer this sweep ends up offline.
        m_registry.MarkAllOffline();
        m_dispatchedProbes = 0;

        for (const auto &prefix : subnets)
        {
            if (!common::IsValidSubnetPrefix(prefix))
            {
                common::LogWarn(kTag, "Skipping malformed subnet prefix '" + prefix + "'");
                m_events.progress.Emit("Error: Invalid subnet " + prefix);
                continue;
            }

            if (!SweepSubnet(prefix, pauseGeneration))
                break;
        }

        SetLastScanTime(Clock::now());
        UpdateNextScanTime();

        auto total = m_registry.Size();
        auto online = m_registry.OnlineCount();
        auto offline = total - online;
        common::LogInfo(kTag, "Network scan completed. Online: " + std::to_string(online) +
                                  ", Offline: " + std::to_string(offline) +
                                  ", Total: " + std::to_string(total));
        m_events.progress.Emit("Scan complete - found " + std::to_string(online) + " online devices, " +
                               std::to_string(offline) + " offline");
    }

    bool NetworkScanner::SweepSubnet(const std::string &prefix, std::uint64_t pauseGeneration)
    {
        common::LogInfo(kTag, "Scanning network: " + prefix + "." + std::to_string(m_options.start_octet) +
                                  "-" + std::to_string(m_options.end_octet));
        m_events.progress.Emit("Scanning network " + prefix + ".x...");

        common::CountingSemaphore semaphore(static_cast<std::size_t>(m_options.max_concurrent_connections));
        std::vector<std::thread> probes;
        ProbeJoiner joiner(probes);

        int sinceThrottle = 0;
        for (int octet = m_options.start_octet; octet <= m_options.end_octet; ++octet)
        {
            if (PausedSince(pauseGeneration))
            {
                common::LogInfo(kTag, "Scan cancelled mid-process - scanning was paused");
                return false;
            }

            semaphore.Acquire();

            // The pause may have landed while we waited for a slot.
            if (PausedSince(pauseGeneration))
            {
                semaphore.Release();
                common::LogInfo(kTag, "Scan cancelled mid-process - scanning was paused");
                return false;
            }

            std::string target = prefix + "." + std::to_string(octet);
            try
            {
                probes.emplace_back([this, target, &semaphore]
                                    {
                    SlotGuard slot(semaphore);
                    ProbeAddress(target); });
            }
            catch (const std::system_error &)
            {
                semaphore.Release();
                throw;
            }
            ++m_dispatchedProbes;

            if (++sinceThrottle >= m_options.devices_before_throttle)
            {
                sinceThrottle = 0;
                std::this_thread::sleep_for(m_options.network_throttle_delay);
            }
        }

        return true;
    }

    void NetworkScanner::ProbeAddress(const std::string &address)
    {
        try
        {
            std::optional<std::chrono::milliseconds> roundTrip;
            if (m_deps.pinger)
                roundTrip = m_deps.pinger->Ping(address, m_options.ping_timeout);

            if (!roundTrip)
            {
                // Plain misses never create placeholder entries.
                auto offline = m_registry.MarkOffline(address);
                if (offline)
                {
                    common::LogDebug(kTag, "Device went offline: " + offline->name + " (" + address + ")");
                    m_events.device_discovered.Emit(*offline);
                }
                return;
            }

            Device found = BuildOnlineDevice(address, *roundTrip);
            Device stored = m_registry.Upsert(found);

            common::LogDebug(kTag, "Device online: " + stored.name + " (" + address + ") - " + stored.type +
                                       " - " + std::to_string(stored.response_time.count()) + "ms");
            m_events.device_discovered.Emit(stored);
        }
        catch (const std::exception &e)
        {
            common::LogDebug(kTag, "Error processing device " + address + ": " + e.what());
        }
        catch (...)
        {
            common::LogDebug(kTag, "Error processing device " + address + ": unknown error");
        }
    }

    std::vector<Device> NetworkScanner::ScanSingleDevice(const std::string &address)
    {
        common::LogInfo(kTag, "Scanning single device at " + address);
        m_events.progress.Emit("Scanning device at " + address + "...");

        std::vector<Device> result;

        if (!common::IsValidIpv4(address))
        {
            if (common::IsValidIpv6(address))
            {
                common::LogWarn(kTag, "Only IPv4 addresses are supported: " + address);
                m_events.progress.Emit("Error: Only IPv4 addresses are supported");
            }
            else
            {
                common::LogWarn(kTag, "Invalid IP address format: " + address);
                m_events.progress.Emit("Error: Invalid IP address format");
            }
            return result;
        }

        try
        {
            std::optional<std::chrono::milliseconds> roundTrip;
            if (m_deps.pinger)
                roundTrip = m_deps.pinger->Ping(address, m_options.ping_timeout);

            if (roundTrip)
            {
                result.push_back(BuildOnlineDevice(address, *roundTrip));
            }
            else
            {
                Device offline;
                offline.address = address;
                offline.is_online = false;
                offline.last_seen = Clock::now();
                offline.name = ResolveName(address);
                result.push_back(offline);
            }

            bool found = result.front().is_online;
            common::LogInfo(kTag, "Single device scan completed for " + address + ": " +
                                      (found ? "responsive" : "not responding"));
            m_events.progress.Emit(std::string("Scan complete - ") + (found ? "Device found" : "No device found"));
        }
        catch (const std::exception &e)
        {
            common::LogError(kTag, "Error during single device scan for " + address + ": " + e.what());

            Device failed;
            failed.address = address;
            failed.is_online = false;
            failed.last_seen = Clock::now();
            failed.name = "ERROR_" + common::LastOctet(address);
            failed.type = "Error";
            result.clear();
            result.push_back(failed);

            m_events.progress.Emit(std::string("Scan error: ") + e.what());
        }

        return result;
    }

    Device NetworkScanner::BuildOnlineDevice(const std::string &address, std::chrono::milliseconds roundTrip)
    {
        Device device;
        device.address = address;
        device.is_online = true;
        device.last_seen = Clock::now();
        device.response_time = roundTrip;
        device.name = ResolveName(address);

        if (m_options.probe_settle_delay.count() > 0)
            std::this_thread::sleep_for(m_options.probe_settle_delay);

        device.mac_address = ResolveMac(address);
        device.type = Classify(address);
        return device;
    }

    std::string NetworkScanner::ResolveName(const std::string &address)
    {
        if (m_deps.hostname_resolver)
        {
            try
            {
                auto name = m_deps.hostname_resolver->ResolveHostName(address);
                if (name && !name->empty())
                    return *name;
            }
            catch (const std::exception &e)
            {
                common::LogDebug(kTag, "Host name lookup failed for " + address + ": " + e.what());
            }
        }
        return PlaceholderName(address);
    }

    std::string NetworkScanner::ResolveMac(const std::string &address)
    {
        if (m_deps.mac_resolver)
        {
            try
            {
                auto mac = m_deps.mac_resolver->ResolveMac(address);
                if (mac && !mac->empty())
                    return *mac;
                common::LogDebug(kTag, "No MAC address found for " + address);
            }
            catch (const std::exception &e)
            {
                common::LogDebug(kTag, "Error getting MAC address for " + address + ": " + e.what());
            }
        }
        return kUnknown;
    }

    std::string NetworkScanner::Classify(const std::string &address)
    {
        if (!m_deps.detection_chain)
            return kUnknown;
        return m_deps.detection_chain->ClassifyDevice(address);
    }

    void NetworkScanner::StartContinuousScanning()
    {
        // Loops from an earlier Start/Pause cycle exit on their own, possibly
        // after finishing a sweep; their handles are joined by the destructor.
        common::LogDebug(kTag, "Starting continuous scanning timers");
        UpdateNextScanTime();

        std::lock_guard<std::mutex> lock(m_timerMutex);
        std::uint64_t generation = ++m_timerGeneration;
        if (m_scheduleThread.joinable())
            m_retiredThreads.push_back(std::move(m_scheduleThread));
        if (m_tickThread.joinable())
            m_retiredThreads.push_back(std::move(m_tickThread));
        m_timerCv.notify_all();

        m_scheduleThread = std::thread(&NetworkScanner::ScheduleLoop, this, generation);
        m_tickThread = std::thread(&NetworkScanner::TickLoop, this, generation);
    }

    void NetworkScanner::StopContinuousScanning()
    {
        RetireTimerThreads();

        {
            std::lock_guard<std::mutex> lock(m_timeMutex);
            m_nextScanTime.reset();
        }
        m_events.next_scan_time_changed.Emit(std::nullopt);
    }

    // Loops are not joined here: the caller may be the schedule thread itself,
    // or a probe thread its sweep is waiting for.
    void NetworkScanner::RetireTimerThreads()
    {
        {
            std::lock_guard<std::mutex> lock(m_timerMutex);
            ++m_timerGeneration;
            if (m_scheduleThread.joinable())
                m_retiredThreads.push_back(std::move(m_scheduleThread));
            if (m_tickThread.joinable())
                m_retiredThreads.push_back(std::move(m_tickThread));
        }
        m_timerCv.notify_all();
    }

    void NetworkScanner::JoinRetiredThreads()
    {
        std::vector<std::thread> retired;
        {
            std::lock_guard<std::mutex> lock(m_timerMutex);
            retired.swap(m_retiredThreads);
        }
        for (auto &t : retired)
            JoinOrDetach(t);
    }

    bool NetworkScanner::WaitForTimer(std::uint64_t timerGeneration, std::chrono::steady_clock::time_point deadline)
    {
        std::unique_lock<std::mutex> lock(m_timerMutex);
        bool cancelled = m_timerCv.wait_until(lock, deadline, [this, timerGeneration]
                                              { return m_timerGeneration != timerGeneration; });
        return !cancelled;
    }

    void NetworkScanner::ScheduleLoop(std::uint64_t timerGeneration)
    {
        auto deadline = std::chrono::steady_clock::now();

        while (WaitForTimer(timerGeneration, deadline))
        {
            std::uint64_t pauseGeneration = m_pauseGeneration;

            if (!m_shouldScan)
            {
                common::LogDebug(kTag, "Timer triggered but scanning is paused - skipping scan");
            }
            else if (m_sweeping)
            {
                common::LogDebug(kTag, "Timer triggered but scan already in progress - skipping scan");
            }
            else
            {
                common::LogDebug(kTag, "Timer triggered - starting scan");
                RunSweep(pauseGeneration);
            }

            // Fixed rate: ticks that fell inside a long sweep are skipped.
            auto now = std::chrono::steady_clock::now();
            do
            {
                deadline += m_options.scan_interval;
            } while (deadline <= now);
        }
    }

    void NetworkScanner::TickLoop(std::uint64_t timerGeneration)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);

        while (WaitForTimer(timerGeneration, deadline))
        {
            if (m_shouldScan)
            {
                auto next = NextScanTime();
                if (next)
                    m_events.next_scan_time_changed.Emit(next);
            }
            deadline += std::chrono::seconds(1);
        }
    }

    void NetworkScanner::UpdateNextScanTime()
    {
        OptionalTime next;
        if (m_shouldScan && m_options.enable_continuous_scanning)
            next = Clock::now() + std::chrono::duration_cast<Clock::duration>(m_options.scan_interval);

        {
            std::lock_guard<std::mutex> lock(m_timeMutex);
            m_nextScanTime = next;
        }
        m_events.next_scan_time_changed.Emit(next);
    }

    void NetworkScanner::SetLastScanTime(Clock::time_point when)
    {
        {
            std::lock_guard<std::mutex> lock(m_timeMutex);
            m_lastScanTime = when;
        }
        m_events.last_scan_time_changed.Emit(OptionalTime(when));
    }
}
