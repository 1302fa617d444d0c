#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "Device.hpp"
#include "DeviceRegistry.hpp"
#include "HostnameResolver.hpp"
#include "MacResolver.hpp"
#include "Pinger.hpp"
#include "ScanEvents.hpp"
#include "ScanOptions.hpp"
#include "SubnetProvider.hpp"
#include "../detection/DetectionChain.hpp"

namespace netsweep::core
{
    enum class ScanState
    {
        Stopped,
        Armed,
        Sweeping
    };

    const char *ToString(ScanState state);

    struct ScannerDependencies
    {
        std::shared_ptr<SubnetProvider> subnet_provider;
        std::shared_ptr<Pinger> pinger;
        std::shared_ptr<HostnameResolver> hostname_resolver;
        std::shared_ptr<MacResolver> mac_resolver;
        std::shared_ptr<detection::DetectionChain> detection_chain;
    };

    /*
     * Sweeps the configured subnets and keeps the roster in Registry() up to
     * date. At most one full sweep runs at a time; pausing is cooperative and
     * lets already dispatched probes finish.
     *
     * The *Async variants run on a separate thread and capture `this`; the
     * scanner must outlive the returned futures.
     */
    class NetworkScanner
    {
    public:
        NetworkScanner(ScanOptions options, ScannerDependencies dependencies);
        ~NetworkScanner();

        NetworkScanner(const NetworkScanner &) = delete;
        NetworkScanner &operator=(const NetworkScanner &) = delete;

        void StartScanning();
        void PauseScanning();
        void ResumeScanning();

        std::vector<Device> ScanNetwork();
        std::future<std::vector<Device>> ScanNetworkAsync();

        // Diagnostic probe of one host. Never touches the shared roster.
        std::vector<Device> ScanSingleDevice(const std::string &address);
        std::future<std::vector<Device>> ScanSingleDeviceAsync(const std::string &address);

        ScanState State() const;
        bool IsScanning() const { return m_sweeping; }
        OptionalTime LastScanTime() const;
        OptionalTime NextScanTime() const;
        std::vector<Device> DiscoveredDevices() const { return m_registry.Snapshot(); }

        // Probes dispatched by the current (or last) sweep.
        std::size_t DispatchedProbeCount() const { return m_dispatchedProbes; }

        DeviceRegistry &Registry() { return m_registry; }
        const DeviceRegistry &Registry() const { return m_registry; }
        ScanEvents &Events() { return m_events; }
        const ScanOptions &Options() const { return m_options; }

    private:
        std::vector<Device> RunSweep(std::uint64_t pauseGeneration);
        void SweepSubnets(std::uint64_t pauseGeneration);
        bool SweepSubnet(const std::string &prefix, std::uint64_t pauseGeneration);
        void ProbeAddress(const std::string &address);

        Device BuildOnlineDevice(const std::string &address, std::chrono::milliseconds roundTrip);
        std::string ResolveName(const std::string &address);
        std::string ResolveMac(const std::string &address);
        std::string Classify(const std::string &address);

        bool PausedSince(std::uint64_t pauseGeneration) const { return m_pauseGeneration != pauseGeneration; }

        void StartContinuousScanning();
        void StopContinuousScanning();
        void ScheduleLoop(std::uint64_t timerGeneration);
        void TickLoop(std::uint64_t timerGeneration);
        bool WaitForTimer(std::uint64_t timerGeneration, std::chrono::steady_clock::time_point deadline);
        void RetireTimerThreads();
        void JoinRetiredThreads();

        void UpdateNextScanTime();
        void SetLastScanTime(Clock::time_point when);

        const ScanOptions m_options;
        ScannerDependencies m_deps;

        DeviceRegistry m_registry;
        ScanEvents m_events;

        std::atomic<bool> m_shouldScan;
        std::atomic<bool> m_sweeping;
        std::atomic<std::uint64_t> m_pauseGeneration;
        std::atomic<std::size_t> m_dispatchedProbes;

        mutable std::mutex m_timeMutex;
        OptionalTime m_lastScanTime;
        OptionalTime m_nextScanTime;

        std::mutex m_timerMutex;
        std::condition_variable m_timerCv;
        std::uint64_t m_timerGeneration = 0;
        std::thread m_scheduleThread;
        std::thread m_tickThread;
        std::vector<std::thread> m_retiredThreads;
    };
}
