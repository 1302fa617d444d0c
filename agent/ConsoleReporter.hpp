#pragma once

#include <ostream>
#include <vector>
#include "../core/ScanEvents.hpp"

namespace netsweep::agent
{
    // One roster row: address, state, latency, MAC, type, name, last seen.
    std::string FormatDeviceLine(const core::Device &device);

    void PrintRoster(std::ostream &out, const std::vector<core::Device> &devices);

    // Mirrors scanner events on the console for as long as it lives.
    class ConsoleReporter
    {
    public:
        explicit ConsoleReporter(core::ScanEvents &events);
        ~ConsoleReporter();

        ConsoleReporter(const ConsoleReporter &) = delete;
        ConsoleReporter &operator=(const ConsoleReporter &) = delete;

    private:
        core::ScanEvents &m_events;
        common::EventChannel<std::string>::Handle m_progress;
        common::EventChannel<core::Device>::Handle m_discovered;
        common::EventChannel<core::OptionalTime>::Handle m_lastScan;
    };
}
