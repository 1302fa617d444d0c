#include "ConsoleReporter.hpp"
#include "../common/Log.hpp"
#include <iomanip>
#include <sstream>

namespace netsweep::agent
{
    std::string FormatDeviceLine(const core::Device &device)
    {
        std::stringstream ss;
        ss << std::left << std::setw(16) << device.address
           << std::setw(8) << (device.is_online ? "online" : "offline");

        if (device.is_online)
            ss << std::setw(8) << (std::to_string(device.response_time.count()) + "ms");
        else
            ss << std::setw(8) << "-";

        ss << std::setw(19) << device.mac_address
           << std::setw(34) << device.type
           << device.name;

        if (device.last_seen.time_since_epoch().count() != 0)
            ss << "  (seen " << core::FormatTime(device.last_seen) << ")";
        return ss.str();
    }

    void PrintRoster(std::ostream &out, const std::vector<core::Device> &devices)
    {
        out << std::left << std::setw(16) << "ADDRESS" << std::setw(8) << "STATE" << std::setw(8) << "RTT"
            << std::setw(19) << "MAC" << std::setw(34) << "TYPE" << "NAME\n";
        for (const auto &d : devices)
            out << FormatDeviceLine(d) << "\n";
    }

    ConsoleReporter::ConsoleReporter(core::ScanEvents &events)
        : m_events(events)
    {
        m_progress = m_events.progress.Connect([](const std::string &message)
                                               { common::LogInfo("Scan", message); });

        m_discovered = m_events.device_discovered.Connect([](const core::Device &device)
                                                          { common::LogDebug("Device", FormatDeviceLine(device)); });

        m_lastScan = m_events.last_scan_time_changed.Connect([](const core::OptionalTime &when)
                                                             {
            if (when)
                common::LogInfo("Scan", "Last scan at " + core::FormatTime(*when)); });
    }

    ConsoleReporter::~ConsoleReporter()
    {
        m_events.progress.Disconnect(m_progress);
        m_events.device_discovered.Disconnect(m_discovered);
        m_events.last_scan_time_changed.Disconnect(m_lastScan);
    }
}
