#pragma once

#include <optional>
#include <string>
#include "Device.hpp"
#include "../common/EventChannel.hpp"

namespace netsweep::core
{
    using OptionalTime = std::optional<Clock::time_point>;

    struct ScanEvents
    {
        common::EventChannel<std::string> progress;
        common::EventChannel<Device> device_discovered;
        common::EventChannel<bool> scanning_state_changed;
        common::EventChannel<OptionalTime> next_scan_time_changed;
        common::EventChannel<OptionalTime> last_scan_time_changed;
    };
}
