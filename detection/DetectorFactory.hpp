#pragma once

#include <memory>
#include <vector>
#include "DetectionChain.hpp"
#include "PortDetectionOptions.hpp"

namespace netsweep::detection
{
    struct DetectorToggles
    {
        bool upnp = true;
        bool service_endpoints = true;
        bool http = true;
        bool ssh = true;
        bool windows_services = true;
    };

    // Port based detectors only: service endpoints, HTTP, SSH, Windows services.
    std::vector<std::shared_ptr<DeviceTypeDetector>> CreateDefaultDetectors(const PortDetectionOptions &options);

    // Default set plus UPnP discovery.
    std::vector<std::shared_ptr<DeviceTypeDetector>> CreateEnhancedDetectors(const PortDetectionOptions &options);

    std::vector<std::shared_ptr<DeviceTypeDetector>> CreateDetectors(const PortDetectionOptions &options,
                                                                     const DetectorToggles &toggles);

    std::shared_ptr<DetectionChain> CreateDetectionChain(const PortDetectionOptions &options,
                                                         const DetectorToggles &toggles);
}
