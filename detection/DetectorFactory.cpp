#include "DetectorFactory.hpp"
#include "HttpDetector.hpp"
#include "ServiceEndpointDetector.hpp"
#include "SshDetector.hpp"
#include "UpnpDetector.hpp"
#include "WindowsServicesDetector.hpp"
#include "../common/Log.hpp"

namespace netsweep::detection
{
    std::vector<std::shared_ptr<DeviceTypeDetector>> CreateDefaultDetectors(const PortDetectionOptions &options)
    {
        DetectorToggles toggles;
        toggles.upnp = false;
        return CreateDetectors(options, toggles);
    }

    std::vector<std::shared_ptr<DeviceTypeDetector>> CreateEnhancedDetectors(const PortDetectionOptions &options)
    {
        return CreateDetectors(options, DetectorToggles{});
    }

    std::vector<std::shared_ptr<DeviceTypeDetector>> CreateDetectors(const PortDetectionOptions &options,
                                                                     const DetectorToggles &toggles)
    {
        std::vector<std::shared_ptr<DeviceTypeDetector>> detectors;

        if (toggles.upnp)
            detectors.push_back(std::make_shared<UpnpDetector>(options));
        if (toggles.service_endpoints)
            detectors.push_back(std::make_shared<ServiceEndpointDetector>(options));
        if (toggles.http)
            detectors.push_back(std::make_shared<HttpDetector>(options));
        if (toggles.ssh)
            detectors.push_back(std::make_shared<SshDetector>(options));
        if (toggles.windows_services)
            detectors.push_back(std::make_shared<WindowsServicesDetector>(options));

        return detectors;
    }

    std::shared_ptr<DetectionChain> CreateDetectionChain(const PortDetectionOptions &options,
                                                         const DetectorToggles &toggles)
    {
        auto chain = std::make_shared<DetectionChain>(CreateDetectors(options, toggles));

        std::string names;
        for (const auto &detector : chain->Detectors())
            names += (names.empty() ? "" : ", ") + detector->Name() + "(" + std::to_string(detector->Priority()) + ")";
        common::LogInfo("Detect", "Detection chain: " + (names.empty() ? std::string("none") : names));

        return chain;
    }
}
