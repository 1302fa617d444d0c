#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "DeviceTypeDetector.hpp"

namespace netsweep::detection
{
    class DetectionChain
    {
    public:
        DetectionChain() = default;
        explicit DetectionChain(std::vector<std::shared_ptr<DeviceTypeDetector>> detectors);

        // First non-empty answer in priority order, or "Unknown".
        std::string ClassifyDevice(const std::string &address) const;
        std::optional<std::string> TryClassify(const std::string &address) const;

        const std::vector<std::shared_ptr<DeviceTypeDetector>> &Detectors() const { return m_detectors; }
        bool Empty() const { return m_detectors.empty(); }

    private:
        std::vector<std::shared_ptr<DeviceTypeDetector>> m_detectors;
    };
}
