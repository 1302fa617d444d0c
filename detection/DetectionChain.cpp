#include "DetectionChain.hpp"
#include "../common/Log.hpp"
#include "../core/Device.hpp"
#include <algorithm>
#include <exception>

namespace netsweep::detection
{
    DetectionChain::DetectionChain(std::vector<std::shared_ptr<DeviceTypeDetector>> detectors)
    {
        for (auto &detector : detectors)
        {
            if (detector)
                m_detectors.push_back(std::move(detector));
        }

        std::stable_sort(m_detectors.begin(), m_detectors.end(),
                         [](const std::shared_ptr<DeviceTypeDetector> &a, const std::shared_ptr<DeviceTypeDetector> &b)
                         { return a->Priority() > b->Priority(); });
    }

    std::optional<std::string> DetectionChain::TryClassify(const std::string &address) const
    {
        for (const auto &detector : m_detectors)
        {
            std::optional<std::string> detected;
            try
            {
                detected = detector->Classify(address);
            }
            catch (const std::exception &e)
            {
                common::LogDebug("Detection", detector->Name() + " failed for " + address + ": " + e.what());
                continue;
            }
            catch (...)
            {
                common::LogDebug("Detection", detector->Name() + " failed for " + address + ": unknown error");
                continue;
            }

            if (detected && !detected->empty())
            {
                common::LogDebug("Detection", address + " classified by " + detector->Name() + " as " + *detected);
                return detected;
            }
        }

        common::LogDebug("Detection", "No device type detected for " + address + ", keeping as Unknown");
        return std::nullopt;
    }

    std::string DetectionChain::ClassifyDevice(const std::string &address) const
    {
        auto detected = TryClassify(address);
        return detected ? *detected : std::string(core::kUnknown);
    }
}
