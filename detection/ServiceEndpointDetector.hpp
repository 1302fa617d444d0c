#pragma once

#include "DeviceTypeDetector.hpp"
#include "PortDetectionOptions.hpp"

namespace netsweep::detection
{
    // First open port from the configured endpoint list names the device.
    class ServiceEndpointDetector : public DeviceTypeDetector
    {
    public:
        explicit ServiceEndpointDetector(PortDetectionOptions options) : m_options(std::move(options)) {}

        int Priority() const override { return 60; }
        std::string Name() const override { return "ServiceEndpoint"; }
        std::optional<std::string> Classify(const std::string &address) override;

    private:
        PortDetectionOptions m_options;
    };
}
