#pragma once

#include <optional>
#include <string>

namespace netsweep::detection
{
    class DeviceTypeDetector
    {
    public:
        virtual ~DeviceTypeDetector() = default;

        // Higher runs first. Cheap, specific detectors should rank above
        // broad, expensive ones.
        virtual int Priority() const = 0;
        virtual std::string Name() const = 0;

        // A label such as "Ubuntu Linux (SSH)", or nullopt for no match.
        // Implementations own their timeouts.
        virtual std::optional<std::string> Classify(const std::string &address) = 0;
    };
}
