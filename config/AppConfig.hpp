#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "../common/Log.hpp"
#include "../core/ScanOptions.hpp"
#include "../detection/DetectorFactory.hpp"
#include "../detection/PortDetectionOptions.hpp"

namespace netsweep::config
{
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct StorageConfig
    {
        std::string database{"netsweep.db"};
    };

    struct AppConfig
    {
        common::LogLevel log_level{common::LogLevel::Info};

        core::ScanOptions scanner{};
        // Empty means "auto": the local interface's /24.
        std::vector<std::string> subnets{};

        detection::PortDetectionOptions ports{};
        detection::DetectorToggles detectors{};

        StorageConfig storage{};
    };

    // Every key is optional. Throws ConfigError on unreadable files, YAML
    // syntax errors and values that cannot be used (bad prefixes, ports, levels).
    // Out-of-range scanner numbers are clamped with a warning instead.
    AppConfig LoadAppConfig(const std::string &path);
    AppConfig LoadAppConfigFromString(const std::string &yaml);
}
