#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace netsweep::core
{
    class Pinger
    {
    public:
        virtual ~Pinger() = default;

        // Round-trip time of one echo request, or nullopt if no reply within timeout.
        virtual std::optional<std::chrono::milliseconds> Ping(const std::string &address,
                                                              std::chrono::milliseconds timeout) = 0;
    };
}
