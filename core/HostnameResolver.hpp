#pragma once

#include <optional>
#include <string>

namespace netsweep::core
{
    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;
        virtual std::optional<std::string> ResolveHostName(const std::string &address) = 0;
    };
}
