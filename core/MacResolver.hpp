#pragma once

#include <map>
#include <optional>
#include <string>

namespace netsweep::core
{
    class MacResolver
    {
    public:
        virtual ~MacResolver() = default;

        // IPv4 address -> "AA:BB:CC:DD:EE:FF".
        virtual std::map<std::string, std::string> GetArpTable() = 0;

        virtual std::optional<std::string> ResolveMac(const std::string &address)
        {
            auto table = GetArpTable();
            auto it = table.find(address);
            if (it == table.end())
                return std::nullopt;
            return it->second;
        }
    };
}
