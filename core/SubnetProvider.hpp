#pragma once

#include <string>
#include <vector>

namespace netsweep::core
{
    class SubnetProvider
    {
    public:
        virtual ~SubnetProvider() = default;

        // Three-octet prefixes such as "192.168.1".
        virtual std::vector<std::string> GetSubnetsToScan() = 0;
    };
}
