#pragma once

#include "../core/SubnetProvider.hpp"

namespace netsweep::net
{
    // The /24 of the default route interface's IPv4 address, looked up on every call.
    class LocalSubnetProvider : public core::SubnetProvider
    {
    public:
        std::vector<std::string> GetSubnetsToScan() override;
    };
}
