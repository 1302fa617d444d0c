#pragma once

#include <vector>
#include "../core/SubnetProvider.hpp"

namespace netsweep::net
{
    // Fixed list of three-octet prefixes. Malformed and duplicate entries are dropped with a warning.
    class StaticSubnetProvider : public core::SubnetProvider
    {
    public:
        explicit StaticSubnetProvider(const std::vector<std::string> &prefixes);

        std::vector<std::string> GetSubnetsToScan() override { return m_prefixes; }

    private:
        std::vector<std::string> m_prefixes;
    };
}
