#include "StaticSubnetProvider.hpp"
#include "../common/Ipv4.hpp"
#include "../common/Log.hpp"
#include <algorithm>

namespace netsweep::net
{
    StaticSubnetProvider::StaticSubnetProvider(const std::vector<std::string> &prefixes)
    {
        for (const auto &prefix : prefixes)
        {
            if (!common::IsValidSubnetPrefix(prefix))
            {
                common::LogWarn("Subnet", "Ignoring malformed subnet prefix '" + prefix + "'");
                continue;
            }
            if (std::find(m_prefixes.begin(), m_prefixes.end(), prefix) != m_prefixes.end())
            {
                common::LogWarn("Subnet", "Ignoring duplicate subnet prefix '" + prefix + "'");
                continue;
            }
            m_prefixes.push_back(prefix);
        }
    }
}
