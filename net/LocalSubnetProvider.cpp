#include "LocalSubnetProvider.hpp"
#include "../common/Ipv4.hpp"
#include "../common/Log.hpp"
#include <tins/tins.h>

namespace netsweep::net
{
    std::vector<std::string> LocalSubnetProvider::GetSubnetsToScan()
    {
        std::vector<std::string> subnets;

        try
        {
            Tins::NetworkInterface iface = Tins::NetworkInterface::default_interface();
            Tins::NetworkInterface::Info info = iface.info();

            std::string localIp = info.ip_addr.to_string();
            if (info.ip_addr.is_loopback() || localIp == "0.0.0.0")
            {
                common::LogWarn("Subnet", "Could not determine local IP address");
                return subnets;
            }

            std::string prefix = common::SubnetPrefixOf(localIp);
            subnets.push_back(prefix);
            common::LogInfo("Subnet", "Local IP: " + localIp + " on " + iface.name() + ", Subnet: " + prefix + ".x");
        }
        catch (const std::exception &e)
        {
            common::LogError("Subnet", std::string("Error determining local subnet: ") + e.what());
        }

        return subnets;
    }
}
