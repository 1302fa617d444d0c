#include "Ipv4.hpp"
#include <arpa/inet.h>
#include <algorithm>
#include <cstring>

namespace netsweep::common
{
    bool IsValidIpv4(const std::string &address)
    {
        in_addr addr;
        return inet_pton(AF_INET, address.c_str(), &addr) == 1;
    }

    bool IsValidIpv6(const std::string &address)
    {
        in6_addr addr;
        return inet_pton(AF_INET6, address.c_str(), &addr) == 1;
    }

    bool IsValidSubnetPrefix(const std::string &prefix)
    {
        if (std::count(prefix.begin(), prefix.end(), '.') != 2)
            return false;
        return IsValidIpv4(prefix + ".0");
    }

    std::optional<std::uint32_t> Ipv4ToHostOrder(const std::string &address)
    {
        in_addr addr;
        if (inet_pton(AF_INET, address.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string LastOctet(const std::string &address)
    {
        auto pos = address.find_last_of('.');
        if (pos == std::string::npos)
            return address;
        return address.substr(pos + 1);
    }

    std::string SubnetPrefixOf(const std::string &address)
    {
        auto pos = address.find_last_of('.');
        if (pos == std::string::npos)
            return "";
        return address.substr(0, pos);
    }
}
