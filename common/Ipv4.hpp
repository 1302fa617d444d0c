#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace netsweep::common
{
    // Strict dotted-quad check (inet_pton semantics: no shorthand, no spaces).
    bool IsValidIpv4(const std::string &address);
    bool IsValidIpv6(const std::string &address);

    // "192.168.1" style three-octet prefix.
    bool IsValidSubnetPrefix(const std::string &prefix);

    std::optional<std::uint32_t> Ipv4ToHostOrder(const std::string &address);

    std::string LastOctet(const std::string &address);
    std::string SubnetPrefixOf(const std::string &address);
}
