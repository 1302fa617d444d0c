#pragma once

#include "../core/HostnameResolver.hpp"

namespace netsweep::net
{
    // "nas.lan" -> "NAS", "pc01.corp.example" -> "PC01 (corp)", "printer" -> "PRINTER"
    std::string FormatHostName(const std::string &fqdn);

    // Reverse lookup through the system resolver (getnameinfo with NI_NAMEREQD).
    class DnsHostnameResolver : public core::HostnameResolver
    {
    public:
        std::optional<std::string> ResolveHostName(const std::string &address) override;
    };
}
