#pragma once

#include <istream>
#include "../core/MacResolver.hpp"

namespace netsweep::net
{
    // Parses the kernel neighbour table format of /proc/net/arp.
    // Incomplete entries (all-zero hardware address) are skipped.
    std::map<std::string, std::string> ParseArpTable(std::istream &in);

    // "aa-bb-cc-dd-ee-ff" / "aa:bb:..." -> "AA:BB:CC:DD:EE:FF"; empty if malformed.
    std::string NormalizeMac(const std::string &mac);

    class ArpTableResolver : public core::MacResolver
    {
    public:
        explicit ArpTableResolver(std::string tablePath = "/proc/net/arp");

        std::map<std::string, std::string> GetArpTable() override;

        const std::string &TablePath() const { return m_tablePath; }

    private:
        std::string m_tablePath;
    };
}
