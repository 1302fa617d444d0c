#include "ArpTableResolver.hpp"
#include "../common/Ipv4.hpp"
#include "../common/Log.hpp"
#include <cctype>
#include <fstream>
#include <sstream>

namespace netsweep::net
{
    std::string NormalizeMac(const std::string &mac)
    {
        std::string hex;
        for (char c : mac)
        {
            if (c == ':' || c == '-')
                continue;
            if (!std::isxdigit(static_cast<unsigned char>(c)))
                return std::string();
            hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        if (hex.size() != 12)
            return std::string();

        std::string out;
        for (size_t i = 0; i < hex.size(); i += 2)
        {
            if (!out.empty())
                out.push_back(':');
            out.append(hex, i, 2);
        }
        return out;
    }

    std::map<std::string, std::string> ParseArpTable(std::istream &in)
    {
        std::map<std::string, std::string> table;

        std::string line;
        std::getline(in, line); // header
        while (std::getline(in, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac))
                continue;

            if (!common::IsValidIpv4(ip))
                continue;

            std::string normalized = NormalizeMac(mac);
            if (normalized.empty() || normalized == "00:00:00:00:00:00")
                continue;

            table[ip] = normalized;
        }
        return table;
    }

    ArpTableResolver::ArpTableResolver(std::string tablePath)
        : m_tablePath(std::move(tablePath))
    {
    }

    std::map<std::string, std::string> ArpTableResolver::GetArpTable()
    {
        std::ifstream arpFile(m_tablePath);
        if (!arpFile.is_open())
        {
            common::LogDebug("ARP", "Cannot open " + m_tablePath);
            return {};
        }
        return ParseArpTable(arpFile);
    }
}
