#include "DnsHostnameResolver.hpp"
#include "../common/Log.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace netsweep::net
{
    namespace
    {
        std::string ToUpper(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return text;
        }
    }

    std::string FormatHostName(const std::string &fqdn)
    {
        auto firstDot = fqdn.find('.');
        if (firstDot == std::string::npos)
            return ToUpper(fqdn);

        std::string computer = ToUpper(fqdn.substr(0, firstDot));

        auto secondDot = fqdn.find('.', firstDot + 1);
        std::string domain = fqdn.substr(firstDot + 1, secondDot == std::string::npos ? std::string::npos : secondDot - firstDot - 1);

        if (domain.size() > 2)
            return computer + " (" + domain + ")";
        return computer;
    }

    std::optional<std::string> DnsHostnameResolver::ResolveHostName(const std::string &address)
    {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST] = {0};
        int rc = getnameinfo(reinterpret_cast<sockaddr *>(&addr), sizeof(addr), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
        {
            common::LogDebug("DNS", "No reverse record for " + address + ": " + gai_strerror(rc));
            return std::nullopt;
        }

        std::string name(host);
        if (name.empty())
            return std::nullopt;
        return FormatHostName(name);
    }
}
