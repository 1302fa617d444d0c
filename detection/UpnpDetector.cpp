#include "UpnpDetector.hpp"
#include "../common/Log.hpp"
#include "../net/TcpProbe.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <netinet/in.h>
#include <poll.h>
#include <set>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace netsweep::detection
{
    namespace
    {
        const std::string kTag = "UPnP";
        const char *kSsdpAddress = "239.255.255.250";
        const int kSsdpPort = 1900;

        std::string ToLower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string Trim(const std::string &text)
        {
            auto begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return std::string();
            auto end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        std::string DecodeEntities(std::string text)
        {
            static const std::pair<const char *, const char *> kEntities[] = {
                {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&apos;", "'"}, {"&amp;", "&"}};
            for (const auto &[entity, plain] : kEntities)
            {
                std::string from(entity);
                size_t pos = 0;
                while ((pos = text.find(from, pos)) != std::string::npos)
                {
                    text.replace(pos, from.size(), plain);
                    pos += 1;
                }
            }
            return text;
        }

        // Finds <tag> or <ns:tag> inside [from, to) and returns its text content.
        std::string ElementText(const std::string &xml, const std::string &tag, size_t from, size_t to)
        {
            size_t pos = from;
            while (true)
            {
                pos = xml.find('<', pos);
                if (pos == std::string::npos || pos >= to)
                    return std::string();

                size_t nameEnd = xml.find_first_of(" \t\r\n/>", pos + 1);
                if (nameEnd == std::string::npos)
                    return std::string();

                std::string name = xml.substr(pos + 1, nameEnd - pos - 1);
                auto colon = name.find(':');
                std::string local = colon == std::string::npos ? name : name.substr(colon + 1);

                if (local == tag)
                {
                    size_t open = xml.find('>', nameEnd);
                    if (open == std::string::npos || open >= to)
                        return std::string();
                    if (xml[open - 1] == '/')
                        return std::string();

                    size_t close = xml.find("</" + name, open + 1);
                    if (close == std::string::npos || close > to)
                        return std::string();
                    return Trim(DecodeEntities(xml.substr(open + 1, close - open - 1)));
                }
                pos = nameEnd;
            }
        }

        // Range of the first element whose local name is `tag`, content only.
        bool ElementRange(const std::string &xml, const std::string &tag, size_t &begin, size_t &end)
        {
            size_t pos = 0;
            while ((pos = xml.find('<', pos)) != std::string::npos)
            {
                size_t nameEnd = xml.find_first_of(" \t\r\n/>", pos + 1);
                if (nameEnd == std::string::npos)
                    return false;

                std::string name = xml.substr(pos + 1, nameEnd - pos - 1);
                auto colon = name.find(':');
                std::string local = colon == std::string::npos ? name : name.substr(colon + 1);

                if (local == tag)
                {
                    size_t open = xml.find('>', nameEnd);
                    if (open == std::string::npos)
                        return false;
                    size_t close = xml.rfind("</" + name);
                    if (close == std::string::npos || close < open)
                        return false;
                    begin = open + 1;
                    end = close;
                    return true;
                }
                pos = nameEnd;
            }
            return false;
        }

        class UdpSocket
        {
        public:
            UdpSocket() : m_fd(socket(AF_INET, SOCK_DGRAM, 0)) {}
            ~UdpSocket()
            {
                if (m_fd >= 0)
                    close(m_fd);
            }

            UdpSocket(const UdpSocket &) = delete;
            UdpSocket &operator=(const UdpSocket &) = delete;

            int Fd() const { return m_fd; }

        private:
            int m_fd;
        };
    }

    std::optional<SsdpResponse> ParseSsdpResponse(const std::string &datagram, const std::string &origin)
    {
        std::istringstream lines(datagram);
        std::string statusLine;
        if (!std::getline(lines, statusLine))
            return std::nullopt;

        std::string status = ToLower(statusLine);
        if (status.rfind("http/1.", 0) != 0 || status.find(" 200") == std::string::npos)
            return std::nullopt;

        SsdpResponse response;
        response.origin = origin;

        std::string line;
        while (std::getline(lines, line))
        {
            auto colon = line.find(':');
            if (colon == std::string::npos)
                continue;

            std::string key = ToLower(Trim(line.substr(0, colon)));
            std::string value = Trim(line.substr(colon + 1));

            if (key == "location")
                response.location = value;
            else if (key == "server")
                response.server = value;
            else if (key == "st")
                response.search_target = value;
        }

        if (response.location.empty())
            return std::nullopt;
        return response;
    }

    std::optional<HttpUrl> ParseHttpUrl(const std::string &url)
    {
        const std::string scheme = "http://";
        if (ToLower(url.substr(0, scheme.size())) != scheme)
            return std::nullopt;

        std::string rest = url.substr(scheme.size());
        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);

        HttpUrl parsed;
        if (slash != std::string::npos)
            parsed.path = rest.substr(slash);

        auto colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos)
        {
            std::string port = authority.substr(colon + 1);
            if (port.empty() || port.size() > 5 || !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
                return std::nullopt;
            parsed.port = std::stoi(port);
            if (parsed.port <= 0 || parsed.port > 65535)
                return std::nullopt;
        }

        if (parsed.host.empty())
            return std::nullopt;
        return parsed;
    }

    std::optional<UpnpDescription> ParseUpnpDescription(const std::string &xml)
    {
        size_t begin = 0;
        size_t end = 0;
        if (!ElementRange(xml, "device", begin, end))
            return std::nullopt;

        // Embedded devices follow in <deviceList>; only the root device's own fields count.
        size_t nested = xml.find("deviceList", begin);
        size_t limit = (nested != std::string::npos && nested < end) ? nested : end;

        UpnpDescription description;
        description.friendly_name = ElementText(xml, "friendlyName", begin, limit);
        description.manufacturer = ElementText(xml, "manufacturer", begin, limit);
        description.model_name = ElementText(xml, "modelName", begin, limit);
        description.device_type = ElementText(xml, "deviceType", begin, limit);
        return description;
    }

    std::optional<std::string> ExtractUpnpTypeHint(const std::string &deviceTypeUrn)
    {
        if (deviceTypeUrn.empty())
            return std::nullopt;

        std::string lower = ToLower(deviceTypeUrn);
        auto has = [&lower](const char *needle)
        { return lower.find(needle) != std::string::npos; };

        if (has("mediaserver"))
            return "Media Server";
        if (has("mediarenderer"))
            return "Media Renderer";
        if (has("printer"))
            return "Printer";
        if (has("scanner"))
            return "Scanner";
        if (has("router") || has("gateway"))
            return "Router/Gateway";
        if (has("tv") || has("television"))
            return "Smart TV";
        if (has("light"))
            return "Smart Light";
        if (has("thermostat"))
            return "Thermostat";
        if (has("camera"))
            return "Camera";
        if (has("storage"))
            return "Network Storage";
        return std::nullopt;
    }

    std::string BuildUpnpDescription(const UpnpDescription &description)
    {
        std::vector<std::string> parts;

        if (!description.friendly_name.empty() && description.friendly_name != description.manufacturer)
            parts.push_back(description.friendly_name);
        else if (!description.model_name.empty())
            parts.push_back(description.manufacturer.empty() ? description.model_name
                                                             : description.manufacturer + " " + description.model_name);
        else if (!description.manufacturer.empty())
            parts.push_back(description.manufacturer);

        auto hint = ExtractUpnpTypeHint(description.device_type);
        if (hint)
            parts.push_back(*hint);

        if (parts.empty())
            return "UPnP Device";

        std::string joined;
        for (const auto &part : parts)
        {
            if (!joined.empty())
                joined += " - ";
            joined += part;
        }
        return joined + " (UPnP)";
    }

    std::optional<std::string> UpnpDetector::Classify(const std::string &address)
    {
        {
            std::lock_guard<std::mutex> lock(m_cacheMutex);
            auto it = m_deviceCache.find(address);
            if (it != m_deviceCache.end())
            {
                common::LogDebug(kTag, "Cache hit for " + address + ": " + it->second);
                return it->second;
            }
        }

        std::set<std::string> tried;
        for (const auto &response : Search())
        {
            auto url = ParseHttpUrl(response.location);
            bool matches = response.origin == address || (url && url->host == address);
            if (!matches || !tried.insert(response.location).second)
                continue;

            auto info = FetchDescription(response.location);
            if (!info)
                continue;

            {
                std::lock_guard<std::mutex> lock(m_cacheMutex);
                m_deviceCache[address] = *info;
            }
            common::LogInfo("Detect", "UPnP device detected: " + *info);
            return info;
        }
        return std::nullopt;
    }

    std::vector<SsdpResponse> UpnpDetector::Search()
    {
        std::lock_guard<std::mutex> lock(m_searchMutex);

        auto now = std::chrono::steady_clock::now();
        if (m_haveSearch && now - m_lastSearchAt < m_options.ssdp_cache_ttl)
            return m_lastSearch;

        m_lastSearch = RunSearch();
        m_lastSearchAt = std::chrono::steady_clock::now();
        m_haveSearch = true;
        return m_lastSearch;
    }

    std::vector<SsdpResponse> UpnpDetector::RunSearch()
    {
        std::vector<SsdpResponse> responses;

        UdpSocket sock;
        if (sock.Fd() < 0)
        {
            common::LogDebug(kTag, "Cannot open SSDP socket");
            return responses;
        }

        sockaddr_in group{};
        group.sin_family = AF_INET;
        group.sin_port = htons(kSsdpPort);
        inet_pton(AF_INET, kSsdpAddress, &group.sin_addr);

        int mx = std::max<int>(1, static_cast<int>(m_options.ssdp_search_window.count() / 1000));
        std::string request = "M-SEARCH * HTTP/1.1\r\n"
                              "HOST: 239.255.255.250:1900\r\n"
                              "MAN: \"ssdp:discover\"\r\n"
                              "MX: " + std::to_string(mx) + "\r\n"
                              "ST: ssdp:all\r\n\r\n";

        if (sendto(sock.Fd(), request.data(), request.size(), 0, reinterpret_cast<sockaddr *>(&group), sizeof(group)) < 0)
        {
            common::LogDebug(kTag, "M-SEARCH send failed");
            return responses;
        }

        auto deadline = std::chrono::steady_clock::now() + m_options.ssdp_search_window;
        char buf[2048];
        while (true)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0 || !net::WaitFd(sock.Fd(), POLLIN, left))
                break;

            sockaddr_in from{};
            socklen_t fromLen = sizeof(from);
            ssize_t n = recvfrom(sock.Fd(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr *>(&from), &fromLen);
            if (n <= 0)
                continue;

            char originText[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &from.sin_addr, originText, sizeof(originText));

            auto parsed = ParseSsdpResponse(std::string(buf, static_cast<size_t>(n)), originText);
            if (parsed)
                responses.push_back(*parsed);
        }

        common::LogDebug(kTag, "SSDP search collected " + std::to_string(responses.size()) + " answers");
        return responses;
    }

    std::optional<std::string> UpnpDetector::FetchDescription(const std::string &location)
    {
        auto url = ParseHttpUrl(location);
        if (!url)
            return std::nullopt;

        net::TcpProbe probe;
        if (!probe.Connect(url->host, url->port, m_options.port_connection_timeout))
            return std::nullopt;

        // HTTP/1.0 keeps the body unchunked and the connection closing.
        std::string request = "GET " + url->path + " HTTP/1.0\r\nHost: " + url->host + ":" +
                              std::to_string(url->port) + "\r\nConnection: close\r\n\r\n";
        if (!probe.SendAll(request))
            return std::nullopt;

        std::string response = probe.ReceiveAll();
        auto bodyAt = response.find("\r\n\r\n");
        if (bodyAt == std::string::npos)
        {
            common::LogDebug(kTag, "Incomplete description response from " + location);
            return std::nullopt;
        }

        auto description = ParseUpnpDescription(response.substr(bodyAt + 4));
        if (!description)
            return std::nullopt;
        return BuildUpnpDescription(*description);
    }
}
