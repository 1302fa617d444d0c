#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <vector>
#include "DeviceTypeDetector.hpp"
#include "PortDetectionOptions.hpp"

namespace netsweep::detection
{
    struct SsdpResponse
    {
        std::string origin; // address the answer came from
        std::string location;
        std::string server;
        std::string search_target;
    };

    struct UpnpDescription
    {
        std::string friendly_name;
        std::string manufacturer;
        std::string model_name;
        std::string device_type;
    };

    struct HttpUrl
    {
        std::string host;
        int port = 80;
        std::string path = "/";
    };

    // Header block of an M-SEARCH answer. nullopt unless it is a 200 with a LOCATION.
    std::optional<SsdpResponse> ParseSsdpResponse(const std::string &datagram, const std::string &origin);

    // Only plain http:// URLs; descriptors are never served over TLS on a LAN.
    std::optional<HttpUrl> ParseHttpUrl(const std::string &url);

    // Reads the first <device> element of a UPnP device description document.
    std::optional<UpnpDescription> ParseUpnpDescription(const std::string &xml);

    // "Media Server", "Router/Gateway", ... from a deviceType URN.
    std::optional<std::string> ExtractUpnpTypeHint(const std::string &deviceTypeUrn);

    // "<name> - <hint> (UPnP)", or "UPnP Device" when nothing usable is present.
    std::string BuildUpnpDescription(const UpnpDescription &description);

    /*
     * Multicasts an SSDP M-SEARCH and matches answers to the target by origin
     * or LOCATION host, then fetches the device description over HTTP.
     *
     * A sweep asks the detector about many hosts at once, so one search result
     * is shared by all callers for ssdp_cache_ttl. Successful classifications
     * are cached per address for the lifetime of the detector.
     */
    class UpnpDetector : public DeviceTypeDetector
    {
    public:
        explicit UpnpDetector(PortDetectionOptions options) : m_options(std::move(options)) {}

        int Priority() const override { return 90; }
        std::string Name() const override { return "UPnP"; }
        std::optional<std::string> Classify(const std::string &address) override;

    private:
        std::vector<SsdpResponse> Search();
        std::vector<SsdpResponse> RunSearch();
        std::optional<std::string> FetchDescription(const std::string &location);

        PortDetectionOptions m_options;

        std::mutex m_cacheMutex;
        std::map<std::string, std::string> m_deviceCache;

        std::mutex m_searchMutex;
        std::vector<SsdpResponse> m_lastSearch;
        std::chrono::steady_clock::time_point m_lastSearchAt{};
        bool m_haveSearch = false;
    };
}
