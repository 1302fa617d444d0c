#pragma once

#include <openssl/ssl.h>
#include "DeviceTypeDetector.hpp"
#include "PortDetectionOptions.hpp"

namespace netsweep::detection
{
    // Classifies from the Server header (and a few framework markers) of an
    // HTTP response. Any other HTTP response gets a port based "Unknown (...)" label.
    std::optional<std::string> ParseHttpServerHeader(const std::string &response, int port);

    /*
     * Sends "HEAD /" to the custom IoT ports and then the standard HTTP ports,
     * stopping at the first port that answers with a recognizable response.
     * Ports listed in tls_ports are spoken to over TLS; certificates are not
     * verified since only the headers are of interest.
     */
    class HttpDetector : public DeviceTypeDetector
    {
    public:
        explicit HttpDetector(PortDetectionOptions options);
        ~HttpDetector() override;

        HttpDetector(const HttpDetector &) = delete;
        HttpDetector &operator=(const HttpDetector &) = delete;

        int Priority() const override { return 50; }
        std::string Name() const override { return "HTTP"; }
        std::optional<std::string> Classify(const std::string &address) override;

    private:
        std::optional<std::string> ProbeHttpPort(const std::string &address, int port);
        std::string ExchangePlain(const std::string &address, int port, const std::string &request);
        std::string ExchangeTls(const std::string &address, int port, const std::string &request);
        bool IsTlsPort(int port) const;

        PortDetectionOptions m_options;
        SSL_CTX *m_ssl_ctx;
    };
}
