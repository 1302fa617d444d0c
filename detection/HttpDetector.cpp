#include "HttpDetector.hpp"
#include "../common/Log.hpp"
#include "../net/TcpProbe.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <openssl/err.h>
#include <poll.h>
#include <sstream>

namespace netsweep::detection
{
    namespace
    {
        const std::string kTag = "HTTP";

        std::string ToLower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        bool Contains(const std::string &haystack, const char *needle)
        {
            return haystack.find(needle) != std::string::npos;
        }

        // Retries an SSL call while it only wants more I/O, like the blocking
        // helpers around SSL_read/SSL_write.
        template <typename Op>
        int SslRetry(SSL *ssl, int fd, std::chrono::milliseconds timeout, Op op)
        {
            while (true)
            {
                int n = op();
                if (n > 0)
                    return n;

                int err = SSL_get_error(ssl, n);
                if (err == SSL_ERROR_WANT_READ)
                {
                    if (!net::WaitFd(fd, POLLIN, timeout))
                        return -1;
                    continue;
                }
                if (err == SSL_ERROR_WANT_WRITE)
                {
                    if (!net::WaitFd(fd, POLLOUT, timeout))
                        return -1;
                    continue;
                }
                return n;
            }
        }

        struct SslHandle
        {
            explicit SslHandle(SSL *ssl) : m_ssl(ssl) {}
            ~SslHandle()
            {
                if (m_ssl)
                {
                    SSL_shutdown(m_ssl);
                    SSL_free(m_ssl);
                }
            }

            SslHandle(const SslHandle &) = delete;
            SslHandle &operator=(const SslHandle &) = delete;

            SSL *m_ssl;
        };
    }

    std::optional<std::string> ParseHttpServerHeader(const std::string &response, int port)
    {
        std::istringstream lines(response);
        std::string line;
        while (std::getline(lines, line))
        {
            std::string lower = ToLower(line);

            if (lower.rfind("server:", 0) == 0)
            {
                if (Contains(lower, "microsoft-iis"))
                {
                    if (Contains(lower, "iis/10.0"))
                        return "Windows Server 2016/2019/2022 (HTTP)";
                    if (Contains(lower, "iis/8.5"))
                        return "Windows Server 2012 R2 (HTTP)";
                    if (Contains(lower, "iis/8.0"))
                        return "Windows Server 2012 (HTTP)";
                    return "Windows Server (HTTP)";
                }
                if (Contains(lower, "kestrel"))
                    return "Windows/Linux (.NET) (HTTP)";
                if (Contains(lower, "apache") || Contains(lower, "nginx") || Contains(lower, "lighttpd"))
                    return "Linux Server (HTTP)";
            }

            if (Contains(lower, "asp.net"))
                return "Windows Server (.NET) (HTTP)";
            if (Contains(lower, "microsoft-httpapi"))
                return "Windows Server (HTTP)";
        }

        if (!Contains(response, "HTTP/1."))
            return std::nullopt;

        switch (port)
        {
        case 5000:
            return "Unknown (.NET App) (HTTP)";
        case 8000:
        case 8080:
            return "Unknown (Web App) (HTTP)";
        case 8443:
            return "Unknown (Secure Web) (HTTP)";
        default:
            return "Unknown (HTTP)";
        }
    }

    HttpDetector::HttpDetector(PortDetectionOptions options)
        : m_options(std::move(options)), m_ssl_ctx(nullptr)
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            ERR_print_errors_fp(stderr);
            common::LogWarn(kTag, "TLS context unavailable, HTTPS ports are probed as plain HTTP");
            return;
        }
        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_NONE, nullptr);
    }

    HttpDetector::~HttpDetector()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    std::optional<std::string> HttpDetector::Classify(const std::string &address)
    {
        for (const auto *ports : {&m_options.custom_iot_ports, &m_options.standard_http_ports})
        {
            for (int port : *ports)
            {
                auto type = ProbeHttpPort(address, port);
                if (type)
                {
                    common::LogInfo("Detect", "Device type detected via HTTP on port " + std::to_string(port) + ": " + *type);
                    return type;
                }
            }
        }
        return std::nullopt;
    }

    bool HttpDetector::IsTlsPort(int port) const
    {
        return m_ssl_ctx &&
               std::find(m_options.tls_ports.begin(), m_options.tls_ports.end(), port) != m_options.tls_ports.end();
    }

    std::optional<std::string> HttpDetector::ProbeHttpPort(const std::string &address, int port)
    {
        std::string request = "HEAD / HTTP/1.1\r\nHost: " + address + "\r\nConnection: close\r\n\r\n";

        std::string response = IsTlsPort(port) ? ExchangeTls(address, port, request)
                                               : ExchangePlain(address, port, request);
        if (response.empty())
            return std::nullopt;

        return ParseHttpServerHeader(response, port);
    }

    std::string HttpDetector::ExchangePlain(const std::string &address, int port, const std::string &request)
    {
        net::TcpProbe probe;
        if (!probe.Connect(address, port, m_options.port_connection_timeout))
            return std::string();
        if (!probe.SendAll(request))
            return std::string();
        return probe.ReceiveSome(1024);
    }

    std::string HttpDetector::ExchangeTls(const std::string &address, int port, const std::string &request)
    {
        net::TcpProbe probe;
        if (!probe.Connect(address, port, m_options.port_connection_timeout))
            return std::string();

        SslHandle ssl(SSL_new(m_ssl_ctx));
        if (!ssl.m_ssl)
            return std::string();
        SSL_set_fd(ssl.m_ssl, probe.Fd());

        const auto timeout = m_options.port_connection_timeout;
        if (SslRetry(ssl.m_ssl, probe.Fd(), timeout, [&] { return SSL_connect(ssl.m_ssl); }) <= 0)
        {
            common::LogDebug(kTag, "TLS handshake failed with " + address + ":" + std::to_string(port));
            ERR_clear_error();
            return std::string();
        }

        size_t off = 0;
        while (off < request.size())
        {
            int n = SslRetry(ssl.m_ssl, probe.Fd(), timeout, [&]
                             { return SSL_write(ssl.m_ssl, request.data() + off, static_cast<int>(request.size() - off)); });
            if (n <= 0)
                return std::string();
            off += static_cast<size_t>(n);
        }

        char buf[1024];
        int n = SslRetry(ssl.m_ssl, probe.Fd(), timeout, [&]
                         { return SSL_read(ssl.m_ssl, buf, sizeof(buf)); });
        if (n <= 0)
        {
            ERR_clear_error();
            return std::string();
        }
        return std::string(buf, static_cast<size_t>(n));
    }
}
