#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace netsweep::net
{
    bool WaitFd(int fd, short events, std::chrono::milliseconds timeout);

    /*
     * One short-lived TCP connection used by the port based detectors.
     * Every call is bounded by the timeout given to Connect; the socket is
     * closed when the probe goes out of scope.
     */
    class TcpProbe
    {
    public:
        TcpProbe() = default;
        ~TcpProbe();

        TcpProbe(const TcpProbe &) = delete;
        TcpProbe &operator=(const TcpProbe &) = delete;
        TcpProbe(TcpProbe &&other) noexcept;
        TcpProbe &operator=(TcpProbe &&other) noexcept;

        bool Connect(const std::string &address, int port, std::chrono::milliseconds timeout);
        void Close();

        bool IsConnected() const { return m_fd != -1; }
        int Fd() const { return m_fd; }
        std::chrono::milliseconds Timeout() const { return m_timeout; }

        bool SendAll(const std::string &data);

        // Reads whatever arrives before the timeout, up to maxBytes. Empty on timeout or EOF.
        std::string ReceiveSome(std::size_t maxBytes = 4096);

        // Reads until the peer closes, maxBytes is reached or the timeout expires.
        std::string ReceiveAll(std::size_t maxBytes = 64 * 1024);

    private:
        int m_fd = -1;
        std::chrono::milliseconds m_timeout{1000};
    };

    bool IsPortOpen(const std::string &address, int port, std::chrono::milliseconds timeout);
}
