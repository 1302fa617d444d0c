#include "TcpProbe.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace netsweep::net
{
    bool WaitFd(int fd, short events, std::chrono::milliseconds timeout)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int r = poll(&pfd, 1, static_cast<int>(timeout.count()));
        return r > 0;
    }

    TcpProbe::~TcpProbe()
    {
        Close();
    }

    TcpProbe::TcpProbe(TcpProbe &&other) noexcept
        : m_fd(other.m_fd), m_timeout(other.m_timeout)
    {
        other.m_fd = -1;
    }

    TcpProbe &TcpProbe::operator=(TcpProbe &&other) noexcept
    {
        if (this != &other)
        {
            Close();
            m_fd = other.m_fd;
            m_timeout = other.m_timeout;
            other.m_fd = -1;
        }
        return *this;
    }

    bool TcpProbe::Connect(const std::string &address, int port, std::chrono::milliseconds timeout)
    {
        Close();
        m_timeout = timeout;

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
            return false;

        m_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_fd < 0)
        {
            m_fd = -1;
            return false;
        }

        int flags = fcntl(m_fd, F_GETFL, 0);
        if (flags < 0 || fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) < 0)
        {
            Close();
            return false;
        }

        if (connect(m_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0)
            return true;

        if (errno != EINPROGRESS)
        {
            Close();
            return false;
        }

        if (!WaitFd(m_fd, POLLOUT, timeout))
        {
            Close();
            return false;
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0)
        {
            Close();
            return false;
        }
        return true;
    }

    void TcpProbe::Close()
    {
        if (m_fd != -1)
        {
            close(m_fd);
            m_fd = -1;
        }
    }

    bool TcpProbe::SendAll(const std::string &data)
    {
        if (m_fd == -1)
            return false;

        size_t off = 0;
        while (off < data.size())
        {
            ssize_t n = send(m_fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                if (!WaitFd(m_fd, POLLOUT, m_timeout))
                    return false;
                continue;
            }
            return false;
        }
        return true;
    }

    std::string TcpProbe::ReceiveSome(std::size_t maxBytes)
    {
        std::string out;
        if (m_fd == -1 || !WaitFd(m_fd, POLLIN, m_timeout))
            return out;

        out.resize(maxBytes);
        ssize_t n = recv(m_fd, &out[0], maxBytes, 0);
        if (n <= 0)
            return std::string();
        out.resize(static_cast<size_t>(n));
        return out;
    }

    std::string TcpProbe::ReceiveAll(std::size_t maxBytes)
    {
        std::string out;
        auto deadline = std::chrono::steady_clock::now() + m_timeout;

        while (m_fd != -1 && out.size() < maxBytes)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0 || !WaitFd(m_fd, POLLIN, left))
                break;

            char buf[4096];
            ssize_t n = recv(m_fd, buf, sizeof(buf), 0);
            if (n <= 0)
                break;
            out.append(buf, static_cast<size_t>(n));
        }

        if (out.size() > maxBytes)
            out.resize(maxBytes);
        return out;
    }

    bool IsPortOpen(const std::string &address, int port, std::chrono::milliseconds timeout)
    {
        TcpProbe probe;
        return probe.Connect(address, port, timeout);
    }
}
