#include "IcmpPinger.hpp"
#include "../common/Log.hpp"
#include <tins/tins.h>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace netsweep::net
{
    namespace
    {
        const std::string kTag = "Ping";

        bool IsRoot()
        {
            return geteuid() == 0;
        }

        class SocketHandle
        {
        public:
            explicit SocketHandle(int fd) : m_fd(fd) {}
            ~SocketHandle()
            {
                if (m_fd >= 0)
                    close(m_fd);
            }

            SocketHandle(const SocketHandle &) = delete;
            SocketHandle &operator=(const SocketHandle &) = delete;

            int Get() const { return m_fd; }

        private:
            int m_fd;
        };

        std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        }
    }

    IcmpPinger::IcmpPinger()
        : m_privileged(IsRoot()), m_identifier(static_cast<uint16_t>(getpid() & 0xFFFF))
    {
        if (!m_privileged)
            common::LogInfo(kTag, "Not running as root, using unprivileged ICMP sockets");
    }

    std::optional<std::chrono::milliseconds> IcmpPinger::Ping(const std::string &address, std::chrono::milliseconds timeout)
    {
        try
        {
            return m_privileged ? PingRaw(address, timeout) : PingDatagram(address, timeout);
        }
        catch (const std::exception &e)
        {
            bool expected = false;
            if (m_reportedFailure.compare_exchange_strong(expected, true))
                common::LogWarn(kTag, std::string("ICMP echo failed: ") + e.what());
            else
                common::LogDebug(kTag, "ICMP echo to " + address + " failed: " + e.what());
            return std::nullopt;
        }
    }

    std::optional<std::chrono::milliseconds> IcmpPinger::PingRaw(const std::string &address, std::chrono::milliseconds timeout)
    {
        Tins::IPv4Address target(address);
        Tins::NetworkInterface iface(target);

        auto secs = static_cast<uint32_t>(timeout.count() / 1000);
        auto usecs = static_cast<uint32_t>((timeout.count() % 1000) * 1000);
        Tins::PacketSender sender(iface, secs, usecs);

        Tins::IP ip = Tins::IP(target) / Tins::ICMP(Tins::ICMP::ECHO_REQUEST);
        Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
        icmp.id(m_identifier);
        icmp.sequence(NextSequence());

        auto start = std::chrono::steady_clock::now();
        std::unique_ptr<Tins::PDU> reply(sender.send_recv(ip, iface));
        if (!reply)
            return std::nullopt;

        const Tins::ICMP *answer = reply->find_pdu<Tins::ICMP>();
        if (!answer || answer->type() != Tins::ICMP::ECHO_REPLY)
            return std::nullopt;

        return ElapsedSince(start);
    }

    std::optional<std::chrono::milliseconds> IcmpPinger::PingDatagram(const std::string &address, std::chrono::milliseconds timeout)
    {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        SocketHandle sock(socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP));
        if (sock.Get() < 0)
            throw std::runtime_error(std::string("cannot open ICMP socket: ") + std::strerror(errno));

        if (connect(sock.Get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
            return std::nullopt;

        uint16_t sequence = NextSequence();
        Tins::ICMP request(Tins::ICMP::ECHO_REQUEST);
        request.id(m_identifier);
        request.sequence(sequence);
        Tins::PDU::serialization_type bytes = request.serialize();

        auto start = std::chrono::steady_clock::now();
        if (send(sock.Get(), bytes.data(), bytes.size(), 0) < 0)
            return std::nullopt;

        // The kernel rewrites the identifier on datagram sockets; match on sequence.
        uint8_t buffer[1500];
        while (true)
        {
            auto left = timeout - ElapsedSince(start);
            if (left.count() <= 0)
                return std::nullopt;

            pollfd pfd{};
            pfd.fd = sock.Get();
            pfd.events = POLLIN;
            if (poll(&pfd, 1, static_cast<int>(left.count())) <= 0)
                return std::nullopt;

            ssize_t n = recv(sock.Get(), buffer, sizeof(buffer), 0);
            if (n <= 0)
                return std::nullopt;

            try
            {
                Tins::ICMP reply(buffer, static_cast<uint32_t>(n));
                if (reply.type() == Tins::ICMP::ECHO_REPLY && reply.sequence() == sequence)
                    return ElapsedSince(start);
            }
            catch (const Tins::malformed_packet &)
            {
                common::LogDebug(kTag, "Ignoring malformed ICMP reply from " + address);
            }
        }
    }
}
