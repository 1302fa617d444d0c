#pragma once

#include <atomic>
#include <cstdint>
#include "../core/Pinger.hpp"

namespace netsweep::net
{
    /*
     * ICMP echo via libtins. With raw socket privilege (root) the request goes
     * out through Tins::PacketSender::send_recv; otherwise the same echo PDU is
     * written to an unprivileged ICMP datagram socket, which needs
     * net.ipv4.ping_group_range to cover the process group.
     */
    class IcmpPinger : public core::Pinger
    {
    public:
        IcmpPinger();

        std::optional<std::chrono::milliseconds> Ping(const std::string &address,
                                                      std::chrono::milliseconds timeout) override;

    private:
        std::optional<std::chrono::milliseconds> PingRaw(const std::string &address, std::chrono::milliseconds timeout);
        std::optional<std::chrono::milliseconds> PingDatagram(const std::string &address, std::chrono::milliseconds timeout);

        uint16_t NextSequence() { return static_cast<uint16_t>(++m_sequence); }

        bool m_privileged;
        uint16_t m_identifier;
        std::atomic<uint32_t> m_sequence{0};
        std::atomic<bool> m_reportedFailure{false};
    };
}
