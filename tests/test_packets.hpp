// tests/test_packets.hpp
#ifndef GENEVA_TEST_PACKETS_HPP
#define GENEVA_TEST_PACKETS_HPP

#include "common/packet.hpp"
#include <arpa/inet.h>
#include <netinet/ip.h>
#include <netinet/tcp.h>
#include <netinet/udp.h>
#include <cstring>
#include <string>
#include <vector>

namespace GenevaTest
{
    /**
     * @brief Header values for a test IPv4 packet
     */
    struct PacketSpec
    {
        std::string src = "10.0.0.1";
        std::string dst = "93.184.216.34";
        uint16_t sport = 40000;
        uint16_t dport = 80;
        uint32_t seq = 1000;
        uint32_t ack = 0;
        uint8_t flags = TH_SYN;
        uint16_t window = 65535;
        uint8_t ttl = 64;
        uint16_t id = 0x1234;
        uint16_t frag_off = 0; // host order, flags included
        std::vector<uint8_t> options;
        std::string payload;
    };

    inline void fillIpHeader(std::vector<uint8_t> &bytes, const PacketSpec &spec, uint8_t protocol)
    {
        struct iphdr ip;
        std::memset(&ip, 0, sizeof(ip));
        ip.version = 4;
        ip.ihl = 5;
        ip.tos = 0;
        ip.tot_len = htons(static_cast<uint16_t>(bytes.size()));
        ip.id = htons(spec.id);
        ip.frag_off = htons(spec.frag_off);
        ip.ttl = spec.ttl;
        ip.protocol = protocol;
        inet_pton(AF_INET, spec.src.c_str(), &ip.saddr);
        inet_pton(AF_INET, spec.dst.c_str(), &ip.daddr);
        std::memcpy(bytes.data(), &ip, sizeof(ip));
    }

    /**
     * @brief IPv4 + TCP packet with valid checksums
     */
    inline Geneva::Common::Packet buildTcpPacket(const PacketSpec &spec = PacketSpec())
    {
        size_t tcp_length = sizeof(struct tcphdr) + spec.options.size();
        std::vector<uint8_t> bytes(sizeof(struct iphdr) + tcp_length + spec.payload.size(), 0);

        fillIpHeader(bytes, spec, IPPROTO_TCP);

        struct tcphdr tcp;
        std::memset(&tcp, 0, sizeof(tcp));
        tcp.th_sport = htons(spec.sport);
        tcp.th_dport = htons(spec.dport);
        tcp.th_seq = htonl(spec.seq);
        tcp.th_ack = htonl(spec.ack);
        tcp.th_off = static_cast<uint8_t>(tcp_length / 4);
        tcp.th_flags = spec.flags;
        tcp.th_win = htons(spec.window);
        std::memcpy(bytes.data() + sizeof(struct iphdr), &tcp, sizeof(tcp));

        std::memcpy(bytes.data() + sizeof(struct iphdr) + sizeof(struct tcphdr),
                    spec.options.data(), spec.options.size());
        std::memcpy(bytes.data() + sizeof(struct iphdr) + tcp_length,
                    spec.payload.data(), spec.payload.size());

        Geneva::Common::Packet packet(std::move(bytes), 1000000);
        packet.updateIPv4Checksum();
        packet.updateTCPChecksum();
        return packet;
    }

    /**
     * @brief IPv4 + UDP packet (no TCP layer)
     */
    inline Geneva::Common::Packet buildUdpPacket(const PacketSpec &spec = PacketSpec())
    {
        std::vector<uint8_t> bytes(sizeof(struct iphdr) + sizeof(struct udphdr) + spec.payload.size(), 0);

        fillIpHeader(bytes, spec, IPPROTO_UDP);

        struct udphdr udp;
        std::memset(&udp, 0, sizeof(udp));
        udp.uh_sport = htons(spec.sport);
        udp.uh_dport = htons(53);
        udp.uh_ulen = htons(static_cast<uint16_t>(sizeof(struct udphdr) + spec.payload.size()));
        std::memcpy(bytes.data() + sizeof(struct iphdr), &udp, sizeof(udp));
        std::memcpy(bytes.data() + sizeof(struct iphdr) + sizeof(struct udphdr),
                    spec.payload.data(), spec.payload.size());

        Geneva::Common::Packet packet(std::move(bytes), 1000000);
        packet.updateIPv4Checksum();
        return packet;
    }

    inline std::string payloadOf(const Geneva::Common::Packet &packet)
    {
        const auto &data = packet.data();
        size_t offset = packet.hasTCP() ? packet.tcpPayloadOffset() : packet.ipPayloadOffset();
        return std::string(data.begin() + static_cast<std::ptrdiff_t>(offset),
                           data.begin() + static_cast<std::ptrdiff_t>(packet.datagramEnd()));
    }

} // namespace GenevaTest

#endif // GENEVA_TEST_PACKETS_HPP
