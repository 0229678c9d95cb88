// src/common/packet.hpp
#ifndef GENEVA_PACKET_HPP
#define GENEVA_PACKET_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>

namespace Geneva
{
    namespace Common
    {
        /**
         * @brief Internet checksum helpers (RFC 1071)
         */
        class Checksum
        {
        public:
            /**
             * @brief Add 16-bit big-endian words of a buffer to a running sum
             */
            static uint32_t partial(const uint8_t *data, size_t length, uint32_t sum = 0);

            /**
             * @brief Fold a running sum and return its one's complement
             */
            static uint16_t finish(uint32_t sum);

            static uint16_t internet(const uint8_t *data, size_t length);
        };

        /**
         * @brief Raw IPv4 datagram with parsed layer offsets
         *
         * The buffer starts at the IPv4 header (no link-layer header). Layer
         * information is recomputed by reparse(); any code that changes header
         * lengths, the protocol number or the fragment offset must call it.
         * Malformed input never throws, the packet simply reports no layers.
         */
        class Packet
        {
        public:
            static constexpr size_t MIN_IPV4_HEADER = 20;
            static constexpr size_t MIN_TCP_HEADER = 20;
            static constexpr size_t MAX_TCP_HEADER = 60;
            static constexpr uint8_t PROTO_TCP = 6;

            // IPv4 header field offsets
            static constexpr size_t IP_OFF_VERSION_IHL = 0;
            static constexpr size_t IP_OFF_TOS = 1;
            static constexpr size_t IP_OFF_TOTAL_LENGTH = 2;
            static constexpr size_t IP_OFF_ID = 4;
            static constexpr size_t IP_OFF_FLAGS_FRAG = 6;
            static constexpr size_t IP_OFF_TTL = 8;
            static constexpr size_t IP_OFF_PROTOCOL = 9;
            static constexpr size_t IP_OFF_CHECKSUM = 10;
            static constexpr size_t IP_OFF_SRC = 12;
            static constexpr size_t IP_OFF_DST = 16;

            // TCP header field offsets (relative to the TCP header)
            static constexpr size_t TCP_OFF_SPORT = 0;
            static constexpr size_t TCP_OFF_DPORT = 2;
            static constexpr size_t TCP_OFF_SEQ = 4;
            static constexpr size_t TCP_OFF_ACK = 8;
            static constexpr size_t TCP_OFF_DATAOFS = 12;
            static constexpr size_t TCP_OFF_FLAGS = 13;
            static constexpr size_t TCP_OFF_WINDOW = 14;
            static constexpr size_t TCP_OFF_CHECKSUM = 16;
            static constexpr size_t TCP_OFF_URGPTR = 18;

            Packet();
            explicit Packet(std::vector<uint8_t> data, uint64_t timestamp_us = 0);
            Packet(const uint8_t *data, size_t length, uint64_t timestamp_us = 0);

            // ==================== Raw access ====================
            const std::vector<uint8_t> &data() const { return data_; }

            /**
             * @brief Mutable buffer; call reparse() after structural changes
             */
            std::vector<uint8_t> &buffer() { return data_; }

            size_t size() const { return data_.size(); }
            bool empty() const { return data_.empty(); }

            uint64_t getTimestamp() const { return timestamp_us_; }
            void setTimestamp(uint64_t timestamp_us) { timestamp_us_ = timestamp_us; }

            uint8_t readUint8(size_t offset) const;
            uint16_t readUint16(size_t offset) const;
            uint32_t readUint32(size_t offset) const;
            void writeUint8(size_t offset, uint8_t value);
            void writeUint16(size_t offset, uint16_t value);
            void writeUint32(size_t offset, uint32_t value);

            // ==================== Layers ====================
            void reparse();

            bool hasIPv4() const { return has_ipv4_; }
            bool hasTCP() const { return has_tcp_; }

            size_t ipHeaderLength() const { return ip_header_len_; }
            size_t ipPayloadOffset() const { return ip_header_len_; }
            size_t ipPayloadLength() const;

            /**
             * @brief End of the datagram (total length when sane, else buffer size)
             */
            size_t datagramEnd() const { return datagram_end_; }

            uint8_t ipProtocol() const;
            uint16_t ipFragmentOffset() const;
            bool ipMoreFragments() const;
            uint32_t ipSource() const;
            uint32_t ipDestination() const;

            size_t tcpHeaderOffset() const { return ip_header_len_; }
            size_t tcpHeaderLength() const { return tcp_header_len_; }
            size_t tcpPayloadOffset() const { return ip_header_len_ + tcp_header_len_; }
            size_t tcpPayloadLength() const;
            uint8_t tcpFlags() const;

            // ==================== Dependent fields ====================
            /**
             * @brief Drop bytes past the datagram end (link-layer padding)
             */
            void truncateToDatagram();

            void updateIPv4Length();
            void updateIPv4Checksum();
            void updateTCPChecksum();

            bool verifyIPv4Checksum() const;
            bool verifyTCPChecksum() const;

            /**
             * @brief One-line description for logs
             */
            std::string summary() const;

            bool operator==(const Packet &other) const { return data_ == other.data_; }
            bool operator!=(const Packet &other) const { return !(*this == other); }

        private:
            uint32_t tcpPseudoHeaderSum(size_t tcp_length) const;

            std::vector<uint8_t> data_;
            uint64_t timestamp_us_;

            bool has_ipv4_;
            bool has_tcp_;
            size_t ip_header_len_;
            size_t tcp_header_len_;
            size_t datagram_end_;
        };

    } // namespace Common
} // namespace Geneva

#endif // GENEVA_PACKET_HPP
