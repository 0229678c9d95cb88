// src/common/packet.cpp
#include "packet.hpp"
#include "utils.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace Geneva
{
    namespace Common
    {
        // ==================== Checksum ====================

        uint32_t Checksum::partial(const uint8_t *data, size_t length, uint32_t sum)
        {
            size_t i = 0;
            for (; i + 1 < length; i += 2)
            {
                sum += static_cast<uint32_t>(data[i] << 8 | data[i + 1]);
            }

            // Odd trailing byte is padded with zero
            if (i < length)
            {
                sum += static_cast<uint32_t>(data[i] << 8);
            }

            return sum;
        }

        uint16_t Checksum::finish(uint32_t sum)
        {
            while (sum >> 16)
            {
                sum = (sum & 0xFFFF) + (sum >> 16);
            }
            return static_cast<uint16_t>(~sum);
        }

        uint16_t Checksum::internet(const uint8_t *data, size_t length)
        {
            return finish(partial(data, length));
        }

        // ==================== Construction ====================

        Packet::Packet()
            : timestamp_us_(0), has_ipv4_(false), has_tcp_(false),
              ip_header_len_(0), tcp_header_len_(0), datagram_end_(0)
        {
        }

        Packet::Packet(std::vector<uint8_t> data, uint64_t timestamp_us)
            : data_(std::move(data)), timestamp_us_(timestamp_us), has_ipv4_(false),
              has_tcp_(false), ip_header_len_(0), tcp_header_len_(0), datagram_end_(0)
        {
            reparse();
        }

        Packet::Packet(const uint8_t *data, size_t length, uint64_t timestamp_us)
            : Packet(std::vector<uint8_t>(data, data + length), timestamp_us)
        {
        }

        // ==================== Raw access ====================

        uint8_t Packet::readUint8(size_t offset) const
        {
            if (offset + 1 > data_.size())
            {
                throw std::out_of_range("Packet read past end at offset " + std::to_string(offset));
            }
            return data_[offset];
        }

        uint16_t Packet::readUint16(size_t offset) const
        {
            if (offset + 2 > data_.size())
            {
                throw std::out_of_range("Packet read past end at offset " + std::to_string(offset));
            }
            return static_cast<uint16_t>(data_[offset] << 8 | data_[offset + 1]);
        }

        uint32_t Packet::readUint32(size_t offset) const
        {
            if (offset + 4 > data_.size())
            {
                throw std::out_of_range("Packet read past end at offset " + std::to_string(offset));
            }
            return static_cast<uint32_t>(data_[offset]) << 24 |
                   static_cast<uint32_t>(data_[offset + 1]) << 16 |
                   static_cast<uint32_t>(data_[offset + 2]) << 8 |
                   static_cast<uint32_t>(data_[offset + 3]);
        }

        void Packet::writeUint8(size_t offset, uint8_t value)
        {
            if (offset + 1 > data_.size())
            {
                throw std::out_of_range("Packet write past end at offset " + std::to_string(offset));
            }
            data_[offset] = value;
        }

        void Packet::writeUint16(size_t offset, uint16_t value)
        {
            if (offset + 2 > data_.size())
            {
                throw std::out_of_range("Packet write past end at offset " + std::to_string(offset));
            }
            data_[offset] = static_cast<uint8_t>(value >> 8);
            data_[offset + 1] = static_cast<uint8_t>(value & 0xFF);
        }

        void Packet::writeUint32(size_t offset, uint32_t value)
        {
            if (offset + 4 > data_.size())
            {
                throw std::out_of_range("Packet write past end at offset " + std::to_string(offset));
            }
            data_[offset] = static_cast<uint8_t>(value >> 24);
            data_[offset + 1] = static_cast<uint8_t>((value >> 16) & 0xFF);
            data_[offset + 2] = static_cast<uint8_t>((value >> 8) & 0xFF);
            data_[offset + 3] = static_cast<uint8_t>(value & 0xFF);
        }

        // ==================== Layers ====================

        void Packet::reparse()
        {
            has_ipv4_ = false;
            has_tcp_ = false;
            ip_header_len_ = 0;
            tcp_header_len_ = 0;
            datagram_end_ = data_.size();

            if (data_.size() < MIN_IPV4_HEADER)
            {
                return;
            }

            uint8_t version = data_[IP_OFF_VERSION_IHL] >> 4;
            size_t ihl = static_cast<size_t>(data_[IP_OFF_VERSION_IHL] & 0x0F) * 4;
            if (version != 4 || ihl < MIN_IPV4_HEADER || ihl > data_.size())
            {
                return;
            }

            has_ipv4_ = true;
            ip_header_len_ = ihl;

            size_t total_length = readUint16(IP_OFF_TOTAL_LENGTH);
            if (total_length >= ihl && total_length <= data_.size())
            {
                datagram_end_ = total_length;
            }

            // Only the first fragment carries the TCP header
            if (ipProtocol() != PROTO_TCP || ipFragmentOffset() != 0)
            {
                return;
            }

            if (datagram_end_ - ihl < MIN_TCP_HEADER)
            {
                return;
            }

            size_t dataofs = static_cast<size_t>(data_[ihl + TCP_OFF_DATAOFS] >> 4) * 4;
            if (dataofs < MIN_TCP_HEADER || ihl + dataofs > datagram_end_)
            {
                return;
            }

            has_tcp_ = true;
            tcp_header_len_ = dataofs;
        }

        size_t Packet::ipPayloadLength() const
        {
            return has_ipv4_ ? datagram_end_ - ip_header_len_ : 0;
        }

        uint8_t Packet::ipProtocol() const
        {
            return has_ipv4_ ? data_[IP_OFF_PROTOCOL] : 0;
        }

        uint16_t Packet::ipFragmentOffset() const
        {
            return has_ipv4_ ? static_cast<uint16_t>(readUint16(IP_OFF_FLAGS_FRAG) & 0x1FFF) : 0;
        }

        bool Packet::ipMoreFragments() const
        {
            return has_ipv4_ && (readUint16(IP_OFF_FLAGS_FRAG) & 0x2000) != 0;
        }

        uint32_t Packet::ipSource() const
        {
            return has_ipv4_ ? readUint32(IP_OFF_SRC) : 0;
        }

        uint32_t Packet::ipDestination() const
        {
            return has_ipv4_ ? readUint32(IP_OFF_DST) : 0;
        }

        size_t Packet::tcpPayloadLength() const
        {
            return has_tcp_ ? datagram_end_ - tcpPayloadOffset() : 0;
        }

        uint8_t Packet::tcpFlags() const
        {
            return has_tcp_ ? data_[tcpHeaderOffset() + TCP_OFF_FLAGS] : 0;
        }

        // ==================== Dependent fields ====================

        void Packet::truncateToDatagram()
        {
            if (has_ipv4_ && datagram_end_ < data_.size())
            {
                data_.resize(datagram_end_);
            }
        }

        void Packet::updateIPv4Length()
        {
            if (!has_ipv4_)
            {
                return;
            }

            writeUint16(IP_OFF_TOTAL_LENGTH, static_cast<uint16_t>(data_.size()));
            datagram_end_ = data_.size();
        }

        void Packet::updateIPv4Checksum()
        {
            if (!has_ipv4_)
            {
                return;
            }

            writeUint16(IP_OFF_CHECKSUM, 0);
            writeUint16(IP_OFF_CHECKSUM, Checksum::internet(data_.data(), ip_header_len_));
        }

        uint32_t Packet::tcpPseudoHeaderSum(size_t tcp_length) const
        {
            uint32_t sum = Checksum::partial(data_.data() + IP_OFF_SRC, 8);
            sum += PROTO_TCP;
            sum += static_cast<uint32_t>(tcp_length);
            return sum;
        }

        void Packet::updateTCPChecksum()
        {
            if (!has_tcp_)
            {
                return;
            }

            size_t tcp_offset = tcpHeaderOffset();
            size_t tcp_length = datagram_end_ - tcp_offset;

            writeUint16(tcp_offset + TCP_OFF_CHECKSUM, 0);
            uint32_t sum = tcpPseudoHeaderSum(tcp_length);
            sum = Checksum::partial(data_.data() + tcp_offset, tcp_length, sum);
            writeUint16(tcp_offset + TCP_OFF_CHECKSUM, Checksum::finish(sum));
        }

        bool Packet::verifyIPv4Checksum() const
        {
            if (!has_ipv4_)
            {
                return false;
            }
            return Checksum::internet(data_.data(), ip_header_len_) == 0;
        }

        bool Packet::verifyTCPChecksum() const
        {
            if (!has_tcp_)
            {
                return false;
            }

            size_t tcp_offset = tcpHeaderOffset();
            size_t tcp_length = datagram_end_ - tcp_offset;
            uint32_t sum = tcpPseudoHeaderSum(tcp_length);
            sum = Checksum::partial(data_.data() + tcp_offset, tcp_length, sum);
            return Checksum::finish(sum) == 0;
        }

        std::string Packet::summary() const
        {
            std::ostringstream oss;

            if (!has_ipv4_)
            {
                oss << "non-IPv4 (" << data_.size() << " bytes)";
                return oss.str();
            }

            oss << Utils::ipv4ToString(ipSource());
            if (has_tcp_)
            {
                oss << ":" << readUint16(tcpHeaderOffset() + TCP_OFF_SPORT);
            }
            oss << " -> " << Utils::ipv4ToString(ipDestination());
            if (has_tcp_)
            {
                oss << ":" << readUint16(tcpHeaderOffset() + TCP_OFF_DPORT);

                static const char FLAG_LETTERS[] = "FSRPAUEC";
                std::string flags;
                uint8_t bits = tcpFlags();
                for (int i = 0; i < 8; ++i)
                {
                    if (bits & (1 << i))
                    {
                        flags += FLAG_LETTERS[i];
                    }
                }
                oss << " [" << flags << "]";
            }
            else
            {
                oss << " proto=" << static_cast<int>(ipProtocol());
            }

            if (ipFragmentOffset() != 0 || ipMoreFragments())
            {
                oss << " frag=" << ipFragmentOffset() * 8 << (ipMoreFragments() ? "+" : "");
            }
            oss << " len=" << data_.size();
            return oss.str();
        }

    } // namespace Common
} // namespace Geneva
