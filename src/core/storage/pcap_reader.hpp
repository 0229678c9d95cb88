// src/core/storage/pcap_reader.hpp
#ifndef GENEVA_PCAP_READER_HPP
#define GENEVA_PCAP_READER_HPP

#include "common/packet.hpp"
#include <string>
#include <pcap/pcap.h>

namespace Geneva
{
    namespace Core
    {
        namespace Storage
        {
            /**
             * @brief Offline PCAP reader yielding layer-3 packets
             *
             * Supports raw IP captures (DLT_RAW, LINKTYPE_IPV4) and Ethernet
             * captures (DLT_EN10MB, IPv4 frames only; other ethertypes are skipped).
             */
            class PcapReader
            {
            public:
                static constexpr size_t ETHERNET_HEADER_SIZE = 14;
                static constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;

                PcapReader() = default;
                ~PcapReader();

                PcapReader(const PcapReader &) = delete;
                PcapReader &operator=(const PcapReader &) = delete;

                bool open(const std::string &path);

                /**
                 * @brief Read the next IPv4 packet
                 * @return false at end of file or on error (check getLastError())
                 */
                bool next(Common::Packet &packet);

                void close();

                bool isOpen() const { return m_pcap_handle != nullptr; }
                int getDatalink() const { return m_datalink; }
                uint64_t getPacketCount() const { return m_packet_count; }
                uint64_t getSkippedCount() const { return m_skipped_count; }
                const std::string &getLastError() const { return m_last_error; }

            private:
                bool fail(const std::string &message);

                pcap_t *m_pcap_handle{nullptr};
                int m_datalink{DLT_RAW};
                std::string m_current_file;
                std::string m_last_error;
                uint64_t m_packet_count{0};
                uint64_t m_skipped_count{0};
            };

        } // namespace Storage
    } // namespace Core
} // namespace Geneva

#endif // GENEVA_PCAP_READER_HPP
