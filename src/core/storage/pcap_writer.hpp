// src/core/storage/pcap_writer.hpp
#ifndef GENEVA_PCAP_WRITER_HPP
#define GENEVA_PCAP_WRITER_HPP

#include "common/packet.hpp"
#include <string>
#include <atomic>
#include <pcap/pcap.h>

namespace Geneva
{
    namespace Core
    {
        namespace Storage
        {
            /**
             * @brief PCAP file writer for raw IPv4 packets (DLT_RAW)
             */
            class PcapWriter
            {
            public:
                PcapWriter() = default;
                ~PcapWriter();

                PcapWriter(const PcapWriter &) = delete;
                PcapWriter &operator=(const PcapWriter &) = delete;

                /**
                 * @brief Create (or truncate) a PCAP file
                 * @param path File path
                 * @param datalink_type Link type written to the file header
                 * @return true on success, otherwise getLastError() explains
                 */
                bool open(const std::string &path, int datalink_type = DLT_RAW);

                /**
                 * @brief Write a packet using its own timestamp
                 */
                bool writePacket(const Common::Packet &packet);

                /**
                 * @brief Write raw bytes
                 * @param timestamp_us Timestamp (microseconds)
                 */
                bool writeRawPacket(const uint8_t *data, size_t length, uint64_t timestamp_us);

                void close();
                void flush();

                bool isOpen() const { return m_pcap_dumper != nullptr; }
                std::string getCurrentFile() const { return m_current_file; }
                size_t getCurrentSize() const { return m_current_size.load(); }
                uint64_t getPacketCount() const { return m_packet_count.load(); }
                const std::string &getLastError() const { return m_last_error; }

            private:
                bool fail(const std::string &message);

                std::string m_current_file;
                std::string m_last_error;
                std::atomic<size_t> m_current_size{0};
                std::atomic<uint64_t> m_packet_count{0};

                pcap_t *m_pcap_handle{nullptr};
                pcap_dumper_t *m_pcap_dumper{nullptr};

                uint64_t m_writes_since_flush{0};
                static constexpr uint64_t FLUSH_INTERVAL = 100;
            };

        } // namespace Storage
    }     // namespace Core
} // namespace Geneva

#endif // GENEVA_PCAP_WRITER_HPP
