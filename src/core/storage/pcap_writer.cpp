// src/core/storage/pcap_writer.cpp
#include "pcap_writer.hpp"
#include <spdlog/spdlog.h>

namespace Geneva
{
    namespace Core
    {
        namespace Storage
        {
            PcapWriter::~PcapWriter()
            {
                close();
            }

            bool PcapWriter::fail(const std::string &message)
            {
                m_last_error = message;
                spdlog::error(message);
                return false;
            }

            bool PcapWriter::open(const std::string &path, int datalink_type)
            {
                if (m_pcap_dumper)
                {
                    spdlog::debug("Closing existing file before opening new one");
                    close();
                }

                m_last_error.clear();
                spdlog::debug("Opening PCAP file for writing: {} (datalink_type={})", path, datalink_type);

                m_pcap_handle = pcap_open_dead(datalink_type, 65535);
                if (!m_pcap_handle)
                {
                    return fail("Failed to create PCAP handle for file: " + path);
                }

                m_pcap_dumper = pcap_dump_open(m_pcap_handle, path.c_str());
                if (!m_pcap_dumper)
                {
                    std::string error_msg = pcap_geterr(m_pcap_handle);
                    pcap_close(m_pcap_handle);
                    m_pcap_handle = nullptr;
                    return fail("Failed to open PCAP dump file: " + path + " - Error: " + error_msg);
                }

                m_current_file = path;
                m_current_size = 0;
                m_packet_count = 0;
                m_writes_since_flush = 0;

                spdlog::info("PCAP file opened for writing: {}", m_current_file);
                return true;
            }

            bool PcapWriter::writePacket(const Common::Packet &packet)
            {
                return writeRawPacket(packet.data().data(), packet.size(), packet.getTimestamp());
            }

            bool PcapWriter::writeRawPacket(const uint8_t *data, size_t length, uint64_t timestamp_us)
            {
                if (!m_pcap_dumper)
                {
                    return fail("Cannot write packet: no PCAP file open");
                }

                if (!data || length == 0)
                {
                    spdlog::warn("Skipping empty packet");
                    return false;
                }

                struct pcap_pkthdr header;
                header.ts.tv_sec = static_cast<time_t>(timestamp_us / 1000000);
                header.ts.tv_usec = static_cast<suseconds_t>(timestamp_us % 1000000);
                header.caplen = static_cast<bpf_u_int32>(length);
                header.len = static_cast<bpf_u_int32>(length);

                pcap_dump(reinterpret_cast<u_char *>(m_pcap_dumper), &header, data);

                m_packet_count++;
                m_current_size += length + sizeof(struct pcap_pkthdr);

                if (++m_writes_since_flush >= FLUSH_INTERVAL)
                {
                    flush();
                    m_writes_since_flush = 0;
                }

                return true;
            }

            void PcapWriter::flush()
            {
                if (m_pcap_dumper)
                {
                    pcap_dump_flush(m_pcap_dumper);
                }
            }

            void PcapWriter::close()
            {
                if (m_pcap_dumper)
                {
                    spdlog::info("Closing PCAP file: {} (packets={}, size={} bytes)",
                                 m_current_file, m_packet_count.load(), m_current_size.load());

                    flush();
                    pcap_dump_close(m_pcap_dumper);
                    m_pcap_dumper = nullptr;
                }

                if (m_pcap_handle)
                {
                    pcap_close(m_pcap_handle);
                    m_pcap_handle = nullptr;
                }

                m_current_file.clear();
            }

        } // namespace Storage
    } // namespace Core
} // namespace Geneva
