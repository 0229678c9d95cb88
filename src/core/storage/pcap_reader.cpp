// src/core/storage/pcap_reader.cpp
#include "pcap_reader.hpp"
#include <spdlog/spdlog.h>

#ifndef DLT_IPV4
#define DLT_IPV4 228
#endif

namespace Geneva
{
    namespace Core
    {
        namespace Storage
        {
            PcapReader::~PcapReader()
            {
                close();
            }

            bool PcapReader::fail(const std::string &message)
            {
                m_last_error = message;
                spdlog::error(message);
                return false;
            }

            bool PcapReader::open(const std::string &path)
            {
                close();
                m_last_error.clear();

                char errbuf[PCAP_ERRBUF_SIZE] = {0};
                m_pcap_handle = pcap_open_offline(path.c_str(), errbuf);
                if (!m_pcap_handle)
                {
                    return fail("Failed to open PCAP file: " + path + " - Error: " + errbuf);
                }

                m_datalink = pcap_datalink(m_pcap_handle);
                if (m_datalink != DLT_RAW && m_datalink != DLT_IPV4 && m_datalink != DLT_EN10MB)
                {
                    std::string name = pcap_datalink_val_to_name(m_datalink) ? pcap_datalink_val_to_name(m_datalink)
                                                                              : std::to_string(m_datalink);
                    close();
                    return fail("Unsupported datalink type " + name + " in " + path);
                }

                m_current_file = path;
                m_packet_count = 0;
                m_skipped_count = 0;

                spdlog::info("PCAP file opened for reading: {} (datalink={})", path,
                             pcap_datalink_val_to_name(m_datalink) ? pcap_datalink_val_to_name(m_datalink) : "?");
                return true;
            }

            bool PcapReader::next(Common::Packet &packet)
            {
                if (!m_pcap_handle)
                {
                    return fail("Cannot read packet: no PCAP file open");
                }

                while (true)
                {
                    struct pcap_pkthdr *header = nullptr;
                    const u_char *data = nullptr;

                    int rc = pcap_next_ex(m_pcap_handle, &header, &data);
                    if (rc == PCAP_ERROR_BREAK)
                    {
                        return false;
                    }
                    if (rc < 0)
                    {
                        return fail("Error reading " + m_current_file + ": " + pcap_geterr(m_pcap_handle));
                    }
                    if (rc == 0)
                    {
                        continue;
                    }

                    uint64_t timestamp_us = static_cast<uint64_t>(header->ts.tv_sec) * 1000000 +
                                            static_cast<uint64_t>(header->ts.tv_usec);
                    size_t length = header->caplen;

                    if (m_datalink == DLT_EN10MB)
                    {
                        if (length < ETHERNET_HEADER_SIZE)
                        {
                            m_skipped_count++;
                            continue;
                        }

                        uint16_t ethertype = static_cast<uint16_t>((data[12] << 8) | data[13]);
                        if (ethertype != ETHERTYPE_IPV4)
                        {
                            m_skipped_count++;
                            continue;
                        }

                        data += ETHERNET_HEADER_SIZE;
                        length -= ETHERNET_HEADER_SIZE;
                    }

                    packet = Common::Packet(data, length, timestamp_us);
                    packet.truncateToDatagram();
                    m_packet_count++;
                    return true;
                }
            }

            void PcapReader::close()
            {
                if (m_pcap_handle)
                {
                    spdlog::info("Closing PCAP file: {} (packets={}, skipped={})",
                                 m_current_file, m_packet_count, m_skipped_count);
                    pcap_close(m_pcap_handle);
                    m_pcap_handle = nullptr;
                }
                m_current_file.clear();
            }

        } // namespace Storage
    } // namespace Core
} // namespace Geneva
