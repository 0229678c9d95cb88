// src/core/engine/header_fields.cpp

#include "header_fields.hpp"
#include "common/utils.hpp"
#include <algorithm>

namespace Geneva
{
    namespace Engine
    {
        using Common::Packet;
        using Common::Utils;

        namespace
        {
            uint64_t maskFor(unsigned width)
            {
                return width >= 64 ? ~0ULL : (1ULL << width) - 1;
            }

            uint64_t corruptValue(uint64_t old_value, uint64_t mask, RandomSource &random)
            {
                uint64_t value = random.next() & mask;
                if (value == old_value)
                {
                    value ^= 1;
                }
                return value;
            }

            bool parseBounded(const std::string &text, uint64_t mask, uint64_t &value)
            {
                uint64_t parsed = 0;
                if (!Utils::parseUnsigned(text, parsed) || parsed > mask)
                {
                    return false;
                }
                value = parsed;
                return true;
            }
        }

        // ==================== HeaderFieldAccessor ====================

        HeaderFieldAccessor::HeaderFieldAccessor(Protocol protocol, const std::string &name, FieldKind kind,
                                                 const Layout &layout, unsigned dependents)
            : FieldAccessor(protocol, name, kind, describe(protocol, kind, layout.width)),
              layout_(layout), dependents_(dependents), mask_(maskFor(layout.width))
        {
        }

        const HeaderFieldAccessor::FlagTable &HeaderFieldAccessor::flagTable(Protocol protocol)
        {
            // Multi-letter names first so "DF" is not read as "D" + "F"
            static const FlagTable ip_flags = {
                {"DF", 0x2},
                {"MF", 0x1},
                {"R", 0x4}};
            static const FlagTable tcp_flags = {
                {"F", 0x001},
                {"S", 0x002},
                {"R", 0x004},
                {"P", 0x008},
                {"A", 0x010},
                {"U", 0x020},
                {"E", 0x040},
                {"C", 0x080},
                {"N", 0x100}};

            return protocol == Protocol::IP ? ip_flags : tcp_flags;
        }

        std::string HeaderFieldAccessor::describe(Protocol protocol, FieldKind kind, unsigned width)
        {
            std::string description = std::to_string(width) + "-bit";
            if (kind == FieldKind::FLAGS)
            {
                std::vector<std::string> names;
                for (const auto &entry : flagTable(protocol))
                {
                    names.push_back(entry.first);
                }
                description += " flags (" + Utils::join(names, " ") + ")";
            }
            return description;
        }

        size_t HeaderFieldAccessor::containerOffset(const Packet &packet) const
        {
            size_t base = getProtocol() == Protocol::IP ? 0 : packet.tcpHeaderOffset();
            return base + layout_.offset;
        }

        uint64_t HeaderFieldAccessor::read(const Packet &packet) const
        {
            size_t offset = containerOffset(packet);
            uint64_t raw = 0;
            switch (layout_.container)
            {
            case 1:
                raw = packet.readUint8(offset);
                break;
            case 2:
                raw = packet.readUint16(offset);
                break;
            default:
                raw = packet.readUint32(offset);
                break;
            }
            return (raw >> layout_.shift) & mask_;
        }

        void HeaderFieldAccessor::write(Packet &packet, uint64_t value) const
        {
            size_t offset = containerOffset(packet);
            uint64_t field_bits = mask_ << layout_.shift;

            switch (layout_.container)
            {
            case 1:
            {
                uint64_t raw = packet.readUint8(offset);
                raw = (raw & ~field_bits) | ((value & mask_) << layout_.shift);
                packet.writeUint8(offset, static_cast<uint8_t>(raw));
                break;
            }
            case 2:
            {
                uint64_t raw = packet.readUint16(offset);
                raw = (raw & ~field_bits) | ((value & mask_) << layout_.shift);
                packet.writeUint16(offset, static_cast<uint16_t>(raw));
                break;
            }
            default:
            {
                uint64_t raw = packet.readUint32(offset);
                raw = (raw & ~field_bits) | ((value & mask_) << layout_.shift);
                packet.writeUint32(offset, static_cast<uint32_t>(raw));
                break;
            }
            }
        }

        bool HeaderFieldAccessor::parseFlags(const std::string &text, uint64_t &bits) const
        {
            const FlagTable &table = flagTable(getProtocol());
            uint64_t result = 0;
            size_t pos = 0;

            while (pos < text.size())
            {
                bool matched = false;
                for (const auto &entry : table)
                {
                    if (text.compare(pos, entry.first.size(), entry.first) == 0)
                    {
                        result |= entry.second;
                        pos += entry.first.size();
                        matched = true;
                        break;
                    }
                }
                if (!matched)
                {
                    return false;
                }
            }

            bits = result;
            return true;
        }

        bool HeaderFieldAccessor::parseValue(const std::string &text, FieldValue &value) const
        {
            value = FieldValue();
            if (text.empty())
            {
                return false;
            }

            if (getKind() == FieldKind::FLAGS && !Utils::isUnsignedInteger(text))
            {
                return parseFlags(text, value.number) && value.number <= mask_;
            }

            return parseBounded(text, mask_, value.number);
        }

        bool HeaderFieldAccessor::extract(const Packet &packet, FieldValue &value) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }
            value = FieldValue();
            value.number = read(packet);
            return true;
        }

        bool HeaderFieldAccessor::replace(Packet &packet, const FieldValue &value) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }
            write(packet, value.number);
            return true;
        }

        bool HeaderFieldAccessor::add(Packet &packet, const FieldValue &value) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }
            // FLAGS add is a bitwise OR
            uint64_t current = read(packet);
            write(packet, getKind() == FieldKind::FLAGS ? (current | value.number) : ((current + value.number) & mask_));
            return true;
        }

        bool HeaderFieldAccessor::corrupt(Packet &packet, RandomSource &random) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }
            write(packet, corruptValue(read(packet), mask_, random));
            return true;
        }

        void HeaderFieldAccessor::recomputeDependents(Packet &packet) const
        {
            if (dependents_ & REPARSE)
            {
                packet.reparse();
            }
            if (dependents_ & IP_CHECKSUM)
            {
                packet.updateIPv4Checksum();
            }
            if (dependents_ & TCP_CHECKSUM)
            {
                packet.updateTCPChecksum();
            }
        }

        // ==================== PayloadFieldAccessor ====================

        PayloadFieldAccessor::PayloadFieldAccessor(Protocol protocol)
            : FieldAccessor(protocol, "load", FieldKind::TEXT, "payload bytes")
        {
        }

        size_t PayloadFieldAccessor::payloadOffset(const Packet &packet) const
        {
            return getProtocol() == Protocol::IP ? packet.ipPayloadOffset() : packet.tcpPayloadOffset();
        }

        bool PayloadFieldAccessor::parseValue(const std::string &text, FieldValue &value) const
        {
            value = FieldValue();
            value.bytes.assign(text.begin(), text.end());
            return true;
        }

        bool PayloadFieldAccessor::extract(const Packet &packet, FieldValue &value) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }

            value = FieldValue();
            const auto &data = packet.data();
            value.bytes.assign(data.begin() + static_cast<std::ptrdiff_t>(payloadOffset(packet)),
                               data.begin() + static_cast<std::ptrdiff_t>(packet.datagramEnd()));
            return true;
        }

        bool PayloadFieldAccessor::replace(Packet &packet, const FieldValue &value) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }

            size_t offset = payloadOffset(packet);
            if (offset + value.bytes.size() > MAX_DATAGRAM_SIZE)
            {
                return false;
            }

            packet.truncateToDatagram();
            auto &buffer = packet.buffer();
            buffer.resize(offset);
            buffer.insert(buffer.end(), value.bytes.begin(), value.bytes.end());
            return true;
        }

        bool PayloadFieldAccessor::add(Packet &packet, const FieldValue &value) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }

            if (packet.datagramEnd() + value.bytes.size() > MAX_DATAGRAM_SIZE)
            {
                return false;
            }

            packet.truncateToDatagram();
            auto &buffer = packet.buffer();
            buffer.insert(buffer.end(), value.bytes.begin(), value.bytes.end());
            return true;
        }

        bool PayloadFieldAccessor::corrupt(Packet &packet, RandomSource &random) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }

            packet.truncateToDatagram();
            auto &buffer = packet.buffer();
            for (size_t i = payloadOffset(packet); i < buffer.size(); ++i)
            {
                buffer[i] = static_cast<uint8_t>(random.next() & 0xFF);
            }
            return true;
        }

        void PayloadFieldAccessor::recomputeDependents(Packet &packet) const
        {
            packet.updateIPv4Length();
            packet.reparse();
            packet.updateIPv4Checksum();
            packet.updateTCPChecksum();
        }

        // ==================== TcpOptionAccessor ====================

        TcpOptionAccessor::TcpOptionAccessor(const std::string &name, uint8_t kind, unsigned width)
            : FieldAccessor(Protocol::TCP, name, FieldKind::NUMERIC,
                            "option kind " + std::to_string(kind) +
                                (width == 0 ? " (presence)" : " (" + std::to_string(width) + "-bit)")),
              kind_(kind), width_(width), mask_(width == 0 ? 1 : maskFor(width))
        {
        }

        size_t TcpOptionAccessor::optionsEnd(const Packet &packet)
        {
            const auto &data = packet.data();
            size_t pos = packet.tcpHeaderOffset() + Packet::MIN_TCP_HEADER;
            size_t end = packet.tcpPayloadOffset();

            while (pos < end)
            {
                uint8_t kind = data[pos];
                if (kind == KIND_EOL)
                {
                    break;
                }
                if (kind == KIND_NOP)
                {
                    ++pos;
                    continue;
                }
                if (pos + 1 >= end || data[pos + 1] < 2 || pos + data[pos + 1] > end)
                {
                    break;
                }
                pos += data[pos + 1];
            }

            // Trailing NOP padding is dropped as well
            size_t start = packet.tcpHeaderOffset() + Packet::MIN_TCP_HEADER;
            while (pos > start && data[pos - 1] == KIND_NOP)
            {
                --pos;
            }
            return pos;
        }

        bool TcpOptionAccessor::locate(const Packet &packet, Location &location) const
        {
            const auto &data = packet.data();
            size_t pos = packet.tcpHeaderOffset() + Packet::MIN_TCP_HEADER;
            size_t end = packet.tcpPayloadOffset();

            while (pos < end)
            {
                uint8_t kind = data[pos];
                if (kind == KIND_EOL || kind == KIND_NOP)
                {
                    if (kind == kind_)
                    {
                        location = {pos, 1};
                        return true;
                    }
                    if (kind == KIND_EOL)
                    {
                        return false;
                    }
                    ++pos;
                    continue;
                }

                if (pos + 1 >= end || data[pos + 1] < 2 || pos + data[pos + 1] > end)
                {
                    return false;
                }

                size_t length = data[pos + 1];
                if (kind == kind_)
                {
                    location = {pos, length};
                    return true;
                }
                pos += length;
            }

            return false;
        }

        bool TcpOptionAccessor::readValue(const Packet &packet, const Location &location, uint64_t &value) const
        {
            if (width_ == 0)
            {
                value = 1;
                return true;
            }

            size_t bytes = width_ / 8;
            if (location.length < 2 + bytes)
            {
                return false;
            }

            size_t offset = location.offset + 2;
            switch (bytes)
            {
            case 1:
                value = packet.readUint8(offset);
                break;
            case 2:
                value = packet.readUint16(offset);
                break;
            default:
                value = packet.readUint32(offset);
                break;
            }
            return true;
        }

        bool TcpOptionAccessor::writeValue(Packet &packet, const Location &location, uint64_t value) const
        {
            if (width_ == 0)
            {
                return true;
            }

            size_t bytes = width_ / 8;
            if (location.length < 2 + bytes)
            {
                return false;
            }

            size_t offset = location.offset + 2;
            switch (bytes)
            {
            case 1:
                packet.writeUint8(offset, static_cast<uint8_t>(value));
                break;
            case 2:
                packet.writeUint16(offset, static_cast<uint16_t>(value));
                break;
            default:
                packet.writeUint32(offset, static_cast<uint32_t>(value));
                break;
            }
            return true;
        }

        std::vector<uint8_t> TcpOptionAccessor::build(uint64_t value) const
        {
            auto put16 = [](std::vector<uint8_t> &out, uint64_t v)
            {
                out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
                out.push_back(static_cast<uint8_t>(v & 0xFF));
            };
            auto put32 = [&put16](std::vector<uint8_t> &out, uint64_t v)
            {
                put16(out, v >> 16);
                put16(out, v);
            };

            std::vector<uint8_t> option;
            switch (kind_)
            {
            case KIND_EOL:
            case KIND_NOP:
                option.push_back(kind_);
                break;
            case KIND_MSS:
            case KIND_USER_TIMEOUT:
                option = {kind_, 4};
                put16(option, value);
                break;
            case KIND_WSCALE:
            case KIND_ALT_CHECKSUM:
                option = {kind_, 3, static_cast<uint8_t>(value)};
                break;
            case KIND_SACK:
                // One block with equal edges
                option = {kind_, 10};
                put32(option, value);
                put32(option, value);
                break;
            case KIND_TIMESTAMP:
                // TSecr is zero
                option = {kind_, 10};
                put32(option, value);
                put32(option, 0);
                break;
            case KIND_MD5:
                option = {kind_, 18};
                option.resize(18, 0);
                break;
            default:
                option = {kind_, 2};
                break;
            }
            return option;
        }

        bool TcpOptionAccessor::insert(Packet &packet, uint64_t value) const
        {
            size_t start = packet.tcpHeaderOffset() + Packet::MIN_TCP_HEADER;
            size_t end = packet.tcpPayloadOffset();
            size_t used = optionsEnd(packet);

            const auto &data = packet.data();
            std::vector<uint8_t> options(data.begin() + static_cast<std::ptrdiff_t>(start),
                                         data.begin() + static_cast<std::ptrdiff_t>(used));
            std::vector<uint8_t> option = build(value);
            options.insert(options.end(), option.begin(), option.end());

            uint8_t pad = kind_ == KIND_EOL ? KIND_EOL : KIND_NOP;
            while (options.size() % 4 != 0)
            {
                options.push_back(pad);
            }

            if (options.size() > MAX_OPTIONS_LENGTH)
            {
                return false;
            }

            packet.truncateToDatagram();
            auto &buffer = packet.buffer();
            buffer.erase(buffer.begin() + static_cast<std::ptrdiff_t>(start),
                         buffer.begin() + static_cast<std::ptrdiff_t>(end));
            buffer.insert(buffer.begin() + static_cast<std::ptrdiff_t>(start), options.begin(), options.end());

            size_t dataofs_offset = packet.tcpHeaderOffset() + Packet::TCP_OFF_DATAOFS;
            uint8_t dataofs = static_cast<uint8_t>((Packet::MIN_TCP_HEADER + options.size()) / 4);
            packet.writeUint8(dataofs_offset,
                              static_cast<uint8_t>((packet.readUint8(dataofs_offset) & 0x0F) | (dataofs << 4)));

            packet.updateIPv4Length();
            packet.reparse();
            return true;
        }

        bool TcpOptionAccessor::parseValue(const std::string &text, FieldValue &value) const
        {
            value = FieldValue();
            return parseBounded(text, mask_, value.number);
        }

        bool TcpOptionAccessor::extract(const Packet &packet, FieldValue &value) const
        {
            Location location{};
            if (!hasLayer(packet) || !locate(packet, location))
            {
                return false;
            }

            value = FieldValue();
            return readValue(packet, location, value.number);
        }

        bool TcpOptionAccessor::replace(Packet &packet, const FieldValue &value) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }

            Location location{};
            if (locate(packet, location))
            {
                return writeValue(packet, location, value.number);
            }
            return insert(packet, value.number);
        }

        bool TcpOptionAccessor::add(Packet &packet, const FieldValue &value) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }

            Location location{};
            if (!locate(packet, location))
            {
                return insert(packet, value.number & mask_);
            }

            uint64_t old_value = 0;
            if (!readValue(packet, location, old_value))
            {
                return false;
            }
            return writeValue(packet, location, (old_value + value.number) & mask_);
        }

        bool TcpOptionAccessor::corrupt(Packet &packet, RandomSource &random) const
        {
            if (!hasLayer(packet))
            {
                return false;
            }

            Location location{};
            if (!locate(packet, location))
            {
                return insert(packet, random.next() & mask_);
            }

            uint64_t old_value = 0;
            if (!readValue(packet, location, old_value))
            {
                return false;
            }
            return writeValue(packet, location, corruptValue(old_value, mask_, random));
        }

        void TcpOptionAccessor::recomputeDependents(Packet &packet) const
        {
            packet.reparse();
            packet.updateIPv4Checksum();
            packet.updateTCPChecksum();
        }

    } // namespace Engine
} // namespace Geneva
