// src/core/engine/field_registry.cpp

#include "field_registry.hpp"
#include "header_fields.hpp"

namespace Geneva
{
    namespace Engine
    {
        std::string fieldKindToString(FieldKind kind)
        {
            switch (kind)
            {
            case FieldKind::NUMERIC:
                return "numeric";
            case FieldKind::TEXT:
                return "text";
            case FieldKind::FLAGS:
                return "flags";
            }
            return "unknown";
        }

        // ==================== FieldAccessor ====================

        FieldAccessor::FieldAccessor(Protocol protocol, const std::string &name, FieldKind kind,
                                     const std::string &description)
            : protocol_(protocol), name_(name), kind_(kind), description_(description)
        {
        }

        std::string FieldAccessor::getQualifiedName() const
        {
            return protocolToString(protocol_) + ":" + name_;
        }

        bool FieldAccessor::hasLayer(const Common::Packet &packet) const
        {
            return protocol_ == Protocol::IP ? packet.hasIPv4() : packet.hasTCP();
        }

        // ==================== FieldRegistry ====================

        void FieldRegistry::registerField(FieldAccessorPtr accessor)
        {
            if (!accessor)
            {
                return;
            }

            std::string key = makeKey(accessor->getProtocol(), accessor->getName());
            auto it = index_.find(key);
            if (it != index_.end())
            {
                accessors_[it->second] = std::move(accessor);
                return;
            }

            index_[key] = accessors_.size();
            accessors_.push_back(std::move(accessor));
        }

        const FieldAccessor *FieldRegistry::find(Protocol protocol, const std::string &name) const
        {
            auto it = index_.find(makeKey(protocol, name));
            return it != index_.end() ? accessors_[it->second].get() : nullptr;
        }

        std::vector<const FieldAccessor *> FieldRegistry::getFields(Protocol protocol) const
        {
            std::vector<const FieldAccessor *> fields;
            for (const auto &accessor : accessors_)
            {
                if (accessor->getProtocol() == protocol)
                {
                    fields.push_back(accessor.get());
                }
            }
            return fields;
        }

        std::string FieldRegistry::makeKey(Protocol protocol, const std::string &name)
        {
            return protocolToString(protocol) + ":" + name;
        }

        std::shared_ptr<FieldRegistry> FieldRegistry::createDefault()
        {
            using Common::Packet;
            using Dep = HeaderFieldAccessor::Dependents;

            auto registry = std::make_shared<FieldRegistry>();

            auto header = [&registry](Protocol protocol, const std::string &name, FieldKind kind,
                                      size_t offset, size_t container, unsigned shift, unsigned width,
                                      unsigned dependents)
            {
                registry->registerField(std::make_shared<HeaderFieldAccessor>(
                    protocol, name, kind, HeaderFieldAccessor::Layout{offset, container, shift, width}, dependents));
            };

            // ==================== IPv4 ====================
            const unsigned ip_sum = Dep::IP_CHECKSUM;
            const unsigned ip_struct = Dep::REPARSE | Dep::IP_CHECKSUM;
            const unsigned ip_addr = Dep::IP_CHECKSUM | Dep::TCP_CHECKSUM;

            header(Protocol::IP, "version", FieldKind::NUMERIC, Packet::IP_OFF_VERSION_IHL, 1, 4, 4, ip_struct);
            header(Protocol::IP, "ihl", FieldKind::NUMERIC, Packet::IP_OFF_VERSION_IHL, 1, 0, 4, ip_struct);
            header(Protocol::IP, "tos", FieldKind::NUMERIC, Packet::IP_OFF_TOS, 1, 0, 8, ip_sum);
            header(Protocol::IP, "len", FieldKind::NUMERIC, Packet::IP_OFF_TOTAL_LENGTH, 2, 0, 16, ip_struct);
            header(Protocol::IP, "id", FieldKind::NUMERIC, Packet::IP_OFF_ID, 2, 0, 16, ip_sum);
            header(Protocol::IP, "flags", FieldKind::FLAGS, Packet::IP_OFF_FLAGS_FRAG, 2, 13, 3, ip_struct);
            header(Protocol::IP, "frag", FieldKind::NUMERIC, Packet::IP_OFF_FLAGS_FRAG, 2, 0, 13, ip_struct);
            header(Protocol::IP, "ttl", FieldKind::NUMERIC, Packet::IP_OFF_TTL, 1, 0, 8, ip_sum);
            header(Protocol::IP, "protocol", FieldKind::NUMERIC, Packet::IP_OFF_PROTOCOL, 1, 0, 8, ip_struct);
            header(Protocol::IP, "chksum", FieldKind::NUMERIC, Packet::IP_OFF_CHECKSUM, 2, 0, 16, Dep::NONE);
            header(Protocol::IP, "src", FieldKind::NUMERIC, Packet::IP_OFF_SRC, 4, 0, 32, ip_addr);
            header(Protocol::IP, "dst", FieldKind::NUMERIC, Packet::IP_OFF_DST, 4, 0, 32, ip_addr);
            registry->registerField(std::make_shared<PayloadFieldAccessor>(Protocol::IP));

            // ==================== TCP ====================
            const unsigned tcp_sum = Dep::TCP_CHECKSUM;
            const unsigned tcp_struct = Dep::REPARSE | Dep::TCP_CHECKSUM;

            header(Protocol::TCP, "sport", FieldKind::NUMERIC, Packet::TCP_OFF_SPORT, 2, 0, 16, tcp_sum);
            header(Protocol::TCP, "dport", FieldKind::NUMERIC, Packet::TCP_OFF_DPORT, 2, 0, 16, tcp_sum);
            header(Protocol::TCP, "seq", FieldKind::NUMERIC, Packet::TCP_OFF_SEQ, 4, 0, 32, tcp_sum);
            header(Protocol::TCP, "ack", FieldKind::NUMERIC, Packet::TCP_OFF_ACK, 4, 0, 32, tcp_sum);
            header(Protocol::TCP, "dataofs", FieldKind::NUMERIC, Packet::TCP_OFF_DATAOFS, 2, 12, 4, tcp_struct);
            header(Protocol::TCP, "reserved", FieldKind::NUMERIC, Packet::TCP_OFF_DATAOFS, 2, 9, 3, tcp_sum);
            header(Protocol::TCP, "flags", FieldKind::FLAGS, Packet::TCP_OFF_DATAOFS, 2, 0, 9, tcp_sum);
            header(Protocol::TCP, "window", FieldKind::NUMERIC, Packet::TCP_OFF_WINDOW, 2, 0, 16, tcp_sum);
            header(Protocol::TCP, "chksum", FieldKind::NUMERIC, Packet::TCP_OFF_CHECKSUM, 2, 0, 16, Dep::NONE);
            header(Protocol::TCP, "urgptr", FieldKind::NUMERIC, Packet::TCP_OFF_URGPTR, 2, 0, 16, tcp_sum);
            registry->registerField(std::make_shared<PayloadFieldAccessor>(Protocol::TCP));

            // TCP options: name, kind, value width in bits (0 = presence only)
            const struct
            {
                const char *name;
                uint8_t kind;
                unsigned width;
            } options[] = {
                {"options-eol", TcpOptionAccessor::KIND_EOL, 0},
                {"options-nop", TcpOptionAccessor::KIND_NOP, 0},
                {"options-mss", TcpOptionAccessor::KIND_MSS, 16},
                {"options-wscale", TcpOptionAccessor::KIND_WSCALE, 8},
                {"options-sackok", TcpOptionAccessor::KIND_SACK_PERMITTED, 0},
                {"options-sack", TcpOptionAccessor::KIND_SACK, 32},
                {"options-timestamp", TcpOptionAccessor::KIND_TIMESTAMP, 32},
                {"options-altchksum", TcpOptionAccessor::KIND_ALT_CHECKSUM, 8},
                {"options-altchksumopt", TcpOptionAccessor::KIND_ALT_CHECKSUM_DATA, 0},
                {"options-md5header", TcpOptionAccessor::KIND_MD5, 0},
                {"options-uto", TcpOptionAccessor::KIND_USER_TIMEOUT, 16},
            };

            for (const auto &option : options)
            {
                registry->registerField(std::make_shared<TcpOptionAccessor>(option.name, option.kind, option.width));
            }

            return registry;
        }

    } // namespace Engine
} // namespace Geneva
