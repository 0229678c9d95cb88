// src/core/engine/header_fields.hpp

#ifndef GENEVA_HEADER_FIELDS_HPP
#define GENEVA_HEADER_FIELDS_HPP

#include "field_registry.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Fixed-position bit field in the IPv4 or TCP header
         */
        class HeaderFieldAccessor : public FieldAccessor
        {
        public:
            enum Dependents : unsigned
            {
                NONE = 0,
                REPARSE = 1 << 0,     // field affects layer boundaries
                IP_CHECKSUM = 1 << 1,
                TCP_CHECKSUM = 1 << 2
            };

            /**
             * @brief Field position: big-endian container at a header offset
             */
            struct Layout
            {
                size_t offset;    // bytes from the start of the layer header
                size_t container; // 1, 2 or 4 bytes
                unsigned shift;   // bit position of the field's LSB in the container
                unsigned width;   // field width in bits
            };

            HeaderFieldAccessor(Protocol protocol, const std::string &name, FieldKind kind,
                                const Layout &layout, unsigned dependents);

            bool parseValue(const std::string &text, FieldValue &value) const override;
            bool extract(const Common::Packet &packet, FieldValue &value) const override;
            bool replace(Common::Packet &packet, const FieldValue &value) const override;
            bool add(Common::Packet &packet, const FieldValue &value) const override;
            bool corrupt(Common::Packet &packet, RandomSource &random) const override;
            void recomputeDependents(Common::Packet &packet) const override;

            uint64_t getMask() const { return mask_; }

        private:
            using FlagTable = std::vector<std::pair<std::string, uint64_t>>;

            size_t containerOffset(const Common::Packet &packet) const;
            uint64_t read(const Common::Packet &packet) const;
            void write(Common::Packet &packet, uint64_t value) const;

            bool parseFlags(const std::string &text, uint64_t &bits) const;

            static const FlagTable &flagTable(Protocol protocol);
            static std::string describe(Protocol protocol, FieldKind kind, unsigned width);

            Layout layout_;
            unsigned dependents_;
            uint64_t mask_;
        };

        /**
         * @brief Payload bytes following the IPv4 or TCP header ("load")
         */
        class PayloadFieldAccessor : public FieldAccessor
        {
        public:
            static constexpr size_t MAX_DATAGRAM_SIZE = 65535;

            explicit PayloadFieldAccessor(Protocol protocol);

            bool parseValue(const std::string &text, FieldValue &value) const override;
            bool extract(const Common::Packet &packet, FieldValue &value) const override;
            bool replace(Common::Packet &packet, const FieldValue &value) const override;
            bool add(Common::Packet &packet, const FieldValue &value) const override;
            bool corrupt(Common::Packet &packet, RandomSource &random) const override;
            void recomputeDependents(Common::Packet &packet) const override;

        private:
            size_t payloadOffset(const Common::Packet &packet) const;
        };

        /**
         * @brief A TCP option addressed by kind
         *
         * The value is the option's first numeric field (TSval for
         * timestamps, the first left edge for SACK). Presence-only options
         * read as 1. Writing an absent option appends it to the option list.
         */
        class TcpOptionAccessor : public FieldAccessor
        {
        public:
            static constexpr uint8_t KIND_EOL = 0;
            static constexpr uint8_t KIND_NOP = 1;
            static constexpr uint8_t KIND_MSS = 2;
            static constexpr uint8_t KIND_WSCALE = 3;
            static constexpr uint8_t KIND_SACK_PERMITTED = 4;
            static constexpr uint8_t KIND_SACK = 5;
            static constexpr uint8_t KIND_TIMESTAMP = 8;
            static constexpr uint8_t KIND_ALT_CHECKSUM = 14;
            static constexpr uint8_t KIND_ALT_CHECKSUM_DATA = 15;
            static constexpr uint8_t KIND_MD5 = 19;
            static constexpr uint8_t KIND_USER_TIMEOUT = 28;

            static constexpr size_t MAX_OPTIONS_LENGTH = 40;

            /**
             * @param width Value width in bits, 0 for presence-only options
             */
            TcpOptionAccessor(const std::string &name, uint8_t kind, unsigned width);

            bool parseValue(const std::string &text, FieldValue &value) const override;
            bool extract(const Common::Packet &packet, FieldValue &value) const override;
            bool replace(Common::Packet &packet, const FieldValue &value) const override;
            bool add(Common::Packet &packet, const FieldValue &value) const override;
            bool corrupt(Common::Packet &packet, RandomSource &random) const override;
            void recomputeDependents(Common::Packet &packet) const override;

            uint8_t getOptionKind() const { return kind_; }

        private:
            struct Location
            {
                size_t offset; // absolute offset of the kind byte
                size_t length;
            };

            bool locate(const Common::Packet &packet, Location &location) const;
            bool readValue(const Common::Packet &packet, const Location &location, uint64_t &value) const;
            bool writeValue(Common::Packet &packet, const Location &location, uint64_t value) const;
            bool insert(Common::Packet &packet, uint64_t value) const;
            std::vector<uint8_t> build(uint64_t value) const;

            /**
             * @brief End of the last well-formed option before EOL/padding
             */
            static size_t optionsEnd(const Common::Packet &packet);

            uint8_t kind_;
            unsigned width_;
            uint64_t mask_;
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_HEADER_FIELDS_HPP
