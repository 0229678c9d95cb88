// src/core/engine/field_registry.hpp

#ifndef GENEVA_FIELD_REGISTRY_HPP
#define GENEVA_FIELD_REGISTRY_HPP

#include "strategy_types.hpp"
#include "random_source.hpp"
#include "common/packet.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Comparison semantics of a field
         */
        enum class FieldKind
        {
            NUMERIC, // decimal integer
            TEXT,    // raw bytes
            FLAGS    // bit set, letters or decimal
        };

        std::string fieldKindToString(FieldKind kind);

        /**
         * @brief Value read from, or written to, a packet field
         */
        struct FieldValue
        {
            uint64_t number = 0;        // NUMERIC and FLAGS
            std::vector<uint8_t> bytes; // TEXT

            bool operator==(const FieldValue &other) const
            {
                return number == other.number && bytes == other.bytes;
            }
            bool operator!=(const FieldValue &other) const { return !(*this == other); }
        };

        /**
         * @brief Read/write capability for one (protocol, field) pair
         *
         * Mutators return false when the field cannot be located or
         * changed on a packet that carries the protocol layer. They never
         * touch checksums or lengths; recomputeDependents() does that.
         */
        class FieldAccessor
        {
        public:
            FieldAccessor(Protocol protocol, const std::string &name, FieldKind kind,
                          const std::string &description);
            virtual ~FieldAccessor() = default;

            Protocol getProtocol() const { return protocol_; }
            const std::string &getName() const { return name_; }
            FieldKind getKind() const { return kind_; }
            const std::string &getDescription() const { return description_; }

            /**
             * @brief "tcp:flags"
             */
            std::string getQualifiedName() const;

            /**
             * @brief Check that the packet carries this field's protocol layer
             */
            bool hasLayer(const Common::Packet &packet) const;

            /**
             * @brief Convert DSL text into a value for this field
             * @return false if the text is not a valid value (e.g. too wide)
             */
            virtual bool parseValue(const std::string &text, FieldValue &value) const = 0;

            virtual bool extract(const Common::Packet &packet, FieldValue &value) const = 0;

            virtual bool replace(Common::Packet &packet, const FieldValue &value) const = 0;
            virtual bool add(Common::Packet &packet, const FieldValue &value) const = 0;
            virtual bool corrupt(Common::Packet &packet, RandomSource &random) const = 0;

            /**
             * @brief Fix lengths/checksums owned by the layer after a mutation
             */
            virtual void recomputeDependents(Common::Packet &packet) const = 0;

        private:
            Protocol protocol_;
            std::string name_;
            FieldKind kind_;
            std::string description_;
        };

        using FieldAccessorPtr = std::shared_ptr<const FieldAccessor>;

        /**
         * @brief Lookup table from (protocol, field name) to accessor
         */
        class FieldRegistry
        {
        public:
            FieldRegistry() = default;

            /**
             * @brief Add an accessor, replacing any previous one with the same name
             */
            void registerField(FieldAccessorPtr accessor);

            /**
             * @return Accessor or nullptr if the field is unknown
             */
            const FieldAccessor *find(Protocol protocol, const std::string &name) const;

            bool contains(Protocol protocol, const std::string &name) const
            {
                return find(protocol, name) != nullptr;
            }

            /**
             * @brief Accessors for a protocol in registration order
             */
            std::vector<const FieldAccessor *> getFields(Protocol protocol) const;

            size_t size() const { return accessors_.size(); }

            /**
             * @brief Registry with the standard IPv4 and TCP field set
             */
            static std::shared_ptr<FieldRegistry> createDefault();

        private:
            static std::string makeKey(Protocol protocol, const std::string &name);

            std::vector<FieldAccessorPtr> accessors_;
            std::unordered_map<std::string, size_t> index_;
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_FIELD_REGISTRY_HPP
