// src/core/engine/action_executor.cpp

#include "action_executor.hpp"
#include <spdlog/spdlog.h>
#include <iterator>

namespace Geneva
{
    namespace Engine
    {
        using Common::Packet;

        namespace
        {
            void append(std::vector<Packet> &out, std::vector<Packet> &&more)
            {
                out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
            }

            /**
             * @brief Header bytes [0, header_end) followed by payload [from, to)
             */
            Packet rebuild(const Packet &packet, size_t header_end, size_t from, size_t to)
            {
                const auto &data = packet.data();
                std::vector<uint8_t> bytes;
                bytes.reserve(header_end + (to - from));
                bytes.insert(bytes.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(header_end));
                bytes.insert(bytes.end(), data.begin() + static_cast<std::ptrdiff_t>(from),
                             data.begin() + static_cast<std::ptrdiff_t>(to));
                return Packet(std::move(bytes), packet.getTimestamp());
            }
        }

        ActionExecutor::ActionExecutor(std::shared_ptr<const FieldRegistry> registry,
                                       std::shared_ptr<RandomSource> random)
            : registry_(std::move(registry)), random_(std::move(random)), statistics_(nullptr)
        {
        }

        void ActionExecutor::count(std::atomic<uint64_t> EngineStatistics::*counter) const
        {
            if (statistics_)
            {
                (statistics_->*counter)++;
            }
        }

        std::vector<Packet> ActionExecutor::execute(const Action *action, Packet packet) const
        {
            if (!action)
            {
                return {std::move(packet)};
            }

            switch (action->getType())
            {
            case ActionType::SEND:
                return {std::move(packet)};

            case ActionType::DROP:
                count(&EngineStatistics::drops);
                return {};

            case ActionType::DUPLICATE:
                return executeDuplicate(static_cast<const DuplicateAction &>(*action), std::move(packet));

            case ActionType::FRAGMENT:
                return executeFragment(static_cast<const FragmentAction &>(*action), std::move(packet));

            case ActionType::TAMPER:
                return executeTamper(static_cast<const TamperAction &>(*action), std::move(packet));
            }

            throw ExecutorError("Unknown action type in '" + action->toString() + "'");
        }

        // ==================== Duplicate ====================

        std::vector<Packet> ActionExecutor::executeDuplicate(const DuplicateAction &action, Packet packet) const
        {
            count(&EngineStatistics::duplicates);

            Packet copy = packet;
            std::vector<Packet> result = execute(action.getLeft(), std::move(packet));
            append(result, execute(action.getRight(), std::move(copy)));
            return result;
        }

        // ==================== Fragment ====================

        std::vector<Packet> ActionExecutor::executeFragment(const FragmentAction &action, Packet packet) const
        {
            Packet first;
            Packet second;

            bool split = action.getProtocol() == Protocol::TCP
                             ? splitTCP(packet, action.getOffset(), first, second)
                             : splitIP(packet, action.getOffset(), first, second);

            if (!split)
            {
                // Only the left branch sees the unsplit packet
                count(&EngineStatistics::unsplittable_fragments);
                spdlog::warn("Cannot {} at offset {} ({}), applying left branch only",
                             action.toString(), action.getOffset(), packet.summary());
                return execute(action.getLeft(), std::move(packet));
            }

            count(&EngineStatistics::fragments);
            spdlog::debug("Fragmented {} into {} + {} bytes", packet.summary(), first.size(), second.size());

            std::vector<Packet> left = execute(action.getLeft(), std::move(first));
            std::vector<Packet> right = execute(action.getRight(), std::move(second));

            if (action.isInOrder())
            {
                append(left, std::move(right));
                return left;
            }

            append(right, std::move(left));
            return right;
        }

        bool ActionExecutor::splitTCP(const Packet &packet, size_t offset, Packet &first, Packet &second)
        {
            if (!packet.hasTCP())
            {
                return false;
            }

            size_t payload_start = packet.tcpPayloadOffset();
            size_t payload_length = packet.tcpPayloadLength();
            if (offset == 0 || offset >= payload_length)
            {
                return false;
            }

            size_t end = packet.datagramEnd();
            size_t split_at = payload_start + offset;

            first = rebuild(packet, payload_start, payload_start, split_at);
            second = rebuild(packet, payload_start, split_at, end);

            size_t seq_offset = second.tcpHeaderOffset() + Packet::TCP_OFF_SEQ;
            second.writeUint32(seq_offset, second.readUint32(seq_offset) + static_cast<uint32_t>(offset));

            for (Packet *fragment : {&first, &second})
            {
                fragment->updateIPv4Length();
                fragment->reparse();
                fragment->updateIPv4Checksum();
                fragment->updateTCPChecksum();
            }
            return true;
        }

        bool ActionExecutor::splitIP(const Packet &packet, size_t offset, Packet &first, Packet &second)
        {
            if (!packet.hasIPv4())
            {
                return false;
            }

            // Fragment payloads other than the last must be a multiple of 8 bytes
            size_t aligned = (offset / 8) * 8;
            size_t header_length = packet.ipHeaderLength();
            size_t payload_length = packet.ipPayloadLength();
            if (aligned == 0 || aligned >= payload_length)
            {
                return false;
            }

            size_t split_at = header_length + aligned;
            first = rebuild(packet, header_length, header_length, split_at);
            second = rebuild(packet, header_length, split_at, packet.datagramEnd());

            uint16_t flags_frag = packet.readUint16(Packet::IP_OFF_FLAGS_FRAG);
            uint16_t original_offset = flags_frag & 0x1FFF;
            uint16_t flags = flags_frag & 0xE000;

            // First fragment: same offset, more fragments follow
            first.writeUint16(Packet::IP_OFF_FLAGS_FRAG, static_cast<uint16_t>(flags | 0x2000 | original_offset));

            // Second fragment: shifted offset, original MF
            uint16_t second_offset = static_cast<uint16_t>((original_offset + aligned / 8) & 0x1FFF);
            second.writeUint16(Packet::IP_OFF_FLAGS_FRAG, static_cast<uint16_t>(flags | second_offset));

            for (Packet *fragment : {&first, &second})
            {
                fragment->updateIPv4Length();
                fragment->reparse();
                fragment->updateIPv4Checksum();
            }
            return true;
        }

        // ==================== Tamper ====================

        std::vector<Packet> ActionExecutor::executeTamper(const TamperAction &action, Packet packet) const
        {
            const FieldAccessor *accessor = registry_ ? registry_->find(action.getProtocol(), action.getField()) : nullptr;
            if (!accessor)
            {
                throw ExecutorError("No accessor registered for " + protocolToString(action.getProtocol()) +
                                    ":" + action.getField() + " in '" + action.toString() + "'");
            }

            if (!accessor->hasLayer(packet))
            {
                spdlog::debug("{} skipped, packet has no {} layer ({})", action.toString(),
                              protocolToString(action.getProtocol()), packet.summary());
                return {std::move(packet)};
            }

            bool changed = false;
            switch (action.getMode())
            {
            case TamperMode::CORRUPT:
                if (!random_)
                {
                    throw ExecutorError("No random source configured for '" + action.toString() + "'");
                }
                changed = accessor->corrupt(packet, *random_);
                break;

            case TamperMode::REPLACE:
            case TamperMode::ADD:
            {
                FieldValue value;
                if (!action.getValue() || !accessor->parseValue(*action.getValue(), value))
                {
                    throw ExecutorError("Invalid tamper value in '" + action.toString() + "'");
                }
                changed = action.getMode() == TamperMode::REPLACE ? accessor->replace(packet, value)
                                                                  : accessor->add(packet, value);
                break;
            }
            }

            if (!changed)
            {
                throw ExecutorError("Cannot apply '" + action.toString() + "' to " + packet.summary());
            }

            accessor->recomputeDependents(packet);
            count(&EngineStatistics::tampers);
            return {std::move(packet)};
        }

    } // namespace Engine
} // namespace Geneva
