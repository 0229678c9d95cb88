// src/core/engine/action_executor.hpp

#ifndef GENEVA_ACTION_EXECUTOR_HPP
#define GENEVA_ACTION_EXECUTOR_HPP

#include "action_tree.hpp"
#include "field_registry.hpp"
#include "random_source.hpp"
#include "common/packet.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Engine counters (lock-free, shared by concurrent apply calls)
         */
        struct EngineStatistics
        {
            std::atomic<uint64_t> packets_processed{0};
            std::atomic<uint64_t> packets_matched{0};
            std::atomic<uint64_t> packets_passed_through{0};
            std::atomic<uint64_t> packets_output{0};
            std::atomic<uint64_t> duplicates{0};
            std::atomic<uint64_t> fragments{0};
            std::atomic<uint64_t> unsplittable_fragments{0};
            std::atomic<uint64_t> tampers{0};
            std::atomic<uint64_t> drops{0};
            std::atomic<uint64_t> executor_errors{0};

            /**
             * @brief Plain copy of the counters
             */
            struct Snapshot
            {
                uint64_t packets_processed;
                uint64_t packets_matched;
                uint64_t packets_passed_through;
                uint64_t packets_output;
                uint64_t duplicates;
                uint64_t fragments;
                uint64_t unsplittable_fragments;
                uint64_t tampers;
                uint64_t drops;
                uint64_t executor_errors;
            };

            Snapshot snapshot() const
            {
                return Snapshot{packets_processed.load(), packets_matched.load(),
                                packets_passed_through.load(), packets_output.load(),
                                duplicates.load(), fragments.load(), unsplittable_fragments.load(),
                                tampers.load(), drops.load(), executor_errors.load()};
            }

            void reset()
            {
                packets_processed = 0;
                packets_matched = 0;
                packets_passed_through = 0;
                packets_output = 0;
                duplicates = 0;
                fragments = 0;
                unsplittable_fragments = 0;
                tampers = 0;
                drops = 0;
                executor_errors = 0;
            }
        };

        /**
         * @brief Runs an action tree on a packet
         *
         * Each call owns its input packet and returns independent output
         * packets. Throws ExecutorError when a registered field cannot be
         * changed on a packet that carries the field's layer.
         */
        class ActionExecutor
        {
        public:
            ActionExecutor(std::shared_ptr<const FieldRegistry> registry,
                           std::shared_ptr<RandomSource> random);

            /**
             * @param action Action to run, nullptr means send
             */
            std::vector<Common::Packet> execute(const Action *action, Common::Packet packet) const;

            /**
             * @brief Counters to update while executing (may be nullptr)
             */
            void setStatistics(EngineStatistics *statistics) { statistics_ = statistics; }

            /**
             * @brief Split a TCP segment after `offset` payload bytes
             * @return false if the packet has no TCP layer or the offset is not inside the payload
             */
            static bool splitTCP(const Common::Packet &packet, size_t offset,
                                 Common::Packet &first, Common::Packet &second);

            /**
             * @brief Split an IPv4 datagram after `offset` payload bytes (rounded down to 8)
             * @return false if the packet has no IPv4 layer or the offset is not inside the payload
             */
            static bool splitIP(const Common::Packet &packet, size_t offset,
                                Common::Packet &first, Common::Packet &second);

        private:
            std::vector<Common::Packet> executeDuplicate(const DuplicateAction &action, Common::Packet packet) const;
            std::vector<Common::Packet> executeFragment(const FragmentAction &action, Common::Packet packet) const;
            std::vector<Common::Packet> executeTamper(const TamperAction &action, Common::Packet packet) const;

            void count(std::atomic<uint64_t> EngineStatistics::*counter) const;

            std::shared_ptr<const FieldRegistry> registry_;
            std::shared_ptr<RandomSource> random_;
            EngineStatistics *statistics_;
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_ACTION_EXECUTOR_HPP
