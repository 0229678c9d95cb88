// src/core/engine/trigger_matcher.hpp

#ifndef GENEVA_TRIGGER_MATCHER_HPP
#define GENEVA_TRIGGER_MATCHER_HPP

#include "action_tree.hpp"
#include "field_registry.hpp"
#include "common/packet.hpp"
#include <memory>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Evaluates triggers against packets
         *
         * Never fails: a missing layer, an unregistered field or a value
         * the field cannot represent all mean "no match".
         */
        class TriggerMatcher
        {
        public:
            explicit TriggerMatcher(std::shared_ptr<const FieldRegistry> registry);

            bool matches(const Trigger &trigger, const Common::Packet &packet, Direction direction) const;

            /**
             * @brief First tree in the forest whose trigger matches, or nullptr
             */
            const ActionTree *findFirstMatch(const Forest &forest, const Common::Packet &packet,
                                             Direction direction) const;

        private:
            std::shared_ptr<const FieldRegistry> registry_;
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_TRIGGER_MATCHER_HPP
