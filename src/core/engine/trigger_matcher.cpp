// src/core/engine/trigger_matcher.cpp

#include "trigger_matcher.hpp"
#include <spdlog/spdlog.h>

namespace Geneva
{
    namespace Engine
    {
        TriggerMatcher::TriggerMatcher(std::shared_ptr<const FieldRegistry> registry)
            : registry_(std::move(registry))
        {
        }

        bool TriggerMatcher::matches(const Trigger &trigger, const Common::Packet &packet,
                                     Direction /*direction*/) const
        {
            if (!registry_)
            {
                return false;
            }

            const FieldAccessor *accessor = registry_->find(trigger.getProtocol(), trigger.getField());
            if (!accessor)
            {
                spdlog::debug("Trigger {} uses an unregistered field, never matches", trigger.toString());
                return false;
            }

            if (!accessor->hasLayer(packet))
            {
                return false;
            }

            FieldValue expected;
            if (!accessor->parseValue(trigger.getValue(), expected))
            {
                return false;
            }

            FieldValue actual;
            if (!accessor->extract(packet, actual))
            {
                return false;
            }

            return actual == expected;
        }

        const ActionTree *TriggerMatcher::findFirstMatch(const Forest &forest, const Common::Packet &packet,
                                                         Direction direction) const
        {
            for (const auto &tree : forest)
            {
                if (matches(tree.getTrigger(), packet, direction))
                {
                    return &tree;
                }
            }
            return nullptr;
        }

    } // namespace Engine
} // namespace Geneva
