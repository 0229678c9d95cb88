// src/core/engine/strategy_validator.cpp

#include "strategy_validator.hpp"
#include <spdlog/spdlog.h>

namespace Geneva
{
    namespace Engine
    {
        StrategyValidator::StrategyValidator(std::shared_ptr<const FieldRegistry> registry,
                                             const ValidatorOptions &options)
            : registry_(std::move(registry)), options_(options)
        {
        }

        bool StrategyValidator::validate(const Strategy &strategy)
        {
            error_ = CompileError();

            if (!registry_)
            {
                return setError("", "", "No field registry configured");
            }

            return validateForest(strategy.getOutbound(), Direction::OUTBOUND) &&
                   validateForest(strategy.getInbound(), Direction::INBOUND);
        }

        bool StrategyValidator::validateForest(const Forest &forest, Direction direction)
        {
            for (size_t i = 0; i < forest.size(); ++i)
            {
                const ActionTree &tree = forest[i];

                if (tree.depth() > options_.max_depth)
                {
                    return setError(tree.toString(),
                                    "at most " + std::to_string(options_.max_depth) + " nested actions",
                                    "Action tree " + std::to_string(i + 1) + " of the " +
                                        directionToString(direction) + " forest nests " +
                                        std::to_string(tree.depth()) + " composite actions");
                }

                if (!validateTrigger(tree.getTrigger()) || !validateAction(tree.getAction()))
                {
                    return false;
                }
            }
            return true;
        }

        bool StrategyValidator::validateTrigger(const Trigger &trigger)
        {
            const std::string node = trigger.toString();
            const FieldAccessor *accessor = lookupField(trigger.getProtocol(), trigger.getField(), node);
            if (!accessor)
            {
                return false;
            }

            FieldValue value;
            if (!accessor->parseValue(trigger.getValue(), value))
            {
                return setError(node, accessor->getDescription(),
                                "Invalid value '" + trigger.getValue() + "' for " + accessor->getQualifiedName());
            }
            return true;
        }

        bool StrategyValidator::validateAction(const Action &action)
        {
            switch (action.getType())
            {
            case ActionType::SEND:
            case ActionType::DROP:
                return true;

            case ActionType::DUPLICATE:
            {
                const auto &duplicate = static_cast<const DuplicateAction &>(action);
                return (!duplicate.getLeft() || validateAction(*duplicate.getLeft())) &&
                       (!duplicate.getRight() || validateAction(*duplicate.getRight()));
            }

            case ActionType::FRAGMENT:
                return validateFragment(static_cast<const FragmentAction &>(action));

            case ActionType::TAMPER:
                return validateTamper(static_cast<const TamperAction &>(action));
            }

            return setError(action.toString(), "", "Unknown action type");
        }

        bool StrategyValidator::validateFragment(const FragmentAction &fragment)
        {
            if (fragment.getOffset() > options_.max_fragment_offset)
            {
                return setError(fragment.toString(),
                                "offset <= " + std::to_string(options_.max_fragment_offset),
                                "Fragment offset " + std::to_string(fragment.getOffset()) + " is too large");
            }

            return (!fragment.getLeft() || validateAction(*fragment.getLeft())) &&
                   (!fragment.getRight() || validateAction(*fragment.getRight()));
        }

        bool StrategyValidator::validateTamper(const TamperAction &tamper)
        {
            const std::string node = tamper.toString();
            const FieldAccessor *accessor = lookupField(tamper.getProtocol(), tamper.getField(), node);
            if (!accessor)
            {
                return false;
            }

            const auto &value = tamper.getValue();
            const std::string mode = tamperModeToString(tamper.getMode());

            if (tamper.getMode() == TamperMode::CORRUPT)
            {
                if (value)
                {
                    return setError(node + " (value '" + *value + "')", "no value",
                                    "Tamper mode 'corrupt' does not take a value");
                }
                return true;
            }

            if (!value)
            {
                return setError(node, "value", "Tamper mode '" + mode + "' requires a value");
            }

            FieldValue parsed;
            if (!accessor->parseValue(*value, parsed))
            {
                return setError(node, accessor->getDescription(),
                                "Invalid value '" + *value + "' for " + accessor->getQualifiedName());
            }
            return true;
        }

        const FieldAccessor *StrategyValidator::lookupField(Protocol protocol, const std::string &field,
                                                            const std::string &node)
        {
            const FieldAccessor *accessor = registry_->find(protocol, field);
            if (!accessor)
            {
                setError(node, "known " + protocolToString(protocol) + " field",
                         "Unknown field '" + field + "' for protocol " + protocolToString(protocol));
            }
            return accessor;
        }

        bool StrategyValidator::setError(const std::string &node, const std::string &expected,
                                         const std::string &message)
        {
            error_.kind = CompileErrorKind::VALIDATION;
            error_.position = CompileError::NO_POSITION;
            error_.expected = expected;
            error_.node = node;
            error_.message = message;
            spdlog::error(error_.toString());
            return false;
        }

    } // namespace Engine
} // namespace Geneva
