// src/core/engine/strategy_validator.hpp

#ifndef GENEVA_STRATEGY_VALIDATOR_HPP
#define GENEVA_STRATEGY_VALIDATOR_HPP

#include "action_tree.hpp"
#include "field_registry.hpp"
#include "strategy_types.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace Geneva
{
    namespace Engine
    {
        struct ValidatorOptions
        {
            size_t max_depth = 8;
            uint32_t max_fragment_offset = 65535;
        };

        /**
         * @brief Semantic checks run on a parsed strategy
         *
         * - every trigger and tamper field is registered for its protocol
         * - trigger and tamper values are valid for the field
         * - tamper value present exactly for replace/add
         * - fragment offsets within the configured maximum
         * - composite nesting within the configured depth
         */
        class StrategyValidator
        {
        public:
            StrategyValidator(std::shared_ptr<const FieldRegistry> registry,
                              const ValidatorOptions &options = ValidatorOptions());

            /**
             * @return true if valid, otherwise getError() names the offending node
             */
            bool validate(const Strategy &strategy);

            const CompileError &getError() const { return error_; }

        private:
            bool validateForest(const Forest &forest, Direction direction);
            bool validateTrigger(const Trigger &trigger);
            bool validateAction(const Action &action);
            bool validateFragment(const FragmentAction &fragment);
            bool validateTamper(const TamperAction &tamper);

            const FieldAccessor *lookupField(Protocol protocol, const std::string &field, const std::string &node);

            bool setError(const std::string &node, const std::string &expected, const std::string &message);

            std::shared_ptr<const FieldRegistry> registry_;
            ValidatorOptions options_;
            CompileError error_;
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_STRATEGY_VALIDATOR_HPP
