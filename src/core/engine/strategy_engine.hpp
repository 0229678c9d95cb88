// src/core/engine/strategy_engine.hpp

#ifndef GENEVA_STRATEGY_ENGINE_HPP
#define GENEVA_STRATEGY_ENGINE_HPP

#include "action_executor.hpp"
#include "action_tree.hpp"
#include "field_registry.hpp"
#include "random_source.hpp"
#include "strategy_types.hpp"
#include "strategy_validator.hpp"
#include "trigger_matcher.hpp"
#include "common/config_manager.hpp"
#include "common/packet.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Engine tuning, usually read from the configuration
         */
        struct EngineOptions
        {
            size_t max_depth = 8;
            uint32_t max_fragment_offset = 65535;
            uint64_t random_seed = 0; ///< 0 = nondeterministic

            static EngineOptions fromConfig(const Common::ConfigManager &config);

            ValidatorOptions validatorOptions() const;
        };

        /**
         * @brief Outcome of compiling strategy text: a strategy or an error, never both
         */
        class CompileResult
        {
        public:
            explicit CompileResult(std::shared_ptr<const Strategy> strategy)
                : strategy_(std::move(strategy)) {}
            explicit CompileResult(const CompileError &error)
                : error_(error) {}

            bool ok() const { return strategy_ != nullptr; }
            explicit operator bool() const { return ok(); }

            std::shared_ptr<const Strategy> getStrategy() const { return strategy_; }
            const CompileError &getError() const { return error_; }

        private:
            std::shared_ptr<const Strategy> strategy_;
            CompileError error_;
        };

        /**
         * @brief Parse and validate strategy text
         */
        CompileResult compileStrategy(const std::string &text,
                                      std::shared_ptr<const FieldRegistry> registry,
                                      const EngineOptions &options = EngineOptions());

        /**
         * @brief Strategy runtime
         *
         * Compiles strategies against a field registry and applies them to
         * packets. A compiled strategy is immutable and may be applied from
         * several threads at once; the statistics are atomic.
         */
        class StrategyEngine
        {
        public:
            explicit StrategyEngine(const EngineOptions &options = EngineOptions(),
                                    std::shared_ptr<const FieldRegistry> registry = nullptr);

            /**
             * @brief Use a specific random source for corrupt tampering
             */
            StrategyEngine(const EngineOptions &options,
                           std::shared_ptr<const FieldRegistry> registry,
                           std::shared_ptr<RandomSource> random);

            CompileResult compile(const std::string &text) const;

            /**
             * @brief Run the first matching tree of the direction's forest
             *
             * A packet no trigger matches is returned unchanged.
             * @throws ExecutorError if a field accessor fails on a packet that has its layer
             */
            std::vector<Common::Packet> apply(const Strategy &strategy, Common::Packet packet,
                                              Direction direction);

            /**
             * @brief Tree that apply() would run, or nullptr for pass-through
             */
            const ActionTree *findMatch(const Strategy &strategy, const Common::Packet &packet,
                                        Direction direction) const;

            EngineStatistics::Snapshot getStatistics() const { return statistics_.snapshot(); }
            void resetStatistics() { statistics_.reset(); }

            std::shared_ptr<const FieldRegistry> getRegistry() const { return registry_; }
            const EngineOptions &getOptions() const { return options_; }

        private:
            EngineOptions options_;
            std::shared_ptr<const FieldRegistry> registry_;
            std::shared_ptr<RandomSource> random_;
            TriggerMatcher matcher_;
            ActionExecutor executor_;
            EngineStatistics statistics_;
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_STRATEGY_ENGINE_HPP
