// src/core/engine/strategy_engine.cpp

#include "strategy_engine.hpp"
#include "strategy_parser.hpp"
#include <spdlog/spdlog.h>

namespace Geneva
{
    namespace Engine
    {
        // ==================== EngineOptions ====================

        EngineOptions EngineOptions::fromConfig(const Common::ConfigManager &config)
        {
            EngineOptions options;
            int max_depth = config.getInt(Common::ConfigKeys::ENGINE_MAX_DEPTH, static_cast<int>(options.max_depth));
            int max_offset = config.getInt(Common::ConfigKeys::ENGINE_MAX_FRAGMENT_OFFSET,
                                           static_cast<int>(options.max_fragment_offset));
            int seed = config.getInt(Common::ConfigKeys::ENGINE_RANDOM_SEED, 0);
            if (max_depth > 0)
            {
                options.max_depth = static_cast<size_t>(max_depth);
            }
            if (max_offset > 0)
            {
                options.max_fragment_offset = static_cast<uint32_t>(max_offset);
            }
            if (seed > 0)
            {
                options.random_seed = static_cast<uint64_t>(seed);
            }
            return options;
        }

        ValidatorOptions EngineOptions::validatorOptions() const
        {
            ValidatorOptions options;
            options.max_depth = max_depth;
            options.max_fragment_offset = max_fragment_offset;
            return options;
        }

        // ==================== Compile ====================

        CompileResult compileStrategy(const std::string &text,
                                      std::shared_ptr<const FieldRegistry> registry,
                                      const EngineOptions &options)
        {
            Parser parser;
            std::unique_ptr<Strategy> strategy = parser.parse(text);
            if (!strategy)
            {
                return CompileResult(parser.getError());
            }

            StrategyValidator validator(std::move(registry), options.validatorOptions());
            if (!validator.validate(*strategy))
            {
                return CompileResult(validator.getError());
            }

            spdlog::info("Compiled strategy '{}' ({} outbound, {} inbound trees, depth {})",
                         strategy->toString(), strategy->getOutbound().size(),
                         strategy->getInbound().size(), strategy->maxDepth());

            return CompileResult(std::shared_ptr<const Strategy>(std::move(strategy)));
        }

        // ==================== StrategyEngine ====================

        namespace
        {
            std::shared_ptr<RandomSource> makeRandomSource(uint64_t seed)
            {
                if (seed != 0)
                {
                    return std::make_shared<SeededRandomSource>(seed);
                }
                return std::make_shared<SeededRandomSource>();
            }
        }

        StrategyEngine::StrategyEngine(const EngineOptions &options,
                                       std::shared_ptr<const FieldRegistry> registry)
            : StrategyEngine(options, std::move(registry), makeRandomSource(options.random_seed))
        {
        }

        StrategyEngine::StrategyEngine(const EngineOptions &options,
                                       std::shared_ptr<const FieldRegistry> registry,
                                       std::shared_ptr<RandomSource> random)
            : options_(options),
              registry_(registry ? std::move(registry) : FieldRegistry::createDefault()),
              random_(std::move(random)),
              matcher_(registry_),
              executor_(registry_, random_)
        {
            executor_.setStatistics(&statistics_);
        }

        CompileResult StrategyEngine::compile(const std::string &text) const
        {
            return compileStrategy(text, registry_, options_);
        }

        const ActionTree *StrategyEngine::findMatch(const Strategy &strategy, const Common::Packet &packet,
                                                    Direction direction) const
        {
            return matcher_.findFirstMatch(strategy.getForest(direction), packet, direction);
        }

        std::vector<Common::Packet> StrategyEngine::apply(const Strategy &strategy, Common::Packet packet,
                                                          Direction direction)
        {
            statistics_.packets_processed++;

            const ActionTree *tree = findMatch(strategy, packet, direction);
            if (!tree)
            {
                statistics_.packets_passed_through++;
                statistics_.packets_output++;
                spdlog::debug("{} {}: no trigger matched, passing through",
                              directionToString(direction), packet.summary());
                return {std::move(packet)};
            }

            statistics_.packets_matched++;
            spdlog::debug("{} {}: matched {}", directionToString(direction), packet.summary(),
                          tree->getTrigger().toString());

            try
            {
                std::vector<Common::Packet> output = executor_.execute(&tree->getAction(), std::move(packet));
                statistics_.packets_output += output.size();
                spdlog::debug("{} produced {} packet(s)", tree->toString(), output.size());
                return output;
            }
            catch (const ExecutorError &e)
            {
                statistics_.executor_errors++;
                spdlog::error("Executing {} failed: {}", tree->toString(), e.what());
                throw;
            }
        }

    } // namespace Engine
} // namespace Geneva
