// interfaces/cli/cli_commands.hpp
#ifndef GENEVA_CLI_COMMANDS_HPP
#define GENEVA_CLI_COMMANDS_HPP

#include "cli_parser.hpp"
#include "core/engine/strategy_engine.hpp"
#include <memory>
#include <string>

namespace Geneva
{
    namespace Interface
    {
        namespace CLI
        {
            // ==================== Command Manager ====================
            class CommandManager
            {
            public:
                CommandManager();

                void initialize();
                void registerAllCommands();

                CLIParser &getParser() { return parser_; }

                /**
                 * @brief Set by exit/quit
                 */
                bool shouldExit() const { return exit_requested_; }

                Engine::StrategyEngine &getEngine() { return *engine_; }

            private:
                // ==================== Command Handlers ====================
                bool handleHelp(const Command &cmd);
                bool handleVersion(const Command &cmd);
                bool handleExit(const Command &cmd);

                // Strategy commands
                bool handleCompile(const Command &cmd);
                bool handleFields(const Command &cmd);
                bool handleApply(const Command &cmd);
                bool handleHex(const Command &cmd);
                bool handleStats(const Command &cmd);

                // Configuration commands
                bool handleConfig(const Command &cmd);
                bool handleLoadConfig(const Command &cmd);

                // Helper functions
                void rebuildEngine();
                bool applySeedOption(const Command &cmd);
                std::shared_ptr<const Engine::Strategy> compileOption(const Command &cmd);
                bool parseDirectionOption(const Command &cmd, Engine::Direction &direction) const;
                void printStatistics() const;

                CLIParser parser_;
                std::unique_ptr<Engine::StrategyEngine> engine_;
                bool exit_requested_;
            };

        } // namespace CLI
    } // namespace Interface
} // namespace Geneva

#endif // GENEVA_CLI_COMMANDS_HPP
