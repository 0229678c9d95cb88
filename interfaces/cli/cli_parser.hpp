// interfaces/cli/cli_parser.hpp
#ifndef GENEVA_CLI_PARSER_HPP
#define GENEVA_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <map>
#include <functional>

namespace Geneva
{
    namespace Interface
    {
        namespace CLI
        {
            // ==================== Command Structure ====================
            struct Command
            {
                std::string name;
                std::vector<std::string> args;
                std::map<std::string, std::string> options;

                Command() = default;
                explicit Command(const std::string &cmd_name) : name(cmd_name) {}

                bool hasOption(const std::string &key) const { return options.find(key) != options.end(); }

                std::string getOption(const std::string &key, const std::string &default_value = "") const
                {
                    auto it = options.find(key);
                    return it != options.end() ? it->second : default_value;
                }
            };

            // ==================== Command Handler ====================
            /**
             * @brief Returns true if the command succeeded
             */
            using CommandHandler = std::function<bool(const Command &cmd)>;

            // ==================== Command Info ====================
            struct CommandInfo
            {
                std::string name;
                std::string description;
                std::string usage;
                std::vector<std::string> examples;
                CommandHandler handler;

                CommandInfo() = default;
                CommandInfo(const std::string &n, const std::string &desc,
                            const std::string &u, CommandHandler h)
                    : name(n), description(desc), usage(u), handler(std::move(h))
                {
                }
            };

            // ==================== CLI Parser Class ====================
            class CLIParser
            {
            public:
                // ==================== Command Registration ====================
                void registerCommand(const std::string &name,
                                     const std::string &description,
                                     const std::string &usage,
                                     CommandHandler handler);

                void registerCommand(const CommandInfo &cmd_info);

                bool unregisterCommand(const std::string &name);

                // ==================== Command Parsing ====================
                Command parseCommand(const std::string &input) const;
                Command parseCommandLine(int argc, char *argv[]) const;

                /**
                 * @brief Split on whitespace, honouring single and double quotes
                 */
                static std::vector<std::string> tokenize(const std::string &input);

                /**
                 * @brief Build a command from tokens (first token is the name)
                 *
                 * Tokens starting with '-' are options; the following token is
                 * their value unless it is itself an option.
                 */
                static Command buildCommand(const std::vector<std::string> &tokens);

                // ==================== Command Execution ====================
                bool executeCommand(const Command &cmd);
                bool executeCommand(const std::string &input);

                // ==================== Command Info ====================
                bool hasCommand(const std::string &name) const;
                CommandInfo getCommandInfo(const std::string &name) const;
                std::vector<CommandInfo> getAllCommands() const;

                // ==================== Help ====================
                void printHelp() const;
                bool printCommandHelp(const std::string &name) const;
                void printVersion() const;

                // ==================== Auto-completion ====================
                std::vector<std::string> getCompletions(const std::string &prefix) const;
                std::string getClosestCommand(const std::string &name) const;

            private:
                std::map<std::string, CommandInfo> commands_;

                static int levenshteinDistance(const std::string &s1, const std::string &s2);
            };

        } // namespace CLI
    } // namespace Interface
} // namespace Geneva

#endif // GENEVA_CLI_PARSER_HPP
