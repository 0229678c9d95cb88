// interfaces/cli/cli_parser.cpp
#include "cli_parser.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <climits>

namespace Geneva
{
    namespace Interface
    {
        namespace CLI
        {
            // ==================== Command Registration ====================

            void CLIParser::registerCommand(const std::string &name,
                                            const std::string &description,
                                            const std::string &usage,
                                            CommandHandler handler)
            {
                commands_[name] = CommandInfo(name, description, usage, std::move(handler));
            }

            void CLIParser::registerCommand(const CommandInfo &cmd_info)
            {
                commands_[cmd_info.name] = cmd_info;
            }

            bool CLIParser::unregisterCommand(const std::string &name)
            {
                return commands_.erase(name) > 0;
            }

            // ==================== Command Parsing ====================

            Command CLIParser::parseCommand(const std::string &input) const
            {
                return buildCommand(tokenize(input));
            }

            Command CLIParser::parseCommandLine(int argc, char *argv[]) const
            {
                std::vector<std::string> tokens;
                for (int i = 1; i < argc; ++i)
                {
                    tokens.emplace_back(argv[i]);
                }
                return buildCommand(tokens);
            }

            Command CLIParser::buildCommand(const std::vector<std::string> &tokens)
            {
                Command cmd;

                if (tokens.empty())
                {
                    return cmd;
                }

                cmd.name = tokens[0];

                for (size_t i = 1; i < tokens.size(); ++i)
                {
                    const std::string &token = tokens[i];

                    if (token.size() >= 2 && token[0] == '-')
                    {
                        std::string value;

                        if (i + 1 < tokens.size() && !tokens[i + 1].empty() && tokens[i + 1][0] != '-')
                        {
                            value = tokens[++i];
                        }
                        else
                        {
                            value = "true";
                        }

                        cmd.options[token] = value;
                    }
                    else
                    {
                        cmd.args.push_back(token);
                    }
                }

                return cmd;
            }

            std::vector<std::string> CLIParser::tokenize(const std::string &input)
            {
                std::vector<std::string> tokens;
                std::string current;
                bool in_quotes = false;
                char quote_char = '\0';

                for (char c : input)
                {
                    if (c == '"' || c == '\'')
                    {
                        if (!in_quotes)
                        {
                            in_quotes = true;
                            quote_char = c;
                        }
                        else if (c == quote_char)
                        {
                            in_quotes = false;
                            quote_char = '\0';
                        }
                        else
                        {
                            current += c;
                        }
                    }
                    else if (std::isspace(static_cast<unsigned char>(c)) && !in_quotes)
                    {
                        if (!current.empty())
                        {
                            tokens.push_back(current);
                            current.clear();
                        }
                    }
                    else
                    {
                        current += c;
                    }
                }

                if (!current.empty())
                {
                    tokens.push_back(current);
                }

                return tokens;
            }

            // ==================== Command Execution ====================

            bool CLIParser::executeCommand(const Command &cmd)
            {
                if (cmd.name.empty())
                {
                    return false;
                }

                auto it = commands_.find(cmd.name);
                if (it == commands_.end())
                {
                    std::cerr << "Unknown command: " << cmd.name << std::endl;

                    std::string closest = getClosestCommand(cmd.name);
                    if (!closest.empty())
                    {
                        std::cerr << "Did you mean: " << closest << "?" << std::endl;
                    }

                    return false;
                }

                try
                {
                    return it->second.handler(cmd);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Error executing command: " << e.what() << std::endl;
                    return false;
                }
            }

            bool CLIParser::executeCommand(const std::string &input)
            {
                return executeCommand(parseCommand(input));
            }

            // ==================== Command Info ====================

            bool CLIParser::hasCommand(const std::string &name) const
            {
                return commands_.find(name) != commands_.end();
            }

            CommandInfo CLIParser::getCommandInfo(const std::string &name) const
            {
                auto it = commands_.find(name);
                if (it != commands_.end())
                {
                    return it->second;
                }
                return CommandInfo();
            }

            std::vector<CommandInfo> CLIParser::getAllCommands() const
            {
                std::vector<CommandInfo> result;
                for (const auto &pair : commands_)
                {
                    result.push_back(pair.second);
                }
                return result;
            }

            // ==================== Help ====================

            void CLIParser::printHelp() const
            {
                std::cout << "\nGeneva strategy engine - available commands:\n" << std::endl;

                for (const auto &pair : commands_)
                {
                    const CommandInfo &info = pair.second;
                    std::cout << "  " << std::left << std::setw(14) << info.name << info.description << std::endl;
                }

                std::cout << "\nUse 'help <command>' for detailed information about a command.\n" << std::endl;
            }

            bool CLIParser::printCommandHelp(const std::string &name) const
            {
                auto it = commands_.find(name);
                if (it == commands_.end())
                {
                    std::cerr << "Unknown command: " << name << std::endl;
                    return false;
                }

                const CommandInfo &info = it->second;

                std::cout << "\nCommand: " << info.name << std::endl;
                std::cout << "\nDescription:" << std::endl;
                std::cout << "  " << info.description << std::endl;
                std::cout << "\nUsage:" << std::endl;
                std::cout << "  " << info.usage << std::endl;

                if (!info.examples.empty())
                {
                    std::cout << "\nExamples:" << std::endl;
                    for (const auto &example : info.examples)
                    {
                        std::cout << "  " << example << std::endl;
                    }
                }

                std::cout << std::endl;
                return true;
            }

            void CLIParser::printVersion() const
            {
                std::cout << "geneva_cli - Geneva strategy engine, version 1.0.0" << std::endl;
            }

            // ==================== Auto-completion ====================

            std::vector<std::string> CLIParser::getCompletions(const std::string &prefix) const
            {
                std::vector<std::string> completions;

                for (const auto &pair : commands_)
                {
                    if (pair.first.compare(0, prefix.size(), prefix) == 0)
                    {
                        completions.push_back(pair.first);
                    }
                }

                return completions;
            }

            std::string CLIParser::getClosestCommand(const std::string &name) const
            {
                std::string closest;
                int min_distance = INT_MAX;

                for (const auto &pair : commands_)
                {
                    int distance = levenshteinDistance(name, pair.first);
                    if (distance < min_distance && distance <= 3)
                    {
                        min_distance = distance;
                        closest = pair.first;
                    }
                }

                return closest;
            }

            // ==================== Helper Functions ====================

            int CLIParser::levenshteinDistance(const std::string &s1, const std::string &s2)
            {
                const size_t len1 = s1.size();
                const size_t len2 = s2.size();
                std::vector<std::vector<int>> d(len1 + 1, std::vector<int>(len2 + 1));

                for (size_t i = 0; i <= len1; ++i)
                {
                    d[i][0] = static_cast<int>(i);
                }

                for (size_t j = 0; j <= len2; ++j)
                {
                    d[0][j] = static_cast<int>(j);
                }

                for (size_t i = 1; i <= len1; ++i)
                {
                    for (size_t j = 1; j <= len2; ++j)
                    {
                        int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
                        d[i][j] = std::min({d[i - 1][j] + 1,
                                            d[i][j - 1] + 1,
                                            d[i - 1][j - 1] + cost});
                    }
                }

                return d[len1][len2];
            }

        } // namespace CLI
    } // namespace Interface
} // namespace Geneva
