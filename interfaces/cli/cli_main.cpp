// interfaces/cli/cli_main.cpp
#include "cli_commands.hpp"
#include "common/config_manager.hpp"
#include "common/logging.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <readline/readline.h>
#include <readline/history.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

using namespace Geneva;
using namespace Geneva::Interface::CLI;

namespace
{
    CommandManager *g_cmd_manager = nullptr;
    volatile std::sig_atomic_t g_running = 1;

    void signalHandler(int)
    {
        g_running = 0;
    }

    char *commandGenerator(const char *text, int state)
    {
        static std::vector<std::string> matches;
        static size_t index = 0;

        if (state == 0)
        {
            matches = g_cmd_manager ? g_cmd_manager->getParser().getCompletions(text) : std::vector<std::string>();
            index = 0;
        }

        if (index < matches.size())
        {
            return strdup(matches[index++].c_str());
        }
        return nullptr;
    }

    char **commandCompletion(const char *text, int start, int)
    {
        // Only complete the command name
        if (start != 0)
        {
            return nullptr;
        }
        return rl_completion_matches(text, commandGenerator);
    }

    void printBanner()
    {
        std::cout << "Geneva strategy engine - interactive shell\n"
                  << "Type 'help' for available commands, 'exit' to quit.\n" << std::endl;
    }

    int runInteractive(CommandManager &manager)
    {
        rl_attempted_completion_function = commandCompletion;
        printBanner();

        while (g_running && !manager.shouldExit())
        {
            char *line = readline("geneva> ");
            if (!line)
            {
                break;
            }

            std::string input(line);
            free(line);

            if (input.find_first_not_of(" \t") == std::string::npos)
            {
                continue;
            }

            add_history(input.c_str());
            manager.getParser().executeCommand(input);
        }

        return 0;
    }
}

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto &config = Common::ConfigManager::getInstance();
    config.loadFromEnvironment();
    Common::setupLogging(Common::LoggingOptions::fromConfig(config));

    CommandManager manager;
    manager.initialize();
    g_cmd_manager = &manager;

    int status = 0;
    if (argc > 1)
    {
        Command cmd = manager.getParser().parseCommandLine(argc, argv);
        status = manager.getParser().executeCommand(cmd) ? 0 : 1;
    }
    else
    {
        status = runInteractive(manager);
    }

    g_cmd_manager = nullptr;
    spdlog::shutdown();
    return status;
}
