// interfaces/cli/cli_commands.cpp
#include "cli_commands.hpp"
#include "common/config_manager.hpp"
#include "common/logging.hpp"
#include "common/utils.hpp"
#include "core/storage/pcap_reader.hpp"
#include "core/storage/pcap_writer.hpp"
#include <iostream>
#include <iomanip>

namespace Geneva
{
    namespace Interface
    {
        namespace CLI
        {
            using Common::ConfigManager;
            using Common::Utils;

            // ==================== Constructor ====================

            CommandManager::CommandManager()
                : exit_requested_(false)
            {
            }

            // ==================== Initialization ====================

            void CommandManager::initialize()
            {
                registerAllCommands();
                rebuildEngine();
            }

            void CommandManager::registerAllCommands()
            {
                parser_.registerCommand("help",
                    "Show help information",
                    "help [command]",
                    [this](const Command &cmd) { return handleHelp(cmd); });

                parser_.registerCommand("version",
                    "Show version information",
                    "version",
                    [this](const Command &cmd) { return handleVersion(cmd); });

                parser_.registerCommand("exit",
                    "Exit the program",
                    "exit",
                    [this](const Command &cmd) { return handleExit(cmd); });

                parser_.registerCommand("quit",
                    "Exit the program",
                    "quit",
                    [this](const Command &cmd) { return handleExit(cmd); });

                CommandInfo compile("compile",
                    "Compile a strategy and print its canonical form",
                    "compile <strategy>",
                    [this](const Command &cmd) { return handleCompile(cmd); });
                compile.examples = {
                    "compile \"[TCP:flags:PA]-duplicate(tamper{TCP:flags:replace:R},)-| \\/\"",
                    "compile \"\\/ [TCP:flags:SA]-drop-|\""};
                parser_.registerCommand(compile);

                parser_.registerCommand("fields",
                    "List the fields triggers and tamper actions can use",
                    "fields [tcp|ip]",
                    [this](const Command &cmd) { return handleFields(cmd); });

                CommandInfo apply("apply",
                    "Replay a capture through a strategy into a raw-IP capture",
                    "apply -s <strategy> -i <in.pcap> -o <out.pcap> [-d outbound|inbound] "
                    "[--local-ip <a.b.c.d>] [--seed <n>]",
                    [this](const Command &cmd) { return handleApply(cmd); });
                apply.examples = {
                    "apply -s \"[TCP:flags:A]-duplicate-| \\/\" -i in.pcap -o out.pcap --local-ip 10.0.0.2"};
                parser_.registerCommand(apply);

                parser_.registerCommand("hex",
                    "Apply a strategy to one hex-encoded IPv4 packet",
                    "hex -s <strategy> -x <hex> [-d outbound|inbound] [--seed <n>]",
                    [this](const Command &cmd) { return handleHex(cmd); });

                parser_.registerCommand("stats",
                    "Show engine statistics",
                    "stats [-r]",
                    [this](const Command &cmd) { return handleStats(cmd); });

                parser_.registerCommand("config",
                    "Show or modify configuration",
                    "config [key] [value]",
                    [this](const Command &cmd) { return handleConfig(cmd); });

                parser_.registerCommand("load-config",
                    "Load configuration from a JSON file",
                    "load-config <file>",
                    [this](const Command &cmd) { return handleLoadConfig(cmd); });
            }

            // ==================== General Commands ====================

            bool CommandManager::handleHelp(const Command &cmd)
            {
                if (cmd.args.empty())
                {
                    parser_.printHelp();
                    return true;
                }
                return parser_.printCommandHelp(cmd.args[0]);
            }

            bool CommandManager::handleVersion(const Command &)
            {
                parser_.printVersion();
                return true;
            }

            bool CommandManager::handleExit(const Command &)
            {
                exit_requested_ = true;
                return true;
            }

            // ==================== Strategy Commands ====================

            bool CommandManager::handleCompile(const Command &cmd)
            {
                if (cmd.args.empty())
                {
                    std::cerr << "Usage: compile <strategy>" << std::endl;
                    return false;
                }

                Engine::CompileResult result = engine_->compile(Utils::join(cmd.args, " "));
                if (!result)
                {
                    std::cerr << result.getError().toString() << std::endl;
                    return false;
                }

                auto strategy = result.getStrategy();
                std::cout << strategy->toString() << std::endl;
                std::cout << "  outbound trees: " << strategy->getOutbound().size() << std::endl;
                std::cout << "  inbound trees:  " << strategy->getInbound().size() << std::endl;
                std::cout << "  max depth:      " << strategy->maxDepth() << std::endl;
                return true;
            }

            bool CommandManager::handleFields(const Command &cmd)
            {
                std::vector<Engine::Protocol> protocols = {Engine::Protocol::IP, Engine::Protocol::TCP};
                if (!cmd.args.empty())
                {
                    Engine::Protocol protocol;
                    if (!Engine::parseProtocol(cmd.args[0], protocol))
                    {
                        std::cerr << "Unknown protocol: " << cmd.args[0] << std::endl;
                        return false;
                    }
                    protocols = {protocol};
                }

                auto registry = engine_->getRegistry();
                for (auto protocol : protocols)
                {
                    std::cout << "\n" << Utils::toUpperCase(Engine::protocolToString(protocol)) << " fields:" << std::endl;
                    for (const auto *field : registry->getFields(protocol))
                    {
                        std::cout << "  " << std::left << std::setw(22) << field->getName()
                                  << std::setw(9) << Engine::fieldKindToString(field->getKind())
                                  << field->getDescription() << std::endl;
                    }
                }
                std::cout << std::endl;
                return true;
            }

            bool CommandManager::handleApply(const Command &cmd)
            {
                std::string input = cmd.getOption("-i");
                std::string output = cmd.getOption("-o");
                if (input.empty() || output.empty() || !cmd.hasOption("-s"))
                {
                    std::cerr << "Usage: " << parser_.getCommandInfo("apply").usage << std::endl;
                    return false;
                }

                Engine::Direction direction = Engine::Direction::OUTBOUND;
                if (!parseDirectionOption(cmd, direction))
                {
                    return false;
                }

                bool by_address = cmd.hasOption("--local-ip");
                uint32_t local_ip = 0;
                if (by_address && !Utils::ipv4FromString(cmd.getOption("--local-ip"), local_ip))
                {
                    std::cerr << "Invalid --local-ip: " << cmd.getOption("--local-ip") << std::endl;
                    return false;
                }

                if (!applySeedOption(cmd))
                {
                    return false;
                }

                auto strategy = compileOption(cmd);
                if (!strategy)
                {
                    return false;
                }

                Core::Storage::PcapReader reader;
                if (!reader.open(input))
                {
                    std::cerr << reader.getLastError() << std::endl;
                    return false;
                }

                Core::Storage::PcapWriter writer;
                if (!writer.open(output))
                {
                    std::cerr << writer.getLastError() << std::endl;
                    return false;
                }

                uint64_t packets_in = 0;
                Common::Packet packet;
                while (reader.next(packet))
                {
                    packets_in++;

                    Engine::Direction packet_direction = direction;
                    if (by_address && packet.hasIPv4())
                    {
                        packet_direction = packet.ipSource() == local_ip ? Engine::Direction::OUTBOUND
                                                                         : Engine::Direction::INBOUND;
                    }

                    for (const auto &out : engine_->apply(*strategy, std::move(packet), packet_direction))
                    {
                        if (!writer.writePacket(out))
                        {
                            std::cerr << writer.getLastError() << std::endl;
                            return false;
                        }
                    }
                }

                if (!reader.getLastError().empty())
                {
                    std::cerr << reader.getLastError() << std::endl;
                    return false;
                }

                std::cout << "Read " << packets_in << " packets (" << reader.getSkippedCount()
                          << " non-IPv4 skipped), wrote " << writer.getPacketCount()
                          << " packets to " << output << std::endl;
                return true;
            }

            bool CommandManager::handleHex(const Command &cmd)
            {
                std::vector<uint8_t> bytes;
                if (!cmd.hasOption("-s") || !cmd.hasOption("-x"))
                {
                    std::cerr << "Usage: " << parser_.getCommandInfo("hex").usage << std::endl;
                    return false;
                }
                if (!Utils::hexToBytes(cmd.getOption("-x"), bytes) || bytes.empty())
                {
                    std::cerr << "Invalid hex packet" << std::endl;
                    return false;
                }

                Engine::Direction direction = Engine::Direction::OUTBOUND;
                if (!parseDirectionOption(cmd, direction) || !applySeedOption(cmd))
                {
                    return false;
                }

                auto strategy = compileOption(cmd);
                if (!strategy)
                {
                    return false;
                }

                Common::Packet packet(std::move(bytes), Utils::getCurrentTimestampUs());
                const Engine::ActionTree *tree = engine_->findMatch(*strategy, packet, direction);
                std::cout << "Input:   " << packet.summary() << std::endl;
                std::cout << "Matched: " << (tree ? tree->toString() : std::string("(none, pass through)")) << std::endl;

                auto output = engine_->apply(*strategy, std::move(packet), direction);
                std::cout << "Output:  " << output.size() << " packet(s)" << std::endl;
                for (size_t i = 0; i < output.size(); ++i)
                {
                    std::cout << "  [" << i << "] " << output[i].summary() << std::endl;
                    std::cout << "      " << Utils::bytesToHex(output[i].data().data(), output[i].size()) << std::endl;
                }
                return true;
            }

            bool CommandManager::handleStats(const Command &cmd)
            {
                if (cmd.hasOption("-r"))
                {
                    engine_->resetStatistics();
                    std::cout << "Statistics reset" << std::endl;
                }

                printStatistics();
                return true;
            }

            // ==================== Configuration Commands ====================

            bool CommandManager::handleConfig(const Command &cmd)
            {
                auto &config = ConfigManager::getInstance();

                if (cmd.args.empty())
                {
                    config.printAll(std::cout);
                    return true;
                }

                const std::string &key = cmd.args[0];
                if (cmd.args.size() == 1)
                {
                    if (!config.hasKey(key))
                    {
                        std::cerr << "Unknown configuration key: " << key << std::endl;
                        return false;
                    }
                    std::cout << key << " = " << config.getAsString(key) << std::endl;
                    return true;
                }

                if (!config.setFromString(key, cmd.args[1]))
                {
                    std::cerr << "Cannot set " << key << " to '" << cmd.args[1] << "'" << std::endl;
                    return false;
                }

                if (Utils::startsWith(key, "log."))
                {
                    Common::setupLogging(Common::LoggingOptions::fromConfig(config));
                }
                rebuildEngine();

                std::cout << key << " = " << config.getAsString(key) << std::endl;
                return true;
            }

            bool CommandManager::handleLoadConfig(const Command &cmd)
            {
                if (cmd.args.empty())
                {
                    std::cerr << "Usage: load-config <file>" << std::endl;
                    return false;
                }

                auto &config = ConfigManager::getInstance();
                if (!config.loadFromFile(cmd.args[0]))
                {
                    std::cerr << "Failed to load configuration from " << cmd.args[0] << std::endl;
                    return false;
                }

                Common::setupLogging(Common::LoggingOptions::fromConfig(config));
                rebuildEngine();

                std::cout << "Configuration loaded from " << cmd.args[0] << std::endl;
                return true;
            }

            // ==================== Helper Functions ====================

            void CommandManager::rebuildEngine()
            {
                auto options = Engine::EngineOptions::fromConfig(ConfigManager::getInstance());
                engine_ = std::make_unique<Engine::StrategyEngine>(options);
            }

            bool CommandManager::applySeedOption(const Command &cmd)
            {
                if (!cmd.hasOption("--seed"))
                {
                    return true;
                }

                uint64_t seed = 0;
                if (!Utils::parseUnsigned(cmd.getOption("--seed"), seed))
                {
                    std::cerr << "Invalid --seed: " << cmd.getOption("--seed") << std::endl;
                    return false;
                }

                // A new seed needs a new random source, so the statistics restart too
                auto options = engine_->getOptions();
                options.random_seed = seed;
                engine_ = std::make_unique<Engine::StrategyEngine>(options, engine_->getRegistry());
                return true;
            }

            std::shared_ptr<const Engine::Strategy> CommandManager::compileOption(const Command &cmd)
            {
                Engine::CompileResult result = engine_->compile(cmd.getOption("-s"));
                if (!result)
                {
                    std::cerr << result.getError().toString() << std::endl;
                    return nullptr;
                }
                return result.getStrategy();
            }

            bool CommandManager::parseDirectionOption(const Command &cmd, Engine::Direction &direction) const
            {
                if (!cmd.hasOption("-d"))
                {
                    return true;
                }
                if (!Engine::parseDirection(cmd.getOption("-d"), direction))
                {
                    std::cerr << "Invalid direction: " << cmd.getOption("-d") << " (use outbound or inbound)" << std::endl;
                    return false;
                }
                return true;
            }

            void CommandManager::printStatistics() const
            {
                auto stats = engine_->getStatistics();

                std::cout << "\nEngine statistics" << std::endl;
                std::cout << "  Packets processed:      " << stats.packets_processed << std::endl;
                std::cout << "  Packets matched:        " << stats.packets_matched << std::endl;
                std::cout << "  Packets passed through: " << stats.packets_passed_through << std::endl;
                std::cout << "  Packets output:         " << stats.packets_output << std::endl;
                std::cout << "  Duplicates:             " << stats.duplicates << std::endl;
                std::cout << "  Fragments:              " << stats.fragments << std::endl;
                std::cout << "  Unsplittable fragments: " << stats.unsplittable_fragments << std::endl;
                std::cout << "  Tampers:                " << stats.tampers << std::endl;
                std::cout << "  Drops:                  " << stats.drops << std::endl;
                std::cout << "  Executor errors:        " << stats.executor_errors << std::endl;
                std::cout << std::endl;
            }

        } // namespace CLI
    } // namespace Interface
} // namespace Geneva
