// src/common/logging.cpp
#include "logging.hpp"
#include "config_manager.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <vector>
#include <algorithm>
#include <chrono>

namespace Geneva
{
    namespace Common
    {
        LoggingOptions LoggingOptions::fromConfig(const ConfigManager &config)
        {
            LoggingOptions options;
            options.level = config.getString(ConfigKeys::LOG_LEVEL, options.level);
            options.file = config.getString(ConfigKeys::LOG_FILE, options.file);

            int max_size = config.getInt(ConfigKeys::LOG_MAX_SIZE, static_cast<int>(options.max_file_size));
            int max_files = config.getInt(ConfigKeys::LOG_MAX_FILES, static_cast<int>(options.max_files));
            if (max_size > 0)
            {
                options.max_file_size = static_cast<size_t>(max_size);
            }
            if (max_files > 0)
            {
                options.max_files = static_cast<size_t>(max_files);
            }
            return options;
        }

        bool setupLogging(const LoggingOptions &options)
        {
            try
            {
                spdlog::level::level_enum level = spdlog::level::from_str(options.level);

                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_level(level);
                console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

                std::vector<spdlog::sink_ptr> sinks{console_sink};

                if (!options.file.empty())
                {
                    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        options.file, options.max_file_size, options.max_files);
                    file_sink->set_level(spdlog::level::debug);
                    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                    sinks.push_back(file_sink);
                }

                auto logger = std::make_shared<spdlog::logger>("geneva", sinks.begin(), sinks.end());
                logger->set_level(options.file.empty() ? level : std::min(level, spdlog::level::debug));

                spdlog::set_default_logger(logger);
                spdlog::flush_every(std::chrono::seconds(5));

                spdlog::debug("Logger initialized (level={}, file={})", options.level,
                              options.file.empty() ? "<none>" : options.file);
                return true;
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                std::cerr << "Log initialization failed: " << ex.what() << std::endl;
                return false;
            }
        }

    } // namespace Common
} // namespace Geneva
