// src/common/logging.hpp
#ifndef GENEVA_LOGGING_HPP
#define GENEVA_LOGGING_HPP

#include <string>
#include <cstddef>

namespace Geneva
{
    namespace Common
    {
        class ConfigManager;

        /**
         * @brief Logger settings (see ConfigKeys::LOG_*)
         */
        struct LoggingOptions
        {
            std::string level = "info";
            std::string file;               // empty = console only
            size_t max_file_size = 10 * 1024 * 1024;
            size_t max_files = 3;

            static LoggingOptions fromConfig(const ConfigManager &config);
        };

        /**
         * @brief Install the default spdlog logger (console + optional rotating file)
         * @return false if the sinks could not be created; the previous logger stays active
         */
        bool setupLogging(const LoggingOptions &options);

    } // namespace Common
} // namespace Geneva

#endif // GENEVA_LOGGING_HPP
