// src/common/utils.hpp
#ifndef GENEVA_UTILS_HPP
#define GENEVA_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <chrono>
#include <ostream>

namespace Geneva
{
    namespace Common
    {
        /**
         * @brief Utility class with static helper functions
         */
        class Utils
        {
        public:
            // ==================== Time utilities ====================
            /**
             * @brief Current wall-clock time formatted as "YYYY-mm-dd HH:MM:SS.mmm"
             */
            static std::string getCurrentTimestamp();

            /**
             * @brief Current time in microseconds since the epoch
             */
            static uint64_t getCurrentTimestampUs();

            // ==================== String utilities ====================
            static std::vector<std::string> split(const std::string &str, char delimiter);
            static std::string trim(const std::string &str);
            static std::string trim(const std::string &str, const std::string &chars);
            static std::string toLowerCase(const std::string &str);
            static std::string toUpperCase(const std::string &str);
            static bool startsWith(const std::string &str, const std::string &prefix);
            static std::string join(const std::vector<std::string> &strings, const std::string &delimiter);

            // ==================== Conversion utilities ====================
            /**
             * @brief Check that the string is a non-empty run of decimal digits
             */
            static bool isUnsignedInteger(const std::string &str);

            /**
             * @brief Parse an unsigned decimal number
             * @param str Input (leading zeros allowed)
             * @param value Parsed value
             * @return false on empty input, non-digits or overflow
             */
            static bool parseUnsigned(const std::string &str, uint64_t &value);

            static bool isInteger(const std::string &str);
            static int stringToInt(const std::string &str, int default_value = 0);
            static bool stringToBool(const std::string &str, bool default_value = false);

            // ==================== Hex utilities ====================
            static std::string bytesToHex(const void *data, size_t length);

            /**
             * @brief Decode a hex string (whitespace and ':' separators are skipped)
             * @return false on odd digit count or invalid characters
             */
            static bool hexToBytes(const std::string &hex_str, std::vector<uint8_t> &bytes);

            static void hexDump(const void *data, size_t length, std::ostream &os, size_t bytes_per_line = 16);

            // ==================== Network utilities ====================
            /**
             * @brief Convert dotted-quad IPv4 text to a host-order integer
             */
            static bool ipv4FromString(const std::string &text, uint32_t &address);
            static std::string ipv4ToString(uint32_t address);
        };

        /**
         * @brief Thread-safe Singleton template
         */
        template <typename T>
        class Singleton
        {
        public:
            static T &getInstance()
            {
                static T instance;
                return instance;
            }

        protected:
            Singleton() = default;
            virtual ~Singleton() = default;

        public:
            Singleton(const Singleton &) = delete;
            Singleton &operator=(const Singleton &) = delete;
            Singleton(Singleton &&) = delete;
            Singleton &operator=(Singleton &&) = delete;
        };

    } // namespace Common
} // namespace Geneva

#endif // GENEVA_UTILS_HPP
