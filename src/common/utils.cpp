// src/common/utils.cpp
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <ctime>
#include <arpa/inet.h>

namespace Geneva
{
    namespace Common
    {
        // ==================== Time utilities ====================
        std::string Utils::getCurrentTimestamp()
        {
            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()) %
                      1000;

            std::tm tm_buf{};
            localtime_r(&time_t, &tm_buf);

            std::stringstream ss;
            ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
            ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
            return ss.str();
        }

        uint64_t Utils::getCurrentTimestampUs()
        {
            return std::chrono::duration_cast<std::chrono::microseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        // ==================== String utilities ====================
        std::vector<std::string> Utils::split(const std::string &str, char delimiter)
        {
            std::vector<std::string> tokens;
            std::stringstream ss(str);
            std::string token;

            while (std::getline(ss, token, delimiter))
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string Utils::trim(const std::string &str)
        {
            return trim(str, " \t\n\r\f\v");
        }

        std::string Utils::trim(const std::string &str, const std::string &chars)
        {
            size_t start = str.find_first_not_of(chars);
            if (start == std::string::npos)
                return "";

            size_t end = str.find_last_not_of(chars);
            return str.substr(start, end - start + 1);
        }

        std::string Utils::toLowerCase(const std::string &str)
        {
            std::string result = str;
            std::transform(result.begin(), result.end(), result.begin(), ::tolower);
            return result;
        }

        std::string Utils::toUpperCase(const std::string &str)
        {
            std::string result = str;
            std::transform(result.begin(), result.end(), result.begin(), ::toupper);
            return result;
        }

        bool Utils::startsWith(const std::string &str, const std::string &prefix)
        {
            return str.length() >= prefix.length() &&
                   str.compare(0, prefix.length(), prefix) == 0;
        }

        std::string Utils::join(const std::vector<std::string> &strings, const std::string &delimiter)
        {
            if (strings.empty())
                return "";

            std::stringstream ss;
            for (size_t i = 0; i < strings.size(); ++i)
            {
                if (i > 0)
                    ss << delimiter;
                ss << strings[i];
            }
            return ss.str();
        }

        // ==================== Conversion utilities ====================
        bool Utils::isUnsignedInteger(const std::string &str)
        {
            if (str.empty())
                return false;

            return std::all_of(str.begin(), str.end(),
                               [](unsigned char c) { return std::isdigit(c) != 0; });
        }

        bool Utils::parseUnsigned(const std::string &str, uint64_t &value)
        {
            if (!isUnsignedInteger(str))
                return false;

            const uint64_t max = std::numeric_limits<uint64_t>::max();
            uint64_t result = 0;

            for (char c : str)
            {
                uint64_t digit = static_cast<uint64_t>(c - '0');
                if (result > (max - digit) / 10)
                {
                    return false;
                }
                result = result * 10 + digit;
            }

            value = result;
            return true;
        }

        bool Utils::isInteger(const std::string &str)
        {
            if (str.empty())
                return false;

            size_t start = 0;
            if (str[0] == '+' || str[0] == '-')
                start = 1;

            for (size_t i = start; i < str.length(); ++i)
            {
                if (!std::isdigit(static_cast<unsigned char>(str[i])))
                    return false;
            }
            return start < str.length();
        }

        int Utils::stringToInt(const std::string &str, int default_value)
        {
            try
            {
                return std::stoi(str);
            }
            catch (const std::exception &)
            {
                return default_value;
            }
        }

        bool Utils::stringToBool(const std::string &str, bool default_value)
        {
            std::string lower_str = toLowerCase(trim(str));

            if (lower_str == "true" || lower_str == "1" || lower_str == "yes" || lower_str == "on")
                return true;
            else if (lower_str == "false" || lower_str == "0" || lower_str == "no" || lower_str == "off")
                return false;
            else
                return default_value;
        }

        // ==================== Hex utilities ====================
        std::string Utils::bytesToHex(const void *data, size_t length)
        {
            const uint8_t *bytes = static_cast<const uint8_t *>(data);
            std::stringstream ss;

            for (size_t i = 0; i < length; ++i)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
            }
            return ss.str();
        }

        bool Utils::hexToBytes(const std::string &hex_str, std::vector<uint8_t> &bytes)
        {
            std::string digits;
            digits.reserve(hex_str.size());

            for (char c : hex_str)
            {
                if (std::isspace(static_cast<unsigned char>(c)) || c == ':')
                {
                    continue;
                }
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                {
                    return false;
                }
                digits += c;
            }

            if (digits.size() % 2 != 0)
            {
                return false;
            }

            std::vector<uint8_t> result;
            result.reserve(digits.size() / 2);
            for (size_t i = 0; i < digits.size(); i += 2)
            {
                result.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
            }

            bytes = std::move(result);
            return true;
        }

        void Utils::hexDump(const void *data, size_t length, std::ostream &os, size_t bytes_per_line)
        {
            const uint8_t *bytes = static_cast<const uint8_t *>(data);

            for (size_t i = 0; i < length; i += bytes_per_line)
            {
                // Offset
                os << std::hex << std::setw(8) << std::setfill('0') << i << ": ";

                for (size_t j = 0; j < bytes_per_line; ++j)
                {
                    if (i + j < length)
                    {
                        os << std::hex << std::setw(2) << std::setfill('0')
                           << static_cast<int>(bytes[i + j]) << " ";
                    }
                    else
                    {
                        os << "   ";
                    }
                }

                os << " ";

                // ASCII column
                for (size_t j = 0; j < bytes_per_line && i + j < length; ++j)
                {
                    char c = static_cast<char>(bytes[i + j]);
                    os << (std::isprint(static_cast<unsigned char>(c)) ? c : '.');
                }
                os << std::dec << "\n";
            }
        }

        // ==================== Network utilities ====================
        bool Utils::ipv4FromString(const std::string &text, uint32_t &address)
        {
            struct in_addr addr;
            if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            {
                return false;
            }
            address = ntohl(addr.s_addr);
            return true;
        }

        std::string Utils::ipv4ToString(uint32_t address)
        {
            struct in_addr addr;
            addr.s_addr = htonl(address);
            char buf[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &addr, buf, sizeof(buf));
            return std::string(buf);
        }

    } // namespace Common
} // namespace Geneva
