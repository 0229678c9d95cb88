// src/common/config_manager.cpp
#include "config_manager.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <regex>
#include <cstdlib>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

extern char **environ;

using json = nlohmann::json;

namespace Geneva
{
    namespace Common
    {
        // ==================== Constructor ====================
        ConfigManager::ConfigManager()
        {
            initializeDefaults();
        }

        // ==================== Initialization ====================
        void ConfigManager::initializeDefaults()
        {
            setInt(ConfigKeys::ENGINE_MAX_DEPTH, 8, "Maximum nesting of composite actions in one action tree");
            setInt(ConfigKeys::ENGINE_MAX_FRAGMENT_OFFSET, 65535, "Largest accepted fragment split offset");
            setInt(ConfigKeys::ENGINE_RANDOM_SEED, 0, "Seed for corrupt tampering (0 = nondeterministic)");

            setString(ConfigKeys::LOG_LEVEL, "info", "Log level (trace, debug, info, warn, error, critical, off)");
            setString(ConfigKeys::LOG_FILE, "", "Rotating log file path (empty = console only)");
            setInt(ConfigKeys::LOG_MAX_SIZE, 10 * 1024 * 1024, "Maximum log file size in bytes");
            setInt(ConfigKeys::LOG_MAX_FILES, 3, "Number of rotated log files to keep");

            setValidator(ConfigKeys::ENGINE_MAX_DEPTH, [](const std::any &value)
                         { return std::any_cast<int>(value) >= 1; });
            setValidator(ConfigKeys::ENGINE_MAX_FRAGMENT_OFFSET, [](const std::any &value)
                         {
                             int offset = std::any_cast<int>(value);
                             return offset >= 1 && offset <= 65535;
                         });
            setValidator(ConfigKeys::ENGINE_RANDOM_SEED, [](const std::any &value)
                         { return std::any_cast<int>(value) >= 0; });
            setValidator(ConfigKeys::LOG_MAX_SIZE, [](const std::any &value)
                         { return std::any_cast<int>(value) > 0; });
            setValidator(ConfigKeys::LOG_MAX_FILES, [](const std::any &value)
                         { return std::any_cast<int>(value) >= 0; });
        }

        void ConfigManager::resetToDefaults()
        {
            {
                std::unique_lock<std::shared_mutex> lock(config_mutex_);
                config_map_.clear();
            }
            initializeDefaults();
        }

        // ==================== File I/O ====================
        bool ConfigManager::loadFromFile(const std::string &config_file)
        {
            std::ifstream file(config_file);
            if (!file.is_open())
            {
                spdlog::warn("Cannot open config file: {}", config_file);
                return false;
            }

            std::stringstream buffer;
            buffer << file.rdbuf();
            return loadFromJson(buffer.str());
        }

        bool ConfigManager::saveToFile(const std::string &config_file) const
        {
            std::ofstream file(config_file);
            if (!file.is_open())
            {
                spdlog::warn("Cannot create config file: {}", config_file);
                return false;
            }

            file << exportToJson() << "\n";
            return file.good();
        }

        // ==================== JSON Operations ====================
        bool ConfigManager::loadFromJson(const std::string &json_content)
        {
            try
            {
                std::string clean_json = removeJsonComments(json_content);
                json j = json::parse(clean_json);

                if (!j.is_object())
                {
                    spdlog::warn("Config root must be a JSON object");
                    return false;
                }

                return parseJsonRecursive(j.dump(), "");
            }
            catch (const json::exception &e)
            {
                spdlog::warn("JSON parse error: {}", e.what());
                return false;
            }
        }

        std::string ConfigManager::exportToJson() const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            json j = json::object();
            for (const auto &[key, entry] : config_map_)
            {
                switch (entry.type)
                {
                case ConfigType::STRING:
                    j[key] = std::any_cast<std::string>(entry.value);
                    break;
                case ConfigType::INTEGER:
                    j[key] = std::any_cast<int>(entry.value);
                    break;
                case ConfigType::DOUBLE:
                    j[key] = std::any_cast<double>(entry.value);
                    break;
                case ConfigType::BOOLEAN:
                    j[key] = std::any_cast<bool>(entry.value);
                    break;
                case ConfigType::ARRAY:
                    j[key] = std::any_cast<std::vector<std::string>>(entry.value);
                    break;
                }
            }

            return j.dump(4);
        }

        std::string ConfigManager::removeJsonComments(const std::string &json_content) const
        {
            std::string result;
            result.reserve(json_content.size());

            bool in_string = false;
            bool in_line_comment = false;
            bool in_block_comment = false;

            for (size_t i = 0; i < json_content.size(); ++i)
            {
                char c = json_content[i];
                char next = i + 1 < json_content.size() ? json_content[i + 1] : '\0';

                if (in_line_comment)
                {
                    if (c == '\n')
                    {
                        in_line_comment = false;
                        result += c;
                    }
                    continue;
                }

                if (in_block_comment)
                {
                    if (c == '*' && next == '/')
                    {
                        in_block_comment = false;
                        ++i;
                    }
                    continue;
                }

                if (in_string)
                {
                    result += c;
                    if (c == '\\' && next != '\0')
                    {
                        result += next;
                        ++i;
                    }
                    else if (c == '"')
                    {
                        in_string = false;
                    }
                    continue;
                }

                if (c == '"')
                {
                    in_string = true;
                    result += c;
                }
                else if (c == '/' && next == '/')
                {
                    in_line_comment = true;
                    ++i;
                }
                else if (c == '/' && next == '*')
                {
                    in_block_comment = true;
                    ++i;
                }
                else
                {
                    result += c;
                }
            }

            return result;
        }

        bool ConfigManager::parseJsonRecursive(const std::string &json_str, const std::string &prefix)
        {
            json j = json::parse(json_str);
            bool all_ok = true;

            for (auto it = j.begin(); it != j.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
                const json &value = it.value();

                bool ok = true;
                if (value.is_object())
                {
                    ok = parseJsonRecursive(value.dump(), key);
                }
                else if (value.is_string())
                {
                    ok = setString(key, value.get<std::string>());
                }
                else if (value.is_boolean())
                {
                    ok = setBool(key, value.get<bool>());
                }
                else if (value.is_number_integer())
                {
                    ok = setInt(key, value.get<int>());
                }
                else if (value.is_number_float())
                {
                    ok = setDouble(key, value.get<double>());
                }
                else if (value.is_array())
                {
                    std::vector<std::string> arr;
                    for (const auto &item : value)
                    {
                        arr.push_back(item.is_string() ? item.get<std::string>() : item.dump());
                    }
                    ok = setStringArray(key, arr);
                }

                all_ok = all_ok && ok;
            }

            return all_ok;
        }

        // ==================== Environment Variables ====================
        void ConfigManager::loadFromEnvironment(const std::string &prefix)
        {
            if (environ == nullptr)
            {
                return;
            }

            for (char **env = environ; *env != nullptr; ++env)
            {
                std::string env_var(*env);
                size_t eq_pos = env_var.find('=');
                if (eq_pos == std::string::npos)
                    continue;

                std::string name = env_var.substr(0, eq_pos);
                std::string value = env_var.substr(eq_pos + 1);

                if (!prefix.empty())
                {
                    if (!Utils::startsWith(name, prefix))
                        continue;
                    name = name.substr(prefix.length());
                }

                // SECTION__NAME -> section.name; single underscores stay
                std::string key = Utils::toLowerCase(name);
                size_t pos = 0;
                while ((pos = key.find("__", pos)) != std::string::npos)
                {
                    key.replace(pos, 2, ".");
                    ++pos;
                }

                if (key.empty())
                    continue;

                if (hasKey(key))
                {
                    setFromString(key, value);
                }
                else
                {
                    setAutoDetected(key, value);
                }
            }
        }

        // ==================== Command Line Arguments ====================
        void ConfigManager::loadFromCommandLine(int argc, char *argv[])
        {
            for (int i = 1; i < argc; ++i)
            {
                std::string arg(argv[i]);

                if (!Utils::startsWith(arg, "--"))
                    continue;

                size_t eq_pos = arg.find('=');
                if (eq_pos == std::string::npos || eq_pos == 2)
                    continue;

                std::string key = arg.substr(2, eq_pos - 2);
                std::string value = arg.substr(eq_pos + 1);

                if (hasKey(key))
                {
                    setFromString(key, value);
                }
                else
                {
                    setAutoDetected(key, value);
                }
            }
        }

        void ConfigManager::setAutoDetected(const std::string &key, const std::string &value)
        {
            static const std::regex int_pattern(R"(^-?\d{1,9}$)");
            static const std::regex double_pattern(R"(^-?\d+\.\d+$)");

            if (value == "true" || value == "false")
            {
                setBool(key, value == "true");
            }
            else if (std::regex_match(value, int_pattern))
            {
                setInt(key, std::stoi(value));
            }
            else if (std::regex_match(value, double_pattern))
            {
                setDouble(key, std::stod(value));
            }
            else
            {
                setString(key, value);
            }
        }

        // ==================== Set Methods ====================
        bool ConfigManager::setString(const std::string &key, const std::string &value, const std::string &description)
        {
            return setValue(key, value, ConfigType::STRING, description);
        }

        bool ConfigManager::setInt(const std::string &key, int value, const std::string &description)
        {
            return setValue(key, value, ConfigType::INTEGER, description);
        }

        bool ConfigManager::setDouble(const std::string &key, double value, const std::string &description)
        {
            return setValue(key, value, ConfigType::DOUBLE, description);
        }

        bool ConfigManager::setBool(const std::string &key, bool value, const std::string &description)
        {
            return setValue(key, value, ConfigType::BOOLEAN, description);
        }

        bool ConfigManager::setStringArray(const std::string &key, const std::vector<std::string> &value, const std::string &description)
        {
            return setValue(key, value, ConfigType::ARRAY, description);
        }

        bool ConfigManager::setFromString(const std::string &key, const std::string &value)
        {
            ConfigType type;
            {
                std::shared_lock<std::shared_mutex> lock(config_mutex_);
                auto it = config_map_.find(key);
                if (it == config_map_.end())
                {
                    lock.unlock();
                    return setString(key, value);
                }
                type = it->second.type;
            }

            std::string text = Utils::trim(value);
            switch (type)
            {
            case ConfigType::STRING:
                return setString(key, value);

            case ConfigType::INTEGER:
            {
                if (!Utils::isInteger(text))
                {
                    spdlog::warn("Expected integer for key {}, got '{}'", key, value);
                    return false;
                }
                try
                {
                    return setInt(key, std::stoi(text));
                }
                catch (const std::out_of_range &)
                {
                    spdlog::warn("Integer out of range for key {}: {}", key, value);
                    return false;
                }
            }

            case ConfigType::DOUBLE:
            {
                try
                {
                    size_t consumed = 0;
                    double d = std::stod(text, &consumed);
                    if (consumed != text.size())
                    {
                        spdlog::warn("Expected number for key {}, got '{}'", key, value);
                        return false;
                    }
                    return setDouble(key, d);
                }
                catch (const std::logic_error &)
                {
                    spdlog::warn("Expected number for key {}, got '{}'", key, value);
                    return false;
                }
            }

            case ConfigType::BOOLEAN:
            {
                std::string lower = Utils::toLowerCase(text);
                if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
                    return setBool(key, true);
                if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
                    return setBool(key, false);
                spdlog::warn("Expected boolean for key {}, got '{}'", key, value);
                return false;
            }

            case ConfigType::ARRAY:
            {
                std::vector<std::string> parts;
                for (const auto &part : Utils::split(text, ','))
                {
                    std::string trimmed = Utils::trim(part);
                    if (!trimmed.empty())
                        parts.push_back(trimmed);
                }
                return setStringArray(key, parts);
            }
            }

            return false;
        }

        bool ConfigManager::setValue(const std::string &key, const std::any &value, ConfigType type, const std::string &description)
        {
            if (key.empty())
            {
                spdlog::warn("Invalid empty config key");
                return false;
            }

            std::unique_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            ConfigEntry entry(value, type, description);

            if (it != config_map_.end())
            {
                // An existing key keeps its type; int widens to double
                if (it->second.type != type)
                {
                    if (it->second.type == ConfigType::DOUBLE && type == ConfigType::INTEGER)
                    {
                        entry.value = static_cast<double>(std::any_cast<int>(value));
                        entry.type = ConfigType::DOUBLE;
                    }
                    else
                    {
                        spdlog::warn("Type mismatch for key {}: expected {}, got {}", key, getTypeName(it->second.type), getTypeName(type));
                        return false;
                    }
                }

                if (entry.description.empty())
                {
                    entry.description = it->second.description;
                }
                entry.validator = it->second.validator;
            }

            if (entry.validator && !entry.validator(entry.value))
            {
                spdlog::warn("Validation failed for key {}: {}", key, anyToString(entry.value, entry.type));
                return false;
            }

            config_map_[key] = std::move(entry);
            return true;
        }

        // ==================== Get Methods ====================
        std::string ConfigManager::getString(const std::string &key, const std::string &default_value) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return default_value;
            }

            return anyToString(it->second.value, it->second.type);
        }

        int ConfigManager::getInt(const std::string &key, int default_value) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return default_value;
            }

            switch (it->second.type)
            {
            case ConfigType::INTEGER:
                return std::any_cast<int>(it->second.value);
            case ConfigType::DOUBLE:
                return static_cast<int>(std::any_cast<double>(it->second.value));
            case ConfigType::BOOLEAN:
                return std::any_cast<bool>(it->second.value) ? 1 : 0;
            case ConfigType::STRING:
            {
                const auto &text = std::any_cast<const std::string &>(it->second.value);
                return Utils::isInteger(text) ? Utils::stringToInt(text, default_value) : default_value;
            }
            default:
                return default_value;
            }
        }

        double ConfigManager::getDouble(const std::string &key, double default_value) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return default_value;
            }

            switch (it->second.type)
            {
            case ConfigType::DOUBLE:
                return std::any_cast<double>(it->second.value);
            case ConfigType::INTEGER:
                return static_cast<double>(std::any_cast<int>(it->second.value));
            default:
                return default_value;
            }
        }

        bool ConfigManager::getBool(const std::string &key, bool default_value) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return default_value;
            }

            switch (it->second.type)
            {
            case ConfigType::BOOLEAN:
                return std::any_cast<bool>(it->second.value);
            case ConfigType::INTEGER:
                return std::any_cast<int>(it->second.value) != 0;
            case ConfigType::STRING:
                return Utils::stringToBool(std::any_cast<const std::string &>(it->second.value), default_value);
            default:
                return default_value;
            }
        }

        std::vector<std::string> ConfigManager::getStringArray(const std::string &key) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end() || it->second.type != ConfigType::ARRAY)
            {
                return {};
            }

            return std::any_cast<std::vector<std::string>>(it->second.value);
        }

        std::string ConfigManager::getAsString(const std::string &key) const
        {
            return getString(key, "");
        }

        // ==================== Key management ====================
        bool ConfigManager::hasKey(const std::string &key) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);
            return config_map_.find(key) != config_map_.end();
        }

        bool ConfigManager::removeKey(const std::string &key)
        {
            std::unique_lock<std::shared_mutex> lock(config_mutex_);
            return config_map_.erase(key) > 0;
        }

        std::vector<std::string> ConfigManager::getKeys() const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            std::vector<std::string> keys;
            keys.reserve(config_map_.size());
            for (const auto &pair : config_map_)
            {
                keys.push_back(pair.first);
            }

            std::sort(keys.begin(), keys.end());
            return keys;
        }

        std::string ConfigManager::getDescription(const std::string &key) const
        {
            std::shared_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            return it != config_map_.end() ? it->second.description : "";
        }

        bool ConfigManager::setValidator(const std::string &key, std::function<bool(const std::any &)> validator)
        {
            std::unique_lock<std::shared_mutex> lock(config_mutex_);

            auto it = config_map_.find(key);
            if (it == config_map_.end())
            {
                return false;
            }

            it->second.validator = std::move(validator);
            return true;
        }

        void ConfigManager::printAll(std::ostream &os) const
        {
            for (const auto &key : getKeys())
            {
                std::shared_lock<std::shared_mutex> lock(config_mutex_);
                auto it = config_map_.find(key);
                if (it == config_map_.end())
                    continue;

                os << key << " = " << anyToString(it->second.value, it->second.type)
                   << " (" << getTypeName(it->second.type) << ")";
                if (!it->second.description.empty())
                {
                    os << "  # " << it->second.description;
                }
                os << "\n";
            }
        }

        // ==================== Type Conversion Helpers ====================
        std::string ConfigManager::anyToString(const std::any &value, ConfigType type)
        {
            switch (type)
            {
            case ConfigType::STRING:
                return std::any_cast<std::string>(value);

            case ConfigType::INTEGER:
                return std::to_string(std::any_cast<int>(value));

            case ConfigType::DOUBLE:
            {
                std::ostringstream oss;
                oss << std::any_cast<double>(value);
                return oss.str();
            }

            case ConfigType::BOOLEAN:
                return std::any_cast<bool>(value) ? "true" : "false";

            case ConfigType::ARRAY:
                return Utils::join(std::any_cast<std::vector<std::string>>(value), ",");
            }

            return "";
        }

        std::string ConfigManager::getTypeName(ConfigType type)
        {
            switch (type)
            {
            case ConfigType::STRING:
                return "string";
            case ConfigType::INTEGER:
                return "integer";
            case ConfigType::DOUBLE:
                return "double";
            case ConfigType::BOOLEAN:
                return "boolean";
            case ConfigType::ARRAY:
                return "array";
            }
            return "unknown";
        }

    } // namespace Common
} // namespace Geneva
