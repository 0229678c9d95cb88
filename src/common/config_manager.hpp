// src/common/config_manager.hpp
#ifndef GENEVA_CONFIG_MANAGER_HPP
#define GENEVA_CONFIG_MANAGER_HPP

#include "utils.hpp"
#include <string>
#include <unordered_map>
#include <vector>
#include <functional>
#include <any>
#include <shared_mutex>
#include <ostream>

namespace Geneva
{
    namespace Common
    {
        /**
         * @brief Configuration value types
         */
        enum class ConfigType
        {
            STRING,
            INTEGER,
            DOUBLE,
            BOOLEAN,
            ARRAY
        };

        /**
         * @brief A single configuration entry
         */
        struct ConfigEntry
        {
            std::any value;
            ConfigType type;
            std::string description;
            std::function<bool(const std::any &)> validator;

            ConfigEntry() : type(ConfigType::STRING) {}

            ConfigEntry(const std::any &val, ConfigType t, const std::string &desc = "")
                : value(val), type(t), description(desc) {}
        };

        /**
         * @brief Thread-safe configuration store
         *
         * Keys are dotted paths ("engine.max_depth"). JSON objects are flattened
         * into dotted keys on load and exported as a flat object.
         */
        class ConfigManager : public Singleton<ConfigManager>
        {
            friend class Singleton<ConfigManager>;

        public:
            // ==================== Loading ====================
            /**
             * @brief Load configuration from a JSON file (comments allowed)
             * @return true if the file was read and parsed
             */
            bool loadFromFile(const std::string &config_file);

            bool saveToFile(const std::string &config_file) const;

            bool loadFromJson(const std::string &json_content);
            std::string exportToJson() const;

            /**
             * @brief Load variables named <prefix><SECTION>__<KEY>
             *
             * GENEVA_ENGINE__MAX_DEPTH=4 sets "engine.max_depth" to 4.
             */
            void loadFromEnvironment(const std::string &prefix = "GENEVA_");

            /**
             * @brief Load --key=value arguments; other arguments are ignored
             */
            void loadFromCommandLine(int argc, char *argv[]);

            // ==================== Set methods ====================
            bool setString(const std::string &key, const std::string &value, const std::string &description = "");
            bool setInt(const std::string &key, int value, const std::string &description = "");
            bool setDouble(const std::string &key, double value, const std::string &description = "");
            bool setBool(const std::string &key, bool value, const std::string &description = "");
            bool setStringArray(const std::string &key, const std::vector<std::string> &value, const std::string &description = "");

            /**
             * @brief Set a value from text, converting to the key's existing type
             */
            bool setFromString(const std::string &key, const std::string &value);

            // ==================== Get methods ====================
            std::string getString(const std::string &key, const std::string &default_value = "") const;
            int getInt(const std::string &key, int default_value = 0) const;
            double getDouble(const std::string &key, double default_value = 0.0) const;
            bool getBool(const std::string &key, bool default_value = false) const;
            std::vector<std::string> getStringArray(const std::string &key) const;

            /**
             * @brief Any value rendered as text (empty if missing)
             */
            std::string getAsString(const std::string &key) const;

            // ==================== Key management ====================
            bool hasKey(const std::string &key) const;
            bool removeKey(const std::string &key);
            std::vector<std::string> getKeys() const;
            std::string getDescription(const std::string &key) const;

            /**
             * @brief Attach a validator; later sets that fail it are rejected
             */
            bool setValidator(const std::string &key, std::function<bool(const std::any &)> validator);

            /**
             * @brief Drop every entry and restore the built-in defaults
             */
            void resetToDefaults();

            void printAll(std::ostream &os) const;

            static std::string getTypeName(ConfigType type);

        protected:
            ConfigManager();
            ~ConfigManager() override = default;

        private:
            bool setValue(const std::string &key, const std::any &value, ConfigType type, const std::string &description);
            bool parseJsonRecursive(const std::string &json_str, const std::string &prefix);
            std::string removeJsonComments(const std::string &json_content) const;
            void initializeDefaults();
            void setAutoDetected(const std::string &key, const std::string &value);

            static std::string anyToString(const std::any &value, ConfigType type);

            mutable std::shared_mutex config_mutex_;
            std::unordered_map<std::string, ConfigEntry> config_map_;
        };

        // ==================== Predefined config keys ====================
        namespace ConfigKeys
        {
            // Strategy engine
            constexpr const char *ENGINE_MAX_DEPTH = "engine.max_depth";
            constexpr const char *ENGINE_MAX_FRAGMENT_OFFSET = "engine.max_fragment_offset";
            constexpr const char *ENGINE_RANDOM_SEED = "engine.random_seed";

            // Logging
            constexpr const char *LOG_LEVEL = "log.level";
            constexpr const char *LOG_FILE = "log.file";
            constexpr const char *LOG_MAX_SIZE = "log.max_size";
            constexpr const char *LOG_MAX_FILES = "log.max_files";
        }

    } // namespace Common
} // namespace Geneva

#endif // GENEVA_CONFIG_MANAGER_HPP
