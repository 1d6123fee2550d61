/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace DinerEngine {

/**
 * @brief Settings store with category organization
 *
 * Provides type-safe access to tuning values with JSON persistence
 * and default value support.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/tuning.json");
 *   float speed = settings.get<float>("player", "speed", 400.0f);
 *   settings.set("customer", "wait_time", 12.0f);
 *   settings.saveToFile("res/tuning.json");
 *
 * JSON files are read with Boost.PropertyTree, which keeps every leaf as
 * text. Leaves are typed on load: "true"/"false" become bool, whole numbers
 * int, other numbers float, anything else string.
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    /**
     * @brief Gets the singleton instance of SettingsManager
     * @return Reference to the SettingsManager singleton instance
     */
    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    /**
     * @brief Supported setting value types
     */
    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Loads settings from a JSON file, merging into current values
     * @param filepath Path to the JSON settings file
     * @return true if loading successful, false otherwise (current values
     *         are left untouched)
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Loads settings from a JSON string
     * @return true if parsing successful, false otherwise
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Saves current settings to a JSON file
     * @param filepath Path to save the JSON settings file
     * @return true if saving successful, false otherwise
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Gets a typed setting value with optional default
     * @tparam T Type of the setting (int, float, bool, or std::string)
     * @return The setting value or defaultValue if not found or of another
     *         type. An int setting satisfies a float request.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Sets a typed setting value
     * @return true if set successful, false for unsupported types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    static std::string variantToString(const SettingValue& value);

    // Delete copy constructor and assignment operator
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking
template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& value = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const auto* f = std::get_if<float>(&value)) {
            return *f;
        }
        if (const auto* i = std::get_if<int>(&value)) {
            return static_cast<float>(*i);
        }
        return defaultValue;
    } else if constexpr (std::is_same_v<T, int> || std::is_same_v<T, bool> ||
                         std::is_same_v<T, std::string>) {
        if (const auto* v = std::get_if<T>(&value)) {
            return *v;
        }
        return defaultValue;
    } else {
        // Unsupported type, return default
        return defaultValue;
    }
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        m_settings[category][key] = value;
        return true;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        m_settings[category][key] = std::string(value);
        return true;
    } else {
        return false;
    }
}

} // namespace DinerEngine

#endif // SETTINGS_MANAGER_HPP
