/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace pt = boost::property_tree;

namespace DinerEngine {

namespace {

SettingsManager::SettingValue parseLeaf(const std::string& text) {
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();

    int intValue = 0;
    auto [intEnd, intErr] = std::from_chars(first, last, intValue);
    if (intErr == std::errc() && intEnd == last && !text.empty()) {
        return intValue;
    }

    // std::from_chars for float is not available on every standard library
    char* floatEnd = nullptr;
    const float floatValue = std::strtof(text.c_str(), &floatEnd);
    if (!text.empty() && floatEnd == text.c_str() + text.size()) {
        return floatValue;
    }

    return text;
}

bool mergeTree(const pt::ptree& root,
               std::unordered_map<std::string,
                                  std::unordered_map<std::string, SettingsManager::SettingValue>>& out) {
    if (root.empty()) {
        SETTINGS_ERROR("Settings root is not a JSON object");
        return false;
    }

    for (const auto& [categoryName, categoryNode] : root) {
        if (categoryNode.empty()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, valueNode] : categoryNode) {
            if (!valueNode.empty()) {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }
            out[categoryName][key] = parseLeaf(valueNode.data());
        }
    }
    return true;
}

} // namespace

std::string SettingsManager::variantToString(const SettingValue& value) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
    }, value);
}

bool SettingsManager::loadFromFile(const std::string& filepath) {
    pt::ptree root;
    try {
        pt::read_json(filepath, root);
    } catch (const pt::json_parser_error& e) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + e.what());
        return false;
    }

    if (!mergeTree(root, m_settings)) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsManager::loadFromString(const std::string& json) {
    pt::ptree root;
    try {
        std::istringstream stream(json);
        pt::read_json(stream, root);
    } catch (const pt::json_parser_error& e) {
        SETTINGS_ERROR(std::string("Failed to parse settings: ") + e.what());
        return false;
    }
    return mergeTree(root, m_settings);
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    pt::ptree root;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        pt::ptree category;
        for (const auto& [key, value] : categorySettings) {
            category.put(pt::ptree::path_type(key, '\0'), variantToString(value));
        }
        root.add_child(pt::ptree::path_type(categoryName, '\0'), category);
    }

    try {
        pt::write_json(filepath, root);
    } catch (const pt::json_parser_error& e) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath + " - " + e.what());
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }
    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }
    return categoryIt->second.erase(key) > 0;
}

void SettingsManager::clearAll() {
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [categoryName, _] : m_settings) {
        categories.push_back(categoryName);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::vector<std::string> keys;
    auto categoryIt = m_settings.find(category);
    if (categoryIt != m_settings.end()) {
        keys.reserve(categoryIt->second.size());
        for (const auto& [key, _] : categoryIt->second) {
            keys.push_back(key);
        }
    }
    return keys;
}

} // namespace DinerEngine
