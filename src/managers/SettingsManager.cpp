/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <cmath>

namespace Wayfarer {

const SettingsManager::SettingValue* SettingsManager::findUnlocked(const std::string& category,
                                                                   const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt != categoryIt->second.end() ? &keyIt->second : nullptr;
}

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        const JsonObject* entries = categoryValue.tryAsObject();
        if (entries == nullptr) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *entries) {
            switch (value.getType()) {
            case JsonType::Boolean:
                m_settings[categoryName][key] = value.asBool();
                break;
            case JsonType::Number: {
                const double number = value.asNumber();
                if (std::floor(number) == number && std::abs(number) <= 2147483647.0) {
                    m_settings[categoryName][key] = static_cast<int>(number);
                } else {
                    m_settings[categoryName][key] = static_cast<float>(number);
                }
                break;
            }
            case JsonType::String:
                m_settings[categoryName][key] = value.asString();
                break;
            case JsonType::Array: {
                // Lists of strings are stored comma separated
                std::string joined;
                for (const auto& item : value.asArray()) {
                    if (auto text = item.tryAsString()) {
                        joined += joined.empty() ? *text : "," + *text;
                    }
                }
                m_settings[categoryName][key] = joined;
                break;
            }
            default:
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                break;
            }
        }
    }

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonValue root = JsonValue::object();
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonValue category = JsonValue::object();
            for (const auto& [key, value] : categorySettings) {
                std::visit([&category, &key](auto&& arg) {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, float>) {
                        category.set(key, JsonValue(static_cast<double>(arg)));
                    } else {
                        category.set(key, JsonValue(arg));
                    }
                }, value);
            }
            root.set(categoryName, std::move(category));
        }
    }

    std::string error;
    if (!JsonWriter::saveToFile(root, filepath, error)) {
        SETTINGS_ERROR("Failed to save settings: " + error);
        return false;
    }
    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

std::vector<std::string> SettingsManager::getList(const std::string& category, const std::string& key,
                                                  const std::vector<std::string>& defaultValue) const {
    if (!has(category, key)) {
        return defaultValue;
    }
    const std::string raw = get<std::string>(category, key, "");

    std::vector<std::string> parts;
    boost::algorithm::split(parts, raw, boost::algorithm::is_any_of(","));

    std::vector<std::string> items;
    for (auto& part : parts) {
        boost::algorithm::trim(part);
        if (!part.empty()) {
            items.push_back(part);
        }
    }
    return items;
}

bool SettingsManager::applyOverride(const std::string& assignment) {
    const auto eq = assignment.find('=');
    const auto dot = assignment.find('.');
    if (eq == std::string::npos || dot == std::string::npos || dot > eq || dot == 0 ||
        dot + 1 == eq) {
        SETTINGS_WARNING("Ignoring malformed override '" + assignment + "'");
        return false;
    }

    const std::string category = boost::algorithm::trim_copy(assignment.substr(0, dot));
    const std::string key = boost::algorithm::trim_copy(assignment.substr(dot + 1, eq - dot - 1));
    const std::string text = boost::algorithm::trim_copy(assignment.substr(eq + 1));

    if (text == "true" || text == "false") {
        return set(category, key, text == "true");
    }
    int asInt = 0;
    if (boost::conversion::try_lexical_convert(text, asInt)) {
        return set(category, key, asInt);
    }
    float asFloat = 0.0f;
    if (boost::conversion::try_lexical_convert(text, asFloat)) {
        return set(category, key, asFloat);
    }
    return set(category, key, text);
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    return findUnlocked(category, key) != nullptr;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }
    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace Wayfarer
