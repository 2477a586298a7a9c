/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace Wayfarer {

/**
 * @brief Process-wide tunables grouped by category.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("wayfarer.json");
 *   int rows = settings.get<int>("observation", "rows", 9);
 *   settings.applyOverride("pathfinding.max_iterations=5000");
 *
 * Reads take a shared lock, writes an exclusive one.
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merges settings from a JSON file of {category: {key: value}}.
     *
     * Values of unsupported types are skipped with a warning.
     * @return false if the file is missing or not a JSON object
     */
    bool loadFromFile(const std::string& filepath);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed lookup.
     *
     * An int setting satisfies a float request. Missing settings and type
     * mismatches yield defaultValue.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    // Comma separated string setting split into trimmed, non-empty items
    std::vector<std::string> getList(const std::string& category, const std::string& key,
                                     const std::vector<std::string>& defaultValue) const;

    /**
     * @brief Applies "category.key=value" from a command line.
     *
     * The value becomes a bool for true/false, an int or float when it
     * parses as one, and a string otherwise.
     */
    bool applyOverride(const std::string& assignment);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    // Ordered so saved files are stable
    using CategorySettings = std::map<std::string, SettingValue>;
    std::map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    const SettingValue* findUnlocked(const std::string& category, const std::string& key) const;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    const SettingValue* value = findUnlocked(category, key);
    if (value == nullptr) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(value)) {
            return static_cast<float>(*asInt);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(value)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace Wayfarer

#endif // SETTINGS_MANAGER_HPP
