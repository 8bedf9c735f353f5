/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include "combo/ComboLibrary.hpp"
#include "core/SimulationSettings.hpp"
#include "physics/PhysicsConfig.hpp"
#include "show/ShowDirector.hpp"
#include "utils/JsonReader.hpp"
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace PyroForge {

/**
 * @brief Thread-safe settings store with category organization
 *
 * Scalar settings live under "category.key". String lists inside a category
 * are kept as std::vector<std::string>. Top-level arrays ("show", "combos")
 * are kept as parsed JSON and turned into typed structures on request.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   SimulationSettings sim = settings.getSimulationSettings();
 *   float gravity = settings.get<float>("simulation", "gravity", 0.12f);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue =
        std::variant<int, float, bool, std::string, std::vector<std::string>>;

    /**
     * @brief Loads settings from a JSON file, merging into the current ones
     * @return true if loading successful, false otherwise
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Loads settings from a JSON document held in memory
     * @return true if loading successful, false otherwise
     */
    bool loadFromString(const std::string& json);

    /**
     * @brief Gets a typed setting value with optional default
     *
     * Integer values are readable as float. Any other type mismatch returns
     * the default. Thread-safe for concurrent reads.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;

    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

    // "simulation" category; absent fields keep their defaults
    SimulationSettings getSimulationSettings() const;

    // "physics" category
    PhysicsConfig getPhysicsConfig() const;

    // Top-level "show" array
    ShowSequence getShowSequence() const;

    // Top-level "combos" array; combos without stages are skipped
    std::vector<ComboConfig> getCustomCombos() const;

private:
    bool loadDocument(const JsonValue& root, const std::string& source);
    JsonValue getSection(const std::string& name) const;

    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;
    std::unordered_map<std::string, JsonValue> m_sections;

    mutable std::shared_mutex m_settingsMutex;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

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
        if (const int* asInt = std::get_if<int>(&value)) {
            return static_cast<float>(*asInt);
        }
    }
    if (const T* exact = std::get_if<T>(&value)) {
        return *exact;
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string> ||
                  std::is_same_v<T, std::vector<std::string>>) {
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

} // namespace PyroForge

#endif // SETTINGS_MANAGER_HPP
