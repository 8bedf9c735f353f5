/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "shapes/ShapeGenerator.hpp"
#include "trajectory/TrajectoryCalculator.hpp"
#include <algorithm>
#include <format>
#include <mutex>

namespace PyroForge {

namespace {

float numberOr(const JsonValue& object, const std::string& key, float fallback) {
    if (auto number = object[key].tryAsNumber()) {
        return static_cast<float>(*number);
    }
    return fallback;
}

std::optional<float> optionalNumber(const JsonValue& object, const std::string& key) {
    if (auto number = object[key].tryAsNumber()) {
        return static_cast<float>(*number);
    }
    return std::nullopt;
}

std::string stringOr(const JsonValue& object, const std::string& key, const std::string& fallback) {
    if (auto text = object[key].tryAsString()) {
        return *text;
    }
    return fallback;
}

// Absent field -> nullopt silently; unknown name -> nullopt with a warning
template<typename Kind, typename Parser>
std::optional<Kind> parseKind(const JsonValue& object, const std::string& key,
                              const char* what, Parser parser) {
    auto text = object[key].tryAsString();
    if (!text || text->empty() || *text == "random") {
        return std::nullopt;
    }
    auto kind = parser(*text);
    if (!kind) {
        SETTINGS_WARNING(std::format("Unknown {} '{}', using default", what, *text));
    }
    return kind;
}

template<typename Kind, typename Parser>
std::vector<Kind> parseKindList(const std::vector<std::string>& names,
                                const char* what, Parser parser) {
    std::vector<Kind> kinds;
    kinds.reserve(names.size());
    for (const auto& name : names) {
        if (auto kind = parser(name)) {
            if (std::find(kinds.begin(), kinds.end(), *kind) == kinds.end()) {
                kinds.push_back(*kind);
            }
        } else {
            SETTINGS_WARNING(std::format("Unknown {} '{}' in enabled list, skipping", what, name));
        }
    }
    return kinds;
}

std::optional<ComboStageConfig> parseStage(const JsonValue& item, size_t index,
                                           const std::string& comboName) {
    if (!item.isObject()) {
        SETTINGS_WARNING(std::format("Combo '{}' stage {} is not an object, skipping",
                                     comboName, index));
        return std::nullopt;
    }

    ComboStageConfig stage;
    stage.delay = std::max(0.0f, numberOr(item, "delay", 0.0f));
    stage.shape = parseKind<ShapeKind>(item, "shape", "shape", ShapeGenerator::fromString)
                      .value_or(ShapeKind::SPHERE);
    stage.scale = numberOr(item, "scale", 1.0f);
    stage.particleCount = numberOr(item, "particle_count", 1.0f);
    stage.hueShift = numberOr(item, "hue_shift", 0.0f);
    stage.behavior = parseKind<ParticleBehavior>(item, "behavior", "particle behavior",
                                                 particleBehaviorFromString);
    stage.velocityScale = optionalNumber(item, "velocity_scale");
    stage.gravity = optionalNumber(item, "gravity");
    stage.decay = optionalNumber(item, "decay");

    const JsonValue& offset = item["spawn_offset"];
    if (offset.isArray() && offset.size() == 3) {
        stage.spawnOffset = Vector3D(static_cast<float>(offset[size_t{0}].tryAsNumber().value_or(0.0)),
                                     static_cast<float>(offset[size_t{1}].tryAsNumber().value_or(0.0)),
                                     static_cast<float>(offset[size_t{2}].tryAsNumber().value_or(0.0)));
    } else if (!offset.isNull()) {
        SETTINGS_WARNING(std::format("Combo '{}' stage {} spawn_offset must be [x, y, z]",
                                     comboName, index));
    }
    return stage;
}

} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return loadDocument(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    return loadDocument(reader.getRoot(), "<string>");
}

bool SettingsManager::loadDocument(const JsonValue& root, const std::string& source) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    const JsonObject& rootObj = root.asObject();
    for (const auto& [categoryName, categoryValue] : rootObj) {
        if (categoryValue.isArray()) {
            m_sections[categoryName] = categoryValue;
            continue;
        }
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        const JsonObject& categoryObj = categoryValue.asObject();
        for (const auto& [key, value] : categoryObj) {
            SettingValue settingValue;

            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double numValue = value.asNumber();
                if (numValue == static_cast<int>(numValue)) {
                    settingValue = static_cast<int>(numValue);
                } else {
                    settingValue = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else if (value.isArray()) {
                std::vector<std::string> names;
                bool allStrings = true;
                for (const auto& element : value.asArray()) {
                    if (!element.isString()) {
                        allStrings = false;
                        break;
                    }
                    names.push_back(element.asString());
                }
                if (!allStrings) {
                    SETTINGS_WARNING("Setting '" + categoryName + "." + key + "' must be a list of strings, skipping");
                    continue;
                }
                settingValue = std::move(names);
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }

            m_settings[categoryName][key] = std::move(settingValue);
        }
    }

    SETTINGS_INFO("Loaded settings from: " + source);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    return categoryIt->second.find(key) != categoryIt->second.end();
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
    m_sections.clear();
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

JsonValue SettingsManager::getSection(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    auto it = m_sections.find(name);
    return it != m_sections.end() ? it->second : JsonValue();
}

SimulationSettings SettingsManager::getSimulationSettings() const {
    const std::string category = "simulation";
    SimulationSettings settings;

    settings.gravity = get<float>(category, "gravity", settings.gravity);
    settings.friction = std::clamp(get<float>(category, "friction", settings.friction), 0.0f, 1.0f);
    settings.autoLaunchDelay = std::max(0.0f, get<float>(category, "auto_launch_delay", settings.autoLaunchDelay));
    settings.particleCountMultiplier = std::max(0.0f,
        get<float>(category, "particle_count_multiplier", settings.particleCountMultiplier));
    settings.explosionSizeMultiplier = std::max(0.0f,
        get<float>(category, "explosion_size_multiplier", settings.explosionSizeMultiplier));
    settings.starBlinkSpeed = get<float>(category, "star_blink_speed", settings.starBlinkSpeed);
    settings.trailLength = std::max(0, get<int>(category, "trail_length", settings.trailLength));
    settings.ascentTrail = get<bool>(category, "ascent_trail", settings.ascentTrail);
    settings.autoLaunch = get<bool>(category, "auto_launch", settings.autoLaunch);

    const int maxParticles = get<int>(category, "max_particles", static_cast<int>(settings.maxParticles));
    if (maxParticles > 0) {
        settings.maxParticles = static_cast<size_t>(maxParticles);
    } else {
        SETTINGS_WARNING(std::format("max_particles must be positive, keeping {}", settings.maxParticles));
    }

    settings.enabledShapes = parseKindList<ShapeKind>(
        get<std::vector<std::string>>(category, "enabled_shapes"), "shape", ShapeGenerator::fromString);
    settings.enabledTrajectories = parseKindList<TrajectoryKind>(
        get<std::vector<std::string>>(category, "enabled_trajectories"), "trajectory",
        TrajectoryRegistry::fromString);
    settings.enabledCombos = parseKindList<ComboKind>(
        get<std::vector<std::string>>(category, "enabled_combos"), "combo", ComboLibrary::fromString);
    return settings;
}

PhysicsConfig SettingsManager::getPhysicsConfig() const {
    const std::string category = "physics";
    PhysicsConfig config;

    const std::string integrator = get<std::string>(category, "integrator", "");
    if (!integrator.empty()) {
        if (auto kind = integratorKindFromString(integrator)) {
            config.integrator = *kind;
        } else {
            SETTINGS_WARNING("Unknown integrator '" + integrator + "', using verlet");
        }
    }

    const int subSteps = get<int>(category, "sub_steps", config.subSteps);
    config.subSteps = std::max(1, subSteps);

    const float fixedTimeStep = get<float>(category, "fixed_time_step", config.fixedTimeStep);
    if (fixedTimeStep > 0.0f) {
        config.fixedTimeStep = fixedTimeStep;
    } else {
        SETTINGS_WARNING("fixed_time_step must be positive, using default");
    }

    const float maxDeltaTime = get<float>(category, "max_delta_time", config.maxDeltaTime);
    if (maxDeltaTime > 0.0f) {
        config.maxDeltaTime = maxDeltaTime;
    } else {
        SETTINGS_WARNING("max_delta_time must be positive, using default");
    }

    const std::string mode = get<std::string>(category, "mode", "");
    if (mode == "simple") {
        config.mode = StepMode::Simple;
    } else if (mode == "fixed") {
        config.mode = StepMode::Fixed;
    } else if (!mode.empty()) {
        SETTINGS_WARNING("Unknown physics mode '" + mode + "', using fixed");
    }
    return config;
}

ShowSequence SettingsManager::getShowSequence() const {
    ShowSequence sequence;
    const JsonValue section = getSection("show");
    const JsonArray* items = section.tryAsArray();
    if (!items) {
        return sequence;
    }

    for (size_t i = 0; i < items->size(); ++i) {
        const JsonValue& item = (*items)[i];
        if (!item.isObject()) {
            SETTINGS_WARNING(std::format("Show stage {} is not an object, skipping", i));
            continue;
        }

        ShowStage stage;
        stage.name = stringOr(item, "name", std::format("Stage #{}", i + 1));
        stage.delay = std::max(0.0f, numberOr(item, "delay", 0.0f));
        stage.formation = parseKind<LaunchFormation>(item, "formation", "formation",
                                                     launchFormationFromString)
                              .value_or(LaunchFormation::RANDOM);
        stage.count = std::max(1, static_cast<int>(numberOr(item, "count", 1.0f)));
        stage.interval = std::max(0.0f, numberOr(item, "interval", 0.0f));
        stage.shape = parseKind<ShapeKind>(item, "shape", "shape", ShapeGenerator::fromString);
        stage.trajectory = parseKind<TrajectoryKind>(item, "trajectory", "trajectory",
                                                     TrajectoryRegistry::fromString);
        stage.combo = parseKind<ComboKind>(item, "combo", "combo", ComboLibrary::fromString);
        sequence.push_back(std::move(stage));
    }
    return sequence;
}

std::vector<ComboConfig> SettingsManager::getCustomCombos() const {
    std::vector<ComboConfig> combos;
    const JsonValue section = getSection("combos");
    const JsonArray* items = section.tryAsArray();
    if (!items) {
        return combos;
    }

    for (size_t i = 0; i < items->size(); ++i) {
        const JsonValue& item = (*items)[i];
        if (!item.isObject()) {
            SETTINGS_WARNING(std::format("Combo {} is not an object, skipping", i));
            continue;
        }

        ComboConfig combo;
        combo.name = stringOr(item, "name", std::format("custom_{}", i));
        combo.trajectory = parseKind<TrajectoryKind>(item, "trajectory", "trajectory",
                                                     TrajectoryRegistry::fromString)
                               .value_or(TrajectoryKind::LINEAR);

        const JsonArray* stages = item["stages"].tryAsArray();
        if (stages) {
            for (size_t s = 0; s < stages->size(); ++s) {
                if (auto stage = parseStage((*stages)[s], s, combo.name)) {
                    combo.stages.push_back(*stage);
                }
            }
        }
        if (combo.stages.empty()) {
            SETTINGS_WARNING("Combo '" + combo.name + "' has no stages, skipping");
            continue;
        }
        combos.push_back(std::move(combo));
    }
    return combos;
}

} // namespace PyroForge
