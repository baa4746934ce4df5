/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <limits>

namespace CurveLights {

std::optional<SettingsManager::SettingValue> SettingsManager::fromJson(const JsonValue& value) {
    if (value.isBool()) {
        return SettingValue(value.asBool());
    }
    if (value.isString()) {
        return SettingValue(value.asString());
    }
    if (value.isNumber()) {
        const double number = value.asNumber();
        const bool whole = std::floor(number) == number &&
            std::fabs(number) <= static_cast<double>(std::numeric_limits<int>::max());
        if (whole) {
            return SettingValue(static_cast<int>(number));
        }
        return SettingValue(static_cast<float>(number));
    }
    return std::nullopt;
}

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Cannot read " + filepath + ": " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR(filepath + " must hold an object of categories");
        return false;
    }

    size_t loaded = 0;
    std::unique_lock<std::shared_mutex> lock(m_storeMutex);
    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Skipping '" + categoryName + "', categories must be objects");
            continue;
        }

        Category& category = m_store[categoryName];
        for (const auto& [key, value] : categoryValue.asObject()) {
            if (auto setting = fromJson(value)) {
                category[key] = std::move(*setting);
                ++loaded;
            } else {
                SETTINGS_WARNING("Skipping " + categoryName + "." + key +
                                 ", only numbers, bools and strings are settings");
            }
        }
    }

    SETTINGS_INFO("Loaded " + std::to_string(loaded) + " settings from " + filepath);
    return true;
}

const SettingsManager::SettingValue* SettingsManager::findLocked(const std::string& category,
                                                                 const std::string& key) const {
    auto categoryIt = m_store.find(category);
    if (categoryIt == m_store.end()) {
        return nullptr;
    }
    auto valueIt = categoryIt->second.find(key);
    return (valueIt == categoryIt->second.end()) ? nullptr : &valueIt->second;
}

bool SettingsManager::store(const std::string& category, const std::string& key, SettingValue value) {
    {
        std::unique_lock<std::shared_mutex> lock(m_storeMutex);
        const SettingValue* current = findLocked(category, key);
        if (current && *current == value) {
            return true;
        }
        m_store[category][key] = value;
    }

    // Outside the lock, listeners read settings back
    notifyListeners(category, key, value);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_storeMutex);
    return findLocked(category, key) != nullptr;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_storeMutex);
    auto categoryIt = m_store.find(category);
    if (categoryIt == m_store.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_store.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_storeMutex);
    return m_store.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_storeMutex);
    m_store.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    const size_t id = m_nextListenerId++;
    m_listeners.push_back(Listener{id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t listenerId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    std::erase_if(m_listeners, [listenerId](const Listener& listener) {
        return listener.id == listenerId;
    });
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_storeMutex);
    std::vector<std::string> names;
    names.reserve(m_store.size());
    for (const auto& entry : m_store) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_storeMutex);
    std::vector<std::string> keys;
    auto categoryIt = m_store.find(category);
    if (categoryIt != m_store.end()) {
        keys.reserve(categoryIt->second.size());
        for (const auto& entry : categoryIt->second) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key,
                                      const SettingValue& newValue) {
    // Copied first so a callback may register or unregister listeners
    std::vector<ChangeCallback> watching;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const Listener& listener : m_listeners) {
            if (listener.category.empty() || listener.category == category) {
                watching.push_back(listener.callback);
            }
        }
    }

    for (const ChangeCallback& callback : watching) {
        callback(category, key, newValue);
    }
}

} // namespace CurveLights
