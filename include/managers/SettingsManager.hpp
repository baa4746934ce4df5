/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace CurveLights {

class JsonValue;

/**
 * @brief Category/key store backing every tunable of the light show
 *
 * Categories mirror the top level objects of res/settings.json ("particles",
 * "path", "color", "lifecycle", "burst", "comet", "render", "window").
 * LightShowManager listens here and rebuilds or restyles as values change.
 *
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int count = settings.get<int>("particles", "count", 350);
 *   settings.set("path", "family", "lorenz");
 */
class SettingsManager {
public:
    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Invoked after a stored value changed
     */
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merges every category object of a JSON file into the store
     * @return false if the file is unreadable or its root is not an object
     *
     * Whole numbers become int and other numbers float. Arrays, nulls and
     * nested objects inside a category are skipped with a warning. Listeners
     * are not notified; callers read the store once loading is done.
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Reads a value, or defaultValue when absent or of another type
     *
     * get<float> also reads a stored int, so "tail_width": 2 works.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Stores a value and notifies listeners if it differs from the old one
     * @return false if T is not one of the supported setting types
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    /**
     * @brief Watches one category, or every category when category is empty
     * @return Id for unregisterChangeListener
     */
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t listenerId);

    // Sorted by name
    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    SettingsManager() = default;
    ~SettingsManager() = default;
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    using Category = std::map<std::string, SettingValue>;

    struct Listener {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };

    static std::optional<SettingValue> fromJson(const JsonValue& value);

    // Caller holds m_storeMutex
    const SettingValue* findLocked(const std::string& category, const std::string& key) const;

    bool store(const std::string& category, const std::string& key, SettingValue value);
    void notifyListeners(const std::string& category, const std::string& key,
                         const SettingValue& newValue);

    std::map<std::string, Category> m_store;
    mutable std::shared_mutex m_storeMutex;

    std::vector<Listener> m_listeners;
    std::mutex m_listenersMutex;
    size_t m_nextListenerId{0};
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_storeMutex);
    const SettingValue* stored = findLocked(category, key);
    if (!stored) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        if (const int* whole = std::get_if<int>(stored)) {
            return static_cast<float>(*whole);
        }
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(stored)) {
            return *typed;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        return store(category, key, SettingValue(value));
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        return store(category, key, SettingValue(std::string(value)));
    } else {
        return false;
    }
}

} // namespace CurveLights

#endif // SETTINGS_MANAGER_HPP
