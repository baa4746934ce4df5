/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "core/CurveLightsConfig.hpp"
#include <cstdint>
#include <string>

namespace CurveLights {

class SettingsManager;

/**
 * @brief What a single settings change requires from the running show
 */
enum class SettingImpact : uint8_t {
  Live = 0,          // Read on the next tick, nothing to do
  Recolor = 1,       // Reassign particle colors
  RebuildSystem = 2, // Dispose and recreate all particles
  RebuildPath = 3,   // Regenerate the path, then rebuild the system
  ThemeChange = 4    // Switch blend mode and forced color
};

/**
 * @brief Copies every known setting into config; absent keys keep their value
 *
 * Malformed values (unknown enum keys, bad hex colors) log a warning and
 * leave or default the field as documented for each key.
 */
void loadConfig(const SettingsManager &settings, CurveLightsConfig &config);

/**
 * @brief Classifies a change to category.key
 */
SettingImpact classifySettingChange(const std::string &category,
                                    const std::string &key);

/**
 * @brief Maps "dark" or "light"; unknown keys warn and fall back to Theme::Dark
 */
Theme themeFromString(const std::string &key);

const char *themeToString(Theme theme);

} // namespace CurveLights

#endif // CONFIG_LOADER_HPP
