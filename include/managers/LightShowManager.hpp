/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIGHT_SHOW_MANAGER_HPP
#define LIGHT_SHOW_MANAGER_HPP

/**
 * @file LightShowManager.hpp
 * @brief Owns the configuration snapshot, the shared path and the active ParticleSystem
 *
 * Structural changes replace the path and/or system wholesale; the old
 * system is always disposed before the new one is created. When bound to
 * SettingsManager, every settings change reloads the config and is routed
 * by its SettingImpact.
 */

#include "core/ConfigLoader.hpp"
#include "core/CurveLightsConfig.hpp"
#include "particles/ParticleSystem.hpp"
#include "path/Path.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace CurveLights {

class RenderSink;

class LightShowManager {
public:
  static LightShowManager &Instance() {
    static LightShowManager instance;
    return instance;
  }

  /**
   * @brief Builds the path and particle system from config
   * @return true if initialization successful, false otherwise
   */
  bool init(const CurveLightsConfig &config);

  bool isInitialized() const {
    return m_initialized.load(std::memory_order_acquire);
  }

  /**
   * @brief Disposes the system, releases the path and unbinds settings
   */
  void clean();

  bool isShutdown() const { return m_isShutdown; }

  /**
   * @brief Ticks the active system once
   *
   * Rebuilds first when the comet tail width drifted past its threshold.
   */
  void update();

  /**
   * @brief Hands the current frame to the sink
   */
  void render(RenderSink &sink);

  /**
   * @brief Switches particle variant and rebuilds the system
   *
   * These setters change the local snapshot only and do not write back to
   * SettingsManager.
   */
  bool setParticleType(ParticleType type);
  bool setParticleType(const std::string &typeKey);

  /**
   * @brief Switches path family, regenerates the path and rebuilds the system
   */
  bool setPathFamily(PathFamily family);
  bool setPathFamily(const std::string &familyKey);

  void setTheme(Theme theme);

  /**
   * @brief Reassigns all particle colors from the current color settings
   */
  void recolor();

  bool rebuildSystem();
  bool rebuildPath();

  /**
   * @brief Reloads config from SettingsManager and reacts to category.key
   */
  void applySettingChange(const std::string &category, const std::string &key);

  /**
   * @brief Registers a SettingsManager listener that calls applySettingChange
   */
  void bindSettings();
  void unbindSettings();
  bool isBoundToSettings() const { return m_settingsBound; }

  const CurveLightsConfig &getConfig() const { return m_config; }
  std::shared_ptr<const Path> getPath() const { return m_path; }
  const ParticleSystem *getParticleSystem() const { return m_system.get(); }
  uint64_t getFrameCount() const { return m_frameCount; }

private:
  LightShowManager() = default;
  ~LightShowManager() = default;

  LightShowManager(const LightShowManager &) = delete;
  LightShowManager &operator=(const LightShowManager &) = delete;

  CurveLightsConfig m_config{};
  std::shared_ptr<const Path> m_path;
  std::unique_ptr<ParticleSystem> m_system;

  std::atomic<bool> m_initialized{false};
  bool m_isShutdown{false};
  bool m_settingsBound{false};
  size_t m_settingsListenerId{0};
  uint64_t m_frameCount{0};
};

} // namespace CurveLights

#endif // LIGHT_SHOW_MANAGER_HPP
