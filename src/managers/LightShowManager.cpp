/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/LightShowManager.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include "path/PathGenerator.hpp"
#include "render/RenderSink.hpp"
#include <exception>

namespace CurveLights {

bool LightShowManager::init(const CurveLightsConfig &config) {
  if (m_initialized.load(std::memory_order_acquire)) {
    LIGHTSHOW_INFO("LightShowManager already initialized");
    return true;
  }

  try {
    m_config = config;
    m_frameCount = 0;

    if (!rebuildPath()) {
      LIGHTSHOW_ERROR("LightShowManager init failed: could not build path");
      return false;
    }

    m_initialized.store(true, std::memory_order_release);
    m_isShutdown = false;

    LIGHTSHOW_INFO(std::string("LightShowManager initialized: ") +
                   std::to_string(m_system->getParticleCount()) + " " +
                   particleTypeToString(m_config.particleType) + " particles on " +
                   pathFamilyToString(m_config.path.family) + " path");
    return true;
  } catch (const std::exception &e) {
    LIGHTSHOW_ERROR(std::string("Exception during LightShowManager init: ") + e.what());
    m_system.reset();
    m_path.reset();
    return false;
  }
}

void LightShowManager::clean() {
  if (!m_initialized.load(std::memory_order_acquire) || m_isShutdown) {
    return;
  }

  LIGHTSHOW_INFO("LightShowManager shutting down...");

  unbindSettings();
  m_initialized.store(false, std::memory_order_release);
  m_isShutdown = true;

  if (m_system) {
    m_system->dispose();
    m_system.reset();
  }
  m_path.reset();
}

void LightShowManager::update() {
  if (!m_initialized.load(std::memory_order_acquire) || !m_system) {
    return;
  }

  try {
    if (m_system->needsRebuild(m_config)) {
      LIGHTSHOW_DEBUG("Comet tail width changed, rebuilding system");
      if (!rebuildSystem()) {
        return;
      }
    }

    m_system->update(m_config);
    ++m_frameCount;
  } catch (const std::exception &e) {
    LIGHTSHOW_ERROR(std::string("Exception in LightShowManager::update: ") + e.what());
  }
}

void LightShowManager::render(RenderSink &sink) {
  if (!m_system) {
    sink.beginFrame(m_config.render.theme == Theme::Light ? BlendMode::Normal
                                                          : BlendMode::Additive,
                    1.0f);
    sink.endFrame();
    return;
  }
  m_system->render(sink, m_config);
}

bool LightShowManager::setParticleType(ParticleType type) {
  if (type == m_config.particleType && m_system) {
    return true;
  }
  m_config.particleType = type;
  return rebuildSystem();
}

bool LightShowManager::setParticleType(const std::string &typeKey) {
  return setParticleType(particleTypeFromString(typeKey));
}

bool LightShowManager::setPathFamily(PathFamily family) {
  if (family == m_config.path.family && m_path) {
    return true;
  }
  m_config.path.family = family;
  return rebuildPath();
}

bool LightShowManager::setPathFamily(const std::string &familyKey) {
  return setPathFamily(pathFamilyFromString(familyKey));
}

void LightShowManager::setTheme(Theme theme) {
  m_config.render.theme = theme;
  if (m_system) {
    m_system->applyTheme(theme);
  }
  LIGHTSHOW_INFO(std::string("Theme set to ") + themeToString(theme));
}

void LightShowManager::recolor() {
  if (m_system) {
    m_system->recolor(m_config);
  }
}

bool LightShowManager::rebuildSystem() {
  if (!m_path) {
    LIGHTSHOW_ERROR("Cannot rebuild particle system without a path");
    return false;
  }

  try {
    // Old particles are gone before any new ones exist
    if (m_system) {
      m_system->dispose();
      m_system.reset();
    }

    auto system = ParticleSystem::create(m_config.particleType);
    system->applyTheme(m_config.render.theme);
    system->init(m_path, m_config);
    if (!system->isInitialized()) {
      LIGHTSHOW_ERROR("Particle system failed to initialize");
      return false;
    }
    m_system = std::move(system);
    return true;
  } catch (const std::exception &e) {
    LIGHTSHOW_ERROR(std::string("Exception while rebuilding particle system: ") + e.what());
    m_system.reset();
    return false;
  }
}

bool LightShowManager::rebuildPath() {
  try {
    if (m_system) {
      m_system->dispose();
      m_system.reset();
    }
    m_path = PathGenerator::build(m_config.path);
  } catch (const std::exception &e) {
    LIGHTSHOW_ERROR(std::string("Exception while building path: ") + e.what());
    m_path.reset();
    return false;
  }
  return rebuildSystem();
}

void LightShowManager::applySettingChange(const std::string &category,
                                          const std::string &key) {
  if (!m_initialized.load(std::memory_order_acquire)) {
    return;
  }

  loadConfig(SettingsManager::Instance(), m_config);

  switch (classifySettingChange(category, key)) {
  case SettingImpact::Recolor:
    recolor();
    break;
  case SettingImpact::RebuildSystem:
    rebuildSystem();
    break;
  case SettingImpact::RebuildPath:
    rebuildPath();
    break;
  case SettingImpact::ThemeChange:
    setTheme(m_config.render.theme);
    break;
  case SettingImpact::Live:
  default:
    break;
  }
}

void LightShowManager::bindSettings() {
  if (m_settingsBound) {
    return;
  }
  m_settingsListenerId = SettingsManager::Instance().registerChangeListener(
      "", [this](const std::string &category, const std::string &key,
                 const SettingsManager::SettingValue &) {
        applySettingChange(category, key);
      });
  m_settingsBound = true;
}

void LightShowManager::unbindSettings() {
  if (!m_settingsBound) {
    return;
  }
  SettingsManager::Instance().unregisterChangeListener(m_settingsListenerId);
  m_settingsBound = false;
}

} // namespace CurveLights
