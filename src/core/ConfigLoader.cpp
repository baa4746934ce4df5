/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include "particles/ColorAssigner.hpp"
#include "particles/ParticleSystem.hpp"
#include "path/PathGenerator.hpp"
#include "utils/Color.hpp"

namespace CurveLights {

namespace {

void loadColor(const SettingsManager &settings, const std::string &key,
               uint32_t &color) {
  if (!settings.has("color", key)) {
    return;
  }
  const std::string text = settings.get<std::string>("color", key, "");
  if (auto parsed = Color::parseHexColor(text)) {
    color = *parsed;
  } else {
    SETTINGS_WARNING("Ignoring malformed color '" + text + "' for color." + key);
  }
}

void loadParticles(const SettingsManager &settings, CurveLightsConfig &config) {
  config.particleCount = settings.get<int>("particles", "count", config.particleCount);
  config.trailLength = settings.get<int>("particles", "trail_length", config.trailLength);
  config.speedFactor = settings.get<float>("particles", "speed_factor", config.speedFactor);
  config.scatterRadius = settings.get<float>("particles", "scatter_radius", config.scatterRadius);
  config.particleSize = settings.get<float>("particles", "size", config.particleSize);
  if (settings.has("particles", "type")) {
    config.particleType = particleTypeFromString(settings.get<std::string>("particles", "type"));
  }
}

void loadPath(const SettingsManager &settings, PathSettings &path) {
  if (settings.has("path", "family")) {
    path.family = pathFamilyFromString(settings.get<std::string>("path", "family"));
  }
  path.vivianiA = settings.get<float>("path", "viviani_a", path.vivianiA);
  path.vivianiSamples = settings.get<int>("path", "viviani_samples", path.vivianiSamples);
  path.lorenzSigma = settings.get<float>("path", "lorenz_sigma", path.lorenzSigma);
  path.lorenzRho = settings.get<float>("path", "lorenz_rho", path.lorenzRho);
  path.lorenzBeta = settings.get<float>("path", "lorenz_beta", path.lorenzBeta);
  path.lorenzStepSize = settings.get<float>("path", "lorenz_step_size", path.lorenzStepSize);
  path.lorenzSteps = settings.get<int>("path", "lorenz_steps", path.lorenzSteps);
  path.lorenzScale = settings.get<float>("path", "lorenz_scale", path.lorenzScale);
  path.lemniscateWidth = settings.get<float>("path", "lemniscate_width", path.lemniscateWidth);
  path.lemniscateHeight = settings.get<float>("path", "lemniscate_height", path.lemniscateHeight);
  path.lemniscateSamples = settings.get<int>("path", "lemniscate_samples", path.lemniscateSamples);
}

void loadColors(const SettingsManager &settings, ColorSettings &color) {
  if (settings.has("color", "mode")) {
    color.strategy = colorStrategyFromString(settings.get<std::string>("color", "mode"));
  }
  loadColor(settings, "single", color.singleColor);

  for (size_t i = 0; i < PALETTE_SIZE; ++i) {
    const std::string key = "palette" + std::to_string(i + 1);
    loadColor(settings, key, color.palette[i].color);
    color.palette[i].enabled =
        settings.get<bool>("color", key + "_enabled", color.palette[i].enabled);
  }
}

void loadLifecycle(const SettingsManager &settings, LifecycleSettings &lifecycle) {
  lifecycle.enabled = settings.get<bool>("lifecycle", "enabled", lifecycle.enabled);
  lifecycle.fadeIn = settings.get<float>("lifecycle", "fade_in", lifecycle.fadeIn);
  lifecycle.stable = settings.get<float>("lifecycle", "stable", lifecycle.stable);
  lifecycle.fadeOut = settings.get<float>("lifecycle", "fade_out", lifecycle.fadeOut);
  lifecycle.randomOffsetMax =
      settings.get<float>("lifecycle", "random_offset_max", lifecycle.randomOffsetMax);
}

void loadBurst(const SettingsManager &settings, BurstSettings &burst) {
  burst.emissionProbability =
      settings.get<float>("burst", "emission_probability", burst.emissionProbability);
  burst.minSparks = settings.get<int>("burst", "min_sparks", burst.minSparks);
  burst.maxSparks = settings.get<int>("burst", "max_sparks", burst.maxSparks);
  burst.pathFollow = settings.get<float>("burst", "path_follow", burst.pathFollow);
  burst.sparkSpeed = settings.get<float>("burst", "spark_speed", burst.sparkSpeed);
  burst.sparkSize = settings.get<float>("burst", "spark_size", burst.sparkSize);
}

void loadHeadTail(const SettingsManager &settings, HeadTailSettings &headTail) {
  headTail.tailWidth = settings.get<float>("comet", "tail_width", headTail.tailWidth);
  headTail.headSize = settings.get<float>("comet", "head_size", headTail.headSize);
  headTail.tailSpacing = settings.get<float>("comet", "tail_spacing", headTail.tailSpacing);
}

void loadRender(const SettingsManager &settings, RenderSettings &render) {
  if (settings.has("render", "theme")) {
    render.theme = themeFromString(settings.get<std::string>("render", "theme"));
  }
  render.bloomStrength = settings.get<float>("render", "bloom_strength", render.bloomStrength);
  render.bloomRadius = settings.get<float>("render", "bloom_radius", render.bloomRadius);
  render.bloomThreshold = settings.get<float>("render", "bloom_threshold", render.bloomThreshold);
  render.lineAlpha = settings.get<float>("render", "line_alpha", render.lineAlpha);
}

} // anonymous namespace

void loadConfig(const SettingsManager &settings, CurveLightsConfig &config) {
  loadParticles(settings, config);
  loadPath(settings, config.path);
  loadColors(settings, config.color);
  loadLifecycle(settings, config.lifecycle);
  loadBurst(settings, config.burst);
  loadHeadTail(settings, config.headTail);
  loadRender(settings, config.render);
}

SettingImpact classifySettingChange(const std::string &category,
                                    const std::string &key) {
  if (category == "path") {
    return SettingImpact::RebuildPath;
  }
  if (category == "color") {
    return SettingImpact::Recolor;
  }
  if (category == "render" && key == "theme") {
    return SettingImpact::ThemeChange;
  }
  if (category == "particles" &&
      (key == "count" || key == "trail_length" || key == "scatter_radius" ||
       key == "size" || key == "type")) {
    return SettingImpact::RebuildSystem;
  }
  if (category == "lifecycle" && key == "random_offset_max") {
    return SettingImpact::RebuildSystem;
  }
  return SettingImpact::Live;
}

Theme themeFromString(const std::string &key) {
  if (key == "dark") {
    return Theme::Dark;
  }
  if (key == "light") {
    return Theme::Light;
  }
  SETTINGS_WARNING("Unknown theme '" + key + "', using dark");
  return Theme::Dark;
}

const char *themeToString(Theme theme) {
  return (theme == Theme::Light) ? "light" : "dark";
}

} // namespace CurveLights
