/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CURVE_LIGHTS_CONFIG_HPP
#define CURVE_LIGHTS_CONFIG_HPP

/**
 * @file CurveLightsConfig.hpp
 * @brief Plain configuration snapshot shared by the path, particle and manager layers
 *
 * The struct is owned by LightShowManager (or a test) and passed by const
 * reference into every constructor and update. Structural fields
 * (counts, lengths, family parameters) are read when a system is built;
 * live fields (speedFactor, lifecycle fractions, burst tuning) are read
 * on every tick.
 */

#include "utils/Vector3D.hpp"
#include <array>
#include <cstdint>

namespace CurveLights {

/**
 * @brief Procedural path families
 */
enum class PathFamily : uint8_t {
  Viviani = 0,    // Closed loop
  Lorenz = 1,     // Open trajectory
  Lemniscate = 2, // Closed figure-eight
  COUNT = 3
};

/**
 * @brief Particle variants managed by ParticleSystem
 */
enum class ParticleType : uint8_t {
  Trail = 0,
  Burst = 1,
  HeadTail = 2,
  COUNT = 3
};

/**
 * @brief Color assignment strategies
 */
enum class ColorStrategy : uint8_t {
  Uniform = 0,
  RandomHue = 1,
  Palette = 2
};

/**
 * @brief Visual theme; drives blend mode and the forced light-theme color
 */
enum class Theme : uint8_t { Dark = 0, Light = 1 };

/**
 * @brief Compositing modes exposed to the render collaborator
 */
enum class BlendMode : uint8_t {
  Additive = 0, // Lights over dark background
  Normal = 1    // Standard alpha blending
};

struct PathSettings {
  PathFamily family{PathFamily::Viviani};

  float vivianiA{5.0f};
  int vivianiSamples{256};

  float lorenzSigma{10.0f};
  float lorenzRho{28.0f};
  float lorenzBeta{8.0f / 3.0f};
  float lorenzStepSize{0.005f};
  int lorenzSteps{4000};
  Vector3D lorenzStart{0.1f, 0.0f, 0.0f};
  float lorenzScale{0.25f};

  float lemniscateWidth{8.0f};
  float lemniscateHeight{5.0f};
  int lemniscateSamples{256};
};

struct LifecycleSettings {
  bool enabled{true};
  float fadeIn{0.15f};
  float stable{0.6f};
  float fadeOut{0.25f};
  float randomOffsetMax{1.0f};
};

struct BurstSettings {
  float emissionProbability{0.6f};
  int minSparks{2};
  int maxSparks{6};
  float pathFollow{0.7f};
  float sparkSpeed{0.05f};
  float sparkSize{1.5f};
};

struct HeadTailSettings {
  float tailWidth{1.0f};
  float headSize{3.0f};
  float tailSpacing{1.0f};
};

struct PaletteEntry {
  uint32_t color{0xFFFFFFFF};
  bool enabled{true};
};

constexpr size_t PALETTE_SIZE = 5;

struct ColorSettings {
  ColorStrategy strategy{ColorStrategy::Palette};
  uint32_t singleColor{0xFFFFFFFF};
  std::array<PaletteEntry, PALETTE_SIZE> palette{{{0xFFF1CCFF, true},
                                                  {0xFFDD80FF, true},
                                                  {0xFFBB00FF, true},
                                                  {0x80BDFFFF, true},
                                                  {0x007BFFFF, true}}};
};

struct RenderSettings {
  Theme theme{Theme::Dark};
  // Forwarded to an external bloom pass; the bundled demo does not use them
  float bloomStrength{2.5f};
  float bloomRadius{0.5f};
  float bloomThreshold{0.04f};
  float lineAlpha{0.8f};
};

struct CurveLightsConfig {
  ParticleType particleType{ParticleType::Trail};
  int particleCount{350};
  int trailLength{24};
  float speedFactor{0.004f};
  float scatterRadius{1.3f};
  float particleSize{1.0f};

  PathSettings path{};
  LifecycleSettings lifecycle{};
  BurstSettings burst{};
  HeadTailSettings headTail{};
  ColorSettings color{};
  RenderSettings render{};
};

} // namespace CurveLights

#endif // CURVE_LIGHTS_CONFIG_HPP
