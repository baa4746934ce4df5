/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_RIDER_HPP
#define PATH_RIDER_HPP

#include "core/CurveLightsConfig.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>

namespace CurveLights {

/**
 * @brief Motion state shared by every particle variant
 *
 * Holds the particle's position along the path, its personal speed, the
 * scatter offset for the current loop and its lifecycle phase. Randomized
 * fields are drawn once in spawn(); scatterOffset is redrawn on every wrap.
 */
struct PathRider {
  static constexpr float MIN_SPEED_MULTIPLIER = 0.5f;
  static constexpr float MAX_SPEED_MULTIPLIER = 1.5f;

  float currentT{0.0f};
  float speedMultiplier{1.0f};
  float lifecycleOffset{0.0f};
  float lifecycleAlpha{1.0f};
  Vector3D scatterOffset{};
  uint32_t color{0xFFFFFFFF};
  bool justReset{false};
  bool needsRedraw{true};

  /**
   * @brief Draws starting position, speed multiplier, lifecycle offset and scatter
   */
  void spawn(const CurveLightsConfig &config);

  /**
   * @brief Per-tick parameter step, speedFactor is read live
   */
  float speed(const CurveLightsConfig &config) const;

  /**
   * @brief Advances currentT by one tick
   * @return true when currentT crossed 1; currentT is then 0, the scatter
   * offset is fresh and justReset is set
   */
  bool advance(const CurveLightsConfig &config);

  /**
   * @brief Recomputes lifecycleAlpha, adding the seam correction on open paths
   */
  void updateLifecycle(const LifecycleSettings &lifecycle, bool pathClosed);
};

} // namespace CurveLights

#endif // PATH_RIDER_HPP
