/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/PathRider.hpp"
#include "particles/LifecycleAlpha.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>

namespace CurveLights {

void PathRider::spawn(const CurveLightsConfig &config) {
  currentT = randomFloat(0.0f, 1.0f);
  speedMultiplier = randomFloat(MIN_SPEED_MULTIPLIER, MAX_SPEED_MULTIPLIER);
  lifecycleOffset =
      randomFloat(0.0f, std::max(config.lifecycle.randomOffsetMax, 0.0f));
  scatterOffset = randomInBall(config.scatterRadius);
  lifecycleAlpha = 1.0f;
  justReset = false;
  needsRedraw = true;
}

float PathRider::speed(const CurveLightsConfig &config) const {
  return std::max(config.speedFactor, 0.0f) * speedMultiplier;
}

bool PathRider::advance(const CurveLightsConfig &config) {
  currentT += speed(config);
  if (currentT < 1.0f) {
    return false;
  }

  currentT = 0.0f;
  scatterOffset = randomInBall(config.scatterRadius);
  justReset = true;
  return true;
}

void PathRider::updateLifecycle(const LifecycleSettings &lifecycle,
                                bool pathClosed) {
  float alpha = 1.0f;
  if (lifecycle.enabled) {
    alpha = LifecycleAlphaCalculator::compute(
        lifecycle.fadeIn, lifecycle.stable, lifecycle.fadeOut,
        LifecycleAlphaCalculator::cyclePosition(lifecycleOffset, currentT));
  }

  if (!pathClosed) {
    float seam = LifecycleAlphaCalculator::seamFactor(
        currentT, justReset, lifecycle.fadeIn, lifecycle.fadeOut);
    alpha = LifecycleAlphaCalculator::combine(alpha, seam);
  }

  if (justReset &&
      LifecycleAlphaCalculator::seamRecovered(currentT, lifecycle.fadeIn)) {
    justReset = false;
  }

  lifecycleAlpha = std::clamp(alpha, 0.0f, 1.0f);
}

} // namespace CurveLights
