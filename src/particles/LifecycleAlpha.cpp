/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/LifecycleAlpha.hpp"
#include <algorithm>
#include <cmath>

namespace CurveLights {

float LifecycleAlphaCalculator::compute(float fadeIn, float stable,
                                        float fadeOut, float p) {
  fadeIn = std::max(fadeIn, 0.0f);
  stable = std::max(stable, 0.0f);
  fadeOut = std::max(fadeOut, 0.0f);

  float alpha;
  if (p < fadeIn) {
    alpha = p / fadeIn;
  } else if (p < fadeIn + stable) {
    alpha = 1.0f;
  } else if (fadeOut > 0.0f) {
    alpha = 1.0f - (p - fadeIn - stable) / fadeOut;
  } else {
    alpha = 0.0f;
  }

  if (!std::isfinite(alpha)) {
    return 0.0f;
  }
  return std::clamp(alpha, 0.0f, 1.0f);
}

float LifecycleAlphaCalculator::cyclePosition(float lifecycleOffset,
                                              float currentT) {
  float p = lifecycleOffset + currentT;
  if (!std::isfinite(p)) {
    return 0.0f;
  }
  p -= std::floor(p);
  return (p >= 1.0f) ? 0.0f : p;
}

float LifecycleAlphaCalculator::seamFactor(float currentT, bool recentlyReset,
                                           float fadeIn, float fadeOut) {
  float factor = 1.0f;

  if (fadeOut > 0.0f && currentT > 1.0f - fadeOut) {
    factor = std::min(factor, (1.0f - currentT) / fadeOut);
  }

  if (recentlyReset && fadeIn > 0.0f && currentT < fadeIn) {
    factor = std::min(factor, currentT / fadeIn);
  }

  return std::clamp(factor, 0.0f, 1.0f);
}

float LifecycleAlphaCalculator::combine(float lifecycleAlpha, float seamAlpha) {
  return std::clamp(lifecycleAlpha * seamAlpha, 0.0f, 1.0f);
}

} // namespace CurveLights
