/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIFECYCLE_ALPHA_HPP
#define LIFECYCLE_ALPHA_HPP

namespace CurveLights {

/**
 * @brief Pure fade-in / hold / fade-out visibility math
 *
 * The fractions are raw thresholds on a normalized cycle and need not sum
 * to 1. Zero-length fades become steps. Every result is clamped to [0,1].
 */
class LifecycleAlphaCalculator {
public:
  /**
   * @brief Lifecycle alpha at normalized position p
   * @param fadeIn Length of the fade-in ramp starting at p = 0
   * @param stable Length of the fully visible hold after fade-in
   * @param fadeOut Length of the fade-out ramp after the hold
   * @param p Position in the cycle, normally in [0,1)
   */
  static float compute(float fadeIn, float stable, float fadeOut, float p);

  /**
   * @brief (lifecycleOffset + currentT) mod 1
   */
  static float cyclePosition(float lifecycleOffset, float currentT);

  /**
   * @brief Open-path seam multiplier
   *
   * Ramps to 0 over the last fadeOut of currentT, and while recentlyReset is
   * set ramps back up from 0 over the first fadeIn.
   */
  static float seamFactor(float currentT, bool recentlyReset, float fadeIn,
                          float fadeOut);

  /**
   * @brief True once the post-reset ramp has completed
   */
  static bool seamRecovered(float currentT, float fadeIn) {
    return currentT >= fadeIn;
  }

  /**
   * @brief Lifecycle and seam multipliers compose by multiplication
   */
  static float combine(float lifecycleAlpha, float seamAlpha);
};

} // namespace CurveLights

#endif // LIFECYCLE_ALPHA_HPP
