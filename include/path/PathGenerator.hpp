/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_GENERATOR_HPP
#define PATH_GENERATOR_HPP

#include "core/CurveLightsConfig.hpp"
#include "path/Path.hpp"
#include "utils/Vector3D.hpp"
#include <memory>
#include <string>
#include <vector>

namespace CurveLights {

/**
 * @brief Raw output of a path family before it is wrapped in a Path
 */
struct GeneratedPath {
  std::vector<Vector3D> points;
  bool closed{false};
};

/**
 * @brief Builds control-point sequences for the procedural path families
 *
 * Every family yields at least MIN_POINTS points; smaller sample or step
 * counts are raised. The closed flag travels with the points because
 * lifecycle blending treats open paths differently at the seam.
 */
class PathGenerator {
public:
  static constexpr int MIN_POINTS = 3;

  /**
   * @brief Generates the control points for settings.family
   */
  static GeneratedPath generate(const PathSettings &settings);

  /**
   * @brief Generates and wraps the result in a shareable immutable Path
   */
  static std::shared_ptr<const Path> build(const PathSettings &settings);

  /**
   * @brief Viviani curve over t in [0,4pi), end point not repeated. Closed.
   */
  static GeneratedPath generateViviani(float a, int samples);

  /**
   * @brief Euler-integrated Lorenz attractor, axes shown as (x, z, y). Open.
   */
  static GeneratedPath generateLorenz(const PathSettings &settings);

  /**
   * @brief Lemniscate of Gerono over s in [0,2pi). Closed.
   */
  static GeneratedPath generateLemniscate(float width, float height,
                                          int samples);

  /**
   * @brief Evaluates x = a(1+cos t), y = a sin t, z = 2a sin(t/2)
   */
  static Vector3D vivianiPoint(float a, float t);

  static bool isClosedFamily(PathFamily family);
};

/**
 * @brief Maps "viviani", "lorenz" or "lemniscate" to a family
 *
 * Unknown keys log a warning and fall back to PathFamily::Viviani.
 */
PathFamily pathFamilyFromString(const std::string &key);

const char *pathFamilyToString(PathFamily family);

} // namespace CurveLights

#endif // PATH_GENERATOR_HPP
