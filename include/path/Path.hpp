/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_HPP
#define PATH_HPP

#include "utils/Vector3D.hpp"
#include <cstddef>
#include <vector>

namespace CurveLights {

/**
 * @brief Immutable interpolated 3D curve built from ordered control points
 *
 * Interpolation is centripetal Catmull-Rom. The public parameter t is
 * arc-length normalized: equal steps in t cover equal distances along the
 * curve. pointAt() and tangentAt() accept any real t; closed paths wrap it
 * into [0,1) and open paths clamp it to [0,1].
 *
 * Degenerate inputs never fail: an empty path evaluates to the origin, a
 * single point evaluates to itself, and a zero-length path falls back to
 * uniform parameterization.
 */
class Path {
public:
  Path() = default;
  Path(std::vector<Vector3D> points, bool closed);

  /**
   * @brief Position on the curve at arc-length parameter t
   */
  Vector3D pointAt(float t) const;

  /**
   * @brief Unit direction of travel at arc-length parameter t
   */
  Vector3D tangentAt(float t) const;

  bool isClosed() const { return m_closed; }
  bool empty() const { return m_points.empty(); }
  size_t size() const { return m_points.size(); }
  const std::vector<Vector3D>& getPoints() const { return m_points; }

  float getLength() const { return m_totalLength; }
  const Vector3D& getCenter() const { return m_center; }
  float getBoundingRadius() const { return m_boundingRadius; }

  /**
   * @brief Wraps any real t into [0,1)
   */
  static float wrap(float t);

private:
  float normalizeParameter(float t) const;
  float arcToCurveParameter(float u) const;
  Vector3D evaluate(float t) const;
  void buildArcLengthTable();
  void computeBounds();

  std::vector<Vector3D> m_points;
  std::vector<float> m_arcLengths; // Cumulative, m_arcLengths[0] == 0
  float m_totalLength{0.0f};
  Vector3D m_center{};
  float m_boundingRadius{0.0f};
  bool m_closed{false};
};

} // namespace CurveLights

#endif // PATH_HPP
