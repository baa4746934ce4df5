/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TRAIL_PARTICLE_HPP
#define TRAIL_PARTICLE_HPP

#include "core/CurveLightsConfig.hpp"
#include "particles/PathRider.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <vector>

namespace CurveLights {

class ColorAssigner;
class Path;
class RenderSink;

/**
 * @brief Point of light dragging a fixed-length fading trail along the path
 *
 * positions[0] is the head. Each tick the ring shifts one slot toward the
 * tail and a fresh head is sampled. On wrap the whole ring collapses onto
 * the new head so no streak is drawn across the loop.
 */
class TrailParticle {
public:
  static constexpr float INITIAL_SAMPLE_SPACING = 0.001f;

  TrailParticle(const Path &path, const CurveLightsConfig &config,
                const ColorAssigner &colors);

  void update(const CurveLightsConfig &config, const ColorAssigner &colors);
  void recolor(const ColorAssigner &colors);
  void render(RenderSink &sink, const CurveLightsConfig &config) const;

  const std::vector<Vector3D> &getPositions() const { return m_positions; }
  const std::vector<float> &getWeights() const { return m_weights; }
  size_t getTrailLength() const { return m_positions.size(); }
  const Vector3D &getHead() const { return m_positions.front(); }

  PathRider &getRider() { return m_rider; }
  const PathRider &getRider() const { return m_rider; }

  /**
   * @brief Linear ramp from 1 at index 0 to 0 at index length-1
   */
  static void fillFadeWeights(std::vector<float> &weights);

private:
  const Path *m_path;
  PathRider m_rider;
  std::vector<Vector3D> m_positions;
  std::vector<float> m_weights;
};

} // namespace CurveLights

#endif // TRAIL_PARTICLE_HPP
