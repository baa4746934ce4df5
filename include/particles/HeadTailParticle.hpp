/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HEAD_TAIL_PARTICLE_HPP
#define HEAD_TAIL_PARTICLE_HPP

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
 * @brief Comet: a bright head followed by one primary and several wide tail strands
 *
 * Tails carry no history. Every tick each strand resamples the path at
 * currentT - i * segmentLength, so all strands share the same samples and
 * differ only by a fixed lateral offset. Strand 0 is the primary tail and
 * has no offset.
 */
class HeadTailParticle {
public:
  static constexpr float STRAND_RADIUS = 0.12f;
  static constexpr float STRAND_DEPTH_RATIO = 0.25f;
  static constexpr float MAX_TAIL_WIDTH = 16.0f;

  HeadTailParticle(const Path &path, const CurveLightsConfig &config,
                   const ColorAssigner &colors);

  void update(const CurveLightsConfig &config, const ColorAssigner &colors);
  void recolor(const ColorAssigner &colors);
  void render(RenderSink &sink, const CurveLightsConfig &config) const;

  /**
   * @brief floor(tailWidth * 2) with tailWidth clamped to [0, MAX_TAIL_WIDTH]
   *
   * NaN yields no wide strands.
   */
  static int wideStrandCount(float tailWidth);

  const Vector3D &getHead() const { return m_head; }
  size_t getStrandCount() const { return m_strands.size(); }
  size_t getWideStrandCount() const { return m_strands.size() - 1; }
  const std::vector<Vector3D> &getStrand(size_t index) const { return m_strands[index]; }
  const Vector3D &getStrandOffset(size_t index) const { return m_strandOffsets[index]; }
  const std::vector<float> &getWeights() const { return m_weights; }
  size_t getTailLength() const { return m_weights.size(); }

  PathRider &getRider() { return m_rider; }
  const PathRider &getRider() const { return m_rider; }

private:
  void sampleTail(const CurveLightsConfig &config);

  const Path *m_path;
  PathRider m_rider;
  Vector3D m_head{};
  float m_headWeight{1.0f};
  std::vector<std::vector<Vector3D>> m_strands;
  std::vector<Vector3D> m_strandOffsets;
  std::vector<float> m_weights; // Shared by all strands, fixed at construction
};

} // namespace CurveLights

#endif // HEAD_TAIL_PARTICLE_HPP
