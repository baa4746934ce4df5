/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BURST_PARTICLE_HPP
#define BURST_PARTICLE_HPP

#include "core/CurveLightsConfig.hpp"
#include "particles/PathRider.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace CurveLights {

class ColorAssigner;
class Path;
class RenderSink;

/**
 * @brief Invisible guide point that sheds short-lived sparks along the path
 *
 * Sparks live in a fixed Structure of Arrays pool of 3 x trailLength slots.
 * Live sparks always occupy the prefix [0, liveCount); an expired spark is
 * replaced by the last live one (swap-and-pop), so ordering is not stable.
 * Emission past capacity is dropped.
 */
class BurstParticle {
public:
  static constexpr size_t POOL_FACTOR = 3;
  static constexpr float SPARK_GRAVITY = 0.0008f;
  static constexpr float SPARK_SIZE_DECAY = 0.96f;
  static constexpr float MIN_LIFE_DECAY = 0.015f;
  static constexpr float MAX_LIFE_DECAY = 0.035f;
  static constexpr float DOWNWARD_BIAS = 0.004f;

  BurstParticle(const Path &path, const CurveLightsConfig &config,
                const ColorAssigner &colors);

  /**
   * @brief Advances the guide, ages live sparks, then rolls for emission
   */
  void update(const CurveLightsConfig &config, const ColorAssigner &colors);

  /**
   * @brief Emits up to count sparks from the guide position
   * @return Number of sparks actually emitted
   */
  size_t emitSparks(int count, const CurveLightsConfig &config);

  /**
   * @brief Bursts draw in heat color unless a theme override is active
   */
  void recolor(const ColorAssigner &colors);

  void render(RenderSink &sink, const CurveLightsConfig &config) const;

  size_t getLiveCount() const { return m_liveCount; }
  size_t getCapacity() const { return m_positions.size(); }
  const Vector3D &getGuidePosition() const { return m_guidePosition; }
  const std::vector<Vector3D> &getSparkPositions() const { return m_positions; }
  const std::vector<Vector3D> &getSparkVelocities() const { return m_velocities; }
  const std::vector<float> &getSparkLives() const { return m_lives; }
  const std::vector<float> &getSparkSizes() const { return m_sizes; }

  PathRider &getRider() { return m_rider; }
  const PathRider &getRider() const { return m_rider; }

private:
  void updateSparks();
  void swapSparks(size_t a, size_t b);

  const Path *m_path;
  PathRider m_rider;
  Vector3D m_guidePosition{};

  // SoA spark pool, prefix [0, m_liveCount) is alive
  std::vector<Vector3D> m_positions;
  std::vector<Vector3D> m_velocities;
  std::vector<float> m_lives;
  std::vector<float> m_sizes;
  size_t m_liveCount{0};
};

} // namespace CurveLights

#endif // BURST_PARTICLE_HPP
