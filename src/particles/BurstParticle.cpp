/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/BurstParticle.hpp"
#include "particles/ColorAssigner.hpp"
#include "path/Path.hpp"
#include "render/RenderSink.hpp"
#include "utils/RandomUtils.hpp"
#include <algorithm>
#include <utility>

namespace CurveLights {

BurstParticle::BurstParticle(const Path &path, const CurveLightsConfig &config,
                             const ColorAssigner &colors)
    : m_path(&path) {
  m_rider.spawn(config);
  recolor(colors);

  const size_t capacity =
      POOL_FACTOR * static_cast<size_t>(std::max(config.trailLength, 1));
  m_positions.resize(capacity);
  m_velocities.resize(capacity);
  m_lives.resize(capacity, 0.0f);
  m_sizes.resize(capacity, 0.0f);

  m_guidePosition = m_path->pointAt(m_rider.currentT) + m_rider.scatterOffset;
}

// Burst color is fixed, loop-wrap does not recolor
void BurstParticle::update(const CurveLightsConfig &config,
                           [[maybe_unused]] const ColorAssigner &colors) {
  m_rider.advance(config);
  m_guidePosition = m_path->pointAt(m_rider.currentT) + m_rider.scatterOffset;

  updateSparks();

  const BurstSettings &burst = config.burst;
  if (randomChance(burst.emissionProbability)) {
    const int minSparks = std::max(burst.minSparks, 0);
    const int maxSparks = std::max(burst.maxSparks, minSparks);
    emitSparks(randomInt(minSparks, maxSparks), config);
  }

  m_rider.needsRedraw = true;
}

void BurstParticle::updateSparks() {
  size_t i = 0;
  while (i < m_liveCount) {
    m_lives[i] -= randomFloat(MIN_LIFE_DECAY, MAX_LIFE_DECAY);

    if (m_lives[i] > 0.0f) {
      m_positions[i] += m_velocities[i];
      m_velocities[i].setY(m_velocities[i].getY() - SPARK_GRAVITY);
      m_sizes[i] *= SPARK_SIZE_DECAY;
      ++i;
    } else {
      // Last live spark moves into slot i and is processed next iteration
      --m_liveCount;
      swapSparks(i, m_liveCount);
      m_lives[m_liveCount] = 0.0f;
    }
  }
}

size_t BurstParticle::emitSparks(int count, const CurveLightsConfig &config) {
  if (count <= 0) {
    return 0;
  }

  const BurstSettings &burst = config.burst;
  const float follow = std::clamp(burst.pathFollow, 0.0f, 1.0f);
  const Vector3D tangent = m_path->tangentAt(m_rider.currentT);
  const float bias = DOWNWARD_BIAS / (1.0f + 4.0f * follow);

  const size_t available = m_positions.size() - m_liveCount;
  const size_t toEmit = std::min(static_cast<size_t>(count), available);

  for (size_t n = 0; n < toEmit; ++n) {
    const size_t slot = m_liveCount++;

    Vector3D direction =
        (tangent * follow + randomUnitVector() * (1.0f - follow)).normalized();
    Vector3D velocity = direction * (burst.sparkSpeed * randomFloat(0.5f, 1.0f));
    velocity.setY(velocity.getY() - bias);

    m_positions[slot] = m_guidePosition;
    m_velocities[slot] = velocity;
    m_lives[slot] = 1.0f;
    m_sizes[slot] = burst.sparkSize * randomFloat(0.5f, 1.0f);
  }

  return toEmit;
}

void BurstParticle::swapSparks(size_t a, size_t b) {
  if (a == b) {
    return;
  }
  std::swap(m_positions[a], m_positions[b]);
  std::swap(m_velocities[a], m_velocities[b]);
  std::swap(m_lives[a], m_lives[b]);
  std::swap(m_sizes[a], m_sizes[b]);
}

void BurstParticle::recolor(const ColorAssigner &colors) {
  m_rider.color = colors.getOverride().value_or(ColorAssigner::BURST_HEAT_COLOR);
  m_rider.needsRedraw = true;
}

void BurstParticle::render(RenderSink &sink,
                           const CurveLightsConfig &config) const {
  if (m_liveCount == 0) {
    return;
  }

  RenderBatch batch;
  batch.kind = PrimitiveKind::Points;
  batch.positions = m_positions.data();
  batch.weights = m_lives.data();
  batch.sizes = m_sizes.data();
  batch.count = m_liveCount;
  batch.color = m_rider.color;
  batch.lifecycleAlpha = m_rider.lifecycleAlpha;
  batch.sizeHint = config.burst.sparkSize;
  batch.needsRedraw = m_rider.needsRedraw;
  sink.submit(batch);
}

} // namespace CurveLights
