/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/TrailParticle.hpp"
#include "particles/ColorAssigner.hpp"
#include "path/Path.hpp"
#include "render/RenderSink.hpp"
#include <algorithm>

namespace CurveLights {

TrailParticle::TrailParticle(const Path &path, const CurveLightsConfig &config,
                             const ColorAssigner &colors)
    : m_path(&path) {
  m_rider.spawn(config);
  m_rider.color = colors.assign();

  const size_t length = static_cast<size_t>(std::max(config.trailLength, 1));
  m_positions.resize(length);
  m_weights.resize(length);

  for (size_t i = 0; i < length; ++i) {
    float t = m_rider.currentT - static_cast<float>(i) * INITIAL_SAMPLE_SPACING;
    m_positions[i] = m_path->pointAt(t) + m_rider.scatterOffset;
  }
  fillFadeWeights(m_weights);
}

void TrailParticle::fillFadeWeights(std::vector<float> &weights) {
  const size_t length = weights.size();
  const float denominator =
      static_cast<float>(std::max<size_t>(1, length > 0 ? length - 1 : 0));
  for (size_t i = 0; i < length; ++i) {
    weights[i] = std::clamp(1.0f - static_cast<float>(i) / denominator, 0.0f, 1.0f);
  }
}

void TrailParticle::update(const CurveLightsConfig &config,
                           const ColorAssigner &colors) {
  if (m_rider.advance(config)) {
    m_rider.color = colors.assign();
    const Vector3D head = m_path->pointAt(m_rider.currentT) + m_rider.scatterOffset;
    std::fill(m_positions.begin(), m_positions.end(), head);
  } else {
    std::move_backward(m_positions.begin(), m_positions.end() - 1,
                       m_positions.end());
    m_positions.front() = m_path->pointAt(m_rider.currentT) + m_rider.scatterOffset;
  }

  fillFadeWeights(m_weights);
  m_rider.needsRedraw = true;
}

void TrailParticle::recolor(const ColorAssigner &colors) {
  m_rider.color = colors.assign();
  m_rider.needsRedraw = true;
}

void TrailParticle::render(RenderSink &sink,
                           const CurveLightsConfig &config) const {
  RenderBatch batch;
  batch.kind = PrimitiveKind::LineStrip;
  batch.positions = m_positions.data();
  batch.weights = m_weights.data();
  batch.count = m_positions.size();
  batch.color = m_rider.color;
  batch.lifecycleAlpha = m_rider.lifecycleAlpha;
  batch.sizeHint = config.particleSize;
  batch.needsRedraw = m_rider.needsRedraw;
  sink.submit(batch);
}

} // namespace CurveLights
