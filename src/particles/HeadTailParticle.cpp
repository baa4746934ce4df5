/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/HeadTailParticle.hpp"
#include "particles/ColorAssigner.hpp"
#include "particles/TrailParticle.hpp"
#include "path/Path.hpp"
#include "render/RenderSink.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace CurveLights {

int HeadTailParticle::wideStrandCount(float tailWidth) {
  if (std::isnan(tailWidth)) {
    return 0;
  }
  const float width = std::clamp(tailWidth, 0.0f, MAX_TAIL_WIDTH);
  return static_cast<int>(std::floor(width * 2.0f));
}

HeadTailParticle::HeadTailParticle(const Path &path,
                                   const CurveLightsConfig &config,
                                   const ColorAssigner &colors)
    : m_path(&path) {
  m_rider.spawn(config);
  m_rider.color = colors.assign();

  const size_t length = static_cast<size_t>(std::max(config.trailLength, 1));
  const int wide = wideStrandCount(config.headTail.tailWidth);
  const float radius =
      STRAND_RADIUS * std::max(1.0f, config.headTail.tailWidth);

  m_weights.resize(length);
  TrailParticle::fillFadeWeights(m_weights);

  m_strandOffsets.reserve(static_cast<size_t>(wide) + 1);
  m_strandOffsets.emplace_back(0.0f, 0.0f, 0.0f);
  for (int k = 0; k < wide; ++k) {
    float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(k) /
                  static_cast<float>(wide);
    float depth = (k % 2 == 0 ? 1.0f : -1.0f) * STRAND_DEPTH_RATIO * radius;
    m_strandOffsets.emplace_back(radius * std::cos(angle),
                                 radius * std::sin(angle), depth);
  }

  m_strands.assign(m_strandOffsets.size(), std::vector<Vector3D>(length));
  sampleTail(config);
}

void HeadTailParticle::sampleTail(const CurveLightsConfig &config) {
  const float segmentLength =
      m_rider.speed(config) * std::max(config.headTail.tailSpacing, 0.0f);

  m_head = m_path->pointAt(m_rider.currentT) + m_rider.scatterOffset;

  const size_t length = m_weights.size();
  for (size_t i = 0; i < length; ++i) {
    float t = Path::wrap(m_rider.currentT - static_cast<float>(i) * segmentLength);
    const Vector3D base = m_path->pointAt(t) + m_rider.scatterOffset;
    for (size_t k = 0; k < m_strands.size(); ++k) {
      m_strands[k][i] = base + m_strandOffsets[k];
    }
  }
}

void HeadTailParticle::update(const CurveLightsConfig &config,
                              const ColorAssigner &colors) {
  if (m_rider.advance(config)) {
    m_rider.color = colors.assign();
  }
  sampleTail(config);
  m_rider.needsRedraw = true;
}

void HeadTailParticle::recolor(const ColorAssigner &colors) {
  m_rider.color = colors.assign();
  m_rider.needsRedraw = true;
}

void HeadTailParticle::render(RenderSink &sink,
                              const CurveLightsConfig &config) const {
  RenderBatch strand;
  strand.kind = PrimitiveKind::LineStrip;
  strand.weights = m_weights.data();
  strand.count = m_weights.size();
  strand.color = m_rider.color;
  strand.lifecycleAlpha = m_rider.lifecycleAlpha;
  strand.sizeHint = config.particleSize;
  strand.needsRedraw = m_rider.needsRedraw;

  for (const auto &positions : m_strands) {
    strand.positions = positions.data();
    sink.submit(strand);
  }

  RenderBatch head = strand;
  head.kind = PrimitiveKind::Points;
  head.positions = &m_head;
  head.weights = &m_headWeight;
  head.count = 1;
  head.sizeHint = config.headTail.headSize * config.particleSize;
  sink.submit(head);
}

} // namespace CurveLights
