/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RENDER_SINK_HPP
#define RENDER_SINK_HPP

#include "core/CurveLightsConfig.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <cstdint>

namespace CurveLights {

enum class PrimitiveKind : uint8_t {
  LineStrip = 0, // Trails and tail strands, head sample first
  Points = 1     // Sparks and comet heads
};

/**
 * @brief Non-owning view of one particle's buffers for a single frame
 *
 * Pointers stay valid until the next ParticleSystem::update() or dispose().
 * weights holds one value per position; sizes may be null, in which case
 * sizeHint applies to every sample.
 */
struct RenderBatch {
  PrimitiveKind kind{PrimitiveKind::LineStrip};
  const Vector3D *positions{nullptr};
  const float *weights{nullptr};
  const float *sizes{nullptr};
  size_t count{0};
  uint32_t color{0xFFFFFFFF};
  float lifecycleAlpha{1.0f};
  float sizeHint{1.0f};
  bool needsRedraw{true};
};

/**
 * @brief Rendering collaborator that consumes particle buffers each frame
 */
class RenderSink {
public:
  virtual ~RenderSink() = default;

  virtual void beginFrame(BlendMode blendMode, float thicknessHint) = 0;
  virtual void submit(const RenderBatch &batch) = 0;
  virtual void endFrame() = 0;
};

} // namespace CurveLights

#endif // RENDER_SINK_HPP
