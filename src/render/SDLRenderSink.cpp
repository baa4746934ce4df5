/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "render/SDLRenderSink.hpp"
#include "core/Logger.hpp"
#include "utils/Color.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

namespace CurveLights {

namespace {
constexpr uint8_t LIGHT_BACKGROUND = 0xF0;
}

SDLRenderSink::SDLRenderSink(SDL_Renderer *renderer) : mp_renderer(renderer) {
  if (!mp_renderer) {
    RENDER_ERROR("SDLRenderSink created without a renderer - frames will be dropped");
  }
  updateCameraBasis();
}

void SDLRenderSink::setFocus(const Vector3D &center, float radius) {
  m_focus = center;
  m_distance = std::max(radius, 0.1f) * CAMERA_DISTANCE_FACTOR;
  updateCameraBasis();
  RENDER_DEBUG("Camera focus set, orbit distance " + std::to_string(m_distance));
}

void SDLRenderSink::advanceOrbit(float deltaTime) {
  m_orbitAngle = std::fmod(m_orbitAngle + ORBIT_SPEED * deltaTime,
                           2.0f * std::numbers::pi_v<float>);
  updateCameraBasis();
}

void SDLRenderSink::setLineAlpha(float lineAlpha) {
  m_lineAlpha = std::clamp(lineAlpha, 0.0f, 1.0f);
}

void SDLRenderSink::updateCameraBasis() {
  m_eye = m_focus + Vector3D(std::cos(m_orbitAngle) * m_distance,
                             m_distance * CAMERA_ELEVATION,
                             std::sin(m_orbitAngle) * m_distance);
  m_forward = (m_focus - m_eye).normalized();
  m_right = m_forward.cross(Vector3D(0.0f, 1.0f, 0.0f)).normalized();
  m_up = m_right.cross(m_forward);
}

void SDLRenderSink::beginFrame(BlendMode blendMode, float thicknessHint) {
  m_batchCount = 0;
  m_linePasses = std::clamp(static_cast<int>(std::lround(thicknessHint)), 1, 4);

  if (!mp_renderer) {
    return;
  }

  int width = 0;
  int height = 0;
  if (SDL_GetCurrentRenderOutputSize(mp_renderer, &width, &height) && width > 0 && height > 0) {
    m_halfWidth = static_cast<float>(width) * 0.5f;
    m_halfHeight = static_cast<float>(height) * 0.5f;
  }
  const float halfFov = FIELD_OF_VIEW_DEGREES * 0.5f * std::numbers::pi_v<float> / 180.0f;
  m_focalLength = m_halfHeight / std::tan(halfFov);

  if (m_theme == Theme::Light) {
    SDL_SetRenderDrawColor(mp_renderer, LIGHT_BACKGROUND, LIGHT_BACKGROUND, LIGHT_BACKGROUND, 255);
  } else {
    SDL_SetRenderDrawColor(mp_renderer, 0, 0, 0, 255);
  }
  SDL_RenderClear(mp_renderer);

  const SDL_BlendMode sdlBlend =
      blendMode == BlendMode::Additive ? SDL_BLENDMODE_ADD : SDL_BLENDMODE_BLEND;
  if (!SDL_SetRenderDrawBlendMode(mp_renderer, sdlBlend)) {
    RENDER_WARN(std::string("Failed to set blend mode: ") + SDL_GetError());
  }
}

void SDLRenderSink::submit(const RenderBatch &batch) {
  ++m_batchCount;
  if (!mp_renderer || !batch.positions || batch.count == 0 || batch.lifecycleAlpha <= 0.0f) {
    return;
  }

  switch (batch.kind) {
  case PrimitiveKind::LineStrip:
    drawLineStrip(batch);
    break;
  case PrimitiveKind::Points:
    drawPoints(batch);
    break;
  }
}

void SDLRenderSink::endFrame() {
  if (mp_renderer) {
    SDL_RenderPresent(mp_renderer);
  }
}

SDLRenderSink::ScreenPoint SDLRenderSink::project(const Vector3D &world) const {
  const Vector3D rel = world - m_eye;
  ScreenPoint out;
  out.depth = rel.dot(m_forward);
  if (out.depth < NEAR_PLANE) {
    return out;
  }
  const float scale = m_focalLength / out.depth;
  out.x = m_halfWidth + rel.dot(m_right) * scale;
  out.y = m_halfHeight - rel.dot(m_up) * scale;
  out.visible = true;
  return out;
}

void SDLRenderSink::setDrawColor(uint32_t rgba, float alpha) const {
  const float a = std::clamp(alpha, 0.0f, 1.0f) * (static_cast<float>(Color::alpha(rgba)) / 255.0f);
  SDL_SetRenderDrawColor(mp_renderer, Color::red(rgba), Color::green(rgba), Color::blue(rgba),
                         static_cast<uint8_t>(a * 255.0f));
}

void SDLRenderSink::drawLineStrip(const RenderBatch &batch) {
  if (batch.count < 2) {
    return;
  }

  ScreenPoint previous = project(batch.positions[0]);
  for (size_t i = 1; i < batch.count; ++i) {
    const ScreenPoint current = project(batch.positions[i]);
    if (previous.visible && current.visible) {
      const float weight = batch.weights ? batch.weights[i - 1] : 1.0f;
      const float alpha = weight * batch.lifecycleAlpha * m_lineAlpha;
      if (alpha > 0.0f) {
        setDrawColor(batch.color, alpha);
        for (int pass = 0; pass < m_linePasses; ++pass) {
          const float offset = static_cast<float>(pass);
          SDL_RenderLine(mp_renderer, previous.x, previous.y + offset, current.x, current.y + offset);
        }
      }
    }
    previous = current;
  }
}

void SDLRenderSink::drawPoints(const RenderBatch &batch) {
  for (size_t i = 0; i < batch.count; ++i) {
    const ScreenPoint point = project(batch.positions[i]);
    if (!point.visible) {
      continue;
    }
    const float weight = batch.weights ? batch.weights[i] : 1.0f;
    const float alpha = weight * batch.lifecycleAlpha;
    if (alpha <= 0.0f) {
      continue;
    }

    const float worldSize = (batch.sizes ? batch.sizes[i] : batch.sizeHint) * POINT_WORLD_SIZE;
    const float pixels = std::max(1.0f, worldSize * m_focalLength / point.depth);

    SDL_FRect rect{point.x - pixels * 0.5f, point.y - pixels * 0.5f, pixels, pixels};
    setDrawColor(batch.color, alpha);
    SDL_RenderFillRect(mp_renderer, &rect);
  }
}

} // namespace CurveLights
