/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SDL_RENDER_SINK_HPP
#define SDL_RENDER_SINK_HPP

#include "render/RenderSink.hpp"
#include "utils/Vector3D.hpp"

struct SDL_Renderer;

namespace CurveLights {

/**
 * @brief Draws particle batches with SDL_Renderer through a perspective camera
 *
 * The camera orbits the focus point on a horizontal circle and always looks
 * at it. Line strips become per-segment lines whose alpha is the sample
 * weight times the particle's lifecycle alpha times the global line alpha.
 * Points become filled squares scaled by depth.
 */
class SDLRenderSink : public RenderSink {
public:
  static constexpr float FIELD_OF_VIEW_DEGREES = 75.0f;
  static constexpr float CAMERA_DISTANCE_FACTOR = 2.2f;
  static constexpr float CAMERA_ELEVATION = 0.35f;
  static constexpr float NEAR_PLANE = 0.05f;
  static constexpr float POINT_WORLD_SIZE = 0.05f;
  static constexpr float ORBIT_SPEED = 0.15f; // radians per second

  explicit SDLRenderSink(SDL_Renderer *renderer);

  void beginFrame(BlendMode blendMode, float thicknessHint) override;
  void submit(const RenderBatch &batch) override;
  void endFrame() override;

  /**
   * @brief Centers the orbit on a path; distance follows its bounding radius
   */
  void setFocus(const Vector3D &center, float radius);
  void advanceOrbit(float deltaTime);

  void setLineAlpha(float lineAlpha);
  void setTheme(Theme theme) { m_theme = theme; }

  size_t getSubmittedBatchCount() const { return m_batchCount; }

private:
  struct ScreenPoint {
    float x{0.0f};
    float y{0.0f};
    float depth{0.0f};
    bool visible{false};
  };

  ScreenPoint project(const Vector3D &world) const;
  void updateCameraBasis();
  void drawLineStrip(const RenderBatch &batch);
  void drawPoints(const RenderBatch &batch);
  void setDrawColor(uint32_t rgba, float alpha) const;

  SDL_Renderer *mp_renderer{nullptr}; // Not owned

  Vector3D m_focus{};
  float m_distance{10.0f};
  float m_orbitAngle{0.0f};

  Vector3D m_eye{};
  Vector3D m_right{1.0f, 0.0f, 0.0f};
  Vector3D m_up{0.0f, 1.0f, 0.0f};
  Vector3D m_forward{0.0f, 0.0f, -1.0f};

  float m_halfWidth{640.0f};
  float m_halfHeight{360.0f};
  float m_focalLength{1.0f};

  float m_lineAlpha{0.8f};
  int m_linePasses{1};
  Theme m_theme{Theme::Dark};
  size_t m_batchCount{0};
};

} // namespace CurveLights

#endif // SDL_RENDER_SINK_HPP
