/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PARTICLE_SYSTEM_HPP
#define PARTICLE_SYSTEM_HPP

/**
 * @file ParticleSystem.hpp
 * @brief Homogeneous collection of one particle variant along a shared path
 *
 * The variant is a closed set, so storage is a std::variant of per-type
 * vectors and behavior is routed through a static table of per-type
 * operations indexed by ParticleType:
 * - create: build N particles from the current config
 * - update: tick every particle once
 * - recolor: reassign colors without touching motion state
 * - lifecycle: apply fade and open-path seam alpha
 * - render: hand buffers to a RenderSink
 */

#include "core/CurveLightsConfig.hpp"
#include "particles/BurstParticle.hpp"
#include "particles/ColorAssigner.hpp"
#include "particles/HeadTailParticle.hpp"
#include "particles/TrailParticle.hpp"
#include "path/Path.hpp"
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace CurveLights {

class RenderSink;

class ParticleSystem {
public:
  /**
   * @brief Width change (in tailWidth units) that forces a comet rebuild
   */
  static constexpr float TAIL_WIDTH_REBUILD_THRESHOLD = 0.05f;

  using Storage =
      std::variant<std::vector<TrailParticle>, std::vector<BurstParticle>,
                   std::vector<HeadTailParticle>>;

  /**
   * @brief Creates an empty system for the given variant
   */
  static std::unique_ptr<ParticleSystem> create(ParticleType type);

  /**
   * @brief Creates a system from a type key ("trail", "burst", "comet")
   *
   * Unknown keys log a warning and fall back to the trail variant.
   */
  static std::unique_ptr<ParticleSystem> create(const std::string &typeKey);

  explicit ParticleSystem(ParticleType type);
  ~ParticleSystem();

  ParticleSystem(const ParticleSystem &) = delete;
  ParticleSystem &operator=(const ParticleSystem &) = delete;

  /**
   * @brief Disposes existing particles and builds config.particleCount new ones
   * @param path Shared immutable path; every particle keeps a non-owning reference
   * @param config Configuration snapshot for structural fields
   */
  void init(std::shared_ptr<const Path> path, const CurveLightsConfig &config);

  /**
   * @brief Ticks every particle once, then applies lifecycle alpha
   */
  void update(const CurveLightsConfig &config);

  /**
   * @brief Re-reads the color settings and reassigns every particle's color
   */
  void recolor(const CurveLightsConfig &config);

  /**
   * @brief Switches blend mode; the light theme also forces a fixed dark color
   */
  void applyTheme(Theme theme);

  /**
   * @brief Submits every particle between beginFrame and endFrame
   *
   * Clears the per-particle needs-redraw flags afterwards.
   */
  void render(RenderSink &sink, const CurveLightsConfig &config);

  /**
   * @brief Releases all particles and the path reference
   */
  void dispose();

  /**
   * @brief True when a structural comet setting drifted past its threshold
   */
  bool needsRebuild(const CurveLightsConfig &config) const;

  ParticleType getType() const { return m_type; }
  size_t getParticleCount() const;
  bool isInitialized() const { return m_initialized; }
  BlendMode getBlendMode() const { return m_blendMode; }
  Theme getTheme() const { return m_theme; }
  float getThicknessHint() const { return m_thicknessHint; }
  float getBuiltTailWidth() const { return m_builtTailWidth; }
  const Path *getPath() const { return m_path.get(); }
  const ColorAssigner &getColorAssigner() const { return m_colors; }

  template <typename P> const std::vector<P> *getParticlesAs() const {
    return std::get_if<std::vector<P>>(&m_storage);
  }

  template <typename P> std::vector<P> *getParticlesAs() {
    return std::get_if<std::vector<P>>(&m_storage);
  }

private:
  struct Operations {
    void (*create)(ParticleSystem &, const CurveLightsConfig &);
    void (*update)(ParticleSystem &, const CurveLightsConfig &);
    void (*recolor)(ParticleSystem &);
    void (*lifecycle)(ParticleSystem &, const LifecycleSettings &, bool);
    void (*render)(ParticleSystem &, RenderSink &, const CurveLightsConfig &);
  };

  template <typename P> static Operations makeOperations();
  static const Operations &operationsFor(ParticleType type);

  template <typename P>
  static void createParticles(ParticleSystem &system,
                              const CurveLightsConfig &config);
  template <typename P>
  static void updateParticles(ParticleSystem &system,
                              const CurveLightsConfig &config);
  template <typename P> static void recolorParticles(ParticleSystem &system);
  template <typename P>
  static void applyLifecycle(ParticleSystem &system,
                             const LifecycleSettings &lifecycle, bool closed);
  template <typename P>
  static void renderParticles(ParticleSystem &system, RenderSink &sink,
                              const CurveLightsConfig &config);

  static float thicknessHintFor(ParticleType type,
                                const CurveLightsConfig &config);

  ParticleType m_type;
  Storage m_storage;
  std::shared_ptr<const Path> m_path;
  ColorAssigner m_colors;
  BlendMode m_blendMode{BlendMode::Additive};
  Theme m_theme{Theme::Dark};
  float m_thicknessHint{1.0f};
  float m_builtTailWidth{0.0f};
  bool m_initialized{false};
};

/**
 * @brief Maps "trail", "burst", "comet" or "headtail" to a variant
 *
 * Unknown keys log a warning and fall back to ParticleType::Trail.
 */
ParticleType particleTypeFromString(const std::string &key);

const char *particleTypeToString(ParticleType type);

} // namespace CurveLights

#endif // PARTICLE_SYSTEM_HPP
