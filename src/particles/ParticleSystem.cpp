/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ParticleSystem.hpp"
#include "core/Logger.hpp"
#include "render/RenderSink.hpp"
#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>

namespace CurveLights {

namespace {

constexpr size_t TYPE_COUNT = static_cast<size_t>(ParticleType::COUNT);

size_t typeIndex(ParticleType type) {
  size_t index = static_cast<size_t>(type);
  return (index < TYPE_COUNT) ? index : 0;
}

} // anonymous namespace

// Operation templates ------------------------------------------------------

template <typename P>
void ParticleSystem::createParticles(ParticleSystem &system,
                                     const CurveLightsConfig &config) {
  auto &particles = system.m_storage.emplace<std::vector<P>>();
  const size_t count = static_cast<size_t>(std::max(config.particleCount, 0));
  particles.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    particles.emplace_back(*system.m_path, config, system.m_colors);
  }
}

template <typename P>
void ParticleSystem::updateParticles(ParticleSystem &system,
                                     const CurveLightsConfig &config) {
  for (auto &particle : std::get<std::vector<P>>(system.m_storage)) {
    particle.update(config, system.m_colors);
  }
}

template <typename P>
void ParticleSystem::recolorParticles(ParticleSystem &system) {
  for (auto &particle : std::get<std::vector<P>>(system.m_storage)) {
    particle.recolor(system.m_colors);
  }
}

template <typename P>
void ParticleSystem::applyLifecycle(ParticleSystem &system,
                                    const LifecycleSettings &lifecycle,
                                    bool closed) {
  for (auto &particle : std::get<std::vector<P>>(system.m_storage)) {
    particle.getRider().updateLifecycle(lifecycle, closed);
  }
}

template <typename P>
void ParticleSystem::renderParticles(ParticleSystem &system, RenderSink &sink,
                                     const CurveLightsConfig &config) {
  for (auto &particle : std::get<std::vector<P>>(system.m_storage)) {
    particle.render(sink, config);
    particle.getRider().needsRedraw = false;
  }
}

template <typename P> ParticleSystem::Operations ParticleSystem::makeOperations() {
  return Operations{&createParticles<P>, &updateParticles<P>,
                    &recolorParticles<P>, &applyLifecycle<P>,
                    &renderParticles<P>};
}

const ParticleSystem::Operations &ParticleSystem::operationsFor(ParticleType type) {
  // Order matches ParticleType and the Storage alternatives
  static const std::array<Operations, TYPE_COUNT> s_operations{
      makeOperations<TrailParticle>(), makeOperations<BurstParticle>(),
      makeOperations<HeadTailParticle>()};
  return s_operations[typeIndex(type)];
}

// Lifecycle ---------------------------------------------------------------

std::unique_ptr<ParticleSystem> ParticleSystem::create(ParticleType type) {
  if (typeIndex(type) != static_cast<size_t>(type)) {
    PARTICLE_WARN("Invalid particle type, using trail");
    type = ParticleType::Trail;
  }
  return std::make_unique<ParticleSystem>(type);
}

std::unique_ptr<ParticleSystem> ParticleSystem::create(const std::string &typeKey) {
  return create(particleTypeFromString(typeKey));
}

ParticleSystem::ParticleSystem(ParticleType type)
    : m_type(static_cast<ParticleType>(typeIndex(type))) {
  switch (m_type) {
  case ParticleType::Burst:
    m_storage.emplace<std::vector<BurstParticle>>();
    break;
  case ParticleType::HeadTail:
    m_storage.emplace<std::vector<HeadTailParticle>>();
    break;
  case ParticleType::Trail:
  default:
    m_storage.emplace<std::vector<TrailParticle>>();
    break;
  }
}

ParticleSystem::~ParticleSystem() { dispose(); }

void ParticleSystem::init(std::shared_ptr<const Path> path,
                          const CurveLightsConfig &config) {
  dispose();

  if (!path) {
    PARTICLE_ERROR("Cannot initialize particle system without a path");
    return;
  }

  m_path = std::move(path);
  m_colors.configure(config.color);
  if (m_theme == Theme::Light) {
    m_colors.setOverride(ColorAssigner::LIGHT_THEME_COLOR);
  }
  m_thicknessHint = thicknessHintFor(m_type, config);
  m_builtTailWidth = config.headTail.tailWidth;

  operationsFor(m_type).create(*this, config);
  operationsFor(m_type).lifecycle(*this, config.lifecycle, m_path->isClosed());
  m_initialized = true;

  PARTICLE_INFO(std::string("Created ") + std::to_string(getParticleCount()) +
                " " + particleTypeToString(m_type) + " particles");
}

void ParticleSystem::update(const CurveLightsConfig &config) {
  if (!m_initialized || !m_path) {
    return;
  }

  const Operations &ops = operationsFor(m_type);
  ops.update(*this, config);
  ops.lifecycle(*this, config.lifecycle, m_path->isClosed());
}

void ParticleSystem::recolor(const CurveLightsConfig &config) {
  m_colors.configure(config.color);
  if (!m_initialized) {
    return;
  }
  operationsFor(m_type).recolor(*this);
}

void ParticleSystem::applyTheme(Theme theme) {
  m_theme = theme;
  if (theme == Theme::Light) {
    m_blendMode = BlendMode::Normal;
    m_colors.setOverride(ColorAssigner::LIGHT_THEME_COLOR);
  } else {
    m_blendMode = BlendMode::Additive;
    m_colors.clearOverride();
  }

  if (m_initialized) {
    operationsFor(m_type).recolor(*this);
  }
}

void ParticleSystem::render(RenderSink &sink, const CurveLightsConfig &config) {
  sink.beginFrame(m_blendMode, m_thicknessHint);
  if (m_initialized) {
    operationsFor(m_type).render(*this, sink, config);
  }
  sink.endFrame();
}

void ParticleSystem::dispose() {
  std::visit(
      [](auto &particles) {
        using Vec = std::decay_t<decltype(particles)>;
        Vec().swap(particles);
      },
      m_storage);
  m_path.reset();
  m_initialized = false;
}

bool ParticleSystem::needsRebuild(const CurveLightsConfig &config) const {
  if (!m_initialized || m_type != ParticleType::HeadTail) {
    return false;
  }
  return std::fabs(config.headTail.tailWidth - m_builtTailWidth) >
         TAIL_WIDTH_REBUILD_THRESHOLD;
}

size_t ParticleSystem::getParticleCount() const {
  return std::visit([](const auto &particles) { return particles.size(); },
                    m_storage);
}

float ParticleSystem::thicknessHintFor(ParticleType type,
                                       const CurveLightsConfig &config) {
  switch (type) {
  case ParticleType::Burst:
    return config.burst.sparkSize;
  case ParticleType::HeadTail:
    return config.particleSize * (1.0f + std::max(config.headTail.tailWidth, 0.0f));
  case ParticleType::Trail:
  default:
    return config.particleSize;
  }
}

ParticleType particleTypeFromString(const std::string &key) {
  if (key == "trail") {
    return ParticleType::Trail;
  }
  if (key == "burst") {
    return ParticleType::Burst;
  }
  if (key == "comet" || key == "headtail") {
    return ParticleType::HeadTail;
  }
  PARTICLE_WARN("Unknown particle type '" + key + "', using trail");
  return ParticleType::Trail;
}

const char *particleTypeToString(ParticleType type) {
  switch (type) {
  case ParticleType::Trail:
    return "trail";
  case ParticleType::Burst:
    return "burst";
  case ParticleType::HeadTail:
    return "comet";
  default:
    return "unknown";
  }
}

} // namespace CurveLights
