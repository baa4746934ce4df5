/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ParticleSystemTests
#include <boost/test/unit_test.hpp>

#include "core/CurveLightsConfig.hpp"
#include "core/Logger.hpp"
#include "particles/ParticleSystem.hpp"
#include "path/PathGenerator.hpp"
#include "render/RenderSink.hpp"
#include <memory>
#include <vector>

using namespace CurveLights;

namespace {

// Records the frame protocol so tests can inspect what a renderer would see
class RecordingSink : public RenderSink {
public:
  void beginFrame(BlendMode blendMode, float thicknessHint) override {
    ++beginCount;
    lastBlendMode = blendMode;
    lastThickness = thicknessHint;
    batches.clear();
    inFrame = true;
  }

  void submit(const RenderBatch &batch) override {
    BOOST_CHECK(inFrame);
    batches.push_back(batch);
  }

  void endFrame() override {
    ++endCount;
    inFrame = false;
  }

  int beginCount{0};
  int endCount{0};
  bool inFrame{false};
  BlendMode lastBlendMode{BlendMode::Additive};
  float lastThickness{0.0f};
  std::vector<RenderBatch> batches;
};

} // namespace

struct ParticleSystemFixture {
  CurveLightsConfig config;
  std::shared_ptr<const Path> path;

  ParticleSystemFixture() {
    CURVELIGHTS_ENABLE_BENCHMARK_MODE();
    config.particleCount = 40;
    config.trailLength = 12;
    path = PathGenerator::build(config.path);
  }

  ~ParticleSystemFixture() { CURVELIGHTS_DISABLE_BENCHMARK_MODE(); }
};

BOOST_FIXTURE_TEST_SUITE(ParticleSystemTestSuite, ParticleSystemFixture)

BOOST_AUTO_TEST_CASE(TestCreateByKey) {
  BOOST_CHECK(ParticleSystem::create("trail")->getType() == ParticleType::Trail);
  BOOST_CHECK(ParticleSystem::create("burst")->getType() == ParticleType::Burst);
  BOOST_CHECK(ParticleSystem::create("comet")->getType() == ParticleType::HeadTail);
  BOOST_CHECK(ParticleSystem::create("headtail")->getType() == ParticleType::HeadTail);

  // Unknown keys fall back instead of failing
  auto fallback = ParticleSystem::create("fireworks");
  BOOST_REQUIRE(fallback);
  BOOST_CHECK(fallback->getType() == ParticleType::Trail);

  auto invalid = ParticleSystem::create(static_cast<ParticleType>(42));
  BOOST_CHECK(invalid->getType() == ParticleType::Trail);
}

BOOST_AUTO_TEST_CASE(TestInitBuildsConfiguredCount) {
  for (int i = 0; i < static_cast<int>(ParticleType::COUNT); ++i) {
    auto system = ParticleSystem::create(static_cast<ParticleType>(i));
    BOOST_CHECK(!system->isInitialized());
    BOOST_CHECK_EQUAL(system->getParticleCount(), 0u);

    system->init(path, config);
    BOOST_CHECK(system->isInitialized());
    BOOST_CHECK_EQUAL(system->getParticleCount(), 40u);
    BOOST_CHECK(system->getPath() == path.get());
  }
}

BOOST_AUTO_TEST_CASE(TestInitWithoutPathFails) {
  auto system = ParticleSystem::create(ParticleType::Trail);
  system->init(nullptr, config);
  BOOST_CHECK(!system->isInitialized());
  BOOST_CHECK_EQUAL(system->getParticleCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestReinitReplacesParticles) {
  auto system = ParticleSystem::create(ParticleType::Trail);
  system->init(path, config);

  config.particleCount = 7;
  system->init(path, config);
  BOOST_CHECK_EQUAL(system->getParticleCount(), 7u);
}

BOOST_AUTO_TEST_CASE(TestUpdateKeepsLifecycleInRange) {
  auto system = ParticleSystem::create(ParticleType::Trail);
  system->init(path, config);

  for (int tick = 0; tick < 300; ++tick) {
    system->update(config);
  }

  const auto *trails = system->getParticlesAs<TrailParticle>();
  BOOST_REQUIRE(trails);
  for (const auto &trail : *trails) {
    const PathRider &rider = trail.getRider();
    BOOST_CHECK(rider.currentT >= 0.0f && rider.currentT < 1.0f);
    BOOST_CHECK(rider.lifecycleAlpha >= 0.0f && rider.lifecycleAlpha <= 1.0f);
  }
  BOOST_CHECK(system->getParticlesAs<BurstParticle>() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestDisabledLifecycleOnClosedPathIsOpaque) {
  config.lifecycle.enabled = false;
  auto system = ParticleSystem::create(ParticleType::HeadTail);
  system->init(path, config);
  system->update(config);

  for (const auto &comet : *system->getParticlesAs<HeadTailParticle>()) {
    BOOST_CHECK_CLOSE(comet.getRider().lifecycleAlpha, 1.0f, 0.001f);
  }
}

BOOST_AUTO_TEST_CASE(TestRenderProtocol) {
  auto system = ParticleSystem::create(ParticleType::Trail);
  system->init(path, config);

  RecordingSink sink;
  system->render(sink, config);

  BOOST_CHECK_EQUAL(sink.beginCount, 1);
  BOOST_CHECK_EQUAL(sink.endCount, 1);
  BOOST_CHECK_EQUAL(sink.batches.size(), 40u);
  BOOST_CHECK(sink.lastBlendMode == BlendMode::Additive);
  BOOST_CHECK_CLOSE(sink.lastThickness, config.particleSize, 0.001f);
  for (const auto &batch : sink.batches) {
    BOOST_CHECK(batch.needsRedraw);
    BOOST_CHECK_EQUAL(batch.count, 12u);
  }

  // Flags are cleared once drawn and set again by the next tick
  system->render(sink, config);
  for (const auto &batch : sink.batches) {
    BOOST_CHECK(!batch.needsRedraw);
  }
  system->update(config);
  system->render(sink, config);
  for (const auto &batch : sink.batches) {
    BOOST_CHECK(batch.needsRedraw);
  }
}

BOOST_AUTO_TEST_CASE(TestCometBatchesPerParticle) {
  config.headTail.tailWidth = 1.0f;
  auto system = ParticleSystem::create(ParticleType::HeadTail);
  system->init(path, config);

  RecordingSink sink;
  system->render(sink, config);

  // Centre strand + floor(2 * width) wide strands + head
  BOOST_CHECK_EQUAL(sink.batches.size(), 40u * (1u + 2u + 1u));
  BOOST_CHECK_CLOSE(sink.lastThickness, config.particleSize * 2.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestLightThemeForcesDarkColorAndNormalBlend) {
  auto system = ParticleSystem::create(ParticleType::Trail);
  system->init(path, config);

  system->applyTheme(Theme::Light);
  BOOST_CHECK(system->getTheme() == Theme::Light);
  BOOST_CHECK(system->getBlendMode() == BlendMode::Normal);
  for (const auto &trail : *system->getParticlesAs<TrailParticle>()) {
    BOOST_CHECK_EQUAL(trail.getRider().color, ColorAssigner::LIGHT_THEME_COLOR);
  }

  // Recolor while light keeps the override
  system->recolor(config);
  for (const auto &trail : *system->getParticlesAs<TrailParticle>()) {
    BOOST_CHECK_EQUAL(trail.getRider().color, ColorAssigner::LIGHT_THEME_COLOR);
  }

  RecordingSink sink;
  system->render(sink, config);
  BOOST_CHECK(sink.lastBlendMode == BlendMode::Normal);

  system->applyTheme(Theme::Dark);
  BOOST_CHECK(system->getBlendMode() == BlendMode::Additive);
  BOOST_CHECK(!system->getColorAssigner().hasOverride());
}

BOOST_AUTO_TEST_CASE(TestThemeAppliedBeforeInitSurvivesInit) {
  auto system = ParticleSystem::create(ParticleType::HeadTail);
  system->applyTheme(Theme::Light);
  system->init(path, config);

  for (const auto &comet : *system->getParticlesAs<HeadTailParticle>()) {
    BOOST_CHECK_EQUAL(comet.getRider().color, ColorAssigner::LIGHT_THEME_COLOR);
  }
}

BOOST_AUTO_TEST_CASE(TestRecolorUsesNewSettings) {
  auto system = ParticleSystem::create(ParticleType::Trail);
  system->init(path, config);

  config.color.strategy = ColorStrategy::Uniform;
  config.color.singleColor = 0x445566FF;
  system->recolor(config);

  for (const auto &trail : *system->getParticlesAs<TrailParticle>()) {
    BOOST_CHECK_EQUAL(trail.getRider().color, 0x445566FFu);
  }
}

BOOST_AUTO_TEST_CASE(TestBurstIgnoresPaletteRecolor) {
  auto system = ParticleSystem::create(ParticleType::Burst);
  system->init(path, config);

  config.color.strategy = ColorStrategy::Uniform;
  config.color.singleColor = 0x445566FF;
  system->recolor(config);

  for (const auto &burst : *system->getParticlesAs<BurstParticle>()) {
    BOOST_CHECK_EQUAL(burst.getRider().color, ColorAssigner::BURST_HEAT_COLOR);
  }
}

BOOST_AUTO_TEST_CASE(TestDispose) {
  auto system = ParticleSystem::create(ParticleType::Burst);
  system->init(path, config);
  system->dispose();

  BOOST_CHECK(!system->isInitialized());
  BOOST_CHECK_EQUAL(system->getParticleCount(), 0u);
  BOOST_CHECK(system->getPath() == nullptr);
  BOOST_CHECK_EQUAL(path.use_count(), 1);

  // Ticking or drawing a disposed system is harmless
  system->update(config);
  RecordingSink sink;
  system->render(sink, config);
  BOOST_CHECK(sink.batches.empty());
  BOOST_CHECK_EQUAL(sink.endCount, 1);
}

BOOST_AUTO_TEST_CASE(TestCometWidthRebuildThreshold) {
  config.headTail.tailWidth = 1.0f;
  auto comet = ParticleSystem::create(ParticleType::HeadTail);
  comet->init(path, config);

  BOOST_CHECK(!comet->needsRebuild(config));
  config.headTail.tailWidth = 1.04f;
  BOOST_CHECK(!comet->needsRebuild(config));
  config.headTail.tailWidth = 1.2f;
  BOOST_CHECK(comet->needsRebuild(config));

  auto trail = ParticleSystem::create(ParticleType::Trail);
  trail->init(path, config);
  config.headTail.tailWidth = 3.0f;
  BOOST_CHECK(!trail->needsRebuild(config));
}

BOOST_AUTO_TEST_CASE(TestTypeKeys) {
  BOOST_CHECK(particleTypeFromString("trail") == ParticleType::Trail);
  BOOST_CHECK(particleTypeFromString("burst") == ParticleType::Burst);
  BOOST_CHECK(particleTypeFromString("comet") == ParticleType::HeadTail);
  BOOST_CHECK(particleTypeFromString("") == ParticleType::Trail);
  BOOST_CHECK_EQUAL(std::string(particleTypeToString(ParticleType::HeadTail)), "comet");
}

BOOST_AUTO_TEST_SUITE_END()
