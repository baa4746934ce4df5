/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ConfigLoaderTests
#include <boost/test/unit_test.hpp>

#include "core/ConfigLoader.hpp"
#include "core/CurveLightsConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <string>

using namespace CurveLights;

struct ConfigLoaderFixture {
  SettingsManager &settings = SettingsManager::Instance();
  CurveLightsConfig config;

  ConfigLoaderFixture() {
    CURVELIGHTS_ENABLE_BENCHMARK_MODE();
    settings.clearAll();
  }

  ~ConfigLoaderFixture() {
    settings.clearAll();
    CURVELIGHTS_DISABLE_BENCHMARK_MODE();
  }
};

BOOST_FIXTURE_TEST_SUITE(ConfigLoaderTestSuite, ConfigLoaderFixture)

BOOST_AUTO_TEST_CASE(TestEmptySettingsKeepDefaults) {
  loadConfig(settings, config);

  BOOST_CHECK(config.particleType == ParticleType::Trail);
  BOOST_CHECK_EQUAL(config.particleCount, 350);
  BOOST_CHECK_EQUAL(config.trailLength, 24);
  BOOST_CHECK_CLOSE(config.speedFactor, 0.004f, 0.001f);
  BOOST_CHECK_CLOSE(config.scatterRadius, 1.3f, 0.001f);
  BOOST_CHECK(config.path.family == PathFamily::Viviani);
  BOOST_CHECK_CLOSE(config.path.vivianiA, 5.0f, 0.001f);
  BOOST_CHECK_EQUAL(config.path.vivianiSamples, 256);
  BOOST_CHECK(config.color.strategy == ColorStrategy::Palette);
  BOOST_CHECK_CLOSE(config.render.bloomStrength, 2.5f, 0.001f);
  BOOST_CHECK_CLOSE(config.render.bloomRadius, 0.5f, 0.001f);
  BOOST_CHECK_CLOSE(config.render.bloomThreshold, 0.04f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestParticleAndPathKeys) {
  settings.set("particles", "type", std::string("comet"));
  settings.set("particles", "count", 120);
  settings.set("particles", "trail_length", 40);
  settings.set("particles", "speed_factor", 0.01f);
  settings.set("particles", "scatter_radius", 2);
  settings.set("path", "family", std::string("lorenz"));
  settings.set("path", "lorenz_steps", 1500);
  settings.set("path", "lorenz_rho", 30.0f);
  settings.set("path", "lemniscate_width", 6.5f);

  loadConfig(settings, config);

  BOOST_CHECK(config.particleType == ParticleType::HeadTail);
  BOOST_CHECK_EQUAL(config.particleCount, 120);
  BOOST_CHECK_EQUAL(config.trailLength, 40);
  BOOST_CHECK_CLOSE(config.speedFactor, 0.01f, 0.001f);
  BOOST_CHECK_CLOSE(config.scatterRadius, 2.0f, 0.001f);
  BOOST_CHECK(config.path.family == PathFamily::Lorenz);
  BOOST_CHECK_EQUAL(config.path.lorenzSteps, 1500);
  BOOST_CHECK_CLOSE(config.path.lorenzRho, 30.0f, 0.001f);
  BOOST_CHECK_CLOSE(config.path.lemniscateWidth, 6.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestColorKeys) {
  settings.set("color", "mode", std::string("single"));
  settings.set("color", "single", std::string("#336699"));
  settings.set("color", "palette2", std::string("#102030ff"));
  settings.set("color", "palette4_enabled", false);

  loadConfig(settings, config);

  BOOST_CHECK(config.color.strategy == ColorStrategy::Uniform);
  BOOST_CHECK_EQUAL(config.color.singleColor, 0x336699FFu);
  BOOST_CHECK_EQUAL(config.color.palette[1].color, 0x102030FFu);
  BOOST_CHECK(!config.color.palette[3].enabled);
  BOOST_CHECK(config.color.palette[0].enabled);
}

BOOST_AUTO_TEST_CASE(TestMalformedColorKeepsPrevious) {
  settings.set("color", "single", std::string("not-a-color"));
  loadConfig(settings, config);
  BOOST_CHECK_EQUAL(config.color.singleColor, 0xFFFFFFFFu);
}

BOOST_AUTO_TEST_CASE(TestLifecycleBurstCometRenderKeys) {
  settings.set("lifecycle", "enabled", false);
  settings.set("lifecycle", "fade_in", 0.2f);
  settings.set("lifecycle", "random_offset_max", 0.5f);
  settings.set("burst", "emission_probability", 0.25f);
  settings.set("burst", "max_sparks", 9);
  settings.set("burst", "path_follow", 0.3f);
  settings.set("comet", "tail_width", 2.5f);
  settings.set("comet", "head_size", 4);
  settings.set("render", "theme", std::string("light"));
  settings.set("render", "line_alpha", 0.5f);

  loadConfig(settings, config);

  BOOST_CHECK(!config.lifecycle.enabled);
  BOOST_CHECK_CLOSE(config.lifecycle.fadeIn, 0.2f, 0.001f);
  BOOST_CHECK_CLOSE(config.lifecycle.randomOffsetMax, 0.5f, 0.001f);
  BOOST_CHECK_CLOSE(config.burst.emissionProbability, 0.25f, 0.001f);
  BOOST_CHECK_EQUAL(config.burst.maxSparks, 9);
  BOOST_CHECK_CLOSE(config.burst.pathFollow, 0.3f, 0.001f);
  BOOST_CHECK_CLOSE(config.headTail.tailWidth, 2.5f, 0.001f);
  BOOST_CHECK_CLOSE(config.headTail.headSize, 4.0f, 0.001f);
  BOOST_CHECK(config.render.theme == Theme::Light);
  BOOST_CHECK_CLOSE(config.render.lineAlpha, 0.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestUnknownKeysAreIgnored) {
  settings.set("particles", "sparkle", 99);
  settings.set("telemetry", "enabled", true);
  settings.set("particles", "type", std::string("fireworks"));

  CurveLightsConfig defaults;
  loadConfig(settings, config);

  BOOST_CHECK_EQUAL(config.particleCount, defaults.particleCount);
  BOOST_CHECK(config.particleType == ParticleType::Trail);
}

BOOST_AUTO_TEST_CASE(TestClassifySettingChange) {
  BOOST_CHECK(classifySettingChange("path", "family") == SettingImpact::RebuildPath);
  BOOST_CHECK(classifySettingChange("path", "viviani_a") == SettingImpact::RebuildPath);
  BOOST_CHECK(classifySettingChange("color", "mode") == SettingImpact::Recolor);
  BOOST_CHECK(classifySettingChange("color", "palette3_enabled") == SettingImpact::Recolor);
  BOOST_CHECK(classifySettingChange("render", "theme") == SettingImpact::ThemeChange);
  BOOST_CHECK(classifySettingChange("render", "bloom_strength") == SettingImpact::Live);

  for (const char *key : {"count", "trail_length", "scatter_radius", "size", "type"}) {
    BOOST_CHECK(classifySettingChange("particles", key) == SettingImpact::RebuildSystem);
  }
  BOOST_CHECK(classifySettingChange("particles", "speed_factor") == SettingImpact::Live);
  BOOST_CHECK(classifySettingChange("lifecycle", "random_offset_max") == SettingImpact::RebuildSystem);
  BOOST_CHECK(classifySettingChange("lifecycle", "fade_in") == SettingImpact::Live);
  BOOST_CHECK(classifySettingChange("comet", "tail_width") == SettingImpact::Live);
  BOOST_CHECK(classifySettingChange("burst", "max_sparks") == SettingImpact::Live);
}

BOOST_AUTO_TEST_CASE(TestThemeKeys) {
  BOOST_CHECK(themeFromString("dark") == Theme::Dark);
  BOOST_CHECK(themeFromString("light") == Theme::Light);
  BOOST_CHECK(themeFromString("sepia") == Theme::Dark);
  BOOST_CHECK_EQUAL(std::string(themeToString(Theme::Light)), "light");
}

BOOST_AUTO_TEST_SUITE_END()
