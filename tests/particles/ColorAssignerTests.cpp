/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ColorAssignerTests
#include <boost/test/unit_test.hpp>

#include "core/CurveLightsConfig.hpp"
#include "core/Logger.hpp"
#include "particles/ColorAssigner.hpp"
#include "utils/Color.hpp"
#include <set>

using namespace CurveLights;

struct ColorAssignerFixture {
  ColorSettings settings;

  ColorAssignerFixture() {
    CURVELIGHTS_ENABLE_BENCHMARK_MODE();
    settings.palette = {PaletteEntry{0xFF0000FF, false}, PaletteEntry{0x00FF00FF, true},
                        PaletteEntry{0x0000FFFF, false}, PaletteEntry{0xFFFF00FF, true},
                        PaletteEntry{0x00FFFFFF, false}};
  }

  ~ColorAssignerFixture() { CURVELIGHTS_DISABLE_BENCHMARK_MODE(); }
};

BOOST_FIXTURE_TEST_SUITE(ColorAssignerTestSuite, ColorAssignerFixture)

BOOST_AUTO_TEST_CASE(TestPaletteUsesOnlyEnabledEntries) {
  settings.strategy = ColorStrategy::Palette;
  ColorAssigner assigner(settings);

  BOOST_CHECK_EQUAL(assigner.getEnabledPalette().size(), 2u);

  std::set<uint32_t> seen;
  for (int i = 0; i < 500; ++i) {
    uint32_t color = assigner.assign();
    BOOST_CHECK(color == 0x00FF00FF || color == 0xFFFF00FF);
    seen.insert(color);
  }
  // Both enabled entries show up over enough draws
  BOOST_CHECK_EQUAL(seen.size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestEmptyPaletteFallsBackToWhite) {
  settings.strategy = ColorStrategy::Palette;
  for (auto &entry : settings.palette) {
    entry.enabled = false;
  }
  ColorAssigner assigner(settings);

  BOOST_CHECK(assigner.getEnabledPalette().empty());
  for (int i = 0; i < 20; ++i) {
    BOOST_CHECK_EQUAL(assigner.assign(), ColorAssigner::FALLBACK_COLOR);
  }
}

BOOST_AUTO_TEST_CASE(TestUniformReturnsSingleColor) {
  settings.strategy = ColorStrategy::Uniform;
  settings.singleColor = 0x123456FF;
  ColorAssigner assigner(settings);

  for (int i = 0; i < 20; ++i) {
    BOOST_CHECK_EQUAL(assigner.assign(), 0x123456FFu);
  }
}

BOOST_AUTO_TEST_CASE(TestRandomHueIsOpaqueAndVaried) {
  settings.strategy = ColorStrategy::RandomHue;
  ColorAssigner assigner(settings);

  std::set<uint32_t> seen;
  for (int i = 0; i < 100; ++i) {
    uint32_t color = assigner.assign();
    BOOST_CHECK_EQUAL(Color::alpha(color), 0xFF);
    seen.insert(color);
  }
  BOOST_CHECK(seen.size() > 10);
}

BOOST_AUTO_TEST_CASE(TestOverrideWinsOverStrategy) {
  settings.strategy = ColorStrategy::Palette;
  ColorAssigner assigner(settings);

  assigner.setOverride(ColorAssigner::LIGHT_THEME_COLOR);
  BOOST_CHECK(assigner.hasOverride());
  for (int i = 0; i < 20; ++i) {
    BOOST_CHECK_EQUAL(assigner.assign(), ColorAssigner::LIGHT_THEME_COLOR);
  }

  assigner.clearOverride();
  BOOST_CHECK(!assigner.hasOverride());
  uint32_t color = assigner.assign();
  BOOST_CHECK(color == 0x00FF00FF || color == 0xFFFF00FF);
}

BOOST_AUTO_TEST_CASE(TestReconfigureKeepsOverride) {
  ColorAssigner assigner(settings);
  assigner.setOverride(0xABCDEFFF);

  settings.strategy = ColorStrategy::Uniform;
  assigner.configure(settings);
  BOOST_CHECK(assigner.getStrategy() == ColorStrategy::Uniform);
  BOOST_CHECK_EQUAL(assigner.assign(), 0xABCDEFFFu);
}

BOOST_AUTO_TEST_CASE(TestModeKeys) {
  BOOST_CHECK(colorStrategyFromString("single") == ColorStrategy::Uniform);
  BOOST_CHECK(colorStrategyFromString("uniform") == ColorStrategy::Uniform);
  BOOST_CHECK(colorStrategyFromString("rainbow") == ColorStrategy::RandomHue);
  BOOST_CHECK(colorStrategyFromString("random-hue") == ColorStrategy::RandomHue);
  BOOST_CHECK(colorStrategyFromString("palette") == ColorStrategy::Palette);
  BOOST_CHECK(colorStrategyFromString("sepia") == ColorStrategy::RandomHue);

  BOOST_CHECK_EQUAL(std::string(colorStrategyToString(ColorStrategy::Uniform)), "single");
  BOOST_CHECK_EQUAL(std::string(colorStrategyToString(ColorStrategy::Palette)), "palette");
}

BOOST_AUTO_TEST_SUITE_END()
