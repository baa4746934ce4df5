/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "particles/ColorAssigner.hpp"
#include "core/Logger.hpp"
#include "utils/Color.hpp"
#include "utils/RandomUtils.hpp"

namespace CurveLights {

void ColorAssigner::configure(const ColorSettings &settings) {
  m_strategy = settings.strategy;
  m_singleColor = settings.singleColor;

  m_enabledPalette.clear();
  for (const auto &entry : settings.palette) {
    if (entry.enabled) {
      m_enabledPalette.push_back(entry.color);
    }
  }

  if (m_strategy == ColorStrategy::Palette && m_enabledPalette.empty()) {
    COLOR_DEBUG("No palette colors enabled, falling back to white");
  }
}

uint32_t ColorAssigner::assign() const {
  if (m_override) {
    return *m_override;
  }

  switch (m_strategy) {
  case ColorStrategy::Uniform:
    return m_singleColor;
  case ColorStrategy::RandomHue:
    return Color::fromHSL(randomFloat(0.0f, 1.0f), RANDOM_HUE_SATURATION,
                          RANDOM_HUE_LIGHTNESS);
  case ColorStrategy::Palette:
    if (m_enabledPalette.empty()) {
      return FALLBACK_COLOR;
    }
    return m_enabledPalette[static_cast<size_t>(
        randomInt(0, static_cast<int>(m_enabledPalette.size()) - 1))];
  default:
    return FALLBACK_COLOR;
  }
}

ColorStrategy colorStrategyFromString(const std::string &key) {
  if (key == "single" || key == "uniform") {
    return ColorStrategy::Uniform;
  }
  if (key == "rainbow" || key == "random-hue") {
    return ColorStrategy::RandomHue;
  }
  if (key == "palette") {
    return ColorStrategy::Palette;
  }
  COLOR_WARN("Unknown color mode '" + key + "', using rainbow");
  return ColorStrategy::RandomHue;
}

const char *colorStrategyToString(ColorStrategy strategy) {
  switch (strategy) {
  case ColorStrategy::Uniform:
    return "single";
  case ColorStrategy::RandomHue:
    return "rainbow";
  case ColorStrategy::Palette:
    return "palette";
  default:
    return "unknown";
  }
}

} // namespace CurveLights
