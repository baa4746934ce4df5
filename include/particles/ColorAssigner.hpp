/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLOR_ASSIGNER_HPP
#define COLOR_ASSIGNER_HPP

#include "core/CurveLightsConfig.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace CurveLights {

/**
 * @brief Picks particle colors according to the configured strategy
 *
 * - Uniform: always the single configured color
 * - RandomHue: HSL(random, 0.7, 0.6), new on every call
 * - Palette: uniform pick among enabled palette entries, white if none
 *
 * An override (used by the light theme) replaces every strategy until it is
 * cleared.
 */
class ColorAssigner {
public:
  static constexpr uint32_t FALLBACK_COLOR = 0xFFFFFFFF;
  static constexpr uint32_t LIGHT_THEME_COLOR = 0x1A1A2EFF;
  static constexpr uint32_t BURST_HEAT_COLOR = 0xFFB347FF;
  static constexpr float RANDOM_HUE_SATURATION = 0.7f;
  static constexpr float RANDOM_HUE_LIGHTNESS = 0.6f;

  ColorAssigner() { configure(ColorSettings{}); }
  explicit ColorAssigner(const ColorSettings &settings) { configure(settings); }

  /**
   * @brief Replaces strategy, single color and palette
   */
  void configure(const ColorSettings &settings);

  /**
   * @brief Returns a color for a newly created or just-looped particle
   */
  uint32_t assign() const;

  void setOverride(uint32_t color) { m_override = color; }
  void clearOverride() { m_override.reset(); }
  bool hasOverride() const { return m_override.has_value(); }
  std::optional<uint32_t> getOverride() const { return m_override; }

  ColorStrategy getStrategy() const { return m_strategy; }
  const std::vector<uint32_t> &getEnabledPalette() const {
    return m_enabledPalette;
  }

private:
  ColorStrategy m_strategy{ColorStrategy::Palette};
  uint32_t m_singleColor{FALLBACK_COLOR};
  std::vector<uint32_t> m_enabledPalette;
  std::optional<uint32_t> m_override;
};

/**
 * @brief Maps "single"/"uniform", "rainbow"/"random-hue" or "palette"
 *
 * Unknown keys log a warning and fall back to ColorStrategy::RandomHue.
 */
ColorStrategy colorStrategyFromString(const std::string &key);

const char *colorStrategyToString(ColorStrategy strategy);

} // namespace CurveLights

#endif // COLOR_ASSIGNER_HPP
