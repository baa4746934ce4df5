/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "path/PathGenerator.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace CurveLights {

namespace {

constexpr float TWO_PI = 2.0f * std::numbers::pi_v<float>;
constexpr float LORENZ_MAX_STEP = 0.05f;

void padToMinimum(std::vector<Vector3D> &points) {
  const Vector3D fill = points.empty() ? Vector3D() : points.back();
  while (points.size() < static_cast<size_t>(PathGenerator::MIN_POINTS)) {
    points.push_back(fill);
  }
}

} // anonymous namespace

Vector3D PathGenerator::vivianiPoint(float a, float t) {
  return Vector3D(a * (1.0f + std::cos(t)), a * std::sin(t),
                  2.0f * a * std::sin(t * 0.5f));
}

bool PathGenerator::isClosedFamily(PathFamily family) {
  return family != PathFamily::Lorenz;
}

GeneratedPath PathGenerator::generateViviani(float a, int samples) {
  const int count = std::max(samples, MIN_POINTS);

  GeneratedPath result;
  result.closed = true;
  result.points.reserve(static_cast<size_t>(count));

  for (int i = 0; i < count; ++i) {
    float t = 2.0f * TWO_PI * static_cast<float>(i) / static_cast<float>(count);
    result.points.push_back(vivianiPoint(a, t));
  }
  return result;
}

GeneratedPath PathGenerator::generateLorenz(const PathSettings &settings) {
  const int steps = std::max(settings.lorenzSteps, MIN_POINTS);
  const float dt = std::clamp(settings.lorenzStepSize, 1e-5f, LORENZ_MAX_STEP);
  const float sigma = settings.lorenzSigma;
  const float rho = settings.lorenzRho;
  const float beta = settings.lorenzBeta;
  const float scale = settings.lorenzScale;

  GeneratedPath result;
  result.closed = false;
  result.points.reserve(static_cast<size_t>(steps));

  float x = settings.lorenzStart.getX();
  float y = settings.lorenzStart.getY();
  float z = settings.lorenzStart.getZ();

  for (int i = 0; i < steps; ++i) {
    float dx = sigma * (y - x);
    float dy = x * (rho - z) - y;
    float dz = x * y - beta * z;
    x += dx * dt;
    y += dy * dt;
    z += dz * dt;

    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z)) {
      PATH_WARN("Lorenz integration diverged after " + std::to_string(i) +
                " steps, truncating path");
      break;
    }

    result.points.emplace_back(x * scale, z * scale, y * scale);
  }

  padToMinimum(result.points);
  return result;
}

GeneratedPath PathGenerator::generateLemniscate(float width, float height,
                                                int samples) {
  const int count = std::max(samples, MIN_POINTS);

  GeneratedPath result;
  result.closed = true;
  result.points.reserve(static_cast<size_t>(count));

  for (int i = 0; i < count; ++i) {
    float s = TWO_PI * static_cast<float>(i) / static_cast<float>(count);
    float sinS = std::sin(s);
    float cosS = std::cos(s);
    result.points.emplace_back(width * sinS, height * sinS * cosS,
                               0.2f * height * cosS);
  }
  return result;
}

GeneratedPath PathGenerator::generate(const PathSettings &settings) {
  switch (settings.family) {
  case PathFamily::Lorenz:
    return generateLorenz(settings);
  case PathFamily::Lemniscate:
    return generateLemniscate(settings.lemniscateWidth,
                              settings.lemniscateHeight,
                              settings.lemniscateSamples);
  case PathFamily::Viviani:
  default:
    return generateViviani(settings.vivianiA, settings.vivianiSamples);
  }
}

std::shared_ptr<const Path> PathGenerator::build(const PathSettings &settings) {
  GeneratedPath generated = generate(settings);
  const size_t pointCount = generated.points.size();
  auto path = std::make_shared<const Path>(std::move(generated.points),
                                           generated.closed);

  PATH_INFO(std::string("Built ") + pathFamilyToString(settings.family) +
            " path: " + std::to_string(pointCount) + " points, length " +
            std::to_string(path->getLength()) +
            (path->isClosed() ? ", closed" : ", open"));
  return path;
}

PathFamily pathFamilyFromString(const std::string &key) {
  if (key == "viviani") {
    return PathFamily::Viviani;
  }
  if (key == "lorenz") {
    return PathFamily::Lorenz;
  }
  if (key == "lemniscate") {
    return PathFamily::Lemniscate;
  }
  PATH_WARN("Unknown path family '" + key + "', using viviani");
  return PathFamily::Viviani;
}

const char *pathFamilyToString(PathFamily family) {
  switch (family) {
  case PathFamily::Viviani:
    return "viviani";
  case PathFamily::Lorenz:
    return "lorenz";
  case PathFamily::Lemniscate:
    return "lemniscate";
  default:
    return "unknown";
  }
}

} // namespace CurveLights
