/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE PathGeneratorTests
#include <boost/test/unit_test.hpp>

#include "core/CurveLightsConfig.hpp"
#include "core/Logger.hpp"
#include "path/Path.hpp"
#include "path/PathGenerator.hpp"
#include <cmath>
#include <numbers>

using namespace CurveLights;

namespace {

bool allFinite(const GeneratedPath &generated) {
  for (const auto &p : generated.points) {
    if (!std::isfinite(p.getX()) || !std::isfinite(p.getY()) || !std::isfinite(p.getZ())) {
      return false;
    }
  }
  return true;
}

} // namespace

struct PathGeneratorFixture {
  PathGeneratorFixture() { CURVELIGHTS_ENABLE_BENCHMARK_MODE(); }
  ~PathGeneratorFixture() { CURVELIGHTS_DISABLE_BENCHMARK_MODE(); }
};

BOOST_FIXTURE_TEST_SUITE(PathGeneratorTestSuite, PathGeneratorFixture)

BOOST_AUTO_TEST_CASE(TestVivianiDefaults) {
  PathSettings settings;
  GeneratedPath viviani = PathGenerator::generate(settings);

  BOOST_CHECK(viviani.closed);
  BOOST_CHECK_EQUAL(viviani.points.size(), 256u);
  BOOST_CHECK_CLOSE(viviani.points[0].getX(), 10.0f, 0.001f);
  BOOST_CHECK_SMALL(viviani.points[0].getY(), 1e-5f);
  BOOST_CHECK_SMALL(viviani.points[0].getZ(), 1e-5f);
  BOOST_CHECK(allFinite(viviani));
}

BOOST_AUTO_TEST_CASE(TestVivianiPointFormula) {
  const float pi = std::numbers::pi_v<float>;

  Vector3D start = PathGenerator::vivianiPoint(5.0f, 0.0f);
  BOOST_CHECK_CLOSE(start.getX(), 10.0f, 0.001f);
  BOOST_CHECK_SMALL(start.getY(), 1e-5f);
  BOOST_CHECK_SMALL(start.getZ(), 1e-5f);

  Vector3D half = PathGenerator::vivianiPoint(5.0f, pi);
  BOOST_CHECK_SMALL(half.getX(), 1e-4f);
  BOOST_CHECK_SMALL(half.getY(), 1e-4f);
  BOOST_CHECK_CLOSE(half.getZ(), 10.0f, 0.001f);

  // Every point lies on the sphere of radius 2a centred at the origin
  for (float t : {0.3f, 1.7f, 4.0f, 10.5f}) {
    BOOST_CHECK_CLOSE(PathGenerator::vivianiPoint(5.0f, t).length(), 10.0f, 0.01f);
  }
}

BOOST_AUTO_TEST_CASE(TestSampleCountHasFloor) {
  BOOST_CHECK_EQUAL(PathGenerator::generateViviani(5.0f, 0).points.size(),
                    static_cast<size_t>(PathGenerator::MIN_POINTS));
  BOOST_CHECK_EQUAL(PathGenerator::generateLemniscate(8.0f, 5.0f, -10).points.size(),
                    static_cast<size_t>(PathGenerator::MIN_POINTS));

  PathSettings settings;
  settings.family = PathFamily::Lorenz;
  settings.lorenzSteps = 1;
  BOOST_CHECK_EQUAL(PathGenerator::generate(settings).points.size(),
                    static_cast<size_t>(PathGenerator::MIN_POINTS));
}

BOOST_AUTO_TEST_CASE(TestLorenzIsOpenAndFinite) {
  PathSettings settings;
  settings.family = PathFamily::Lorenz;
  GeneratedPath lorenz = PathGenerator::generate(settings);

  BOOST_CHECK(!lorenz.closed);
  BOOST_CHECK_EQUAL(lorenz.points.size(), static_cast<size_t>(settings.lorenzSteps));
  BOOST_CHECK(allFinite(lorenz));

  // The attractor stays bounded: |x| < 30, |y| < 35 and z < 60 before scaling
  for (const auto &p : lorenz.points) {
    BOOST_CHECK(std::fabs(p.getX()) < 30.0f * settings.lorenzScale);
    BOOST_CHECK(std::fabs(p.getZ()) < 35.0f * settings.lorenzScale);
    BOOST_CHECK(p.getY() < 60.0f * settings.lorenzScale);
  }
}

BOOST_AUTO_TEST_CASE(TestLorenzDivergenceIsTruncated) {
  PathSettings settings;
  settings.family = PathFamily::Lorenz;
  settings.lorenzSigma = 1e30f;
  settings.lorenzStepSize = 0.05f;

  GeneratedPath lorenz = PathGenerator::generate(settings);
  BOOST_CHECK(lorenz.points.size() >= static_cast<size_t>(PathGenerator::MIN_POINTS));
  BOOST_CHECK(lorenz.points.size() < static_cast<size_t>(settings.lorenzSteps));
  BOOST_CHECK(allFinite(lorenz));
}

BOOST_AUTO_TEST_CASE(TestLemniscateShape) {
  GeneratedPath lemniscate = PathGenerator::generateLemniscate(8.0f, 5.0f, 256);
  BOOST_CHECK(lemniscate.closed);
  BOOST_CHECK_SMALL(lemniscate.points[0].getX(), 1e-5f);
  BOOST_CHECK_SMALL(lemniscate.points[0].getY(), 1e-5f);
  BOOST_CHECK_CLOSE(lemniscate.points[0].getZ(), 1.0f, 0.001f);

  for (const auto &p : lemniscate.points) {
    BOOST_CHECK(std::fabs(p.getX()) <= 8.0f + 1e-4f);
    BOOST_CHECK(std::fabs(p.getY()) <= 2.5f + 1e-4f);
  }
}

BOOST_AUTO_TEST_CASE(TestBuildMatchesFamilyClosure) {
  for (int i = 0; i < static_cast<int>(PathFamily::COUNT); ++i) {
    PathSettings settings;
    settings.family = static_cast<PathFamily>(i);
    auto path = PathGenerator::build(settings);
    BOOST_REQUIRE(path);
    BOOST_CHECK_EQUAL(path->isClosed(), PathGenerator::isClosedFamily(settings.family));
    BOOST_CHECK(path->size() >= static_cast<size_t>(PathGenerator::MIN_POINTS));
    BOOST_CHECK(path->getLength() > 0.0f);
  }
}

BOOST_AUTO_TEST_CASE(TestFamilyKeys) {
  BOOST_CHECK(pathFamilyFromString("viviani") == PathFamily::Viviani);
  BOOST_CHECK(pathFamilyFromString("lorenz") == PathFamily::Lorenz);
  BOOST_CHECK(pathFamilyFromString("lemniscate") == PathFamily::Lemniscate);
  BOOST_CHECK(pathFamilyFromString("spirograph") == PathFamily::Viviani);
  BOOST_CHECK(pathFamilyFromString("") == PathFamily::Viviani);

  BOOST_CHECK_EQUAL(std::string(pathFamilyToString(PathFamily::Lorenz)), "lorenz");
  BOOST_CHECK(pathFamilyFromString(pathFamilyToString(PathFamily::Lemniscate)) ==
              PathFamily::Lemniscate);
}

BOOST_AUTO_TEST_SUITE_END()
