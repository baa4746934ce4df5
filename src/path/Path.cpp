/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "path/Path.hpp"
#include <algorithm>
#include <cmath>

namespace CurveLights {

namespace {

constexpr size_t MIN_ARC_DIVISIONS = 200;
constexpr size_t ARC_DIVISIONS_PER_POINT = 4;
constexpr float TANGENT_DELTA = 0.0001f;

// Cubic Hermite coefficients for one component of a nonuniform Catmull-Rom span
struct CubicPoly {
  float c0, c1, c2, c3;

  float calc(float t) const { return c0 + t * (c1 + t * (c2 + t * c3)); }
};

CubicPoly nonuniformCatmullRom(float x0, float x1, float x2, float x3,
                               float dt0, float dt1, float dt2) {
  float t1 = (x1 - x0) / dt0 - (x2 - x0) / (dt0 + dt1) + (x2 - x1) / dt1;
  float t2 = (x2 - x1) / dt1 - (x3 - x1) / (dt1 + dt2) + (x3 - x2) / dt2;
  t1 *= dt1;
  t2 *= dt1;

  return CubicPoly{x1, t1, -3.0f * x1 + 3.0f * x2 - 2.0f * t1 - t2,
                   2.0f * x1 - 2.0f * x2 + t1 + t2};
}

} // anonymous namespace

Path::Path(std::vector<Vector3D> points, bool closed)
    : m_points(std::move(points)), m_closed(closed) {
  buildArcLengthTable();
  computeBounds();
}

float Path::wrap(float t) {
  if (!std::isfinite(t)) {
    return 0.0f;
  }
  float wrapped = t - std::floor(t);
  // t slightly below an integer can round up to exactly 1.0f
  return (wrapped >= 1.0f) ? 0.0f : wrapped;
}

float Path::normalizeParameter(float t) const {
  if (m_closed) {
    return wrap(t);
  }
  if (!std::isfinite(t)) {
    return (t > 0.0f) ? 1.0f : 0.0f;
  }
  return std::clamp(t, 0.0f, 1.0f);
}

Vector3D Path::pointAt(float t) const {
  if (m_points.empty()) {
    return Vector3D();
  }
  if (m_points.size() == 1) {
    return m_points.front();
  }
  return evaluate(arcToCurveParameter(normalizeParameter(t)));
}

Vector3D Path::tangentAt(float t) const {
  if (m_points.size() < 2) {
    return Vector3D(1.0f, 0.0f, 0.0f);
  }

  float curveT = arcToCurveParameter(normalizeParameter(t));
  float t1 = curveT - TANGENT_DELTA;
  float t2 = curveT + TANGENT_DELTA;

  if (m_closed) {
    t1 = wrap(t1);
    t2 = wrap(t2);
  } else {
    t1 = std::max(t1, 0.0f);
    t2 = std::min(t2, 1.0f);
  }

  return (evaluate(t2) - evaluate(t1)).normalized();
}

float Path::arcToCurveParameter(float u) const {
  if (m_arcLengths.size() < 2 || m_totalLength <= 0.0f) {
    return u;
  }
  const size_t divisions = m_arcLengths.size() - 1;

  float target = u * m_totalLength;
  auto it = std::upper_bound(m_arcLengths.begin(), m_arcLengths.end(), target);
  if (it == m_arcLengths.end()) {
    return 1.0f;
  }

  size_t upper = static_cast<size_t>(it - m_arcLengths.begin());
  size_t lower = (upper > 0) ? upper - 1 : 0;
  float segment = m_arcLengths[upper] - m_arcLengths[lower];
  float fraction = (segment > 0.0f) ? (target - m_arcLengths[lower]) / segment : 0.0f;

  return (static_cast<float>(lower) + fraction) / static_cast<float>(divisions);
}

Vector3D Path::evaluate(float t) const {
  const size_t count = m_points.size();
  const float spans = static_cast<float>(m_closed ? count : count - 1);

  float p = spans * t;
  long index = static_cast<long>(std::floor(p));
  float weight = p - static_cast<float>(index);

  if (m_closed) {
    long n = static_cast<long>(count);
    index = ((index % n) + n) % n;
  } else if (index >= static_cast<long>(count) - 1) {
    index = static_cast<long>(count) - 2;
    weight = 1.0f;
  } else if (index < 0) {
    index = 0;
    weight = 0.0f;
  }

  const size_t i = static_cast<size_t>(index);
  const Vector3D& p1 = m_points[i % count];
  const Vector3D& p2 = m_points[(i + 1) % count];

  // Open ends are extrapolated by mirroring the neighbouring span
  Vector3D p0 = (m_closed || i > 0)
                    ? m_points[(i + count - 1) % count]
                    : m_points[0] + (m_points[0] - m_points[1]);
  Vector3D p3 = (m_closed || i + 2 < count)
                    ? m_points[(i + 2) % count]
                    : m_points[count - 1] + (m_points[count - 1] - m_points[count - 2]);

  float dt0 = std::pow(Vector3D::distanceSquared(p0, p1), 0.25f);
  float dt1 = std::pow(Vector3D::distanceSquared(p1, p2), 0.25f);
  float dt2 = std::pow(Vector3D::distanceSquared(p2, p3), 0.25f);

  // Coincident points would divide by zero
  if (dt1 < 1e-4f) dt1 = 1.0f;
  if (dt0 < 1e-4f) dt0 = dt1;
  if (dt2 < 1e-4f) dt2 = dt1;

  CubicPoly px = nonuniformCatmullRom(p0.getX(), p1.getX(), p2.getX(), p3.getX(), dt0, dt1, dt2);
  CubicPoly py = nonuniformCatmullRom(p0.getY(), p1.getY(), p2.getY(), p3.getY(), dt0, dt1, dt2);
  CubicPoly pz = nonuniformCatmullRom(p0.getZ(), p1.getZ(), p2.getZ(), p3.getZ(), dt0, dt1, dt2);

  return Vector3D(px.calc(weight), py.calc(weight), pz.calc(weight));
}

void Path::buildArcLengthTable() {
  m_arcLengths.clear();
  m_totalLength = 0.0f;

  if (m_points.size() < 2) {
    return;
  }

  const size_t divisions =
      std::max(MIN_ARC_DIVISIONS, m_points.size() * ARC_DIVISIONS_PER_POINT);
  m_arcLengths.reserve(divisions + 1);
  m_arcLengths.push_back(0.0f);

  Vector3D previous = evaluate(0.0f);
  float accumulated = 0.0f;
  for (size_t i = 1; i <= divisions; ++i) {
    Vector3D current = evaluate(static_cast<float>(i) / static_cast<float>(divisions));
    accumulated += Vector3D::distance(previous, current);
    m_arcLengths.push_back(accumulated);
    previous = current;
  }

  m_totalLength = accumulated;
}

void Path::computeBounds() {
  if (m_points.empty()) {
    m_center = Vector3D();
    m_boundingRadius = 0.0f;
    return;
  }

  Vector3D minCorner = m_points.front();
  Vector3D maxCorner = m_points.front();
  for (const auto& point : m_points) {
    minCorner = Vector3D(std::min(minCorner.getX(), point.getX()),
                         std::min(minCorner.getY(), point.getY()),
                         std::min(minCorner.getZ(), point.getZ()));
    maxCorner = Vector3D(std::max(maxCorner.getX(), point.getX()),
                         std::max(maxCorner.getY(), point.getY()),
                         std::max(maxCorner.getZ(), point.getZ()));
  }

  m_center = (minCorner + maxCorner) * 0.5f;

  float radiusSq = 0.0f;
  for (const auto& point : m_points) {
    radiusSq = std::max(radiusSq, Vector3D::distanceSquared(point, m_center));
  }
  m_boundingRadius = std::sqrt(radiusSq);
}

} // namespace CurveLights
