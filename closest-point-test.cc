#include <algorithm>
#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "closest-point.hh"

using namespace BezierFit;

static const CubicSegment arch = { Point(0, 0), Point(1, 2), Point(2, 2), Point(3, 0) };

TEST(ClosestPoint, PointsOnTheSegment) {
  for (double t : { 0.0, 0.1, 0.37, 0.5, 0.81, 1.0 }) {
    auto projection = closestPoint(arch, evaluate(arch, t));
    EXPECT_NEAR(projection.parameter, t, 1.0e-8);
    EXPECT_NEAR(projection.distance, 0.0, 1.0e-10);
  }
}

TEST(ClosestPoint, Idempotent) {
  auto first = closestPoint(arch, Point(0.7, 2.5));
  auto second = closestPoint(arch, first.point);
  EXPECT_NEAR(second.parameter, first.parameter, 1.0e-8);
  EXPECT_NEAR(second.distance, 0.0, 1.0e-10);
}

TEST(ClosestPoint, InteriorMinimumIsOrthogonal) {
  Point q(1.5, 5);
  auto projection = closestPoint(arch, q);
  EXPECT_NEAR(projection.parameter, 0.5, 1.0e-8);
  EXPECT_NEAR(projection.distance, 3.5, 1.0e-10);

  Point r(2.2, 2.1);
  projection = closestPoint(arch, r);
  auto d = derivative(arch, projection.parameter);
  EXPECT_NEAR((projection.point - r) * d, 0.0, 1.0e-9);
}

TEST(ClosestPoint, EndpointMinima) {
  auto start = closestPoint(arch, Point(-1, -1));
  EXPECT_EQ(start.parameter, 0.0);
  EXPECT_NEAR(start.distance, std::sqrt(2.0), 1.0e-12);

  auto end = closestPoint(arch, Point(4, -1));
  EXPECT_EQ(end.parameter, 1.0);
  EXPECT_NEAR(end.distance, std::sqrt(2.0), 1.0e-12);
}

TEST(ClosestPoint, GlobalOnSelfIntersectingSegment) {
  CubicSegment loop = { Point(0, 0), Point(3, 3), Point(-1, 3), Point(2, 0) };
  for (const auto &q : { Point(1, 1), Point(0.5, 2.5), Point(1, 0.2), Point(-0.5, 1) }) {
    double brute = std::numeric_limits<double>::max();
    for (size_t i = 0; i <= 10000; ++i)
      brute = std::min(brute, (evaluate(loop, i / 10000.0) - q).norm());
    auto projection = closestPoint(loop, q);
    EXPECT_LE(projection.distance, brute + 1.0e-9);
  }
}

TEST(ClosestPoint, CoarseGridFindsHiddenMinimum) {
  // With three samples only t = 0.5 is a sampled minimum, and it leads away
  // from the nearest arc
  CubicSegment loop = { Point(0, 0), Point(3, 3), Point(-1, 3), Point(2, 0) };
  Point q(0.78, 2.03);
  double brute = std::numeric_limits<double>::max();
  for (size_t i = 0; i <= 20000; ++i)
    brute = std::min(brute, (evaluate(loop, i / 20000.0) - q).norm());
  auto projection = closestPoint(loop, q, 2);
  EXPECT_LT(brute, 0.04);
  EXPECT_LE(projection.distance, brute + 1.0e-9);
  auto d = derivative(loop, projection.parameter);
  EXPECT_NEAR((projection.point - q) * d, 0.0, 1.0e-9);
}

TEST(ClosestPoint, DegenerateSegment) {
  CubicSegment dot = { Point(1, 1), Point(1, 1), Point(1, 1), Point(1, 1) };
  auto projection = closestPoint(dot, Point(4, 5));
  EXPECT_EQ(projection.parameter, 0.0);
  EXPECT_NEAR(projection.distance, 5.0, 1.0e-12);
}

TEST(ClosestPoint, TiesGoToTheSmallestParameter) {
  QuadraticSegment symmetric = { Point(0, 0), Point(1, 2), Point(2, 0) };
  auto projection = closestPoint(symmetric, Point(1, -10));
  EXPECT_EQ(projection.parameter, 0.0);
  EXPECT_NEAR(projection.distance, std::sqrt(101.0), 1.0e-12);
}
