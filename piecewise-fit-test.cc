#include <algorithm>
#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "closest-point.hh"
#include "piecewise-fit.hh"

using namespace BezierFit;
using Geometry::Point2DVector;

static double curveDistance(const Curve &curve, const Point &p) {
  double result = std::numeric_limits<double>::max();
  for (const auto &segment : curve.segments())
    result = std::min(result, closestPoint(segment, p).distance);
  return result;
}

static Point2DVector lShape() {
  Point2DVector points;
  for (size_t i = 0; i <= 8; ++i)
    points.emplace_back(i / 4.0, 0);
  for (size_t i = 1; i <= 8; ++i)
    points.emplace_back(2, i / 4.0);
  return points;
}

TEST(PiecewiseFit, ErrorBound) {
  auto points = lShape();
  for (auto method : { FitMethod::Linear, FitMethod::Alternating, FitMethod::Nonlinear }) {
    auto fit = fitPiecewise(points, FitOptions(), 0.01, method);
    EXPECT_GT(fit.curve.size(), 1u);
    EXPECT_FALSE(fit.curve.closed());
    for (const auto &p : points)
      EXPECT_LE(curveDistance(fit.curve, p), 0.01 + 1.0e-12);
  }
}

TEST(PiecewiseFit, JoinsAreContinuous) {
  auto fit = fitPiecewise(lShape(), FitOptions(), 0.001);
  const auto &segments = fit.curve.segments();
  for (size_t i = 1; i < segments.size(); ++i) {
    auto a = endPoint(segments[i-1]), b = startPoint(segments[i]);
    EXPECT_EQ(a[0], b[0]);
    EXPECT_EQ(a[1], b[1]);
  }
  EXPECT_EQ(fit.curve.start()[0], 0.0);
  EXPECT_EQ(fit.curve.end()[1], 2.0);
}

TEST(PiecewiseFit, SingleSegmentWhenItFits) {
  CubicSegment arch = { Point(0, 0), Point(1, 2), Point(2, 2), Point(3, 0) };
  Point2DVector points;
  for (size_t i = 0; i < 20; ++i)
    points.push_back(evaluate(arch, i / 19.0));
  auto fit = fitPiecewise(points, FitOptions(), 1.0e-4);
  EXPECT_EQ(fit.curve.size(), 1u);
  EXPECT_TRUE(fit.report.converged);
  EXPECT_LT(fit.report.residual_sum_of_squares, 1.0e-16);
}

TEST(PiecewiseFit, TwoPoints) {
  auto fit = fitPiecewise({ Point(0, 0), Point(3, 3) }, FitOptions(), 0.1);
  ASSERT_EQ(fit.curve.size(), 1u);
  EXPECT_TRUE(fit.report.converged);
  auto cp = controlPoints(fit.curve.segments()[0]);
  EXPECT_NEAR(cp[1][0], 1.0, 1.0e-15);
  EXPECT_NEAR(cp[2][1], 2.0, 1.0e-15);
}

TEST(PiecewiseFit, ClosedPolyline) {
  Point2DVector square = { Point(0, 0), Point(1, 0), Point(2, 0), Point(2, 1), Point(2, 2),
                           Point(1, 2), Point(0, 2), Point(0, 1), Point(0, 0) };
  auto fit = fitPiecewise(square, FitOptions(), 0.05);
  EXPECT_TRUE(fit.curve.closed());
  EXPECT_GT(fit.curve.size(), 1u);
  for (const auto &p : square)
    EXPECT_LE(curveDistance(fit.curve, p), 0.05 + 1.0e-12);
}

TEST(PiecewiseFit, InvalidInput) {
  EXPECT_THROW(fitPiecewise({ Point(0, 0) }, FitOptions(), 0.1), InvalidInput);
  EXPECT_THROW(fitPiecewise(lShape(), FitOptions(), 0.0), InvalidInput);
  EXPECT_THROW(fitPiecewise(lShape(), FitOptions(), -1.0), InvalidInput);
}
