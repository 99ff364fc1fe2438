#include <gtest/gtest.h>

#include "linear-fit.hh"
#include "parameterize.hh"

using namespace BezierFit;
using Geometry::DoubleVector;
using Geometry::Point2DVector;

static void expectSamePoint(const Point &a, const Point &b, double tol) {
  EXPECT_NEAR(a[0], b[0], tol);
  EXPECT_NEAR(a[1], b[1], tol);
}

static SampleVector sampleSegment(const Segment &segment, size_t n) {
  Point2DVector points;
  DoubleVector parameters;
  for (size_t i = 0; i < n; ++i) {
    double t = (double)i / (n - 1);
    points.push_back(evaluate(segment, t));
    parameters.push_back(t);
  }
  return makeSamples(points, parameters);
}

TEST(LinearFit, GoldenFixture) {
  auto samples = makeSamples({ Point(0, 0), Point(1, 1), Point(2, 1), Point(3, 0) });
  auto fit = fitLinear(samples, FitOptions());

  ASSERT_TRUE(std::holds_alternative<CubicSegment>(fit.segment));
  auto cp = controlPoints(fit.segment);
  expectSamePoint(cp[0], Point(0, 0), 0.0);
  expectSamePoint(cp[1], Point(0.40727513564932144, 1.4309644062711504), 1.0e-9);
  expectSamePoint(cp[2], Point(2.5927248643506773, 1.4309644062711522), 1.0e-9);
  expectSamePoint(cp[3], Point(3, 0), 0.0);

  EXPECT_LT(fit.report.residual_sum_of_squares, 1.0e-20);
  EXPECT_EQ(fit.report.iterations, 0u);
  EXPECT_TRUE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::Converged);
  ASSERT_EQ(fit.parameters.size(), 4u);
  EXPECT_NEAR(fit.parameters[1], 0.36939806251812934, 1.0e-15);
}

TEST(LinearFit, ExactRecoveryCubic) {
  CubicSegment arch = { Point(0, 0), Point(1, 2), Point(2, 2), Point(3, 0) };
  auto fit = fitLinear(sampleSegment(arch, 10), FitOptions());
  auto expected = controlPoints(arch), cp = controlPoints(fit.segment);
  ASSERT_EQ(cp.size(), 4u);
  for (size_t i = 0; i < 4; ++i)
    expectSamePoint(cp[i], expected[i], 1.0e-9);
  EXPECT_LT(fit.report.residual_sum_of_squares, 1.0e-20);
}

TEST(LinearFit, ExactRecoveryQuadratic) {
  QuadraticSegment bump = { Point(-1, 0), Point(0.5, 3), Point(2, 1) };
  FitOptions options;
  options.degree = Degree::Quadratic;
  auto fit = fitLinear(sampleSegment(bump, 7), options);
  ASSERT_TRUE(std::holds_alternative<QuadraticSegment>(fit.segment));
  expectSamePoint(controlPoints(fit.segment)[1], Point(0.5, 3), 1.0e-9);
  EXPECT_TRUE(fit.report.converged);
}

TEST(LinearFit, LeastSquaresOptimality) {
  Point2DVector points = { Point(0, 0), Point(0.8, 1.3), Point(1.7, 1.6),
                           Point(2.4, 1.1), Point(3.1, 0.2), Point(3.5, -0.4) };
  auto fit = fitLinear(makeSamples(points), FitOptions());
  double rss = fit.report.residual_sum_of_squares;
  EXPECT_GT(rss, 0.0);
  EXPECT_NEAR(rss, residualSumOfSquares(fit.segment, points, fit.parameters), 1.0e-15);

  // Moving any interior coordinate makes it worse
  auto cp = controlPoints(fit.segment);
  for (size_t j = 1; j <= 2; ++j)
    for (size_t c = 0; c < 2; ++c) {
      auto moved = cp;
      moved[j][c] += 1.0e-3;
      EXPECT_GT(residualSumOfSquares(makeSegment(moved), points, fit.parameters), rss);
    }
}

TEST(LinearFit, CoincidentSamples) {
  auto samples = makeSamples({ Point(2, 3), Point(2, 3), Point(2, 3) });
  auto fit = fitLinear(samples, FitOptions());
  EXPECT_FALSE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::Degenerate);
  for (const auto &p : controlPoints(fit.segment))
    expectSamePoint(p, Point(2, 3), 0.0);
  EXPECT_EQ(fit.report.residual_sum_of_squares, 0.0);
}

TEST(LinearFit, ChordFallback) {
  auto fit = fitLinear(makeSamples({ Point(0, 0), Point(3, 6) }), FitOptions());
  EXPECT_FALSE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::Degenerate);
  auto cp = controlPoints(fit.segment);
  expectSamePoint(cp[1], Point(1, 2), 1.0e-15);
  expectSamePoint(cp[2], Point(2, 4), 1.0e-15);

  // Every sample at the same parameter
  Point2DVector points = { Point(0, 0), Point(1, 1), Point(2, 0) };
  fit = fitLinear(makeSamples(points, { 0.5, 0.5, 0.5 }), FitOptions());
  EXPECT_EQ(fit.report.status, FitStatus::Degenerate);
  expectSamePoint(controlPoints(fit.segment)[1], Point(2.0 / 3, 0), 1.0e-15);
}
