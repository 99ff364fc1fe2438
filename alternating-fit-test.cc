#include <gtest/gtest.h>

#include "alternating-fit.hh"
#include "closest-point.hh"
#include "linear-fit.hh"
#include "parameterize.hh"

using namespace BezierFit;
using Geometry::DoubleVector;
using Geometry::Point2DVector;

static const CubicSegment arch = { Point(0, 0), Point(1, 2), Point(2, 2), Point(3, 0) };

static Point2DVector archSamples(size_t n) {
  Point2DVector points;
  for (size_t i = 0; i < n; ++i)
    points.push_back(evaluate(arch, (double)i / (n - 1)));
  return points;
}

static const Point2DVector noisy = {
  Point(0, 0), Point(0.8, 1.3), Point(1.7, 1.6), Point(2.4, 1.1), Point(3.1, 0.2), Point(3.5, -0.4)
};

TEST(AlternatingFit, ResidualNeverIncreases) {
  // Project -> fit cycles done by hand
  auto points = noisy;
  auto parameters = chordLengthParameters(points);
  Segment segment;
  ASSERT_TRUE(solveInterior(points, parameters, 3, segment));
  double previous = residualSumOfSquares(segment, points, parameters);
  for (size_t cycle = 0; cycle < 20; ++cycle) {
    for (size_t i = 0; i < points.size(); ++i) {
      auto projection = closestPoint(segment, points[i]);
      if (projection.distance < (evaluate(segment, parameters[i]) - points[i]).norm())
        parameters[i] = projection.parameter;
    }
    ASSERT_TRUE(solveInterior(points, parameters, 3, segment));
    double residual = residualSumOfSquares(segment, points, parameters);
    EXPECT_LE(residual, previous + 1.0e-15) << "in cycle " << cycle;
    previous = residual;
  }
}

TEST(AlternatingFit, ExactRecoveryWithKnownParameters) {
  auto points = archSamples(20);
  auto fit = fitAlternating(makeSamples(points, uniformParameters(20)), FitOptions());
  EXPECT_TRUE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::Converged);
  EXPECT_EQ(fit.report.iterations, 0u);
  auto expected = controlPoints(arch), cp = controlPoints(fit.segment);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_NEAR(cp[i][0], expected[i][0], 1.0e-9);
    EXPECT_NEAR(cp[i][1], expected[i][1], 1.0e-9);
  }
}

TEST(AlternatingFit, ExactRecoveryFromChordLength) {
  FitOptions options;
  options.max_iterations = 150;
  auto fit = fitAlternating(makeSamples(archSamples(20)), options);
  EXPECT_TRUE(fit.report.converged);
  EXPECT_LE(fit.report.residual_sum_of_squares, options.residual_floor);
  auto expected = controlPoints(arch), cp = controlPoints(fit.segment);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_NEAR(cp[i][0], expected[i][0], 1.0e-6);
    EXPECT_NEAR(cp[i][1], expected[i][1], 1.0e-6);
  }
}

TEST(AlternatingFit, IterationLimit) {
  FitOptions options;
  options.max_iterations = 5;
  auto samples = makeSamples(archSamples(20));
  auto fit = fitAlternating(samples, options);
  EXPECT_FALSE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::IterationLimit);
  EXPECT_EQ(fit.report.iterations, 5u);

  // Still the best segment seen
  auto linear = fitLinear(samples, options);
  EXPECT_LT(fit.report.residual_sum_of_squares, linear.report.residual_sum_of_squares);
  EXPECT_NEAR(fit.report.residual_sum_of_squares,
              residualSumOfSquares(fit.segment, samplePoints(samples), fit.parameters), 1.0e-15);
}

TEST(AlternatingFit, NeverWorseThanLinear) {
  auto samples = makeSamples(noisy);
  FitOptions options;
  auto linear = fitLinear(samples, options);
  double previous = linear.report.residual_sum_of_squares;
  for (size_t n = 1; n <= 10; ++n) {
    options.max_iterations = n;
    auto fit = fitAlternating(samples, options);
    EXPECT_LE(fit.report.residual_sum_of_squares, previous);
    previous = fit.report.residual_sum_of_squares;
  }
}

TEST(AlternatingFit, DegenerateInput) {
  auto fit = fitAlternating(makeSamples({ Point(1, 1), Point(1, 1), Point(1, 1) }),
                            FitOptions());
  EXPECT_FALSE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::Degenerate);
  EXPECT_EQ(fit.report.iterations, 0u);
}

TEST(AlternatingFit, VerboseProgress) {
  FitOptions options;
  options.max_iterations = 2;
  options.verbose = true;
  testing::internal::CaptureStdout();
  fitAlternating(makeSamples(archSamples(10)), options);
  auto output = testing::internal::GetCapturedStdout();
  EXPECT_NE(output.find("Alternating fit #1"), std::string::npos);
  EXPECT_NE(output.find("Alternating fit #2"), std::string::npos);
}

TEST(AlternatingFit, GaussNewtonParameterUpdate) {
  FitOptions options;
  options.t_update = TUpdate::GaussNewton;
  options.max_iterations = 150;
  auto samples = makeSamples(archSamples(20));
  auto fit = fitAlternating(samples, options);
  EXPECT_TRUE(fit.report.converged);
  EXPECT_LT(fit.report.residual_sum_of_squares, 1.0e-12);
  auto expected = controlPoints(arch), cp = controlPoints(fit.segment);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_NEAR(cp[i][0], expected[i][0], 1.0e-6);
    EXPECT_NEAR(cp[i][1], expected[i][1], 1.0e-6);
  }
  EXPECT_EQ(fit.parameters.front(), 0.0);
  EXPECT_EQ(fit.parameters.back(), 1.0);
  for (double t : fit.parameters) {
    EXPECT_GE(t, 0.0);
    EXPECT_LE(t, 1.0);
  }

  // Noisy samples: every extra cycle keeps or lowers the residual
  samples = makeSamples(noisy);
  double previous = fitLinear(samples, options).report.residual_sum_of_squares;
  for (size_t n = 1; n <= 10; ++n) {
    options.max_iterations = n;
    auto partial = fitAlternating(samples, options);
    EXPECT_LE(partial.report.residual_sum_of_squares, previous);
    previous = partial.report.residual_sum_of_squares;
  }
}
