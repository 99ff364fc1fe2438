#include <cmath>

#include <gtest/gtest.h>

#include "linear-fit.hh"
#include "nonlinear-fit.hh"
#include "parameterize.hh"

using namespace BezierFit;
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

TEST(NonlinearFit, ExactRecoveryWithKnownParameters) {
  auto samples = makeSamples(archSamples(20), uniformParameters(20));
  FitOptions options;
  options.fit_parameters = false;
  auto fit = fitNonlinear(samples, options);
  EXPECT_TRUE(fit.report.converged);
  EXPECT_LT(fit.report.residual_sum_of_squares, 1.0e-20);
  auto expected = controlPoints(arch), cp = controlPoints(fit.segment);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_NEAR(cp[i][0], expected[i][0], 1.0e-9);
    EXPECT_NEAR(cp[i][1], expected[i][1], 1.0e-9);
  }
}

TEST(NonlinearFit, ExactRecoveryFromChordLength) {
  auto fit = fitNonlinear(makeSamples(archSamples(20)), FitOptions());
  EXPECT_TRUE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::Converged);
  EXPECT_LT(fit.report.residual_sum_of_squares, 1.0e-16);
  EXPECT_LE(fit.report.iterations, 20u);
  auto expected = controlPoints(arch), cp = controlPoints(fit.segment);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_NEAR(cp[i][0], expected[i][0], 1.0e-5);
    EXPECT_NEAR(cp[i][1], expected[i][1], 1.0e-5);
  }
  // Optimized parameters stay ordered inside [0,1]
  ASSERT_EQ(fit.parameters.size(), 20u);
  for (size_t i = 0; i < fit.parameters.size(); ++i) {
    EXPECT_GE(fit.parameters[i], 0.0);
    EXPECT_LE(fit.parameters[i], 1.0);
  }
}

TEST(NonlinearFit, BelowLinearOrNotConverged) {
  auto samples = makeSamples(noisy);
  FitOptions options;
  auto linear = fitLinear(samples, options);
  auto fit = fitNonlinear(samples, options);
  EXPECT_TRUE(fit.report.residual_sum_of_squares < linear.report.residual_sum_of_squares ||
              !fit.report.converged);
  EXPECT_LE(fit.report.residual_sum_of_squares, linear.report.residual_sum_of_squares);
  EXPECT_LT(fit.report.residual_sum_of_squares, 0.02);
  EXPECT_NEAR(fit.report.residual_sum_of_squares,
              residualSumOfSquares(fit.segment, noisy, fit.parameters), 1.0e-15);
}

TEST(NonlinearFit, FixedParametersAtLinearOptimum) {
  // The linear fit is already optimal for fixed parameters: no step can improve it
  auto samples = makeSamples(noisy);
  FitOptions options;
  options.fit_parameters = false;
  auto linear = fitLinear(samples, options);
  auto fit = fitNonlinear(samples, options);
  EXPECT_FALSE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::LineSearchFailed);
  EXPECT_EQ(fit.report.iterations, 0u);
  EXPECT_NEAR(fit.report.residual_sum_of_squares, linear.report.residual_sum_of_squares, 1.0e-12);
  ASSERT_EQ(fit.parameters.size(), linear.parameters.size());
  for (size_t i = 0; i < fit.parameters.size(); ++i)
    EXPECT_EQ(fit.parameters[i], linear.parameters[i]);
}

TEST(NonlinearFit, LineSearchFailure) {
  auto samples = makeSamples(noisy);
  FitOptions options;
  options.min_step_scale = 2.0;   // not even a full step is tried
  auto linear = fitLinear(samples, options);
  auto fit = fitNonlinear(samples, options);
  EXPECT_FALSE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::LineSearchFailed);
  EXPECT_EQ(fit.report.iterations, 0u);
  EXPECT_EQ(fit.report.residual_sum_of_squares, linear.report.residual_sum_of_squares);
  auto expected = controlPoints(linear.segment), cp = controlPoints(fit.segment);
  for (size_t i = 0; i < cp.size(); ++i) {
    EXPECT_EQ(cp[i][0], expected[i][0]);
    EXPECT_EQ(cp[i][1], expected[i][1]);
  }
  for (size_t i = 0; i < fit.parameters.size(); ++i)
    EXPECT_EQ(fit.parameters[i], linear.parameters[i]);
}

TEST(NonlinearFit, DampingOnSingularSystem) {
  // Cusp at t = 0.5: the tangent of the middle sample vanishes,
  // so its parameter column of the Jacobian is zero
  CubicSegment cusp = { Point(0, 0), Point(1, 1), Point(0, 1), Point(1, 0) };
  Point2DVector points;
  for (size_t i = 0; i <= 10; ++i)
    points.push_back(evaluate(cusp, i / 10.0));
  auto samples = makeSamples(points, uniformParameters(11));

  FitOptions options;
  options.residual_floor = -1.0;  // keep iterating on the exact data
  options.max_iterations = 3;
  options.verbose = true;
  auto linear = fitLinear(samples, options);
  testing::internal::CaptureStdout();
  auto fit = fitNonlinear(samples, options);
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_NE(output.find("Gauss-Newton system damped"), std::string::npos);
  EXPECT_NE(fit.report.status, FitStatus::Degenerate);
  EXPECT_LE(fit.report.residual_sum_of_squares, linear.report.residual_sum_of_squares);
  for (double t : fit.parameters)
    EXPECT_TRUE(std::isfinite(t));
  auto expected = controlPoints(cusp), cp = controlPoints(fit.segment);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_NEAR(cp[i][0], expected[i][0], 1.0e-9);
    EXPECT_NEAR(cp[i][1], expected[i][1], 1.0e-9);
  }
}

TEST(NonlinearFit, ResidualDecreasesWithIterations) {
  auto samples = makeSamples(noisy);
  FitOptions options;
  double previous = fitLinear(samples, options).report.residual_sum_of_squares;
  for (size_t n = 1; n <= 8; ++n) {
    options.max_iterations = n;
    auto fit = fitNonlinear(samples, options);
    EXPECT_LE(fit.report.iterations, n);
    EXPECT_LE(fit.report.residual_sum_of_squares, previous);
    previous = fit.report.residual_sum_of_squares;
  }
}

TEST(NonlinearFit, IterationLimit) {
  FitOptions options;
  options.max_iterations = 1;
  auto fit = fitNonlinear(makeSamples(noisy), options);
  EXPECT_FALSE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::IterationLimit);
  EXPECT_EQ(fit.report.iterations, 1u);
}

TEST(NonlinearFit, QuadraticDegree) {
  QuadraticSegment bump = { Point(0, 0), Point(1, 2), Point(3, 0) };
  Point2DVector points;
  for (size_t i = 0; i < 15; ++i)
    points.push_back(evaluate(bump, i / 14.0));
  FitOptions options;
  options.degree = Degree::Quadratic;
  auto fit = fitNonlinear(makeSamples(points), options);
  ASSERT_TRUE(std::holds_alternative<QuadraticSegment>(fit.segment));
  EXPECT_LT(fit.report.residual_sum_of_squares, 1.0e-12);
}

TEST(NonlinearFit, DegenerateInput) {
  auto fit = fitNonlinear(makeSamples({ Point(1, 1), Point(1, 1), Point(1, 1) }),
                          FitOptions());
  EXPECT_FALSE(fit.report.converged);
  EXPECT_EQ(fit.report.status, FitStatus::Degenerate);
  for (const auto &p : controlPoints(fit.segment)) {
    EXPECT_EQ(p[0], 1.0);
    EXPECT_EQ(p[1], 1.0);
  }
  EXPECT_THROW(fitNonlinear(makeSamples({ Point(1, 1) }), FitOptions()), InvalidInput);
}
