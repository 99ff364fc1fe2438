#include <algorithm>
#include <iostream>

#include "alternating-fit.hh"
#include "closest-point.hh"
#include "linear-fit.hh"
#include "parameterize.hh"

namespace BezierFit {

using Geometry::DoubleVector;
using Geometry::Point2DVector;

static void projectParameters(const Segment &segment, const Point2DVector &points,
                              size_t resolution, DoubleVector &parameters) {
  for (size_t i = 0; i < points.size(); ++i) {
    auto projection = closestPoint(segment, points[i], resolution);
    double current = (evaluate(segment, parameters[i]) - points[i]).norm();
    if (projection.distance < current)
      parameters[i] = projection.parameter;
  }
}

// One Newton step on |C(t) - P|^2 per sample, ignoring the curvature term
static void gaussNewtonParameters(const Segment &segment, const Point2DVector &points,
                                  DoubleVector &parameters) {
  for (size_t i = 0; i < points.size(); ++i) {
    auto deviation = evaluate(segment, parameters[i]) - points[i];
    auto d = derivative(segment, parameters[i]);
    double d2 = d * d;
    if (d2 == 0.0)
      continue;
    double t = std::min(std::max(parameters[i] - (d * deviation) / d2, 0.0), 1.0);
    if ((evaluate(segment, t) - points[i]).norm() < deviation.norm())
      parameters[i] = t;
  }
  // The end samples are the end control points
  parameters.front() = 0.0;
  parameters.back() = 1.0;
}

SegmentFit fitAlternating(const SampleVector &samples, const FitOptions &options) {
  auto best = fitLinear(samples, options);
  if (best.report.status == FitStatus::Degenerate)
    return best;

  auto points = samplePoints(samples);
  size_t n = (size_t)options.degree;
  auto parameters = best.parameters;
  auto segment = best.segment;
  double previous = best.report.residual_sum_of_squares;

  best.report.converged = false;
  best.report.status = FitStatus::IterationLimit;

  for (size_t iteration = 1; iteration <= options.max_iterations; ++iteration) {
    if (previous <= options.residual_floor) {
      best.report.converged = true;
      best.report.status = FitStatus::Converged;
      break;
    }

    // Update the parameters
    if (options.t_update == TUpdate::Projection)
      projectParameters(segment, points, options.projection_resolution, parameters);
    else
      gaussNewtonParameters(segment, points, parameters);

    // Fit
    if (!solveInterior(points, parameters, n, segment)) {
      best.report.iterations = iteration;
      best.report.status = FitStatus::Degenerate;
      break;
    }
    double residual = residualSumOfSquares(segment, points, parameters);
    best.report.iterations = iteration;

    if (options.verbose)
      std::cout << "Alternating fit #" << iteration << ":\tresidual = " << residual << std::endl;

    if (residual < best.report.residual_sum_of_squares) {
      best.segment = segment;
      best.parameters = parameters;
      best.report.residual_sum_of_squares = residual;
    }

    if (previous - residual <= options.tolerance * previous ||
        residual <= options.residual_floor) {
      best.report.converged = true;
      best.report.status = FitStatus::Converged;
      break;
    }
    previous = residual;
  }

  return best;
}

}
