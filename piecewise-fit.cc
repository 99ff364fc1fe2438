#include <algorithm>
#include <iostream>

#include "alternating-fit.hh"
#include "closest-point.hh"
#include "linear-fit.hh"
#include "nonlinear-fit.hh"
#include "parameterize.hh"
#include "piecewise-fit.hh"

namespace BezierFit {

using Geometry::Point2DVector;

SegmentFit fitSegment(const SampleVector &samples, const FitOptions &options, FitMethod method) {
  switch (method) {
  case FitMethod::Linear: return fitLinear(samples, options);
  case FitMethod::Alternating: return fitAlternating(samples, options);
  case FitMethod::Nonlinear: break;
  }
  return fitNonlinear(samples, options);
}

static void fitRange(const Point2DVector &points, size_t first, size_t last,
                     const FitOptions &options, double max_error, FitMethod method,
                     std::vector<Segment> &segments, FitReport &report) {
  Point2DVector piece(points.begin() + first, points.begin() + last + 1);
  if (piece.size() == 2) {
    // A straight piece is exact; the fitters would flag it as degenerate
    segments.push_back(chordSegment(piece[0], piece[1], (size_t)options.degree));
    return;
  }
  auto fit = fitSegment(makeSamples(piece), options, method);

  double max_distance = 0.0;
  size_t worst = 0;
  for (size_t i = 0; i < piece.size(); ++i) {
    double d = closestPoint(fit.segment, piece[i], options.projection_resolution).distance;
    if (d > max_distance) {
      max_distance = d;
      worst = i;
    }
  }

  if (max_distance <= max_error) {
    if (options.verbose)
      std::cout << "Piece [" << first << ", " << last << "]:\tmax. error = " << max_distance
                << " (" << statusName(fit.report.status) << ")" << std::endl;
    segments.push_back(fit.segment);
    report.residual_sum_of_squares += fit.report.residual_sum_of_squares;
    report.iterations += fit.report.iterations;
    if (!fit.report.converged && report.converged) {
      report.converged = false;
      report.status = fit.report.status;
    }
    return;
  }

  size_t split = first + std::min(std::max<size_t>(worst, 1), piece.size() - 2);
  fitRange(points, first, split, options, max_error, method, segments, report);
  fitRange(points, split, last, options, max_error, method, segments, report);
}

CurveFit fitPiecewise(const Point2DVector &points, const FitOptions &options,
                      double max_error, FitMethod method) {
  if (points.size() < 2)
    throw InvalidInput("at least 2 points are needed, got " + std::to_string(points.size()));
  if (!(max_error > 0.0))
    throw InvalidInput("maximal error must be positive");

  std::vector<Segment> segments;
  FitReport report;
  report.converged = true;
  report.status = FitStatus::Converged;
  fitRange(points, 0, points.size() - 1, options, max_error, method, segments, report);

  bool closed = points.size() > 2 && samePoint(points.front(), points.back(), 1.0e-9);
  return { join(segments, closed), report };
}

}
