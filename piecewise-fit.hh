#pragma once

#include "fit-options.hh"

namespace BezierFit {

struct CurveFit {
  Curve curve;
  FitReport report;
};

SegmentFit fitSegment(const SampleVector &samples, const FitOptions &options, FitMethod method);

// Fits the polyline with one segment, and splits it at the worst-fitting point
// while some point is farther than `max_error` from its piece.
// Neighbouring pieces share the split point, so the result is C0.
CurveFit fitPiecewise(const Geometry::Point2DVector &points, const FitOptions &options,
                      double max_error, FitMethod method = FitMethod::Nonlinear);

}
