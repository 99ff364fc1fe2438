#pragma once

#include "fit-options.hh"

namespace BezierFit {

// Least-squares fit of the interior control points, with the endpoints fixed
// at the first and last samples and the parameters taken as given:
//
// sum_i || B(t_i) - Q_i ||^2 -> min
//
// Singular normal equations or coincident samples give the chord fallback
// with `converged == false`.
SegmentFit fitLinear(const SampleVector &samples, const FitOptions &options);

// Core solver, shared with the iterative fitters.
// Sets `segment` in every case; returns false when the chord fallback was used.
bool solveInterior(const Geometry::Point2DVector &points,
                   const Geometry::DoubleVector &parameters,
                   size_t degree, Segment &segment);

// Interior points at fixed fractions of the chord
Segment chordSegment(const Point &start, const Point &end, size_t degree);

bool coincident(const Geometry::Point2DVector &points);

double residualSumOfSquares(const Segment &segment,
                            const Geometry::Point2DVector &points,
                            const Geometry::DoubleVector &parameters);

}
