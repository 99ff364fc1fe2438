#pragma once

#include "fit-options.hh"

namespace BezierFit {

// Cumulative polyline length normalized to [0,1];
// falls back to uniform parameters when all points coincide
Geometry::DoubleVector chordLengthParameters(const Geometry::Point2DVector &points);

// i / (n - 1)
Geometry::DoubleVector uniformParameters(size_t n);

// Like chord length, but with the square roots of the chord lengths
Geometry::DoubleVector centripetalParameters(const Geometry::Point2DVector &points);

Geometry::DoubleVector estimateParameters(const Geometry::Point2DVector &points,
                                          Parameterization method);

// Validates the sample set and returns the supplied or estimated parameters.
// Throws InvalidInput on fewer than 2 samples, non-finite coordinates,
// partially supplied parameters, or supplied parameters that are
// out of [0,1] or decreasing.
Geometry::DoubleVector initialParameters(const SampleVector &samples,
                                         const FitOptions &options);

Geometry::Point2DVector samplePoints(const SampleVector &samples);

// Samples without parameters
SampleVector makeSamples(const Geometry::Point2DVector &points);

// Samples with explicit parameters
SampleVector makeSamples(const Geometry::Point2DVector &points,
                         const Geometry::DoubleVector &parameters);

}
