#pragma once

#include "fit-options.hh"

namespace BezierFit {

// Alternates between updating the sample parameters (closest-point projection,
// or a Gauss-Newton step per sample with `TUpdate::GaussNewton`) and refitting
// the interior control points with the new parameters.
// Returns the best segment seen.
SegmentFit fitAlternating(const SampleVector &samples, const FitOptions &options);

}
