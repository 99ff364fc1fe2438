#pragma once

#include "fit-options.hh"

namespace BezierFit {

// Gauss-Newton fit of the interior control points (and, with `fit_parameters`,
// of the sample parameters as well), started from the linear fit.
// Every accepted step strictly decreases the residual.
SegmentFit fitNonlinear(const SampleVector &samples, const FitOptions &options);

}
