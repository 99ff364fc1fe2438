#pragma once

#include "bezier.hh"

namespace BezierFit {

struct Projection {
  double parameter;
  double distance;
  Point point;
};

// Global closest point on a segment, t in [0,1].
// Newton iterations start from each of `resolution` + 1 uniform samples;
// ties go to the smallest t.
Projection closestPoint(const Segment &segment, const Point &point,
                        size_t resolution = 16,
                        size_t max_iteration = 20, double distance_tol = 1.0e-14,
                        double cosine_tol = 1.0e-14);

}
