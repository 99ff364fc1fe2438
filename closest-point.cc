#include <algorithm>
#include <cmath>

#include "closest-point.hh"

namespace BezierFit {

static const double tie_tolerance = 1.0e-12;

static bool degenerate(const Segment &segment) {
  auto cp = controlPoints(segment);
  for (size_t i = 1; i < cp.size(); ++i)
    if ((cp[i] - cp[0]).norm() > 0.0)
      return false;
  return true;
}

// Newton iteration on (C(u) - P) . C'(u) = 0, clamped to [0,1]
static double refine(const Segment &segment, const Point &point, double u,
                     size_t max_iteration, double distance_tol, double cosine_tol) {
  for (size_t iteration = 0; iteration < max_iteration; ++iteration) {
    auto deviation = evaluate(segment, u) - point;
    auto distance = deviation.norm();
    if (distance < distance_tol)
      break;

    auto d1 = derivative(segment, u);
    auto d2 = secondDerivative(segment, u);
    double scaled_error = d1 * deviation;
    double d1_norm = d1.norm();
    if (d1_norm == 0.0)
      break;
    double cosine_err = std::abs(scaled_error) / (d1_norm * distance);
    if (cosine_err < cosine_tol)
      break;

    double denominator = d2 * deviation + d1 * d1;
    if (denominator <= 0.0)
      break;                    // not heading towards a minimum

    double old = u;
    u -= scaled_error / denominator;
    u = std::min(std::max(u, 0.0), 1.0);

    if ((d1 * (u - old)).norm() < distance_tol)
      break;
  }
  return u;
}

Projection closestPoint(const Segment &segment, const Point &point, size_t resolution,
                        size_t max_iteration, double distance_tol, double cosine_tol) {
  if (degenerate(segment)) {
    auto p0 = startPoint(segment);
    return { 0.0, (point - p0).norm(), p0 };
  }

  resolution = std::max<size_t>(resolution, 1);
  auto p0 = evaluate(segment, 0.0);
  Projection best = { 0.0, (p0 - point).norm(), p0 };
  auto consider = [&](double u) {
    auto p = evaluate(segment, u);
    double d = (p - point).norm();
    double tie = tie_tolerance * std::max(1.0, best.distance);
    if (d < best.distance - tie || (std::abs(d - best.distance) <= tie && u < best.parameter))
      best = { u, d, p };
  };

  consider(1.0);
  // Every sample seeds a Newton run; a coarse grid can hide a minimum between
  // two samples that are not sampled local minima
  for (size_t i = 0; i <= resolution; ++i) {
    double u = (double)i / resolution;
    consider(u);
    consider(refine(segment, point, u, max_iteration, distance_tol, cosine_tol));
  }

  return best;
}

}
