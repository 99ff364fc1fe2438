#include <algorithm>
#include <cmath>
#include <string>

#include "bezier.hh"

namespace BezierFit {

using Geometry::DoubleVector;
using Geometry::Point2DVector;

static const double join_tolerance = 1.0e-9;
static const double merge_tolerance = 1.0e-6;

size_t degree(const Segment &segment) {
  if (std::holds_alternative<CubicSegment>(segment))
    return 3;
  return 2;
}

Point2DVector controlPoints(const Segment &segment) {
  if (auto c = std::get_if<CubicSegment>(&segment))
    return { c->p0, c->p1, c->p2, c->p3 };
  const auto &q = std::get<QuadraticSegment>(segment);
  return { q.p0, q.p1, q.p2 };
}

Segment makeSegment(const Point2DVector &points) {
  if (points.size() == 4)
    return CubicSegment{ points[0], points[1], points[2], points[3] };
  if (points.size() == 3)
    return QuadraticSegment{ points[0], points[1], points[2] };
  throw InvalidInput("a segment needs 3 (quadratic) or 4 (cubic) control points, got " +
                     std::to_string(points.size()));
}

Point startPoint(const Segment &segment) {
  return std::visit([](const auto &s) { return s.p0; }, segment);
}

Point endPoint(const Segment &segment) {
  if (auto c = std::get_if<CubicSegment>(&segment))
    return c->p3;
  return std::get<QuadraticSegment>(segment).p2;
}

static Point deCasteljau(Point2DVector tmp, double t) {
  size_t n = tmp.size() - 1;
  double t1 = 1.0 - t;
  for (size_t k = 1; k <= n; ++k)
    for (size_t i = 0; i <= n - k; ++i)
      tmp[i] = tmp[i] * t1 + tmp[i+1] * t;
  return tmp[0];
}

// Control points of the derivative curve (one degree lower)
static Point2DVector hodograph(const Point2DVector &cp) {
  size_t n = cp.size() - 1;
  Point2DVector result;
  result.reserve(n);
  for (size_t i = 0; i < n; ++i)
    result.push_back((cp[i+1] - cp[i]) * (double)n);
  return result;
}

Point evaluate(const Segment &segment, double t) {
  return deCasteljau(controlPoints(segment), t);
}

Vector derivative(const Segment &segment, double t) {
  return deCasteljau(hodograph(controlPoints(segment)), t);
}

Vector secondDerivative(const Segment &segment, double t) {
  return deCasteljau(hodograph(hodograph(controlPoints(segment))), t);
}

void bernsteinAll(size_t n, double t, DoubleVector &coeff) {
  coeff.clear(); coeff.reserve(n + 1);
  coeff.push_back(1.0);
  double const t1 = 1.0 - t;
  for (size_t j = 1; j <= n; ++j) {
    double saved = 0.0;
    for (size_t k = 0; k < j; ++k) {
      double const tmp = coeff[k];
      coeff[k] = saved + tmp * t1;
      saved = tmp * t;
    }
    coeff.push_back(saved);
  }
}

std::pair<Segment, Segment> subdivide(const Segment &segment, double t) {
  auto tmp = controlPoints(segment);
  size_t n = tmp.size() - 1;
  Point2DVector left, right(n + 1);
  double t1 = 1.0 - t;
  left.push_back(tmp[0]);
  right[n] = tmp[n];
  for (size_t k = 1; k <= n; ++k) {
    for (size_t i = 0; i <= n - k; ++i)
      tmp[i] = tmp[i] * t1 + tmp[i+1] * t;
    left.push_back(tmp[0]);
    right[n-k] = tmp[n-k];
  }
  return { makeSegment(left), makeSegment(right) };
}

bool samePoint(const Point &a, const Point &b, double tolerance) {
  double scale = 1.0 + std::max(a.norm(), b.norm());
  return (a - b).norm() <= tolerance * scale;
}

std::optional<Segment> merge(const Segment &left, const Segment &right) {
  if (left.index() != right.index())
    return std::nullopt;

  auto a = controlPoints(left), b = controlPoints(right);
  size_t n = a.size() - 1;
  if (!samePoint(a[n], b[0], merge_tolerance))
    return std::nullopt;

  // Both legs at the split are scaled copies of the same tangent: t and (1 - t)
  auto la = a[n] - a[n-1], lb = b[1] - b[0];
  double na = la.norm(), nb = lb.norm();
  if (na == 0.0 || nb == 0.0 || la * lb <= 0.0)
    return std::nullopt;
  double t = na / (na + nb);

  // The left piece is the original restricted to [0, t]
  auto original = subdivide(left, 1.0 / t).first;

  auto [l, r] = subdivide(original, t);
  auto lp = controlPoints(l), rp = controlPoints(r);
  for (size_t i = 0; i <= n; ++i)
    if (!samePoint(lp[i], a[i], merge_tolerance) || !samePoint(rp[i], b[i], merge_tolerance))
      return std::nullopt;

  return original;
}

CubicSegment elevate(const QuadraticSegment &q) {
  return { q.p0, q.p0 + (q.p1 - q.p0) * (2.0 / 3.0),
           q.p2 + (q.p1 - q.p2) * (2.0 / 3.0), q.p2 };
}

Curve::Curve(std::vector<Segment> segments, bool closed)
  : segments_(std::move(segments)), closed_(closed)
{
  if (segments_.empty())
    throw InvalidInput("a curve needs at least one segment");
  for (size_t i = 1; i < segments_.size(); ++i)
    if (!samePoint(endPoint(segments_[i-1]), startPoint(segments_[i]), join_tolerance))
      throw InvalidInput("segment #" + std::to_string(i) +
                         " does not start where the previous one ends");
  if (closed_ && !samePoint(start(), end(), join_tolerance))
    throw InvalidInput("closed curve does not end at its starting point");
}

Point Curve::start() const {
  return startPoint(segments_.front());
}

Point Curve::end() const {
  return endPoint(segments_.back());
}

Point Curve::eval(double u) const {
  double n = segments_.size();
  u = std::min(std::max(u, 0.0), n);
  size_t i = std::min((size_t)std::floor(u), segments_.size() - 1);
  return evaluate(segments_[i], u - i);
}

Curve join(const std::vector<Segment> &segments, bool closed) {
  return { segments, closed };
}

Curve subdivide(const Curve &curve) {
  std::vector<Segment> result;
  for (const auto &s : curve.segments()) {
    auto [l, r] = subdivide(s, 0.5);
    result.push_back(l);
    result.push_back(r);
  }
  return { result, curve.closed() };
}

Curve subdivide(const Curve &curve, size_t index, double t) {
  if (index >= curve.size())
    throw InvalidInput("segment index " + std::to_string(index) + " is out of range");
  if (!(t > 0.0 && t < 1.0))
    throw InvalidInput("split parameter must lie in (0,1)");
  auto result = curve.segments();
  auto [l, r] = subdivide(result[index], t);
  result[index] = r;
  result.insert(result.begin() + index, l);
  return { result, curve.closed() };
}

std::vector<ControlPoint> toControlPoints(const Curve &curve) {
  std::vector<ControlPoint> result;
  result.push_back({ curve.start(), true });
  for (const auto &s : curve.segments()) {
    auto cp = controlPoints(s);
    for (size_t i = 1; i + 1 < cp.size(); ++i)
      result.push_back({ cp[i], false });
    result.push_back({ cp.back(), true });
  }
  return result;
}

Curve fromControlPoints(const std::vector<ControlPoint> &points) {
  if (points.size() < 2)
    throw InvalidInput("at least 2 control points are needed");
  if (!points.front().on_curve)
    throw InvalidInput("the first control point must be on the curve");
  if (!points.back().on_curve)
    throw InvalidInput("the last control point must be on the curve");

  std::vector<Segment> segments;
  size_t i = 0;
  while (i + 1 < points.size()) {
    size_t j = i + 1;
    while (!points[j].on_curve)
      ++j;
    const auto &start = points[i].position, &end = points[j].position;
    switch (j - i) {
    case 1:
      segments.push_back(QuadraticSegment{ start, (start + end) / 2.0, end });
      break;
    case 2:
      segments.push_back(QuadraticSegment{ start, points[i+1].position, end });
      break;
    case 3:
      segments.push_back(CubicSegment{ start, points[i+1].position, points[i+2].position, end });
      break;
    default:
      throw InvalidInput("too many consecutive off-curve points at index " +
                         std::to_string(i + 1));
    }
    i = j;
  }

  bool closed = samePoint(points.front().position, points.back().position, join_tolerance);
  return { segments, closed };
}

}
