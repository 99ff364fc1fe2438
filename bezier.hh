#pragma once

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include <geometry.hh>

namespace BezierFit {

using Point = Geometry::Point2D;
using Vector = Geometry::Vector2D;

// Structural errors: bad sample sets, malformed segments or curves
class InvalidInput : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

struct ControlPoint {
  Point position;
  bool on_curve;
};

struct CubicSegment {
  Point p0, p1, p2, p3;
};

struct QuadraticSegment {
  Point p0, p1, p2;
};

using Segment = std::variant<CubicSegment, QuadraticSegment>;

size_t degree(const Segment &segment);
Geometry::Point2DVector controlPoints(const Segment &segment);

// Throws InvalidInput unless there are 3 or 4 points
Segment makeSegment(const Geometry::Point2DVector &points);

Point startPoint(const Segment &segment);
Point endPoint(const Segment &segment);

Point evaluate(const Segment &segment, double t);
Vector derivative(const Segment &segment, double t);
Vector secondDerivative(const Segment &segment, double t);

// All Bernstein polynomials of degree `n` at `t`
void bernsteinAll(size_t n, double t, Geometry::DoubleVector &coeff);

// De Casteljau split at `t`
std::pair<Segment, Segment> subdivide(const Segment &segment, double t);

// Inverse of subdivide(); nullopt when the two pieces are not halves of one segment
std::optional<Segment> merge(const Segment &left, const Segment &right);

CubicSegment elevate(const QuadraticSegment &segment);

class Curve {
public:
  // Throws InvalidInput on an empty list, broken joins,
  // or a closed curve whose ends do not meet
  Curve(std::vector<Segment> segments, bool closed = false);

  const std::vector<Segment> &segments() const { return segments_; }
  size_t size() const { return segments_.size(); }
  bool closed() const { return closed_; }
  Point start() const;
  Point end() const;

  // u in [0, size()]: integer part selects the segment
  Point eval(double u) const;

private:
  std::vector<Segment> segments_;
  bool closed_;
};

Curve join(const std::vector<Segment> &segments, bool closed = false);

// Halves every segment
Curve subdivide(const Curve &curve);
Curve subdivide(const Curve &curve, size_t index, double t);

std::vector<ControlPoint> toControlPoints(const Curve &curve);
Curve fromControlPoints(const std::vector<ControlPoint> &points);

bool samePoint(const Point &a, const Point &b, double tolerance);

}
