#include <cmath>

#include "parameterize.hh"

namespace BezierFit {

using Geometry::DoubleVector;
using Geometry::Point2DVector;

static DoubleVector accumulate(const Point2DVector &points, bool centripetal) {
  size_t n = points.size();
  if (n < 2)
    return DoubleVector(n, 0.0);

  DoubleVector result; result.reserve(n);
  result.push_back(0.0);
  for (size_t i = 1; i < n; ++i) {
    double d = (points[i] - points[i-1]).norm();
    result.push_back(result.back() + (centripetal ? std::sqrt(d) : d));
  }

  double length = result.back();
  if (length == 0.0)
    return uniformParameters(n);
  for (auto &u : result)
    u /= length;
  result.back() = 1.0;
  return result;
}

DoubleVector chordLengthParameters(const Point2DVector &points) {
  return accumulate(points, false);
}

DoubleVector uniformParameters(size_t n) {
  if (n < 2)
    return DoubleVector(n, 0.0);
  DoubleVector result; result.reserve(n);
  for (size_t i = 0; i < n; ++i)
    result.push_back((double)i / (n - 1));
  return result;
}

DoubleVector centripetalParameters(const Point2DVector &points) {
  return accumulate(points, true);
}

DoubleVector estimateParameters(const Point2DVector &points, Parameterization method) {
  switch (method) {
  case Parameterization::Uniform: return uniformParameters(points.size());
  case Parameterization::Centripetal: return centripetalParameters(points);
  case Parameterization::ChordLength: break;
  }
  return chordLengthParameters(points);
}

DoubleVector initialParameters(const SampleVector &samples, const FitOptions &options) {
  size_t n = samples.size();
  if (n < 2)
    throw InvalidInput("at least 2 samples are needed, got " + std::to_string(n));

  size_t supplied = 0;
  for (size_t i = 0; i < n; ++i) {
    const auto &p = samples[i].point;
    if (!std::isfinite(p[0]) || !std::isfinite(p[1]))
      throw InvalidInput("sample #" + std::to_string(i) + " is not finite");
    if (samples[i].parameter)
      supplied++;
  }

  if (supplied == 0)
    return estimateParameters(samplePoints(samples), options.parameterization);
  if (supplied != n)
    throw InvalidInput("either all samples or none should carry a parameter");

  DoubleVector result; result.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    double u = *samples[i].parameter;
    if (!(u >= 0.0 && u <= 1.0))
      throw InvalidInput("parameter of sample #" + std::to_string(i) + " is outside [0,1]");
    if (i > 0 && u < result.back())
      throw InvalidInput("parameter of sample #" + std::to_string(i) + " is decreasing");
    result.push_back(u);
  }
  return result;
}

Point2DVector samplePoints(const SampleVector &samples) {
  Point2DVector result; result.reserve(samples.size());
  for (const auto &s : samples)
    result.push_back(s.point);
  return result;
}

SampleVector makeSamples(const Point2DVector &points) {
  SampleVector result; result.reserve(points.size());
  for (const auto &p : points)
    result.push_back({ p, std::nullopt });
  return result;
}

SampleVector makeSamples(const Point2DVector &points, const DoubleVector &parameters) {
  if (points.size() != parameters.size())
    throw InvalidInput("number of points and parameters differ");
  SampleVector result; result.reserve(points.size());
  for (size_t i = 0; i < points.size(); ++i)
    result.push_back({ points[i], parameters[i] });
  return result;
}

}
