#include <Eigen/Dense>

#include "linear-fit.hh"
#include "parameterize.hh"

namespace BezierFit {

using Geometry::DoubleVector;
using Geometry::Point2DVector;

static const double rank_threshold = 1.0e-12;

Segment chordSegment(const Point &start, const Point &end, size_t degree) {
  auto chord = end - start;
  if (degree == 2)
    return QuadraticSegment{ start, start + chord / 2.0, end };
  return CubicSegment{ start, start + chord / 3.0, start + chord * (2.0 / 3.0), end };
}

bool coincident(const Point2DVector &points) {
  for (const auto &p : points)
    if (!samePoint(p, points.front(), rank_threshold))
      return false;
  return true;
}

double residualSumOfSquares(const Segment &segment, const Point2DVector &points,
                            const DoubleVector &parameters) {
  double result = 0.0;
  for (size_t i = 0; i < points.size(); ++i)
    result += (evaluate(segment, parameters[i]) - points[i]).normSqr();
  return result;
}

// Normal equations of ||Ax - b||^2, one right-hand side per coordinate:
//
// (A^t A) x = A^t b,   A_ij = B^n_{j+1}(t_i),   b_i = Q_i - B^n_0(t_i) P_0 - B^n_n(t_i) P_n
bool solveInterior(const Point2DVector &points, const DoubleVector &parameters,
                   size_t degree, Segment &segment) {
  size_t n = degree, k = degree - 1, m = points.size();
  const auto &p0 = points.front(), &pn = points.back();

  Eigen::MatrixXd A(m, k), b(m, 2);
  DoubleVector coeff;
  for (size_t i = 0; i < m; ++i) {
    bernsteinAll(n, parameters[i], coeff);
    for (size_t j = 0; j < k; ++j)
      A(i, j) = coeff[j+1];
    auto r = points[i] - p0 * coeff[0] - pn * coeff[n];
    b(i, 0) = r[0];
    b(i, 1) = r[1];
  }

  Eigen::MatrixXd AtA = A.transpose() * A;
  Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(AtA);
  qr.setThreshold(rank_threshold);
  if (AtA.isZero() || qr.rank() < (Eigen::Index)k) {
    segment = chordSegment(p0, pn, degree);
    return false;
  }
  Eigen::MatrixXd x = qr.solve(A.transpose() * b);

  Point2DVector cpts;
  cpts.push_back(p0);
  for (size_t j = 0; j < k; ++j)
    cpts.emplace_back(x(j, 0), x(j, 1));
  cpts.push_back(pn);
  segment = makeSegment(cpts);
  return true;
}

SegmentFit fitLinear(const SampleVector &samples, const FitOptions &options) {
  auto parameters = initialParameters(samples, options);
  auto points = samplePoints(samples);
  size_t n = (size_t)options.degree;

  SegmentFit result;
  bool solved = false;
  if (coincident(points))
    result.segment = chordSegment(points.front(), points.back(), n);
  else
    solved = solveInterior(points, parameters, n, result.segment);

  result.report.residual_sum_of_squares = residualSumOfSquares(result.segment, points, parameters);
  result.report.iterations = 0;
  result.report.converged = solved;
  result.report.status = solved ? FitStatus::Converged : FitStatus::Degenerate;
  result.parameters = std::move(parameters);
  return result;
}

}
