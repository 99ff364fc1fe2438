#include <algorithm>
#include <iostream>
#include <optional>

#include <Eigen/Dense>

#include "linear-fit.hh"
#include "nonlinear-fit.hh"
#include "parameterize.hh"

namespace BezierFit {

using Geometry::DoubleVector;
using Geometry::Point2DVector;

static const double rcond_floor = 1.0e-12;
static const size_t max_damping_steps = 30;

// Unknowns: x = [ P_1.x, P_1.y, ..., P_{n-1}.x, P_{n-1}.y | t_0, ..., t_{m-1} ]
// (the parameter block only when they are optimized)
struct Unknowns {
  const Point2DVector &points;
  const DoubleVector &fixed_parameters;
  size_t degree;
  bool fit_parameters;

  size_t interior() const { return degree - 1; }

  Segment segment(const Eigen::VectorXd &x) const {
    Point2DVector cpts;
    cpts.push_back(points.front());
    for (size_t j = 0; j < interior(); ++j)
      cpts.emplace_back(x(2 * j), x(2 * j + 1));
    cpts.push_back(points.back());
    return makeSegment(cpts);
  }

  DoubleVector parameters(const Eigen::VectorXd &x) const {
    if (!fit_parameters)
      return fixed_parameters;
    DoubleVector result(points.size());
    for (size_t i = 0; i < points.size(); ++i)
      result[i] = x(2 * interior() + i);
    return result;
  }

  double residual(const Eigen::VectorXd &x) const {
    return residualSumOfSquares(segment(x), points, parameters(x));
  }

  void clamp(Eigen::VectorXd &x) const {
    if (fit_parameters)
      for (size_t i = 0; i < points.size(); ++i) {
        auto &t = x(2 * interior() + i);
        t = std::min(std::max(t, 0.0), 1.0);
      }
  }
};

// J^T J and J^T r of the residual vector r_i = B(t_i) - Q_i
static void normalEquations(const Unknowns &u, const Eigen::VectorXd &x,
                            Eigen::MatrixXd &JtJ, Eigen::VectorXd &Jtr) {
  size_t m = u.points.size(), k = u.interior(), n = u.degree;
  size_t cols = 2 * k + (u.fit_parameters ? m : 0);
  auto segment = u.segment(x);
  auto parameters = u.parameters(x);

  Eigen::MatrixXd J = Eigen::MatrixXd::Zero(2 * m, cols);
  Eigen::VectorXd r(2 * m);
  DoubleVector coeff;
  for (size_t i = 0; i < m; ++i) {
    double t = parameters[i];
    bernsteinAll(n, t, coeff);
    for (size_t j = 0; j < k; ++j) {
      J(2 * i, 2 * j) = coeff[j+1];
      J(2 * i + 1, 2 * j + 1) = coeff[j+1];
    }
    if (u.fit_parameters) {
      auto d = derivative(segment, t);
      J(2 * i, 2 * k + i) = d[0];
      J(2 * i + 1, 2 * k + i) = d[1];
    }
    auto deviation = evaluate(segment, t) - u.points[i];
    r(2 * i) = deviation[0];
    r(2 * i + 1) = deviation[1];
  }

  JtJ = J.transpose() * J;
  Jtr = J.transpose() * r;
}

// (J^T J + mu I) delta = -J^T r, with mu raised until the system is well-conditioned
static std::optional<Eigen::VectorXd> gaussNewtonStep(const Eigen::MatrixXd &JtJ,
                                                      const Eigen::VectorXd &Jtr,
                                                      double damping, bool verbose) {
  double scale = std::max(JtJ.diagonal().maxCoeff(), 1.0);
  double mu = 0.0;
  for (size_t attempt = 0; attempt < max_damping_steps; ++attempt) {
    Eigen::MatrixXd M = JtJ;
    M.diagonal().array() += mu;
    Eigen::LDLT<Eigen::MatrixXd> ldlt(M);
    auto pivots = ldlt.vectorD().cwiseAbs();
    bool regular = pivots.minCoeff() > rcond_floor * pivots.maxCoeff() &&
      ldlt.rcond() > rcond_floor;
    if (ldlt.info() == Eigen::Success && ldlt.isPositive() && regular) {
      Eigen::VectorXd delta = ldlt.solve(-Jtr);
      if (delta.allFinite()) {
        if (verbose && mu > 0.0)
          std::cout << "Gauss-Newton system damped:\tmu = " << mu << std::endl;
        return delta;
      }
    }
    mu = mu == 0.0 ? damping * scale : mu * 10.0;
  }
  return std::nullopt;
}

SegmentFit fitNonlinear(const SampleVector &samples, const FitOptions &options) {
  auto result = fitLinear(samples, options);
  if (result.report.status == FitStatus::Degenerate)
    return result;

  auto points = samplePoints(samples);
  auto initial_parameters = result.parameters;
  Unknowns u = { points, initial_parameters, (size_t)options.degree, options.fit_parameters };

  size_t k = u.interior(), m = points.size();
  Eigen::VectorXd x(2 * k + (u.fit_parameters ? m : 0));
  auto cpts = controlPoints(result.segment);
  for (size_t j = 0; j < k; ++j) {
    x(2 * j) = cpts[j+1][0];
    x(2 * j + 1) = cpts[j+1][1];
  }
  if (u.fit_parameters)
    for (size_t i = 0; i < m; ++i)
      x(2 * k + i) = initial_parameters[i];

  double residual = result.report.residual_sum_of_squares;
  auto &report = result.report;
  report.converged = false;
  report.status = FitStatus::IterationLimit;

  Eigen::MatrixXd JtJ;
  Eigen::VectorXd Jtr;
  for (size_t iteration = 0; iteration < options.max_iterations; ++iteration) {
    if (residual <= options.residual_floor) {
      report.converged = true;
      report.status = FitStatus::Converged;
      break;
    }

    normalEquations(u, x, JtJ, Jtr);
    auto delta = gaussNewtonStep(JtJ, Jtr, options.damping, options.verbose);
    if (!delta) {
      report.status = FitStatus::Degenerate;
      break;
    }
    if (delta->norm() <= options.tolerance * (x.norm() + options.tolerance)) {
      // A vanishing first step leaves the linear fit as it is
      if (report.iterations == 0) {
        report.status = FitStatus::LineSearchFailed;
        break;
      }
      report.converged = true;
      report.status = FitStatus::Converged;
      break;
    }

    // Backtracking line search
    double alpha = 1.0, trial_residual = residual;
    Eigen::VectorXd trial;
    bool improved = false;
    while (alpha >= options.min_step_scale) {
      trial = x + *delta * alpha;
      u.clamp(trial);
      trial_residual = u.residual(trial);
      if (trial_residual < residual) {
        improved = true;
        break;
      }
      alpha *= options.backtrack_factor;
    }
    if (!improved) {
      report.status = FitStatus::LineSearchFailed;
      break;
    }

    double improvement = residual - trial_residual;
    x = trial;
    residual = trial_residual;
    report.iterations = iteration + 1;

    if (options.verbose)
      std::cout << "Gauss-Newton step #" << report.iterations << ":\tresidual = " << residual
                << "\tstep scale = " << alpha << std::endl;

    if (improvement <= options.tolerance * (residual + improvement)) {
      report.converged = true;
      report.status = FitStatus::Converged;
      break;
    }
  }

  result.segment = u.segment(x);
  result.parameters = u.parameters(x);
  report.residual_sum_of_squares = residual;
  return result;
}

}
