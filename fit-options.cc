#include "fit-options.hh"
#include "switches.hh"

namespace BezierFit {

std::string statusName(FitStatus status) {
  switch (status) {
  case FitStatus::Converged: return "converged";
  case FitStatus::Degenerate: return "degenerate";
  case FitStatus::IterationLimit: return "iteration limit";
  case FitStatus::LineSearchFailed: return "line search failed";
  }
  return "unknown";
}

FitOptions fitOptions(const std::vector<std::string> &switches) {
  FitOptions options;
  parseSwitch<double>(switches, "tolerance", &options.tolerance, options.tolerance);
  parseSwitch<size_t>(switches, "max-iterations", &options.max_iterations,
                      options.max_iterations);
  parseSwitch<double>(switches, "residual-floor", &options.residual_floor,
                      options.residual_floor);
  parseSwitch<size_t>(switches, "projection-resolution", &options.projection_resolution,
                      options.projection_resolution);
  parseSwitch<double>(switches, "backtrack-factor", &options.backtrack_factor,
                      options.backtrack_factor);
  parseSwitch<double>(switches, "min-step-scale", &options.min_step_scale,
                      options.min_step_scale);
  parseSwitch<double>(switches, "damping", &options.damping, options.damping);
  options.fit_parameters = !parseFlag(switches, "fixed-parameters");
  options.verbose = parseFlag(switches, "verbose");

  size_t degree;
  parseSwitch<size_t>(switches, "degree", &degree, 3);
  if (degree == 2)
    options.degree = Degree::Quadratic;
  else if (degree == 3)
    options.degree = Degree::Cubic;
  else
    throw InvalidInput("degree must be 2 or 3, got " + std::to_string(degree));

  std::string param;
  parseSwitch<std::string>(switches, "parameterization", &param, "chord-length");
  if (param == "chord-length")
    options.parameterization = Parameterization::ChordLength;
  else if (param == "uniform")
    options.parameterization = Parameterization::Uniform;
  else if (param == "centripetal")
    options.parameterization = Parameterization::Centripetal;
  else
    throw InvalidInput("unknown parameterization: " + param);

  std::string t_update;
  parseSwitch<std::string>(switches, "t-update", &t_update, "projection");
  if (t_update == "projection")
    options.t_update = TUpdate::Projection;
  else if (t_update == "gauss-newton")
    options.t_update = TUpdate::GaussNewton;
  else
    throw InvalidInput("unknown parameter update: " + t_update);

  if (!(options.tolerance >= 0))
    throw InvalidInput("tolerance must be non-negative");
  if (!(options.backtrack_factor > 0 && options.backtrack_factor < 1))
    throw InvalidInput("backtrack factor must lie in (0,1)");
  if (options.projection_resolution == 0)
    throw InvalidInput("projection resolution must be positive");

  return options;
}

FitMethod fitMethod(const std::vector<std::string> &switches) {
  std::string method;
  parseSwitch<std::string>(switches, "method", &method, "nonlinear");
  if (method == "linear")
    return FitMethod::Linear;
  if (method == "alternating")
    return FitMethod::Alternating;
  if (method == "nonlinear")
    return FitMethod::Nonlinear;
  throw InvalidInput("unknown fitting method: " + method);
}

}
