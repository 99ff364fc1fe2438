#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bezier.hh"

namespace BezierFit {

struct Sample {
  Point point;
  std::optional<double> parameter; // nullopt: to be estimated
};
using SampleVector = std::vector<Sample>;

enum class Degree { Quadratic = 2, Cubic = 3 };

enum class Parameterization { ChordLength, Uniform, Centripetal };

enum class FitMethod { Linear, Alternating, Nonlinear };

// Parameter refresh of the alternating fitter
enum class TUpdate { Projection, GaussNewton };

struct FitOptions {
  double tolerance = 1.0e-8;           // relative residual improvement / step size
  size_t max_iterations = 50;
  Degree degree = Degree::Cubic;
  bool fit_parameters = true;          // nonlinear fitter also moves the t_i
  double residual_floor = 1.0e-20;     // stop iterating below this residual
  Parameterization parameterization = Parameterization::ChordLength;
  size_t projection_resolution = 16;   // coarse samples seeding the projection
  TUpdate t_update = TUpdate::Projection;
  double backtrack_factor = 0.5;
  double min_step_scale = 1.0e-10;
  double damping = 1.0e-9;             // relative to the largest diagonal of J^T J
  bool verbose = false;                // print iteration progress
};

enum class FitStatus { Converged, Degenerate, IterationLimit, LineSearchFailed };

struct FitReport {
  double residual_sum_of_squares = 0.0;
  size_t iterations = 0;
  bool converged = false;
  FitStatus status = FitStatus::Converged;
};

struct SegmentFit {
  Segment segment;
  Geometry::DoubleVector parameters;
  FitReport report;
};

std::string statusName(FitStatus status);

// Reads --tolerance=, --max-iterations=, --degree=, --fixed-parameters,
// --residual-floor=, --parameterization=, --projection-resolution=,
// --backtrack-factor=, --min-step-scale=, --damping=, --t-update=, --verbose;
// throws InvalidInput on unknown enumeration values
FitOptions fitOptions(const std::vector<std::string> &switches);

FitMethod fitMethod(const std::vector<std::string> &switches);

}
