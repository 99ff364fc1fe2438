#include <gtest/gtest.h>

#include "fit-options.hh"
#include "switches.hh"

using namespace BezierFit;

TEST(Switches, ParseSwitch) {
  std::vector<std::string> switches = { "--max-error=0.5", "--closed", "--name=curve" };
  double max_error;
  EXPECT_TRUE(parseSwitch<double>(switches, "max-error", &max_error, 1.0));
  EXPECT_EQ(max_error, 0.5);
  EXPECT_TRUE(parseSwitch<bool>(switches, "closed"));
  EXPECT_FALSE(parseSwitch<bool>(switches, "max"));

  std::string name;
  EXPECT_TRUE(parseSwitch<std::string>(switches, "name", &name));
  EXPECT_EQ(name, "curve");

  size_t count;
  EXPECT_FALSE(parseSwitch<size_t>(switches, "count", &count, 7));
  EXPECT_EQ(count, 7u);

  EXPECT_EQ(findSwitch(switches, "closed"), std::string());
  EXPECT_EQ(findSwitch(switches, "name"), std::string("curve"));
  EXPECT_FALSE(findSwitch(switches, "max").has_value());
}

TEST(Switches, BadValues) {
  double x;
  size_t n;
  EXPECT_THROW(parseSwitch<double>({ "--x=abc" }, "x", &x), InvalidInput);
  EXPECT_TRUE(parseSwitch<double>({ "--x=" }, "x", &x, 2.0));
  EXPECT_EQ(x, 2.0);
  EXPECT_THROW(parseSwitch<size_t>({ "--n=-3" }, "n", &n), InvalidInput);
  EXPECT_THROW(parseSwitch<size_t>({ "--n=2.5" }, "n", &n), InvalidInput);
}

TEST(Switches, Collect) {
  char program[] = "fit-points", file[] = "points.txt", verbose[] = "--verbose",
    degree[] = "--degree=2";
  char *argv[] = { program, file, verbose, degree };
  auto switches = collectSwitches(4, argv, 2);
  ASSERT_EQ(switches.size(), 2u);
  EXPECT_EQ(switches[1], "--degree=2");
  EXPECT_THROW(collectSwitches(4, argv, 1), InvalidInput);
}

TEST(FitOptions, Defaults) {
  auto options = fitOptions({});
  EXPECT_EQ(options.tolerance, 1.0e-8);
  EXPECT_EQ(options.max_iterations, 50u);
  EXPECT_EQ(options.degree, Degree::Cubic);
  EXPECT_TRUE(options.fit_parameters);
  EXPECT_EQ(options.parameterization, Parameterization::ChordLength);
  EXPECT_EQ(options.projection_resolution, 16u);
  EXPECT_EQ(options.t_update, TUpdate::Projection);
  EXPECT_FALSE(options.verbose);
  EXPECT_EQ(fitMethod({}), FitMethod::Nonlinear);
}

TEST(FitOptions, FromSwitches) {
  auto options = fitOptions({ "--tolerance=1e-6", "--max-iterations=10", "--degree=2",
                              "--fixed-parameters", "--parameterization=centripetal",
                              "--verbose", "--damping=0.001", "--backtrack-factor=0.25" });
  EXPECT_EQ(options.tolerance, 1.0e-6);
  EXPECT_EQ(options.max_iterations, 10u);
  EXPECT_EQ(options.degree, Degree::Quadratic);
  EXPECT_FALSE(options.fit_parameters);
  EXPECT_EQ(options.parameterization, Parameterization::Centripetal);
  EXPECT_TRUE(options.verbose);
  EXPECT_EQ(options.damping, 0.001);
  EXPECT_EQ(options.backtrack_factor, 0.25);

  EXPECT_EQ(fitOptions({ "--t-update=gauss-newton" }).t_update, TUpdate::GaussNewton);
  EXPECT_EQ(fitOptions({ "--t-update=projection" }).t_update, TUpdate::Projection);

  EXPECT_EQ(fitMethod({ "--method=linear" }), FitMethod::Linear);
  EXPECT_EQ(fitMethod({ "--method=alternating" }), FitMethod::Alternating);
}

TEST(FitOptions, Invalid) {
  EXPECT_THROW(fitOptions({ "--degree=4" }), InvalidInput);
  EXPECT_THROW(fitOptions({ "--parameterization=arc" }), InvalidInput);
  EXPECT_THROW(fitOptions({ "--tolerance=-1" }), InvalidInput);
  EXPECT_THROW(fitOptions({ "--backtrack-factor=1" }), InvalidInput);
  EXPECT_THROW(fitOptions({ "--projection-resolution=0" }), InvalidInput);
  EXPECT_THROW(fitOptions({ "--max-iterations=many" }), InvalidInput);
  EXPECT_THROW(fitMethod({ "--method=newton" }), InvalidInput);
  EXPECT_THROW(fitOptions({ "--t-update=newton" }), InvalidInput);
}

TEST(FitOptions, OnOffSwitches) {
  EXPECT_TRUE(fitOptions({ "--fixed-parameters=false" }).fit_parameters);
  EXPECT_FALSE(fitOptions({ "--fixed-parameters=yes" }).fit_parameters);
  EXPECT_FALSE(fitOptions({ "--verbose=0" }).verbose);
  EXPECT_TRUE(fitOptions({ "--verbose=1" }).verbose);
  EXPECT_THROW(fitOptions({ "--verbose=maybe" }), InvalidInput);

  EXPECT_TRUE(parseFlag({ "--closed" }, "closed"));
  EXPECT_FALSE(parseFlag({}, "closed"));
  EXPECT_FALSE(parseFlag({ "--closed=no" }, "closed"));
}

TEST(FitOptions, StatusNames) {
  EXPECT_EQ(statusName(FitStatus::Converged), "converged");
  EXPECT_EQ(statusName(FitStatus::LineSearchFailed), "line search failed");
}
