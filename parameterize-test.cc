#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "parameterize.hh"

using namespace BezierFit;
using Geometry::DoubleVector;
using Geometry::Point2DVector;

static void expectParameters(const DoubleVector &actual, const DoubleVector &expected) {
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < actual.size(); ++i)
    EXPECT_NEAR(actual[i], expected[i], 1.0e-15) << "at index " << i;
}

TEST(Parameterization, ChordLength) {
  Point2DVector points = { Point(0, 0), Point(1, 1), Point(2, 1), Point(3, 0) };
  expectParameters(chordLengthParameters(points),
                   { 0.0, 0.36939806251812934, 0.6306019374818708, 1.0 });
}

TEST(Parameterization, CoincidentPointsAreUniform) {
  Point2DVector points(4, Point(2, 3));
  expectParameters(chordLengthParameters(points), { 0.0, 1.0 / 3, 2.0 / 3, 1.0 });
}

TEST(Parameterization, UniformAndCentripetal) {
  expectParameters(uniformParameters(5), { 0.0, 0.25, 0.5, 0.75, 1.0 });

  Point2DVector points = { Point(0, 0), Point(4, 0), Point(5, 0) };
  expectParameters(centripetalParameters(points), { 0.0, 2.0 / 3, 1.0 });
  expectParameters(estimateParameters(points, Parameterization::Centripetal),
                   { 0.0, 2.0 / 3, 1.0 });
  expectParameters(estimateParameters(points, Parameterization::ChordLength),
                   { 0.0, 0.8, 1.0 });
  expectParameters(estimateParameters(points, Parameterization::Uniform),
                   { 0.0, 0.5, 1.0 });
}

TEST(Parameterization, SuppliedParametersAreKept) {
  Point2DVector points = { Point(0, 0), Point(4, 0), Point(5, 0) };
  FitOptions options;
  expectParameters(initialParameters(makeSamples(points, { 0.0, 0.1, 1.0 }), options),
                   { 0.0, 0.1, 1.0 });
  expectParameters(initialParameters(makeSamples(points), options), { 0.0, 0.8, 1.0 });

  options.parameterization = Parameterization::Uniform;
  expectParameters(initialParameters(makeSamples(points), options), { 0.0, 0.5, 1.0 });
}

TEST(Parameterization, InvalidSamples) {
  FitOptions options;
  EXPECT_THROW(initialParameters({}, options), InvalidInput);
  EXPECT_THROW(initialParameters(makeSamples({ Point(1, 1) }), options), InvalidInput);

  double nan = std::numeric_limits<double>::quiet_NaN();
  double inf = std::numeric_limits<double>::infinity();
  EXPECT_THROW(initialParameters(makeSamples({ Point(0, 0), Point(nan, 1) }), options),
               InvalidInput);
  EXPECT_THROW(initialParameters(makeSamples({ Point(0, inf), Point(1, 1) }), options),
               InvalidInput);

  SampleVector mixed = { { Point(0, 0), 0.0 }, { Point(1, 1), std::nullopt },
                         { Point(2, 0), 1.0 } };
  EXPECT_THROW(initialParameters(mixed, options), InvalidInput);

  Point2DVector points = { Point(0, 0), Point(1, 1), Point(2, 0) };
  EXPECT_THROW(initialParameters(makeSamples(points, { 0.0, 1.5, 1.0 }), options),
               InvalidInput);
  EXPECT_THROW(initialParameters(makeSamples(points, { -0.1, 0.5, 1.0 }), options),
               InvalidInput);
  EXPECT_THROW(initialParameters(makeSamples(points, { 0.0, 0.7, 0.6 }), options),
               InvalidInput);
  EXPECT_THROW(makeSamples(points, { 0.0, 1.0 }), InvalidInput);
}
