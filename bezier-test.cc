#include <gtest/gtest.h>

#include "bezier.hh"

using namespace BezierFit;

static void expectSamePoint(const Point &a, const Point &b, double tol = 1.0e-12) {
  EXPECT_NEAR(a[0], b[0], tol);
  EXPECT_NEAR(a[1], b[1], tol);
}

static const CubicSegment arch = { Point(0, 0), Point(1, 2), Point(2, 2), Point(3, 0) };

TEST(Segment, Evaluate) {
  expectSamePoint(evaluate(arch, 0.0), Point(0, 0));
  expectSamePoint(evaluate(arch, 1.0), Point(3, 0));
  expectSamePoint(evaluate(arch, 0.5), Point(1.5, 1.5));

  QuadraticSegment q = { Point(0, 0), Point(1, 2), Point(2, 0) };
  expectSamePoint(evaluate(q, 0.5), Point(1, 1));
  EXPECT_EQ(degree(q), 2u);
  EXPECT_EQ(degree(arch), 3u);
}

TEST(Segment, Derivatives) {
  expectSamePoint(derivative(arch, 0.0), Point(3, 6));
  expectSamePoint(derivative(arch, 1.0), Point(3, -6));
  expectSamePoint(secondDerivative(arch, 0.0), Point(0, -12));

  // Central difference
  double t = 0.3, h = 1.0e-6;
  auto d = (evaluate(arch, t + h) - evaluate(arch, t - h)) / (2 * h);
  expectSamePoint(derivative(arch, t), d, 1.0e-6);
}

TEST(Segment, BernsteinPartitionOfUnity) {
  Geometry::DoubleVector coeff;
  bernsteinAll(3, 0.25, coeff);
  ASSERT_EQ(coeff.size(), 4u);
  EXPECT_NEAR(coeff[0], 27.0 / 64, 1.0e-15);
  EXPECT_NEAR(coeff[1], 27.0 / 64, 1.0e-15);
  EXPECT_NEAR(coeff[2], 9.0 / 64, 1.0e-15);
  EXPECT_NEAR(coeff[3], 1.0 / 64, 1.0e-15);
}

TEST(Segment, MakeSegment) {
  EXPECT_TRUE(std::holds_alternative<QuadraticSegment>(
                makeSegment({ Point(0, 0), Point(1, 1), Point(2, 0) })));
  EXPECT_TRUE(std::holds_alternative<CubicSegment>(makeSegment(controlPoints(arch))));
  EXPECT_THROW(makeSegment({ Point(0, 0), Point(1, 1) }), InvalidInput);
}

TEST(Segment, SubdivideThenMerge) {
  auto [left, right] = subdivide(arch, 0.3);
  expectSamePoint(endPoint(left), evaluate(arch, 0.3));
  expectSamePoint(startPoint(right), evaluate(arch, 0.3));
  expectSamePoint(evaluate(left, 0.5), evaluate(arch, 0.15));
  expectSamePoint(evaluate(right, 0.5), evaluate(arch, 0.65));

  auto merged = merge(left, right);
  ASSERT_TRUE(merged.has_value());
  auto original = controlPoints(arch), result = controlPoints(*merged);
  for (size_t i = 0; i < original.size(); ++i)
    expectSamePoint(result[i], original[i], 1.0e-9);
}

TEST(Segment, MergeRejectsUnrelatedPieces) {
  auto [left, right] = subdivide(arch, 0.5);
  auto cp = controlPoints(right);
  cp[2][1] += 0.5;
  EXPECT_FALSE(merge(left, makeSegment(cp)).has_value());

  QuadraticSegment q = { endPoint(left), Point(4, 1), Point(5, 0) };
  EXPECT_FALSE(merge(left, q).has_value());
}

TEST(Segment, ElevateIsExact) {
  QuadraticSegment q = { Point(0, 0), Point(1, 3), Point(4, 1) };
  auto c = elevate(q);
  for (double t = 0.0; t <= 1.0; t += 0.125)
    expectSamePoint(evaluate(c, t), evaluate(q, t));
}

TEST(Curve, Validation) {
  EXPECT_THROW(join({}), InvalidInput);

  CubicSegment far = { Point(4, 0), Point(5, 1), Point(6, 1), Point(7, 0) };
  EXPECT_THROW(Curve({ arch, far }), InvalidInput);

  // Closed curves must end where they start
  EXPECT_THROW(Curve({ arch }, true), InvalidInput);
  CubicSegment back = { Point(3, 0), Point(2, -2), Point(1, -2), Point(0, 0) };
  Curve loop({ arch, back }, true);
  EXPECT_TRUE(loop.closed());
  expectSamePoint(loop.start(), loop.end());
}

TEST(Curve, Evaluation) {
  QuadraticSegment q = { Point(3, 0), Point(4, -1), Point(5, 0) };
  Curve curve = join({ arch, q });
  EXPECT_EQ(curve.size(), 2u);
  expectSamePoint(curve.eval(0.5), evaluate(arch, 0.5));
  expectSamePoint(curve.eval(1.5), evaluate(q, 0.5));
  expectSamePoint(curve.eval(2.0), Point(5, 0));
  expectSamePoint(curve.end(), Point(5, 0));
}

TEST(Curve, Subdivision) {
  Curve curve({ arch });
  auto halves = subdivide(curve);
  ASSERT_EQ(halves.size(), 2u);
  expectSamePoint(halves.eval(1.0), evaluate(arch, 0.5));
  expectSamePoint(halves.eval(0.5), evaluate(arch, 0.25));

  auto split = subdivide(curve, 0, 0.25);
  ASSERT_EQ(split.size(), 2u);
  expectSamePoint(split.eval(1.0), evaluate(arch, 0.25));

  EXPECT_THROW(subdivide(curve, 1, 0.5), InvalidInput);
  EXPECT_THROW(subdivide(curve, 0, 0.0), InvalidInput);
  EXPECT_THROW(subdivide(curve, 0, 1.0), InvalidInput);
}

TEST(ControlPoints, RoundTrip) {
  QuadraticSegment q = { Point(3, 0), Point(4, -1), Point(5, 0) };
  Curve curve({ arch, q });
  auto points = toControlPoints(curve);
  ASSERT_EQ(points.size(), 6u);
  bool expected[] = { true, false, false, true, false, true };
  for (size_t i = 0; i < points.size(); ++i)
    EXPECT_EQ(points[i].on_curve, expected[i]) << "at index " << i;

  auto decoded = fromControlPoints(points);
  ASSERT_EQ(decoded.size(), 2u);
  EXPECT_FALSE(decoded.closed());
  EXPECT_TRUE(std::holds_alternative<CubicSegment>(decoded.segments()[0]));
  EXPECT_TRUE(std::holds_alternative<QuadraticSegment>(decoded.segments()[1]));
  expectSamePoint(decoded.eval(1.5), curve.eval(1.5));
}

TEST(ControlPoints, Decoding) {
  // on,on is a straight line with its handle in the middle
  auto line = fromControlPoints({ { Point(0, 0), true }, { Point(2, 4), true } });
  ASSERT_EQ(line.size(), 1u);
  auto cp = controlPoints(line.segments()[0]);
  ASSERT_EQ(cp.size(), 3u);
  expectSamePoint(cp[1], Point(1, 2));

  auto triangle = fromControlPoints({ { Point(0, 0), true }, { Point(1, 0), true },
                                      { Point(0, 1), true }, { Point(0, 0), true } });
  EXPECT_EQ(triangle.size(), 3u);
  EXPECT_TRUE(triangle.closed());
}

TEST(ControlPoints, InvalidLists) {
  EXPECT_THROW(fromControlPoints({}), InvalidInput);
  EXPECT_THROW(fromControlPoints({ { Point(0, 0), true } }), InvalidInput);
  EXPECT_THROW(fromControlPoints({ { Point(0, 0), false }, { Point(1, 0), true } }),
               InvalidInput);
  EXPECT_THROW(fromControlPoints({ { Point(0, 0), true }, { Point(1, 0), false } }),
               InvalidInput);
  EXPECT_THROW(fromControlPoints({ { Point(0, 0), true }, { Point(1, 0), false },
                                   { Point(2, 0), false }, { Point(3, 0), false },
                                   { Point(4, 0), true } }),
               InvalidInput);
}
