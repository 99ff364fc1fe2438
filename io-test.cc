#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "io.hh"

using namespace BezierFit;

static void expectSamePoint(const Point &a, const Point &b, double tol = 1.0e-12) {
  EXPECT_NEAR(a[0], b[0], tol);
  EXPECT_NEAR(a[1], b[1], tol);
}

static const CubicSegment arch = { Point(50, 200), Point(100, 50), Point(200, 50), Point(250, 200) };

TEST(SVGPath, Write) {
  EXPECT_EQ(writeSVGPath(Curve({ arch })), "M 50,200 C 100,50 200,50 250,200");

  QuadraticSegment q = { Point(0, 0), Point(3, 3), Point(6, 0) };
  EXPECT_EQ(writeSVGPath(Curve({ q })), "M 0,0 C 2,2 4,2 6,0");

  QuadraticSegment back = { Point(6, 0), Point(3, -3), Point(0, 0) };
  EXPECT_EQ(writeSVGPath(Curve({ q, back }, true)), "M 0,0 C 2,2 4,2 6,0 C 4,-2 2,-2 0,0 Z");
}

TEST(SVGPath, ParseAbsolute) {
  auto curves = parseSVGPath("M 50,200 C 100,50 200,50 250,200");
  ASSERT_EQ(curves.size(), 1u);
  ASSERT_EQ(curves[0].size(), 1u);
  auto cp = controlPoints(curves[0].segments()[0]);
  ASSERT_EQ(cp.size(), 4u);
  expectSamePoint(cp[1], Point(100, 50));
  expectSamePoint(cp[3], Point(250, 200));
  EXPECT_FALSE(curves[0].closed());
}

TEST(SVGPath, RoundTrip) {
  QuadraticSegment q = { Point(250, 200), Point(300, 300), Point(350, 180.5) };
  Curve curve({ arch, q });
  auto curves = parseSVGPath(writeSVGPath(curve));
  ASSERT_EQ(curves.size(), 1u);
  ASSERT_EQ(curves[0].size(), 2u);
  for (double u = 0.0; u <= 2.0; u += 0.25)
    expectSamePoint(curves[0].eval(u), curve.eval(u), 1.0e-12);

  // Elevated handles with long expansions survive the text form
  QuadraticSegment third = { Point(0, 0), Point(1.0 / 3.0, 0.7), Point(1, 0.1) };
  curves = parseSVGPath(writeSVGPath(Curve({ third })));
  auto cp = controlPoints(curves[0].segments()[0]);
  auto elevated = elevate(third);
  EXPECT_EQ(cp[1][0], elevated.p1[0]);
  EXPECT_EQ(cp[2][1], elevated.p2[1]);
}

TEST(SVGPath, LinesAndRelativeCommands) {
  auto curves = parseSVGPath("m10 10 l10 0 h5 v-5");
  ASSERT_EQ(curves.size(), 1u);
  const auto &curve = curves[0];
  ASSERT_EQ(curve.size(), 3u);
  expectSamePoint(curve.start(), Point(10, 10));
  expectSamePoint(curve.end(), Point(25, 5));
  // Lines are quadratics with the handle in the middle
  auto cp = controlPoints(curve.segments()[0]);
  ASSERT_EQ(cp.size(), 3u);
  expectSamePoint(cp[1], Point(15, 10));

  curves = parseSVGPath("M0 0 H4 V3 L0 0");
  ASSERT_EQ(curves[0].size(), 3u);
  expectSamePoint(curves[0].eval(1.0), Point(4, 0));
  expectSamePoint(curves[0].eval(2.0), Point(4, 3));
}

TEST(SVGPath, SmoothCommands) {
  auto curves = parseSVGPath("M0 0 C1 1 2 1 3 0 S5 -1 6 0");
  ASSERT_EQ(curves[0].size(), 2u);
  expectSamePoint(controlPoints(curves[0].segments()[1])[1], Point(4, -1));

  curves = parseSVGPath("M0 0 Q1 1 2 0 T4 0");
  ASSERT_EQ(curves[0].size(), 2u);
  expectSamePoint(controlPoints(curves[0].segments()[1])[1], Point(3, -1));

  // Without a preceding curve the first handle is the current point
  curves = parseSVGPath("M0 0 L1 0 S2 1 3 0");
  expectSamePoint(controlPoints(curves[0].segments()[1])[1], Point(1, 0));
}

TEST(SVGPath, ClosePath) {
  auto curves = parseSVGPath("M0 0 L1 0 L1 1 Z");
  ASSERT_EQ(curves.size(), 1u);
  EXPECT_TRUE(curves[0].closed());
  EXPECT_EQ(curves[0].size(), 3u);

  // No closing line when the path already returns to its start
  curves = parseSVGPath("M0 0 L1 0 L0 0 z");
  EXPECT_TRUE(curves[0].closed());
  EXPECT_EQ(curves[0].size(), 2u);
}

TEST(SVGPath, Subpaths) {
  auto curves = parseSVGPath("M0 0 L1 1 M5 5 L6 6 L7 5");
  ASSERT_EQ(curves.size(), 2u);
  EXPECT_EQ(curves[0].size(), 1u);
  EXPECT_EQ(curves[1].size(), 2u);
  expectSamePoint(curves[1].start(), Point(5, 5));
}

TEST(SVGPath, NumberSyntax) {
  // Exponents, signs and dots separate adjacent numbers; extra pairs after M are linetos
  auto curves = parseSVGPath("M1e1-2.5.5.5");
  ASSERT_EQ(curves.size(), 1u);
  expectSamePoint(curves[0].start(), Point(10, -2.5));
  expectSamePoint(curves[0].end(), Point(0.5, 0.5));

  curves = parseSVGPath("M 0,0 L 1.5E-1,+2");
  expectSamePoint(curves[0].end(), Point(0.15, 2));
}

TEST(SVGPath, Errors) {
  EXPECT_THROW(parseSVGPath("M0 0 A 1 1 0 0 1 2 2"), ParseError);
  EXPECT_THROW(parseSVGPath("L1 1"), ParseError);
  EXPECT_THROW(parseSVGPath("10 10"), ParseError);
  EXPECT_THROW(parseSVGPath("M0 0 X 1 1"), ParseError);
  EXPECT_THROW(parseSVGPath("M0 0 L1"), ParseError);
  EXPECT_THROW(parseSVGPath("M0 0 L1 ."), ParseError);
  EXPECT_TRUE(parseSVGPath("").empty());
}

TEST(JSON, Write) {
  std::vector<ControlPoint> points = { { Point(0, 0), true }, { Point(1, 2.5), false },
                                       { Point(3, 0), true } };
  EXPECT_EQ(writeJSON(points),
            "[{\"x\":0.0,\"y\":0.0,\"on\":true},{\"x\":1.0,\"y\":2.5,\"on\":false},"
            "{\"x\":3.0,\"y\":0.0,\"on\":true}]");
}

TEST(JSON, Parse) {
  auto points = parseJSON(" [ {\"x\": 1, \"y\": -2e1},\n {\"on\": false, \"y\": 3.5, \"x\": 0} ] ");
  ASSERT_EQ(points.size(), 2u);
  expectSamePoint(points[0].position, Point(1, -20));
  EXPECT_TRUE(points[0].on_curve);
  expectSamePoint(points[1].position, Point(0, 3.5));
  EXPECT_FALSE(points[1].on_curve);

  EXPECT_TRUE(parseJSON("[]").empty());
}

TEST(JSON, ExactNumbers) {
  std::vector<ControlPoint> points = { { Point(0.1 + 0.2, -1.0 / 3.0), true } };
  auto decoded = parseJSON(writeJSON(points));
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded[0].position[0], 0.1 + 0.2);
  EXPECT_EQ(decoded[0].position[1], -1.0 / 3.0);
}

TEST(JSON, CurveRoundTrip) {
  QuadraticSegment q = { Point(250, 200), Point(300, 300), Point(350, 180.5) };
  Curve curve({ arch, q });
  auto decoded = fromControlPoints(parseJSON(writeJSON(toControlPoints(curve))));
  ASSERT_EQ(decoded.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<CubicSegment>(decoded.segments()[0]));
  EXPECT_TRUE(std::holds_alternative<QuadraticSegment>(decoded.segments()[1]));
  expectSamePoint(decoded.eval(1.5), curve.eval(1.5), 1.0e-9);
}

TEST(JSON, Errors) {
  EXPECT_THROW(parseJSON("[{\"x\":1}]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":1,\"y\":2,\"z\":3}]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":1,\"y\":2}] 5"), ParseError);
  EXPECT_THROW(parseJSON("{\"x\":1,\"y\":2}"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":\"a\",\"y\":1}]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":1,\"y\":2,\"on\":1}]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":1,\"y\":2},]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":1,\"y\":2}"), ParseError);
  EXPECT_THROW(parseJSON("[1, 2]"), ParseError);
  EXPECT_THROW(parseJSON(""), ParseError);
}

TEST(JSON, NonFiniteAndNonJSONNumbers) {
  EXPECT_THROW(parseJSON("[{\"x\":nan,\"y\":0}]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":inf,\"y\":0}]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":0x10,\"y\":0}]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":1e400,\"y\":0}]"), ParseError);
  EXPECT_THROW(parseJSON("[{\"x\":1,\"x\":-inf,\"y\":0}]"), ParseError);
}

TEST(Formats, Detect) {
  EXPECT_EQ(detectFormat("  [{\"x\":1,\"y\":2}]\n"), InputFormat::JSON);
  EXPECT_EQ(detectFormat("[]"), InputFormat::JSON);
  EXPECT_EQ(detectFormat("M 0,0 C 1,1 2,1 3,0"), InputFormat::SVGPath);
  EXPECT_EQ(detectFormat("\nm10 10 l10 0"), InputFormat::SVGPath);
  EXPECT_FALSE(detectFormat("[1, 2").has_value());
  EXPECT_FALSE(detectFormat("0 0\n1 1\n").has_value());
  EXPECT_FALSE(detectFormat("   ").has_value());
}

TEST(Files, ReadPoints) {
  auto filename = testing::TempDir() + "bezierfit-points.txt";
  {
    std::ofstream f(filename);
    f << "0 0\n1 1.5\n  2 -1e-1\n";
  }
  auto points = readPoints(filename);
  ASSERT_EQ(points.size(), 3u);
  expectSamePoint(points[2], Point(2, -0.1));

  {
    std::ofstream f(filename);
    f << "0 0 1";
  }
  EXPECT_THROW(readPoints(filename), ParseError);
  {
    std::ofstream f(filename);
    f << "0 0 1 x";
  }
  EXPECT_THROW(readPoints(filename), ParseError);

  EXPECT_THROW(readPoints(testing::TempDir() + "no/such/file.txt"), std::runtime_error);
}

TEST(Files, WriteSVG) {
  auto filename = testing::TempDir() + "bezierfit-curve.svg";
  Geometry::Point2DVector samples = { Point(50, 200), Point(150, 90), Point(250, 200) };
  writeSVG(Curve({ arch }), samples, filename);

  std::ifstream f(filename);
  std::stringstream s;
  s << f.rdbuf();
  auto svg = s.str();
  EXPECT_EQ(svg.find("<svg"), 0u);
  EXPECT_NE(svg.find("d=\"M 50,200 C 100,50 200,50 250,200\""), std::string::npos);
  EXPECT_NE(svg.find("<circle cx=\"150\" cy=\"90\""), std::string::npos);
  EXPECT_NE(svg.find("</svg>"), std::string::npos);
}
