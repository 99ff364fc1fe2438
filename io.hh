#pragma once

#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "bezier.hh"

namespace BezierFit {

// Malformed SVG path or JSON text
class ParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// "M x,y C x1,y1 x2,y2 x,y ... [Z]"; quadratic segments are written as cubics
std::string writeSVGPath(const Curve &curve,
                         int precision = std::numeric_limits<double>::max_digits10);

// One curve per subpath. Supports M, L, H, V, C, S, Q, T, Z (absolute and relative);
// lines are stored as quadratics with the control point in the middle.
std::vector<Curve> parseSVGPath(const std::string &path);

// [{"x":0.0,"y":0.0,"on":true}, ...]
std::string writeJSON(const std::vector<ControlPoint> &points);

// `on` is optional and defaults to true; coordinates must be finite numbers
std::vector<ControlPoint> parseJSON(const std::string &json);

enum class InputFormat { SVGPath, JSON };

// JSON when the text is a valid JSON array, SVG path when it starts with a
// path command, nullopt otherwise
std::optional<InputFormat> detectFormat(const std::string &text);

// Whitespace-separated x y pairs
Geometry::Point2DVector readPoints(std::string filename);

// SVG document showing the curve and the samples it was fitted to
void writeSVG(const Curve &curve, const Geometry::Point2DVector &samples, std::string filename);

}
