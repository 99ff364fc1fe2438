#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "io.hh"

namespace BezierFit {

using Geometry::Point2DVector;

static void writePoint(std::ostream &os, const Point &p) {
  os << p[0] << ',' << p[1];
}

std::string writeSVGPath(const Curve &curve, int precision) {
  std::ostringstream s;
  s.precision(precision);
  s << "M ";
  writePoint(s, curve.start());
  for (const auto &segment : curve.segments()) {
    CubicSegment c;
    if (auto q = std::get_if<QuadraticSegment>(&segment))
      c = elevate(*q);
    else
      c = std::get<CubicSegment>(segment);
    s << " C ";
    writePoint(s, c.p1);
    s << ' ';
    writePoint(s, c.p2);
    s << ' ';
    writePoint(s, c.p3);
  }
  if (curve.closed())
    s << " Z";
  return s.str();
}

namespace {

class PathReader {
public:
  PathReader(const std::string &path) : s(path), pos(0) { }

  void skipSeparators() {
    while (pos < s.size() && (std::isspace((unsigned char)s[pos]) || s[pos] == ','))
      pos++;
  }

  bool atEnd() {
    skipSeparators();
    return pos >= s.size();
  }

  bool atNumber() {
    skipSeparators();
    if (pos >= s.size())
      return false;
    char c = s[pos];
    return std::isdigit((unsigned char)c) || c == '.' || c == '-' || c == '+';
  }

  char command() {
    skipSeparators();
    return s[pos++];
  }

  // Scans [sign] digits [. digits] [e [sign] digits]; "1.5.5" reads as 1.5 and .5
  double number() {
    if (!atNumber())
      throw ParseError("number expected at position " + std::to_string(pos));
    size_t start = pos;
    if (s[pos] == '-' || s[pos] == '+')
      pos++;
    size_t digits = digitRun();
    if (pos < s.size() && s[pos] == '.') {
      pos++;
      digits += digitRun();
    }
    if (digits == 0)
      throw ParseError("malformed number at position " + std::to_string(start));
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
      size_t mark = pos++;
      if (pos < s.size() && (s[pos] == '-' || s[pos] == '+'))
        pos++;
      if (digitRun() == 0)
        pos = mark;             // not an exponent after all
    }
    return std::strtod(s.substr(start, pos - start).c_str(), nullptr);
  }

  Point point(const Point &origin, bool relative) {
    double x = number();
    double y = number();
    if (relative)
      return Point(origin[0] + x, origin[1] + y);
    return Point(x, y);
  }

private:
  size_t digitRun() {
    size_t count = 0;
    while (pos < s.size() && std::isdigit((unsigned char)s[pos])) {
      pos++;
      count++;
    }
    return count;
  }

  const std::string &s;
  size_t pos;
};

Segment line(const Point &from, const Point &to) {
  return QuadraticSegment{ from, (from + to) / 2.0, to };
}

}

std::vector<Curve> parseSVGPath(const std::string &path) {
  std::vector<Curve> result;
  std::vector<Segment> segments;
  PathReader reader(path);
  Point start(0, 0), current(0, 0), last_control(0, 0);
  char cmd = 0, previous = 0;

  auto flush = [&](bool closed) {
    if (!segments.empty())
      result.emplace_back(segments, closed);
    segments.clear();
  };

  while (!reader.atEnd()) {
    if (!reader.atNumber()) {
      cmd = reader.command();
      if (!std::strchr("MmLlHhVvCcSsQqTtZzAa", cmd))
        throw ParseError(std::string("unknown path command '") + cmd + "'");
    } else if (cmd == 0 || cmd == 'Z' || cmd == 'z') {
      throw ParseError("path data must start with a command");
    }
    if (previous == 0 && cmd != 'M' && cmd != 'm')
      throw ParseError("path data must start with a moveto command");

    bool relative = std::islower((unsigned char)cmd);
    char upper = std::toupper((unsigned char)cmd);
    switch (upper) {
    case 'M':
      flush(false);
      current = start = reader.point(current, relative);
      cmd = relative ? 'l' : 'L'; // subsequent pairs are implicit linetos
      break;
    case 'L': {
      auto to = reader.point(current, relative);
      segments.push_back(line(current, to));
      current = to;
      break;
    }
    case 'H': {
      double x = reader.number();
      Point to(relative ? current[0] + x : x, current[1]);
      segments.push_back(line(current, to));
      current = to;
      break;
    }
    case 'V': {
      double y = reader.number();
      Point to(current[0], relative ? current[1] + y : y);
      segments.push_back(line(current, to));
      current = to;
      break;
    }
    case 'C': {
      auto c1 = reader.point(current, relative);
      auto c2 = reader.point(current, relative);
      auto to = reader.point(current, relative);
      segments.push_back(CubicSegment{ current, c1, c2, to });
      last_control = c2;
      current = to;
      break;
    }
    case 'S': {
      Point c1 = current;
      if (previous == 'C' || previous == 'S')
        c1 = current + (current - last_control);
      auto c2 = reader.point(current, relative);
      auto to = reader.point(current, relative);
      segments.push_back(CubicSegment{ current, c1, c2, to });
      last_control = c2;
      current = to;
      break;
    }
    case 'Q': {
      auto c = reader.point(current, relative);
      auto to = reader.point(current, relative);
      segments.push_back(QuadraticSegment{ current, c, to });
      last_control = c;
      current = to;
      break;
    }
    case 'T': {
      Point c = current;
      if (previous == 'Q' || previous == 'T')
        c = current + (current - last_control);
      auto to = reader.point(current, relative);
      segments.push_back(QuadraticSegment{ current, c, to });
      last_control = c;
      current = to;
      break;
    }
    case 'Z':
      if (!segments.empty() && !samePoint(current, start, 1.0e-9))
        segments.push_back(line(current, start));
      flush(true);
      current = start;
      break;
    case 'A':
      throw ParseError("elliptical arcs are not supported");
    }
    previous = upper;
  }

  flush(false);
  return result;
}

std::string writeJSON(const std::vector<ControlPoint> &points) {
  auto array = nlohmann::ordered_json::array();
  for (const auto &p : points)
    array.push_back({ { "x", p.position[0] }, { "y", p.position[1] }, { "on", p.on_curve } });
  return array.dump();
}

static double coordinate(const nlohmann::json &value, const char *key, size_t index) {
  if (!value.is_number())
    throw ParseError("point #" + std::to_string(index) + ": " + key + " is not a number");
  double x = value.get<double>();
  if (!std::isfinite(x))
    throw ParseError("point #" + std::to_string(index) + ": " + key + " is not finite");
  return x;
}

std::vector<ControlPoint> parseJSON(const std::string &json) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(json);
  } catch (const nlohmann::json::exception &e) {
    throw ParseError(e.what());
  }
  if (!document.is_array())
    throw ParseError("control points must be a JSON array");

  std::vector<ControlPoint> result;
  for (const auto &item : document) {
    size_t index = result.size();
    if (!item.is_object())
      throw ParseError("point #" + std::to_string(index) + " is not an object");
    bool has_x = false, has_y = false;
    ControlPoint cp = { Point(0, 0), true };
    for (auto it = item.begin(); it != item.end(); ++it) {
      const auto &key = it.key();
      const auto &value = it.value();
      if (key == "x") {
        cp.position[0] = coordinate(value, "x", index);
        has_x = true;
      } else if (key == "y") {
        cp.position[1] = coordinate(value, "y", index);
        has_y = true;
      } else if (key == "on") {
        if (!value.is_boolean())
          throw ParseError("point #" + std::to_string(index) + ": on is not a boolean");
        cp.on_curve = value.get<bool>();
      } else {
        throw ParseError("unknown key \"" + key + "\"");
      }
    }
    if (!has_x || !has_y)
      throw ParseError("point #" + std::to_string(index) + " needs both x and y");
    result.push_back(cp);
  }
  return result;
}

std::optional<InputFormat> detectFormat(const std::string &text) {
  auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return std::nullopt;
  if (text[first] == '[' && nlohmann::json::accept(text))
    return InputFormat::JSON;
  if (std::strchr("MmLCQHVZ", text[first]))
    return InputFormat::SVGPath;
  return std::nullopt;
}

Point2DVector readPoints(std::string filename) {
  std::ifstream f(filename);
  if (!f)
    throw std::runtime_error("cannot open " + filename);
  f.exceptions(std::ios::badbit);
  Point2DVector result;
  double x, y;
  while (f >> x) {
    if (!(f >> y))
      throw ParseError("odd number of coordinates in " + filename);
    result.emplace_back(x, y);
  }
  if (!f.eof())
    throw ParseError("non-numeric data in " + filename);
  return result;
}

void writeSVG(const Curve &curve, const Point2DVector &samples, std::string filename) {
  Point2DVector all = samples;
  for (const auto &segment : curve.segments())
    for (const auto &p : controlPoints(segment))
      all.push_back(p);
  double xmin = all[0][0], xmax = xmin, ymin = all[0][1], ymax = ymin;
  for (const auto &p : all) {
    xmin = std::min(xmin, p[0]); xmax = std::max(xmax, p[0]);
    ymin = std::min(ymin, p[1]); ymax = std::max(ymax, p[1]);
  }
  double margin = std::max(std::max(xmax - xmin, ymax - ymin) * 0.05, 1.0e-3);
  double radius = margin / 5.0;

  std::ofstream f(filename);
  f.exceptions(std::ios::failbit | std::ios::badbit);
  f.precision(10);
  f << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\""
    << xmin - margin << ' ' << ymin - margin << ' '
    << xmax - xmin + 2 * margin << ' ' << ymax - ymin + 2 * margin << "\">" << std::endl;
  f << "  <path d=\"" << writeSVGPath(curve) << "\" fill=\"none\" stroke=\"black\""
    << " stroke-width=\"" << radius / 2.0 << "\"/>" << std::endl;
  for (const auto &p : samples)
    f << "  <circle cx=\"" << p[0] << "\" cy=\"" << p[1] << "\" r=\"" << radius
      << "\" fill=\"red\"/>" << std::endl;
  f << "</svg>" << std::endl;
}

}
