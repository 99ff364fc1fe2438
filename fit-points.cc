#include <fstream>
#include <iostream>
#include <sstream>

#include "io.hh"
#include "piecewise-fit.hh"
#include "switches.hh"

using namespace BezierFit;

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <points.txt|path.svg|points.json> [switches]"
              << std::endl;
    std::cerr << "  --method=linear|alternating|nonlinear --max-error=<distance>" << std::endl;
    std::cerr << "  --degree=2|3 --tolerance=<x> --max-iterations=<n> --fixed-parameters" << std::endl;
    std::cerr << "  --parameterization=chord-length|uniform|centripetal --verbose" << std::endl;
    std::cerr << "  --t-update=projection|gauss-newton --samples=<n> --output=<file.svg>"
              << std::endl;
    return 1;
  }

  try {
    auto switches = collectSwitches(argc, argv, 2);
    auto options = fitOptions(switches);
    auto method = fitMethod(switches);
    double max_error;
    std::string output;
    parseSwitch<double>(switches, "max-error", &max_error, 0.0);
    parseSwitch<std::string>(switches, "output", &output, "/tmp/fit.svg");

    std::ifstream f(argv[1]);
    if (!f)
      throw std::runtime_error(std::string("cannot open ") + argv[1]);
    std::stringstream text;
    text << f.rdbuf();

    // A curve given as SVG path data or JSON control points is sampled
    Geometry::Point2DVector points;
    auto format = detectFormat(text.str());
    if (format) {
      size_t samples;
      parseSwitch<size_t>(switches, "samples", &samples, 50);
      if (samples < 2)
        throw InvalidInput("at least 2 samples are needed");
      std::optional<Curve> source;
      if (*format == InputFormat::JSON) {
        source = fromControlPoints(parseJSON(text.str()));
      } else {
        auto curves = parseSVGPath(text.str());
        if (curves.empty())
          throw ParseError("no curve in the path data");
        source = curves.front();
      }
      for (size_t i = 0; i < samples; ++i)
        points.push_back(source->eval((double)source->size() * i / (samples - 1)));
    } else {
      points = readPoints(argv[1]);
    }
    std::cout << "Input file \"" << argv[1] << "\" read: " << points.size() << " points"
              << std::endl;

    std::optional<Curve> curve;
    FitReport report;
    if (max_error > 0) {
      auto fit = fitPiecewise(points, options, max_error, method);
      curve = fit.curve;
      report = fit.report;
    } else {
      auto fit = fitSegment(makeSamples(points), options, method);
      curve = Curve({ fit.segment });
      report = fit.report;
    }

    std::cout << "Fit of " << curve->size() << " segment(s) "
              << statusName(report.status) << " after " << report.iterations
              << " iterations" << std::endl;
    std::cout << "Residual sum of squares: " << report.residual_sum_of_squares << std::endl;
    std::cout << writeSVGPath(*curve) << std::endl;

    writeSVG(*curve, points, output);
    std::cout << "Curve written to " << output << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 2;
  }
}
