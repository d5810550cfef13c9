#include "windloft_core/mesh/contour.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace windloft::core {
namespace {
constexpr double kRelativeTolerance = 1.0e-12;

std::vector<Vec2> remove_duplicate_points(const std::vector<Vec2>& input, const double tol) {
  std::vector<Vec2> unique_points;
  unique_points.reserve(input.size());
  for (const auto& point : input) {
    if (!unique_points.empty() && distance(unique_points.back(), point) <= tol) {
      continue;
    }
    unique_points.push_back(point);
  }
  if (unique_points.size() >= 2 && distance(unique_points.front(), unique_points.back()) <= tol) {
    unique_points.pop_back();
  }
  return unique_points;
}

struct ExtremeRun {
  std::size_t first = 0;
  std::size_t last = 0;
};

// Locates the single cyclic run of points flagged as extreme.
ExtremeRun find_extreme_run(const std::vector<bool>& flagged, const char* which) {
  const std::size_t n = flagged.size();
  std::size_t starts = 0;
  ExtremeRun run;
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t prev = (i + n - 1) % n;
    if (flagged[i] && !flagged[prev]) {
      run.first = i;
      ++starts;
    }
  }
  if (starts != 1) {
    throw std::invalid_argument(std::string("Contour is not splittable: points at the ") + which +
                                " x-extremum are not contiguous.");
  }
  run.last = run.first;
  while (flagged[(run.last + 1) % n]) {
    run.last = (run.last + 1) % n;
  }
  return run;
}

std::vector<Vec2> walk_forward(const std::vector<Vec2>& points, const std::size_t from,
                               const std::size_t to) {
  const std::size_t n = points.size();
  std::vector<Vec2> chain;
  std::size_t i = from;
  chain.push_back(points[i]);
  while (i != to) {
    i = (i + 1) % n;
    chain.push_back(points[i]);
  }
  return chain;
}

void require_injective(const std::vector<Vec2>& chain, const char* name) {
  for (std::size_t i = 1; i < chain.size(); ++i) {
    if (!(chain[i][0] > chain[i - 1][0])) {
      throw std::invalid_argument(std::string("Contour is not splittable: ") + name +
                                  " chain is not single-valued in x near point " +
                                  std::to_string(i) + ".");
    }
  }
}

double interpolate_y(const std::vector<Vec2>& chain, const double x) {
  for (std::size_t i = 1; i < chain.size(); ++i) {
    if (x <= chain[i][0]) {
      const double t = (x - chain[i - 1][0]) / (chain[i][0] - chain[i - 1][0]);
      return chain[i - 1][1] + t * (chain[i][1] - chain[i - 1][1]);
    }
  }
  return chain.back()[1];
}

double point_segment_distance(const Vec2& p, const Vec2& a, const Vec2& b) {
  const Vec2 ab = b - a;
  const double len2 = ab[0] * ab[0] + ab[1] * ab[1];
  if (len2 <= 0.0) {
    return distance(p, a);
  }
  const Vec2 ap = p - a;
  const double t = std::clamp((ap[0] * ab[0] + ap[1] * ab[1]) / len2, 0.0, 1.0);
  return distance(p, a + t * ab);
}

double directed_hausdorff(const std::vector<Vec2>& from, const std::vector<Vec2>& to) {
  double worst = 0.0;
  for (const Vec2& p : from) {
    double best = std::numeric_limits<double>::max();
    if (to.size() == 1) {
      best = distance(p, to.front());
    }
    for (std::size_t i = 1; i < to.size(); ++i) {
      best = std::min(best, point_segment_distance(p, to[i - 1], to[i]));
    }
    worst = std::max(worst, best);
  }
  return worst;
}
}  // namespace

double polygon_signed_area(const std::vector<Vec2>& points) {
  if (points.size() < 3) {
    return 0.0;
  }
  double area2 = 0.0;
  const std::size_t n = points.size();
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t j = (i + 1) % n;
    area2 += points[i][0] * points[j][1] - points[j][0] * points[i][1];
  }
  return 0.5 * area2;
}

ContourSplit split_contour(const Contour& contour) {
  if (contour.size() < 3) {
    throw std::invalid_argument("Contour is not closed: at least three points are required.");
  }

  double x_min = contour.front()[0];
  double x_max = contour.front()[0];
  double y_min = contour.front()[1];
  double y_max = contour.front()[1];
  for (const auto& p : contour) {
    if (!std::isfinite(p[0]) || !std::isfinite(p[1])) {
      throw std::invalid_argument("Contour contains non-finite coordinates.");
    }
    x_min = std::min(x_min, p[0]);
    x_max = std::max(x_max, p[0]);
    y_min = std::min(y_min, p[1]);
    y_max = std::max(y_max, p[1]);
  }
  const double extent = std::max({x_max - x_min, y_max - y_min, 1.0e-300});
  const double tol = kRelativeTolerance * extent;

  const std::vector<Vec2> points = remove_duplicate_points(contour, tol);
  if (points.size() < 3) {
    throw std::invalid_argument("Contour is not closed: fewer than three distinct points.");
  }
  if (std::abs(polygon_signed_area(points)) <= kRelativeTolerance * extent * extent) {
    throw std::invalid_argument("Contour is not closed: it encloses no area.");
  }

  std::vector<bool> at_min(points.size());
  std::vector<bool> at_max(points.size());
  for (std::size_t i = 0; i < points.size(); ++i) {
    at_min[i] = points[i][0] <= x_min + tol;
    at_max[i] = points[i][0] >= x_max - tol;
  }
  const ExtremeRun min_run = find_extreme_run(at_min, "minimum");
  const ExtremeRun max_run = find_extreme_run(at_max, "maximum");

  std::vector<Vec2> chain_a = walk_forward(points, min_run.last, max_run.first);
  std::vector<Vec2> chain_b = walk_forward(points, max_run.last, min_run.first);
  std::reverse(chain_b.begin(), chain_b.end());

  require_injective(chain_a, "first");
  require_injective(chain_b, "second");

  const double x_mid = 0.5 * (x_min + x_max);
  ContourSplit split;
  if (interpolate_y(chain_a, x_mid) >= interpolate_y(chain_b, x_mid)) {
    split.upper = std::move(chain_a);
    split.lower = std::move(chain_b);
  } else {
    split.upper = std::move(chain_b);
    split.lower = std::move(chain_a);
  }
  return split;
}

ParametricCurve::ParametricCurve(Spline x_of_t, Spline y_of_t)
    : x_of_t_(std::move(x_of_t)), y_of_t_(std::move(y_of_t)) {}

Vec2 ParametricCurve::operator()(const double t) const {
  return {x_of_t_.evaluate(t), y_of_t_.evaluate(t)};
}

ParametricCurve parameterize(const std::vector<Vec2>& chain, const ParameterizeOptions& options) {
  if (chain.size() < 2) {
    throw std::invalid_argument("Cannot parameterize a chain with fewer than two points.");
  }

  std::vector<double> t(chain.size(), 0.0);
  if (options.parameter == ParameterKind::kInjectiveCoordinate) {
    const double x0 = chain.front()[0];
    const double x1 = chain.back()[0];
    if (!(std::abs(x1 - x0) > 0.0)) {
      throw std::invalid_argument("Chain has zero extent along its injective coordinate.");
    }
    for (std::size_t i = 0; i < chain.size(); ++i) {
      t[i] = (chain[i][0] - x0) / (x1 - x0);
    }
  } else {
    for (std::size_t i = 1; i < chain.size(); ++i) {
      t[i] = t[i - 1] + distance(chain[i], chain[i - 1]);
    }
    const double total = t.back();
    if (!(total > 0.0)) {
      throw std::invalid_argument("Chain has zero arclength.");
    }
    for (double& ti : t) {
      ti /= total;
    }
  }

  std::vector<double> xs(chain.size());
  std::vector<double> ys(chain.size());
  for (std::size_t i = 0; i < chain.size(); ++i) {
    xs[i] = chain[i][0];
    ys[i] = chain[i][1];
  }

  SplineOptions spline_options;
  spline_options.degree = options.spline_degree < 1 ? 3 : options.spline_degree;
  spline_options.smoothing = options.smoothing;
  spline_options.boundary = options.boundary;
  return ParametricCurve(fit_spline(t, xs, spline_options), fit_spline(t, ys, spline_options));
}

std::vector<Vec2> discretize(const ParametricCurve& curve, const double t0, const double t1,
                             const Discretization& discretization) {
  const std::vector<double> ts = discretize_parameter(t0, t1, discretization);
  std::vector<Vec2> out;
  out.reserve(ts.size());
  for (const double t : ts) {
    out.push_back(curve(t));
  }
  return out;
}

double hausdorff_distance(const std::vector<Vec2>& a, const std::vector<Vec2>& b) {
  if (a.empty() || b.empty()) {
    throw std::invalid_argument("Hausdorff distance needs two non-empty point sets.");
  }
  return std::max(directed_hausdorff(a, b), directed_hausdorff(b, a));
}
}  // namespace windloft::core
