#pragma once

#include "windloft_core/geometry.hpp"
#include "windloft_core/numerics/discretization.hpp"
#include "windloft_core/numerics/spline.hpp"

#include <vector>

namespace windloft::core {
// Closed 2D contour; the last point connects back to the first.
using Contour = std::vector<Vec2>;

// Both chains run from the minimum-x end to the maximum-x end and are strictly
// increasing in x.
struct ContourSplit {
  std::vector<Vec2> upper;
  std::vector<Vec2> lower;
};

ContourSplit split_contour(const Contour& contour);

enum class ParameterKind {
  kArclength = 0,
  kInjectiveCoordinate,
};

struct ParameterizeOptions {
  ParameterKind parameter = ParameterKind::kArclength;
  int spline_degree = -1;  // -1 resolves to cubic
  double smoothing = 0.001;
  SplineBoundary boundary = SplineBoundary::kExtrapolate;
};

// t in [0, 1] -> (x(t), y(t)).
class ParametricCurve {
 public:
  ParametricCurve(Spline x_of_t, Spline y_of_t);

  Vec2 operator()(double t) const;
  const Spline& x_spline() const { return x_of_t_; }
  const Spline& y_spline() const { return y_of_t_; }

 private:
  Spline x_of_t_;
  Spline y_of_t_;
};

ParametricCurve parameterize(const std::vector<Vec2>& chain,
                             const ParameterizeOptions& options = {});

// n + 1 samples of the curve between t0 and t1.
std::vector<Vec2> discretize(const ParametricCurve& curve, double t0, double t1,
                             const Discretization& discretization);

double polygon_signed_area(const std::vector<Vec2>& points);

// Symmetric Hausdorff distance between two polylines, measured on their vertices
// against the other polyline's segments.
double hausdorff_distance(const std::vector<Vec2>& a, const std::vector<Vec2>& b);
}  // namespace windloft::core
