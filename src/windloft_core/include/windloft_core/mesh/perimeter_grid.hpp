#pragma once

#include "windloft_core/mesh.hpp"
#include "windloft_core/mesh/contour.hpp"
#include "windloft_core/numerics/discretization.hpp"

#include <optional>

namespace windloft::core {
struct PerimeterGridConfig {
  Discretization x_divisions = 50;
  Discretization y_divisions = 50;
  Discretization z_divisions = 0;  // 0 gives a flat grid at z_min

  // Unset heights fall back to 0, or to the farm extent via resolve_domain_heights.
  std::optional<double> z_min;
  std::optional<double> z_max;

  int spline_degree = -1;  // -1 resolves to cubic
  double smoothing = 0.001;
};

// Grids the inside of a closed perimeter: both sides are reparameterized along
// x, discretized with x_divisions and joined by straight lines of y_divisions.
StructuredGrid generate_perimeter_grid(const Contour& perimeter, const PerimeterGridConfig& config);
}  // namespace windloft::core
