#include "windloft_core/mesh/perimeter_grid.hpp"

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace windloft::core {
StructuredGrid generate_perimeter_grid(const Contour& perimeter, const PerimeterGridConfig& config) {
  validate_discretization(config.x_divisions);
  validate_discretization(config.y_divisions);
  validate_discretization(config.z_divisions);
  if (total_divisions(config.x_divisions) < 1 || total_divisions(config.y_divisions) < 1) {
    throw std::invalid_argument("Perimeter grid needs at least one division along x and y.");
  }

  const double z_min = config.z_min.value_or(0.0);
  const double z_max = config.z_max.value_or(0.0);
  const int nz = total_divisions(config.z_divisions);

  const ContourSplit sides = split_contour(perimeter);

  ParameterizeOptions options;
  options.parameter = ParameterKind::kInjectiveCoordinate;
  options.spline_degree = config.spline_degree;
  options.smoothing = config.smoothing;
  const std::vector<Vec2> upper =
    discretize(parameterize(sides.upper, options), 0.0, 1.0, config.x_divisions);
  const std::vector<Vec2> lower =
    discretize(parameterize(sides.lower, options), 0.0, 1.0, config.x_divisions);

  StructuredGrid grid = make_grid({0.0, 0.0, 0.0}, {1.0, 1.0, nz != 0 ? 1.0 : 0.0},
                                  {config.x_divisions, config.y_divisions, config.z_divisions});
  apply_transform(&grid, [&](const Vec3& coords, const GridIndex& index) {
    const std::size_t i = static_cast<std::size_t>(index[0]);
    const double w = coords[1];
    const Vec2 p = lower[i] + w * (upper[i] - lower[i]);
    return Vec3 {p[0], p[1], z_min + coords[2] * (z_max - z_min)};
  });
  return grid;
}
}  // namespace windloft::core
