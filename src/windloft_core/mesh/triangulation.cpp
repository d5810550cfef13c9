#include "windloft_core/mesh/triangulation.hpp"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace windloft::core {
TriangleSurface triangulate(const StructuredGrid& grid, const int split_dim) {
  const std::array<int, 3> nodes = get_node_counts(grid);
  std::vector<int> active;
  for (int d = 0; d < 3; ++d) {
    if (nodes[d] > 1) {
      active.push_back(d);
    }
  }
  if (active.size() != 2) {
    throw std::invalid_argument("Triangulation needs exactly two multi-node grid dimensions, got " +
                                std::to_string(active.size()) + ".");
  }
  if (split_dim != active[0] && split_dim != active[1]) {
    throw std::invalid_argument("Split dimension " + std::to_string(split_dim) +
                                " is not an active grid dimension.");
  }

  const int du = active[0];
  const int dv = active[1];
  const std::array<int, 3> cells = get_cell_counts(grid);
  const int nu = nodes[du];
  const int nv = nodes[dv];

  TriangleSurface surface;
  surface.points = grid.nodes;
  surface.fields = grid.fields;
  surface.triangles.reserve(static_cast<std::size_t>(2) * cells[du] * cells[dv]);

  const auto point_id = [&](const int u, const int v) {
    GridIndex index {0, 0, 0};
    index[du] = (du == grid.loop_dim) ? u % nu : u;
    index[dv] = (dv == grid.loop_dim) ? v % nv : v;
    return static_cast<int>(node_index(grid, index));
  };

  const bool main_diagonal = split_dim == du;
  for (int v = 0; v < cells[dv]; ++v) {
    for (int u = 0; u < cells[du]; ++u) {
      const int a = point_id(u, v);
      const int b = point_id(u + 1, v);
      const int c = point_id(u + 1, v + 1);
      const int d = point_id(u, v + 1);
      if (main_diagonal) {
        surface.triangles.push_back({a, b, c});
        surface.triangles.push_back({a, c, d});
      } else {
        surface.triangles.push_back({a, b, d});
        surface.triangles.push_back({b, c, d});
      }
    }
  }
  return surface;
}

Vec3 triangle_normal(const TriangleSurface& surface, const std::size_t triangle) {
  const auto& tri = surface.triangles.at(triangle);
  const Vec3& a = surface.points[tri[0]];
  const Vec3& b = surface.points[tri[1]];
  const Vec3& c = surface.points[tri[2]];
  return cross(b - a, c - a);
}

double surface_area(const TriangleSurface& surface) {
  double area = 0.0;
  for (std::size_t t = 0; t < surface.triangles.size(); ++t) {
    area += 0.5 * norm(triangle_normal(surface, t));
  }
  return area;
}
}  // namespace windloft::core
