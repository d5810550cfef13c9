#include "windloft_core/mesh.hpp"

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace windloft::core {
namespace {
int components(const FieldKind kind) {
  return static_cast<int>(kind);
}

void insert_field(std::vector<NodeField>* fields, NodeField field, const std::size_t nodes) {
  if (field.name.empty()) {
    throw std::invalid_argument("Node field name must not be empty.");
  }
  if (find_field(*fields, field.name) != nullptr) {
    throw std::invalid_argument("Node field '" + field.name + "' already exists.");
  }
  const std::size_t expected = nodes * static_cast<std::size_t>(components(field.kind));
  if (field.values.size() != expected) {
    throw std::invalid_argument("Node field '" + field.name + "' has " +
                                std::to_string(field.values.size()) + " values, expected " +
                                std::to_string(expected) + ".");
  }
  fields->push_back(std::move(field));
}
}  // namespace

StructuredGrid make_grid(const std::vector<double>& p_min, const std::vector<double>& p_max,
                         const std::vector<Discretization>& divisions, const int loop_dim) {
  const std::size_t dims = divisions.size();
  if (dims < 1 || dims > 3) {
    throw std::invalid_argument("Grid dimension must be 1, 2 or 3.");
  }
  if (p_min.size() != dims || p_max.size() != dims) {
    throw std::invalid_argument("Grid bounds must match the number of dimensions.");
  }
  if (loop_dim < -1 || loop_dim >= static_cast<int>(dims)) {
    throw std::invalid_argument("Loop dimension is out of range.");
  }

  StructuredGrid grid;
  grid.dimension = static_cast<int>(dims);
  grid.loop_dim = loop_dim;
  for (std::size_t d = 0; d < 3; ++d) {
    if (d < dims) {
      grid.p_min[d] = p_min[d];
      grid.p_max[d] = p_max[d];
      grid.divisions[d] = total_divisions(divisions[d]);
      grid.parametric_coords[d] = discretize_parameter(p_min[d], p_max[d], divisions[d]);
    } else {
      grid.parametric_coords[d] = {0.0};
    }
  }

  const std::array<int, 3> n = get_node_counts(grid);
  grid.nodes.reserve(static_cast<std::size_t>(n[0]) * n[1] * n[2]);
  for (int k = 0; k < n[2]; ++k) {
    for (int j = 0; j < n[1]; ++j) {
      for (int i = 0; i < n[0]; ++i) {
        grid.nodes.push_back({grid.parametric_coords[0][i], grid.parametric_coords[1][j],
                              grid.parametric_coords[2][k]});
      }
    }
  }
  return grid;
}

void apply_transform(StructuredGrid* grid, const GridTransform& transform) {
  if (grid == nullptr) {
    throw std::invalid_argument("apply_transform requires a grid.");
  }
  if (!transform) {
    throw std::invalid_argument("apply_transform requires a transform function.");
  }
  const long long count = static_cast<long long>(grid->nodes.size());
  std::exception_ptr failure;

#if defined(_OPENMP)
#pragma omp parallel for schedule(static)
#endif
  for (long long node = 0; node < count; ++node) {
    const std::size_t id = static_cast<std::size_t>(node);
    try {
      grid->nodes[id] = transform(grid->nodes[id], grid_index(*grid, id));
    } catch (...) {
#if defined(_OPENMP)
#pragma omp critical(windloft_transform_failure)
#endif
      {
        if (!failure) {
          failure = std::current_exception();
        }
      }
    }
  }

  if (failure) {
    std::rethrow_exception(failure);
  }
}

std::array<int, 3> get_division_counts(const StructuredGrid& grid) {
  return grid.divisions;
}

std::array<int, 3> get_node_counts(const StructuredGrid& grid) {
  return {grid.divisions[0] + 1, grid.divisions[1] + 1, grid.divisions[2] + 1};
}

std::array<int, 3> get_cell_counts(const StructuredGrid& grid) {
  std::array<int, 3> cells = grid.divisions;
  if (grid.loop_dim >= 0 && grid.divisions[grid.loop_dim] > 0) {
    cells[grid.loop_dim] += 1;
  }
  return cells;
}

std::size_t node_index(const StructuredGrid& grid, const GridIndex& index) {
  const std::array<int, 3> n = get_node_counts(grid);
  GridIndex wrapped = index;
  for (int d = 0; d < 3; ++d) {
    if (d == grid.loop_dim) {
      wrapped[d] = ((index[d] % n[d]) + n[d]) % n[d];
    }
    if (wrapped[d] < 0 || wrapped[d] >= n[d]) {
      throw std::out_of_range("Grid index " + std::to_string(index[d]) +
                              " out of range in dimension " + std::to_string(d) + ".");
    }
  }
  return static_cast<std::size_t>(wrapped[0]) +
         static_cast<std::size_t>(n[0]) *
           (static_cast<std::size_t>(wrapped[1]) +
            static_cast<std::size_t>(n[1]) * static_cast<std::size_t>(wrapped[2]));
}

GridIndex grid_index(const StructuredGrid& grid, const std::size_t node) {
  const std::array<int, 3> n = get_node_counts(grid);
  const std::size_t plane = static_cast<std::size_t>(n[0]) * static_cast<std::size_t>(n[1]);
  return {
    static_cast<int>(node % static_cast<std::size_t>(n[0])),
    static_cast<int>((node / static_cast<std::size_t>(n[0])) % static_cast<std::size_t>(n[1])),
    static_cast<int>(node / plane),
  };
}

const Vec3& get_node(const StructuredGrid& grid, const GridIndex& index) {
  return grid.nodes[node_index(grid, index)];
}

std::size_t node_count(const StructuredGrid& grid) {
  return grid.nodes.size();
}

std::size_t node_count(const TriangleSurface& surface) {
  return surface.points.size();
}

void add_node_field(StructuredGrid* grid, NodeField field) {
  if (grid == nullptr) {
    throw std::invalid_argument("add_node_field requires a grid.");
  }
  insert_field(&grid->fields, std::move(field), grid->nodes.size());
}

void add_node_field(TriangleSurface* surface, NodeField field) {
  if (surface == nullptr) {
    throw std::invalid_argument("add_node_field requires a surface.");
  }
  insert_field(&surface->fields, std::move(field), surface->points.size());
}

void calculate_vector_field(StructuredGrid* grid, const std::string& name,
                            const std::function<Vec3(const Vec3&)>& fun) {
  if (grid == nullptr || !fun) {
    throw std::invalid_argument("calculate_vector_field requires a grid and a function.");
  }
  NodeField field;
  field.name = name;
  field.kind = FieldKind::kVector;
  field.values.reserve(grid->nodes.size() * 3);
  for (const Vec3& node : grid->nodes) {
    const Vec3 value = fun(node);
    field.values.push_back(value[0]);
    field.values.push_back(value[1]);
    field.values.push_back(value[2]);
  }
  add_node_field(grid, std::move(field));
}

void calculate_scalar_field(StructuredGrid* grid, const std::string& name,
                            const std::function<double(const Vec3&)>& fun) {
  if (grid == nullptr || !fun) {
    throw std::invalid_argument("calculate_scalar_field requires a grid and a function.");
  }
  NodeField field;
  field.name = name;
  field.kind = FieldKind::kScalar;
  field.values.reserve(grid->nodes.size());
  for (const Vec3& node : grid->nodes) {
    field.values.push_back(fun(node));
  }
  add_node_field(grid, std::move(field));
}

const NodeField* find_field(const std::vector<NodeField>& fields, const std::string& name) {
  for (const NodeField& field : fields) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}
}  // namespace windloft::core
