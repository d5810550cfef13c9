#pragma once

#include "windloft_core/geometry.hpp"
#include "windloft_core/numerics/discretization.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace windloft::core {
enum class FieldKind {
  kScalar = 1,
  kVector = 3,
};

// Opaque per-node data carried along with a mesh.
struct NodeField {
  std::string name;
  FieldKind kind = FieldKind::kScalar;
  std::vector<double> values;  // components per node, node-major
};

using GridIndex = std::array<int, 3>;

// Rectilinear parametric grid of up to three dimensions. Nodes start at their
// parametric coordinates (unused dimensions padded with zero) and are
// overwritten in place by apply_transform.
struct StructuredGrid {
  int dimension = 3;
  Vec3 p_min {0.0, 0.0, 0.0};
  Vec3 p_max {0.0, 0.0, 0.0};
  std::array<int, 3> divisions {0, 0, 0};
  int loop_dim = -1;  // periodic dimension, -1 for none
  std::array<std::vector<double>, 3> parametric_coords;

  std::vector<Vec3> nodes;  // first dimension varies fastest
  std::vector<NodeField> fields;
};

struct TriangleSurface {
  std::vector<Vec3> points;
  std::vector<std::array<int, 3>> triangles;
  std::vector<NodeField> fields;
};

using GridTransform = std::function<Vec3(const Vec3& coords, const GridIndex& index)>;

StructuredGrid make_grid(const std::vector<double>& p_min, const std::vector<double>& p_max,
                         const std::vector<Discretization>& divisions, int loop_dim = -1);

// Evaluates transform(current node, index) for every node and stores the result.
void apply_transform(StructuredGrid* grid, const GridTransform& transform);

std::array<int, 3> get_division_counts(const StructuredGrid& grid);
std::array<int, 3> get_node_counts(const StructuredGrid& grid);
std::array<int, 3> get_cell_counts(const StructuredGrid& grid);
std::size_t node_index(const StructuredGrid& grid, const GridIndex& index);
GridIndex grid_index(const StructuredGrid& grid, std::size_t node);
const Vec3& get_node(const StructuredGrid& grid, const GridIndex& index);

std::size_t node_count(const StructuredGrid& grid);
std::size_t node_count(const TriangleSurface& surface);

// Field values must hold node_count * components entries; names are unique per mesh.
void add_node_field(StructuredGrid* grid, NodeField field);
void add_node_field(TriangleSurface* surface, NodeField field);
void calculate_vector_field(StructuredGrid* grid, const std::string& name,
                            const std::function<Vec3(const Vec3&)>& fun);
void calculate_scalar_field(StructuredGrid* grid, const std::string& name,
                            const std::function<double(const Vec3&)>& fun);
const NodeField* find_field(const std::vector<NodeField>& fields, const std::string& name);
}  // namespace windloft::core
