#include "windloft_core/mesh.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {
namespace wl = windloft::core;

bool near(const wl::Vec3& a, const wl::Vec3& b, const double tol = 1.0e-12) {
  return std::abs(a[0] - b[0]) <= tol && std::abs(a[1] - b[1]) <= tol &&
         std::abs(a[2] - b[2]) <= tol;
}

template <typename Fn>
bool throws_invalid(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}
}  // namespace

int main() {
  wl::StructuredGrid grid = wl::make_grid({0.0, 0.0}, {1.0, 2.0}, {4, 2});
  const std::array<int, 3> nodes = wl::get_node_counts(grid);
  if (nodes[0] != 5 || nodes[1] != 3 || nodes[2] != 1 || wl::node_count(grid) != 15) {
    std::cerr << "Unexpected node counts " << nodes[0] << "x" << nodes[1] << "x" << nodes[2]
              << ".\n";
    return 1;
  }
  if (!near(wl::get_node(grid, {2, 1, 0}), {0.5, 1.0, 0.0})) {
    std::cerr << "Parametric node (2, 1) is misplaced.\n";
    return 2;
  }
  const wl::GridIndex back = wl::grid_index(grid, wl::node_index(grid, {3, 2, 0}));
  if (back[0] != 3 || back[1] != 2 || back[2] != 0) {
    std::cerr << "grid_index does not invert node_index.\n";
    return 3;
  }

  bool out_of_range = false;
  try {
    static_cast<void>(wl::node_index(grid, {5, 0, 0}));
  } catch (const std::out_of_range&) {
    out_of_range = true;
  }
  if (!out_of_range) {
    std::cerr << "Index past a non-periodic dimension did not throw.\n";
    return 4;
  }

  const wl::StructuredGrid ring = wl::make_grid({0.0, 0.0}, {1.0, 1.0}, {4, 1}, 0);
  if (wl::node_index(ring, {5, 1, 0}) != wl::node_index(ring, {0, 1, 0}) ||
      wl::node_index(ring, {-1, 0, 0}) != wl::node_index(ring, {4, 0, 0})) {
    std::cerr << "Periodic dimension does not wrap.\n";
    return 5;
  }
  if (wl::get_cell_counts(ring)[0] != 5 || wl::get_cell_counts(ring)[1] != 1) {
    std::cerr << "Periodic dimension should add a closing cell.\n";
    return 6;
  }

  const wl::MultiSection sections {{0.5, 2, 1.0, false}, {0.5, 1, 1.0, false}};
  const wl::StructuredGrid line = wl::make_grid({0.0}, {8.0}, {sections});
  const std::vector<double> expected_x {0.0, 2.0, 4.0, 8.0};
  if (line.nodes.size() != expected_x.size()) {
    std::cerr << "Multi-section line has " << line.nodes.size() << " nodes.\n";
    return 7;
  }
  for (std::size_t i = 0; i < expected_x.size(); ++i) {
    if (!near(line.nodes[i], {expected_x[i], 0.0, 0.0})) {
      std::cerr << "Multi-section node " << i << " at " << line.nodes[i][0] << ".\n";
      return 8;
    }
  }

  wl::StructuredGrid mapped = wl::make_grid({0.0, 0.0}, {1.0, 2.0}, {4, 2});
  wl::apply_transform(&mapped, [](const wl::Vec3& x, const wl::GridIndex& index) {
    return wl::Vec3 {2.0 * x[0] + index[1], x[1], static_cast<double>(index[0])};
  });
  for (std::size_t id = 0; id < mapped.nodes.size(); ++id) {
    const wl::GridIndex index = wl::grid_index(mapped, id);
    const wl::Vec3& source = grid.nodes[id];
    const wl::Vec3 expected {2.0 * source[0] + index[1], source[1], static_cast<double>(index[0])};
    if (!near(mapped.nodes[id], expected)) {
      std::cerr << "Transformed node " << id << " mismatch.\n";
      return 9;
    }
  }

  const wl::GridTransform bend = [](const wl::Vec3& x, const wl::GridIndex&) {
    return wl::Vec3 {std::cos(x[0]) * x[1], std::sin(x[0]) * x[1], x[0] * x[1]};
  };
  wl::StructuredGrid first = wl::make_grid({0.0, 0.0}, {3.0, 1.0}, {40, 30});
  wl::StructuredGrid second = first;
  wl::apply_transform(&first, bend);
  wl::apply_transform(&second, bend);
  if (first.nodes != second.nodes) {
    std::cerr << "Repeated transforms differ.\n";
    return 15;
  }

  bool propagated = false;
  try {
    wl::apply_transform(&mapped, [](const wl::Vec3& x, const wl::GridIndex& index) {
      if (index[0] == 3) {
        throw std::runtime_error("transform failure");
      }
      return x;
    });
  } catch (const std::runtime_error&) {
    propagated = true;
  }
  if (!propagated) {
    std::cerr << "Transform exception was not propagated.\n";
    return 10;
  }

  wl::calculate_vector_field(&grid, "velocity",
                             [](const wl::Vec3& x) { return wl::Vec3 {x[0], x[1], 1.0}; });
  const wl::NodeField* velocity = wl::find_field(grid.fields, "velocity");
  if (velocity == nullptr || velocity->values.size() != 3 * wl::node_count(grid) ||
      velocity->values[3 * 7 + 1] != grid.nodes[7][1] || velocity->values[3 * 7 + 2] != 1.0) {
    std::cerr << "Vector field was not evaluated per node.\n";
    return 11;
  }
  if (!throws_invalid([&] {
        wl::calculate_scalar_field(&grid, "velocity", [](const wl::Vec3&) { return 0.0; });
      })) {
    std::cerr << "Duplicate field name was accepted.\n";
    return 12;
  }
  if (!throws_invalid([&] {
        wl::NodeField short_field;
        short_field.name = "short";
        short_field.values = {1.0, 2.0};
        wl::add_node_field(&grid, short_field);
      })) {
    std::cerr << "Field with the wrong length was accepted.\n";
    return 13;
  }

  if (!throws_invalid([] { static_cast<void>(wl::make_grid({}, {}, {})); }) ||
      !throws_invalid([] {
        static_cast<void>(wl::make_grid({0.0, 0.0}, {1.0, 1.0}, {2, 2}, 2));
      }) ||
      !throws_invalid([] { static_cast<void>(wl::make_grid({0.0}, {1.0, 1.0}, {2})); })) {
    std::cerr << "Invalid grid definitions were accepted.\n";
    return 14;
  }

  return 0;
}
