#pragma once

#include "windloft_core/mesh.hpp"

namespace windloft::core {
// Splits every quadrilateral cell of a grid with exactly two active (multi-node)
// dimensions into two triangles. split_dim picks the diagonal: when it is the
// first active dimension the cut runs (i,j)-(i+1,j+1), otherwise (i+1,j)-(i,j+1).
// Winding follows the active dimensions in increasing order for every triangle.
TriangleSurface triangulate(const StructuredGrid& grid, int split_dim);

double surface_area(const TriangleSurface& surface);
Vec3 triangle_normal(const TriangleSurface& surface, std::size_t triangle);
}  // namespace windloft::core
