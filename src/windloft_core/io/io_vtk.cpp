#include "windloft_core/io_vtk.hpp"

#include <array>
#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace windloft::core {
namespace {
constexpr int kVtkVertex = 1;
constexpr int kVtkLine = 3;
constexpr int kVtkTriangle = 5;
constexpr int kVtkQuad = 9;
constexpr int kVtkHexahedron = 12;

struct CellBlock {
  std::vector<int> connectivity;
  std::vector<int> offsets;
  std::vector<int> types;
};

void write_piece(std::ofstream& out, const std::vector<Vec3>& points, const CellBlock& cells,
                 const std::vector<NodeField>& fields) {
  out.precision(12);
  out << "<?xml version=\"1.0\"?>\n";
  out << "<VTKFile type=\"UnstructuredGrid\" version=\"0.1\" byte_order=\"LittleEndian\">\n";
  out << "  <UnstructuredGrid>\n";
  out << "    <Piece NumberOfPoints=\"" << points.size() << "\" NumberOfCells=\""
      << cells.types.size() << "\">\n";

  out << "      <Points>\n";
  out << "        <DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"ascii\">\n";
  for (const Vec3& p : points) {
    out << "          " << p[0] << " " << p[1] << " " << p[2] << "\n";
  }
  out << "        </DataArray>\n";
  out << "      </Points>\n";

  out << "      <Cells>\n";
  out << "        <DataArray type=\"Int32\" Name=\"connectivity\" format=\"ascii\">\n";
  for (std::size_t i = 0; i < cells.connectivity.size(); ++i) {
    out << (i == 0 ? "          " : " ") << cells.connectivity[i];
  }
  out << "\n        </DataArray>\n";
  out << "        <DataArray type=\"Int32\" Name=\"offsets\" format=\"ascii\">\n";
  for (std::size_t i = 0; i < cells.offsets.size(); ++i) {
    out << (i == 0 ? "          " : " ") << cells.offsets[i];
  }
  out << "\n        </DataArray>\n";
  out << "        <DataArray type=\"UInt8\" Name=\"types\" format=\"ascii\">\n";
  for (std::size_t i = 0; i < cells.types.size(); ++i) {
    out << (i == 0 ? "          " : " ") << cells.types[i];
  }
  out << "\n        </DataArray>\n";
  out << "      </Cells>\n";

  if (fields.empty()) {
    out << "      <PointData/>\n";
  } else {
    out << "      <PointData>\n";
    for (const NodeField& field : fields) {
      out << "        <DataArray type=\"Float64\" Name=\"" << field.name
          << "\" NumberOfComponents=\"" << static_cast<int>(field.kind)
          << "\" format=\"ascii\">\n";
      for (std::size_t i = 0; i < field.values.size(); ++i) {
        out << (i == 0 ? "          " : " ") << field.values[i];
      }
      out << "\n        </DataArray>\n";
    }
    out << "      </PointData>\n";
  }
  out << "      <CellData/>\n";
  out << "    </Piece>\n";
  out << "  </UnstructuredGrid>\n";
  out << "</VTKFile>\n";
}

void push_cell(CellBlock* cells, const std::vector<int>& ids, const int type) {
  cells->connectivity.insert(cells->connectivity.end(), ids.begin(), ids.end());
  cells->offsets.push_back(static_cast<int>(cells->connectivity.size()));
  cells->types.push_back(type);
}

CellBlock grid_cells(const StructuredGrid& grid) {
  const std::array<int, 3> nodes = get_node_counts(grid);
  const std::array<int, 3> cell_counts = get_cell_counts(grid);
  std::vector<int> active;
  for (int d = 0; d < 3; ++d) {
    if (nodes[d] > 1) {
      active.push_back(d);
    }
  }

  CellBlock cells;
  if (active.empty()) {
    push_cell(&cells, {0}, kVtkVertex);
    return cells;
  }

  // Corner offsets in VTK order for lines, quads and hexahedra.
  std::vector<std::array<int, 3>> corners;
  int type = kVtkLine;
  if (active.size() == 1) {
    corners = {{0, 0, 0}, {1, 0, 0}};
  } else if (active.size() == 2) {
    corners = {{0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0}};
    type = kVtkQuad;
  } else {
    corners = {{0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0},
               {0, 0, 1}, {1, 0, 1}, {1, 1, 1}, {0, 1, 1}};
    type = kVtkHexahedron;
  }

  std::array<int, 3> extent {1, 1, 1};
  for (std::size_t a = 0; a < active.size(); ++a) {
    extent[a] = cell_counts[active[a]];
  }

  std::vector<int> ids(corners.size());
  for (int k = 0; k < extent[2]; ++k) {
    for (int j = 0; j < extent[1]; ++j) {
      for (int i = 0; i < extent[0]; ++i) {
        const std::array<int, 3> cell {i, j, k};
        for (std::size_t c = 0; c < corners.size(); ++c) {
          GridIndex index {0, 0, 0};
          for (std::size_t a = 0; a < active.size(); ++a) {
            index[active[a]] = cell[a] + corners[c][a];
          }
          ids[c] = static_cast<int>(node_index(grid, index));
        }
        push_cell(&cells, ids, type);
      }
    }
  }
  return cells;
}
}  // namespace

bool write_surface_vtu(const std::filesystem::path& output_path, const TriangleSurface& surface) {
  std::ofstream out(output_path, std::ios::trunc);
  if (!out) {
    return false;
  }

  CellBlock cells;
  cells.connectivity.reserve(surface.triangles.size() * 3);
  for (const auto& tri : surface.triangles) {
    push_cell(&cells, {tri[0], tri[1], tri[2]}, kVtkTriangle);
  }
  write_piece(out, surface.points, cells, surface.fields);
  return static_cast<bool>(out);
}

bool write_grid_vtu(const std::filesystem::path& output_path, const StructuredGrid& grid) {
  std::ofstream out(output_path, std::ios::trunc);
  if (!out) {
    return false;
  }
  write_piece(out, grid.nodes, grid_cells(grid), grid.fields);
  return static_cast<bool>(out);
}

std::vector<std::filesystem::path> write_multipart_vtu(const std::filesystem::path& output_dir,
                                                       const std::string& base_name,
                                                       const MultiPartMesh& mesh) {
  std::vector<std::filesystem::path> written;
  for (const LeafPart& leaf : collect_leaves(mesh, "_")) {
    const std::filesystem::path path = output_dir / (base_name + "_" + leaf.path + ".vtu");
    const bool ok = leaf.grid != nullptr ? write_grid_vtu(path, *leaf.grid)
                                         : write_surface_vtu(path, *leaf.surface);
    if (!ok) {
      throw std::runtime_error("Failed to write VTU output: " + path.string());
    }
    written.push_back(path);
  }
  return written;
}
}  // namespace windloft::core
