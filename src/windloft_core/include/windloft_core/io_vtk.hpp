#pragma once

#include "windloft_core/assembly/multipart_mesh.hpp"
#include "windloft_core/mesh.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace windloft::core {
// ASCII VTU writers; node fields are written as point data.
bool write_surface_vtu(const std::filesystem::path& output_path, const TriangleSurface& surface);
// Cells follow the active dimensions: lines, quads or hexahedra.
bool write_grid_vtu(const std::filesystem::path& output_path, const StructuredGrid& grid);

// One file per leaf part, named <base_name>_<path with '_'>.vtu. Throws
// std::runtime_error when a file cannot be written.
std::vector<std::filesystem::path> write_multipart_vtu(const std::filesystem::path& output_dir,
                                                       const std::string& base_name,
                                                       const MultiPartMesh& mesh);
}  // namespace windloft::core
