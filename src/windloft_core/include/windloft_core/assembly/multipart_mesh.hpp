#pragma once

#include "windloft_core/geometry.hpp"
#include "windloft_core/mesh.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace windloft::core {
class MultiPartMesh;

using MeshPart = std::variant<StructuredGrid, TriangleSurface, std::unique_ptr<MultiPartMesh>>;

// Named parts in insertion order. Names are unique within one level; nested
// parts are addressed by '/'-separated paths such as "rotor/blade1".
class MultiPartMesh {
 public:
  MultiPartMesh();
  ~MultiPartMesh();
  MultiPartMesh(MultiPartMesh&& other) noexcept;
  MultiPartMesh& operator=(MultiPartMesh&& other) noexcept;
  MultiPartMesh(const MultiPartMesh&) = delete;
  MultiPartMesh& operator=(const MultiPartMesh&) = delete;

  // Throws std::invalid_argument if the name is empty, contains '/' or is taken.
  void add_part(const std::string& name, StructuredGrid grid);
  void add_part(const std::string& name, TriangleSurface surface);
  void add_part(const std::string& name, MultiPartMesh mesh);

  bool contains(const std::string& name) const;
  std::size_t size() const { return parts_.size(); }
  bool empty() const { return parts_.empty(); }

  // Throws std::out_of_range for unknown names.
  const MeshPart& part(const std::string& name) const;
  MeshPart& part(const std::string& name);

  const TriangleSurface* find_surface(const std::string& path) const;
  const StructuredGrid* find_grid(const std::string& path) const;
  const MultiPartMesh* find_mesh(const std::string& path) const;

  std::vector<std::pair<std::string, MeshPart>>& parts() { return parts_; }
  const std::vector<std::pair<std::string, MeshPart>>& parts() const { return parts_; }

 private:
  void insert(const std::string& name, MeshPart part);
  const MeshPart* find_part(const std::string& path) const;

  std::vector<std::pair<std::string, MeshPart>> parts_;
};

// A grid or surface reached through the part tree.
struct LeafPart {
  std::string path;
  const StructuredGrid* grid = nullptr;
  const TriangleSurface* surface = nullptr;
};

// Depth-first, in insertion order, path segments joined by separator.
std::vector<LeafPart> collect_leaves(const MultiPartMesh& mesh, const std::string& separator = "/");

std::size_t total_node_count(const MultiPartMesh& mesh);
std::size_t total_triangle_count(const MultiPartMesh& mesh);

// x' = R x + t on every node; vector node fields are rotated with R.
void apply_rigid_transform(StructuredGrid* grid, const RigidTransform& transform);
void apply_rigid_transform(TriangleSurface* surface, const RigidTransform& transform);
void apply_rigid_transform(MultiPartMesh* mesh, const RigidTransform& transform);

template <typename Target>
void apply_rigid_transform(Target* target, const Mat3& rotation, const Vec3& translation) {
  RigidTransform transform;
  transform.rotation = rotation;
  transform.translation = translation;
  apply_rigid_transform(target, transform);
}
}  // namespace windloft::core
