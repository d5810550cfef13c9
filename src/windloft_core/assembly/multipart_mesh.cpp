#include "windloft_core/assembly/multipart_mesh.hpp"

#include <stdexcept>
#include <type_traits>

namespace windloft::core {
namespace {
void rotate_vector_fields(std::vector<NodeField>* fields, const Mat3& rotation) {
  for (NodeField& field : *fields) {
    if (field.kind != FieldKind::kVector) {
      continue;
    }
    for (std::size_t i = 0; i + 2 < field.values.size(); i += 3) {
      const Vec3 rotated =
        multiply(rotation, Vec3 {field.values[i], field.values[i + 1], field.values[i + 2]});
      field.values[i] = rotated[0];
      field.values[i + 1] = rotated[1];
      field.values[i + 2] = rotated[2];
    }
  }
}

void transform_points(std::vector<Vec3>* points, const RigidTransform& transform) {
  for (Vec3& point : *points) {
    point = transform.apply(point);
  }
}

void append_leaves(const MultiPartMesh& mesh, const std::string& prefix,
                   const std::string& separator, std::vector<LeafPart>* leaves) {
  for (const auto& [name, part] : mesh.parts()) {
    const std::string path = prefix.empty() ? name : prefix + separator + name;
    if (const auto* grid = std::get_if<StructuredGrid>(&part)) {
      leaves->push_back({path, grid, nullptr});
    } else if (const auto* surface = std::get_if<TriangleSurface>(&part)) {
      leaves->push_back({path, nullptr, surface});
    } else {
      append_leaves(*std::get<std::unique_ptr<MultiPartMesh>>(part), path, separator, leaves);
    }
  }
}
}  // namespace

MultiPartMesh::MultiPartMesh() = default;
MultiPartMesh::~MultiPartMesh() = default;
MultiPartMesh::MultiPartMesh(MultiPartMesh&& other) noexcept = default;
MultiPartMesh& MultiPartMesh::operator=(MultiPartMesh&& other) noexcept = default;

void MultiPartMesh::insert(const std::string& name, MeshPart part) {
  if (name.empty()) {
    throw std::invalid_argument("Part name must not be empty.");
  }
  if (name.find('/') != std::string::npos) {
    throw std::invalid_argument("Part name '" + name + "' must not contain '/'.");
  }
  if (contains(name)) {
    throw std::invalid_argument("Part '" + name + "' already exists.");
  }
  parts_.emplace_back(name, std::move(part));
}

void MultiPartMesh::add_part(const std::string& name, StructuredGrid grid) {
  insert(name, MeshPart(std::move(grid)));
}

void MultiPartMesh::add_part(const std::string& name, TriangleSurface surface) {
  insert(name, MeshPart(std::move(surface)));
}

void MultiPartMesh::add_part(const std::string& name, MultiPartMesh mesh) {
  insert(name, MeshPart(std::make_unique<MultiPartMesh>(std::move(mesh))));
}

bool MultiPartMesh::contains(const std::string& name) const {
  for (const auto& entry : parts_) {
    if (entry.first == name) {
      return true;
    }
  }
  return false;
}

const MeshPart& MultiPartMesh::part(const std::string& name) const {
  for (const auto& entry : parts_) {
    if (entry.first == name) {
      return entry.second;
    }
  }
  throw std::out_of_range("No part named '" + name + "'.");
}

MeshPart& MultiPartMesh::part(const std::string& name) {
  for (auto& entry : parts_) {
    if (entry.first == name) {
      return entry.second;
    }
  }
  throw std::out_of_range("No part named '" + name + "'.");
}

const MeshPart* MultiPartMesh::find_part(const std::string& path) const {
  const std::size_t slash = path.find('/');
  const std::string head = path.substr(0, slash);
  if (!contains(head)) {
    return nullptr;
  }
  const MeshPart& entry = part(head);
  if (slash == std::string::npos) {
    return &entry;
  }
  const auto* nested = std::get_if<std::unique_ptr<MultiPartMesh>>(&entry);
  if (nested == nullptr) {
    return nullptr;
  }
  return (*nested)->find_part(path.substr(slash + 1));
}

const TriangleSurface* MultiPartMesh::find_surface(const std::string& path) const {
  const MeshPart* found = find_part(path);
  return found == nullptr ? nullptr : std::get_if<TriangleSurface>(found);
}

const StructuredGrid* MultiPartMesh::find_grid(const std::string& path) const {
  const MeshPart* found = find_part(path);
  return found == nullptr ? nullptr : std::get_if<StructuredGrid>(found);
}

const MultiPartMesh* MultiPartMesh::find_mesh(const std::string& path) const {
  const MeshPart* found = find_part(path);
  if (found == nullptr) {
    return nullptr;
  }
  const auto* nested = std::get_if<std::unique_ptr<MultiPartMesh>>(found);
  return nested == nullptr ? nullptr : nested->get();
}

std::vector<LeafPart> collect_leaves(const MultiPartMesh& mesh, const std::string& separator) {
  std::vector<LeafPart> leaves;
  append_leaves(mesh, "", separator, &leaves);
  return leaves;
}

std::size_t total_node_count(const MultiPartMesh& mesh) {
  std::size_t count = 0;
  for (const LeafPart& leaf : collect_leaves(mesh)) {
    count += leaf.grid != nullptr ? node_count(*leaf.grid) : node_count(*leaf.surface);
  }
  return count;
}

std::size_t total_triangle_count(const MultiPartMesh& mesh) {
  std::size_t count = 0;
  for (const LeafPart& leaf : collect_leaves(mesh)) {
    if (leaf.surface != nullptr) {
      count += leaf.surface->triangles.size();
    }
  }
  return count;
}

void apply_rigid_transform(StructuredGrid* grid, const RigidTransform& transform) {
  if (grid == nullptr) {
    throw std::invalid_argument("apply_rigid_transform requires a grid.");
  }
  transform_points(&grid->nodes, transform);
  rotate_vector_fields(&grid->fields, transform.rotation);
}

void apply_rigid_transform(TriangleSurface* surface, const RigidTransform& transform) {
  if (surface == nullptr) {
    throw std::invalid_argument("apply_rigid_transform requires a surface.");
  }
  transform_points(&surface->points, transform);
  rotate_vector_fields(&surface->fields, transform.rotation);
}

void apply_rigid_transform(MultiPartMesh* mesh, const RigidTransform& transform) {
  if (mesh == nullptr) {
    throw std::invalid_argument("apply_rigid_transform requires a multipart mesh.");
  }
  for (auto& entry : mesh->parts()) {
    std::visit(
      [&transform](auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::unique_ptr<MultiPartMesh>>) {
          apply_rigid_transform(value.get(), transform);
        } else {
          apply_rigid_transform(&value, transform);
        }
      },
      entry.second);
  }
}
}  // namespace windloft::core
