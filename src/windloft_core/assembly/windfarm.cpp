#include "windloft_core/assembly/windfarm.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace windloft::core {
namespace {
constexpr double kDomainHeightFactor = 1.25;

RigidTransform make_transform(const Mat3& rotation, const Vec3& translation) {
  RigidTransform transform;
  transform.rotation = rotation;
  transform.translation = translation;
  return transform;
}
}  // namespace

TurbineGeometry default_turbine_geometry() {
  TurbineGeometry geometry;
  geometry.blade = default_blade_definition(60);
  geometry.blade_spline.degree = 3;
  geometry.blade_spline.smoothing = 1.0e-6;
  return geometry;
}

MultiPartMesh generate_windturbine(const double rtip, const double tower_height, const int nblades,
                                   const TurbineGeometry& geometry) {
  if (!(rtip > 0.0) || !(tower_height > 0.0)) {
    throw std::invalid_argument("Turbine tip radius and tower height must be positive.");
  }
  if (nblades < 1) {
    throw std::invalid_argument("A turbine needs at least one blade, got " +
                                std::to_string(nblades) + ".");
  }

  const double rhub = geometry.hub_radius * rtip;
  const double thub = geometry.hub_length * rtip;
  const Vec3 rotor_center {thub / 3.0, 0.0, tower_height + rhub / 2.0};

  const TriangleSurface blade_template =
    generate_blade(rtip, rhub, geometry.blade_divisions, geometry.blade, geometry.blade_spline);
  TriangleSurface hub = generate_hub(rhub, thub, geometry.hub_divisions, geometry.section_points);
  TriangleSurface tower =
    generate_tower(tower_height, geometry.tower_base_diameter * rtip,
                   geometry.tower_top_diameter * rtip, geometry.tower_divisions,
                   geometry.section_points);

  MultiPartMesh rotor;

  // Hub axis y -> -x, nose upstream.
  apply_rigid_transform(&hub, rotation_matrix(90.0, 0.0, 0.0), Vec3 {0.0, 0.0, 0.0});
  rotor.add_part("hub", std::move(hub));

  // Blade span y -> +z with the chord in the rotor plane.
  const Mat3 blade_alignment = rotation_matrix(90.0, 0.0, 90.0);
  const Vec3 blade_offset {-5.0 / 6.0 * thub, 0.0, 0.0};
  for (int k = 0; k < nblades; ++k) {
    const double azimuth = 360.0 * static_cast<double>(k) / static_cast<double>(nblades);
    TriangleSurface blade = blade_template;
    apply_rigid_transform(&blade, multiply(rotation_matrix(0.0, 0.0, azimuth), blade_alignment),
                          blade_offset);
    rotor.add_part("blade" + std::to_string(k + 1), std::move(blade));
  }

  apply_rigid_transform(&rotor, identity_matrix(), rotor_center);

  MultiPartMesh turbine;
  apply_rigid_transform(&tower, rotation_matrix(0.0, 0.0, 90.0), Vec3 {0.0, 0.0, 0.0});
  turbine.add_part("tower", std::move(tower));
  turbine.add_part("rotor", std::move(rotor));
  return turbine;
}

std::size_t validate_layout(const FarmLayout& layout) {
  const std::size_t n = layout.diameter.size();
  if (n == 0) {
    throw std::invalid_argument("Farm layout lists no turbines.");
  }
  if (layout.height.size() != n || layout.blades.size() != n || layout.x.size() != n ||
      layout.y.size() != n || layout.z.size() != n || layout.yaw.size() != n) {
    throw std::invalid_argument(
      "Farm layout arrays (diameter, height, blades, x, y, z, yaw) must have equal length.");
  }
  return n;
}

MultiPartMesh generate_layout(const FarmLayout& layout, const TurbineGeometry& geometry) {
  const std::size_t n = validate_layout(layout);
  std::vector<MultiPartMesh> turbines(n);
  std::exception_ptr failure;

  const long long count = static_cast<long long>(n);
#if defined(_OPENMP)
#pragma omp parallel for schedule(dynamic)
#endif
  for (long long t = 0; t < count; ++t) {
    const std::size_t i = static_cast<std::size_t>(t);
    try {
      MultiPartMesh turbine =
        generate_windturbine(layout.diameter[i] / 2.0, layout.height[i], layout.blades[i], geometry);
      apply_rigid_transform(&turbine, make_transform(rotation_matrix(layout.yaw[i], 0.0, 0.0),
                                                     {layout.x[i], layout.y[i], layout.z[i]}));
      turbines[i] = std::move(turbine);
    } catch (...) {
#if defined(_OPENMP)
#pragma omp critical(windloft_layout_failure)
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

  MultiPartMesh farm;
  for (std::size_t i = 0; i < n; ++i) {
    farm.add_part("turbine" + std::to_string(i + 1), std::move(turbines[i]));
  }
  return farm;
}

PerimeterGridConfig resolve_domain_heights(const PerimeterGridConfig& config,
                                           const FarmLayout& layout) {
  validate_layout(layout);
  PerimeterGridConfig resolved = config;
  if (!resolved.z_min) {
    resolved.z_min = 0.0;
  }
  if (!resolved.z_max) {
    const double max_height = *std::max_element(layout.height.begin(), layout.height.end());
    const double max_diameter = *std::max_element(layout.diameter.begin(), layout.diameter.end());
    resolved.z_max = max_height + kDomainHeightFactor * max_diameter / 2.0;
  }
  return resolved;
}

WindFarm generate_windfarm(const FarmLayout& layout, const Contour& perimeter,
                           const WakeFunction& wake, const WindFarmConfig& config) {
  if (!wake) {
    throw std::invalid_argument("generate_windfarm requires a wake function.");
  }
  const PerimeterGridConfig volume = resolve_domain_heights(config.domain, layout);
  PerimeterGridConfig flat = volume;
  flat.z_divisions = 0;

  WindFarm result;
  result.perimeter_grid = generate_perimeter_grid(perimeter, flat);
  result.fluid_domain = generate_perimeter_grid(perimeter, volume);
  calculate_vector_field(&result.fluid_domain, "wake", wake);
  result.farm = generate_layout(layout, config.turbine);
  return result;
}
}  // namespace windloft::core
