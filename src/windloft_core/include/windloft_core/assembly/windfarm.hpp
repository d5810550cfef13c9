#pragma once

#include "windloft_core/assembly/multipart_mesh.hpp"
#include "windloft_core/mesh/loft.hpp"
#include "windloft_core/mesh/perimeter_grid.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace windloft::core {
// Component shapes of a turbine, lengths normalized by the tip radius.
struct TurbineGeometry {
  BladeDefinition blade;
  double hub_radius = 0.035;
  double hub_length = 0.1;
  double tower_base_diameter = 0.095;
  double tower_top_diameter = 0.061;

  Discretization blade_divisions = 30;
  Discretization hub_divisions = 12;
  Discretization tower_divisions = 20;
  int section_points = 48;  // hub and tower contours

  SplineOptions blade_spline;
};

TurbineGeometry default_turbine_geometry();

// Parts "tower" and "rotor" (with "hub", "blade1".."bladeN"). The tower base
// sits at the origin, the rotor axis points along +x at height
// tower_height + hub_radius / 2 and the hub nose faces -x.
MultiPartMesh generate_windturbine(double rtip, double tower_height, int nblades,
                                   const TurbineGeometry& geometry);

// One entry per turbine in every array. Yaw in degrees about +z.
struct FarmLayout {
  std::vector<double> diameter;
  std::vector<double> height;
  std::vector<int> blades;
  std::vector<double> x;
  std::vector<double> y;
  std::vector<double> z;
  std::vector<double> yaw;
};

// Returns the turbine count; throws std::invalid_argument on mismatched arrays.
std::size_t validate_layout(const FarmLayout& layout);

// Parts "turbine1".."turbineN".
MultiPartMesh generate_layout(const FarmLayout& layout, const TurbineGeometry& geometry);

using WakeFunction = std::function<Vec3(const Vec3&)>;

struct WindFarmConfig {
  PerimeterGridConfig domain;
  TurbineGeometry turbine = default_turbine_geometry();
};

struct WindFarm {
  MultiPartMesh farm;
  StructuredGrid perimeter_grid;
  StructuredGrid fluid_domain;  // carries the "wake" vector field
};

// Fills unset heights: z_min = 0, z_max = max(height) + 1.25 * max(diameter) / 2.
PerimeterGridConfig resolve_domain_heights(const PerimeterGridConfig& config,
                                           const FarmLayout& layout);

WindFarm generate_windfarm(const FarmLayout& layout, const Contour& perimeter,
                           const WakeFunction& wake, const WindFarmConfig& config);
}  // namespace windloft::core
