#pragma once

#include "windloft_core/mesh.hpp"
#include "windloft_core/mesh/contour.hpp"
#include "windloft_core/numerics/discretization.hpp"
#include "windloft_core/numerics/spline.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace windloft::core {
// Unit-chord contour placed at a normalized span position.
struct CrossSection {
  double position = 0.0;
  Contour contour;
};

// Spanwise distributions are (span / bscale, value) pairs. Chords and leading
// edge offsets are normalized by bscale, twist and tilt are in degrees.
struct LoftDefinition {
  double bscale = 1.0;
  double b_low = 0.0;
  double b_up = 1.0;
  Discretization b_divisions = 10;

  DistributionCurve chords;
  DistributionCurve twists;
  DistributionCurve le_x;
  DistributionCurve le_z;
  std::optional<DistributionCurve> tilt_z;
  std::vector<CrossSection> sections;

  SplineOptions spline;
};

struct SectionBracket {
  std::size_t index_in = 0;
  std::size_t index_out = 0;
  double weight = 0.0;  // 0 at index_in, 1 at index_out
};

// Linear scan for the pair of sections around position, weight clamped to [0, 1].
SectionBracket find_bounding_sections(const std::vector<CrossSection>& sections, double position);

// Maps (contour parameter, span, -) grid nodes of a loft onto the lofted surface.
class LoftSpaceTransform {
 public:
  explicit LoftSpaceTransform(const LoftDefinition& definition);

  Vec3 operator()(const Vec3& coords, const GridIndex& index) const;

  double chord(double span) const { return chord_.evaluate(span); }
  double twist(double span) const { return twist_.evaluate(span); }
  double le_x(double span) const { return le_x_.evaluate(span); }
  double le_z(double span) const { return le_z_.evaluate(span); }
  double tilt(double span) const;

 private:
  double bscale_ = 1.0;
  Spline chord_;
  Spline twist_;
  Spline le_x_;
  Spline le_z_;
  std::optional<Spline> tilt_;
  std::vector<CrossSection> sections_;
};

// Throws std::invalid_argument on fewer than two sections, unsorted positions,
// differing contour point counts or an empty span discretization.
void validate_loft_definition(const LoftDefinition& definition);

StructuredGrid generate_loft_grid(const LoftDefinition& definition);
TriangleSurface generate_loft(const LoftDefinition& definition);

// Blade tables normalized by the tip radius.
struct BladeDefinition {
  DistributionCurve chords;
  DistributionCurve twists;
  DistributionCurve le_x;
  DistributionCurve le_z;
  std::optional<DistributionCurve> tilt_z;
  std::vector<CrossSection> sections;
};

// Reads <name>_chord.csv, <name>_twist.csv, <name>_lex.csv, <name>_lez.csv and
// <name>_airfoilsections.csv (position, file) with contours under airfoils/<name>_<file>.
// section_points > 0 resamples every contour to that many points.
BladeDefinition load_blade_definition(const std::filesystem::path& data_path,
                                      const std::string& blade_name, int section_points = 0);

// Procedural three-bladed-rotor blade: cylindrical root blending into NACA sections.
BladeDefinition default_blade_definition(int section_points = 60);

TriangleSurface generate_blade(double rtip, double rhub, const Discretization& r_divisions,
                               const BladeDefinition& blade, const SplineOptions& spline = {});

// Body of revolution along +y from y = 0 (full radius) to y = length (nose).
TriangleSurface generate_hub(double radius, double length, const Discretization& divisions,
                             int section_points);

// Tapered cylinder along +y from y = 0 to y = height, centred on the y axis.
TriangleSurface generate_tower(double height, double base_diameter, double top_diameter,
                               const Discretization& divisions, int section_points);
}  // namespace windloft::core
