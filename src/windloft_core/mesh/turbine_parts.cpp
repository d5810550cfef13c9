#include "windloft_core/mesh/airfoil_mesh.hpp"
#include "windloft_core/mesh/loft.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace windloft::core {
namespace {
std::string trim_copy(const std::string& value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin]))) {
    ++begin;
  }
  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(begin, end - begin);
}

// Rows of "position, file name"; rows whose position does not parse are headers.
std::vector<std::pair<double, std::string>> read_section_index(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open airfoil section index: " + path.string());
  }

  std::vector<std::pair<double, std::string>> rows;
  std::string line;
  while (std::getline(in, line)) {
    const std::size_t comma = line.find(',');
    if (comma == std::string::npos) {
      continue;
    }
    const std::string position_text = trim_copy(line.substr(0, comma));
    std::string file_name = trim_copy(line.substr(comma + 1));
    file_name.erase(std::remove(file_name.begin(), file_name.end(), '"'), file_name.end());

    std::istringstream iss(position_text);
    double position = 0.0;
    if (!(iss >> position) || file_name.empty()) {
      continue;
    }
    rows.emplace_back(position, file_name);
  }
  if (rows.empty()) {
    throw std::invalid_argument("Airfoil section index lists no sections: " + path.string());
  }
  return rows;
}

// Leading edge offsets that centre a section of the given chord on the span axis.
DistributionCurve centred_leading_edge(const DistributionCurve& chords) {
  DistributionCurve le_x;
  le_x.reserve(chords.size());
  for (const auto& row : chords) {
    le_x.push_back({row[0], -0.5 * row[1]});
  }
  return le_x;
}

SplineOptions piecewise_linear() {
  SplineOptions options;
  options.degree = 1;
  options.smoothing = 0.0;
  return options;
}
}  // namespace

BladeDefinition load_blade_definition(const std::filesystem::path& data_path,
                                      const std::string& blade_name, const int section_points) {
  BladeDefinition blade;
  blade.chords = load_distribution_table(data_path / (blade_name + "_chord.csv"));
  blade.twists = load_distribution_table(data_path / (blade_name + "_twist.csv"));
  blade.le_x = load_distribution_table(data_path / (blade_name + "_lex.csv"));
  blade.le_z = load_distribution_table(data_path / (blade_name + "_lez.csv"));

  const auto index = read_section_index(data_path / (blade_name + "_airfoilsections.csv"));
  for (const auto& [position, file_name] : index) {
    CrossSection section;
    section.position = position;
    section.contour =
      load_airfoil_coordinate_file(data_path / "airfoils" / (blade_name + "_" + file_name));
    if (section_points > 0) {
      section.contour = resample_closed_curve(section.contour, section_points);
    }
    blade.sections.push_back(std::move(section));
  }
  return blade;
}

BladeDefinition default_blade_definition(const int section_points) {
  BladeDefinition blade;
  blade.chords = {
    {0.00, 0.053}, {0.10, 0.056}, {0.20, 0.072}, {0.30, 0.068}, {0.45, 0.058},
    {0.60, 0.050}, {0.75, 0.042}, {0.90, 0.033}, {1.00, 0.022},
  };
  blade.twists = {
    {0.00, 13.3}, {0.20, 13.3}, {0.30, 11.5}, {0.45, 9.0},
    {0.60, 6.5},  {0.75, 3.8},  {0.90, 1.5},  {1.00, 0.1},
  };

  // Pitch axis moves from mid-chord on the cylindrical root to quarter chord outboard.
  for (const auto& row : blade.chords) {
    const double r = row[0];
    const double axis = r <= 0.1 ? 0.5 : (r < 0.3 ? 0.5 - (r - 0.1) * 1.25 : 0.25);
    blade.le_x.push_back({r, -axis * row[1]});
  }
  blade.le_z = {{0.0, 0.0}, {1.0, 0.0}};

  blade.sections.push_back({0.0, generate_circle_profile(section_points)});
  blade.sections.push_back({0.1, generate_circle_profile(section_points)});
  blade.sections.push_back({0.3, generate_naca4_profile("4421", section_points)});
  blade.sections.push_back({0.6, generate_naca4_profile("4415", section_points)});
  blade.sections.push_back({1.0, generate_naca4_profile("4412", section_points)});
  return blade;
}

TriangleSurface generate_blade(const double rtip, const double rhub,
                               const Discretization& r_divisions, const BladeDefinition& blade,
                               const SplineOptions& spline) {
  if (!(rtip > 0.0)) {
    throw std::invalid_argument("Blade tip radius must be positive.");
  }
  if (rhub < 0.0 || !(rhub < rtip)) {
    throw std::invalid_argument("Blade hub radius must lie in [0, rtip).");
  }

  LoftDefinition loft;
  loft.bscale = rtip;
  loft.b_low = rhub / rtip;
  loft.b_up = 1.0;
  loft.b_divisions = r_divisions;
  loft.chords = blade.chords;
  loft.twists = blade.twists;
  loft.le_x = blade.le_x;
  loft.le_z = blade.le_z;
  loft.tilt_z = blade.tilt_z;
  loft.sections = blade.sections;
  loft.spline = spline;
  return generate_loft(loft);
}

TriangleSurface generate_hub(const double radius, const double length,
                             const Discretization& divisions, const int section_points) {
  if (!(radius > 0.0) || !(length > 0.0)) {
    throw std::invalid_argument("Hub radius and length must be positive.");
  }
  const double d = 2.0 * radius / length;

  LoftDefinition loft;
  loft.bscale = length;
  loft.b_divisions = divisions;
  loft.chords = {{0.0, 0.85 * d}, {0.15, d}, {0.85, d}, {0.95, 0.7 * d}, {1.0, 0.15 * d}};
  loft.twists = {{0.0, 0.0}, {1.0, 0.0}};
  loft.le_x = centred_leading_edge(loft.chords);
  loft.le_z = {{0.0, 0.0}, {1.0, 0.0}};
  loft.sections = {{0.0, generate_circle_profile(section_points)},
                   {1.0, generate_circle_profile(section_points)}};
  loft.spline = piecewise_linear();
  return generate_loft(loft);
}

TriangleSurface generate_tower(const double height, const double base_diameter,
                               const double top_diameter, const Discretization& divisions,
                               const int section_points) {
  if (!(height > 0.0) || !(base_diameter > 0.0) || !(top_diameter > 0.0)) {
    throw std::invalid_argument("Tower height and diameters must be positive.");
  }

  LoftDefinition loft;
  loft.bscale = height;
  loft.b_divisions = divisions;
  loft.chords = {{0.0, base_diameter / height}, {1.0, top_diameter / height}};
  loft.twists = {{0.0, 0.0}, {1.0, 0.0}};
  loft.le_x = centred_leading_edge(loft.chords);
  loft.le_z = {{0.0, 0.0}, {1.0, 0.0}};
  loft.sections = {{0.0, generate_circle_profile(section_points)},
                   {1.0, generate_circle_profile(section_points)}};
  loft.spline = piecewise_linear();
  return generate_loft(loft);
}
}  // namespace windloft::core
