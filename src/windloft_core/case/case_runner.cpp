#include "windloft_core/case_runner.hpp"

#include "windloft_core/io_vtk.hpp"
#include "windloft_core/mesh/airfoil_mesh.hpp"
#include "windloft_core/version.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
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

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> split(const std::string& text, const char separator) {
  std::vector<std::string> parts;
  std::istringstream iss(text);
  std::string token;
  while (std::getline(iss, token, separator)) {
    parts.push_back(trim_copy(token));
  }
  return parts;
}

double parse_double(const std::string& text, const std::string& what) {
  const std::string trimmed = trim_copy(text);
  std::size_t used = 0;
  double value = 0.0;
  try {
    value = std::stod(trimmed, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("Case value for '" + what + "' is not a number: " + text);
  }
  if (used != trimmed.size()) {
    throw std::invalid_argument("Case value for '" + what + "' is not a number: " + text);
  }
  return value;
}

int parse_int(const std::string& text, const std::string& what) {
  const std::string trimmed = trim_copy(text);
  std::size_t used = 0;
  int value = 0;
  try {
    value = std::stoi(trimmed, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("Case value for '" + what + "' is not an integer: " + text);
  }
  if (used != trimmed.size()) {
    throw std::invalid_argument("Case value for '" + what + "' is not an integer: " + text);
  }
  return value;
}

bool parse_on_off(const std::string& value, const std::string& what) {
  const std::string normalized = to_lower_copy(trim_copy(value));
  if (normalized == "on" || normalized == "true" || normalized == "yes" || normalized == "1") {
    return true;
  }
  if (normalized == "off" || normalized == "false" || normalized == "no" || normalized == "0") {
    return false;
  }
  throw std::invalid_argument("Case value for '" + what + "' is not on/off: " + value);
}

bool has_key(const CaseValues& kv, const char* key) {
  const auto it = kv.find(key);
  return it != kv.end() && !it->second.empty();
}

std::string get_string(const CaseValues& kv, const char* key, const std::string& fallback) {
  const auto it = kv.find(key);
  if (it == kv.end() || it->second.empty()) {
    return fallback;
  }
  return it->second;
}

double get_double(const CaseValues& kv, const char* key, const double fallback) {
  return has_key(kv, key) ? parse_double(kv.at(key), key) : fallback;
}

int get_int(const CaseValues& kv, const char* key, const int fallback) {
  return has_key(kv, key) ? parse_int(kv.at(key), key) : fallback;
}

std::vector<double> get_list(const CaseValues& kv, const char* key) {
  return has_key(kv, key) ? parse_number_list(kv.at(key)) : std::vector<double> {};
}

std::vector<double> get_list_or(const CaseValues& kv, const char* key, const std::size_t count,
                                const double fallback) {
  std::vector<double> values = get_list(kv, key);
  if (values.empty()) {
    values.assign(count, fallback);
  }
  return values;
}

FarmLayout layout_from_case(const CaseValues& kv) {
  FarmLayout layout;
  layout.diameter = get_list(kv, "diameter");
  layout.height = get_list(kv, "height");
  layout.x = get_list(kv, "x");
  layout.y = get_list(kv, "y");

  const std::size_t n = layout.diameter.size();
  layout.z = get_list_or(kv, "z", n, 0.0);
  layout.yaw = get_list_or(kv, "yaw", n, 0.0);
  if (!has_key(kv, "blades")) {
    layout.blades.assign(n, 3);
    return layout;
  }
  std::string text = kv.at("blades");
  std::replace(text.begin(), text.end(), ',', ' ');
  std::istringstream tokens(text);
  std::string token;
  while (tokens >> token) {
    layout.blades.push_back(parse_int(token, "blades"));
  }
  return layout;
}

PerimeterGridConfig domain_from_case(const CaseValues& kv) {
  PerimeterGridConfig config;
  config.x_divisions = parse_discretization(get_string(kv, "nx", "50"));
  config.y_divisions = parse_discretization(get_string(kv, "ny", "50"));
  config.z_divisions = parse_discretization(get_string(kv, "nz", "50"));
  if (has_key(kv, "z_min")) {
    config.z_min = get_double(kv, "z_min", 0.0);
  }
  if (has_key(kv, "z_max")) {
    config.z_max = get_double(kv, "z_max", 0.0);
  }
  if (has_key(kv, "perimeter_spline_degree")) {
    config.spline_degree = get_int(kv, "perimeter_spline_degree", config.spline_degree);
  }
  config.smoothing = get_double(kv, "perimeter_smoothing", config.smoothing);
  return config;
}

void write_log(const std::filesystem::path& run_log_path, const std::string& case_path,
               const std::string& output_name, const RunSummary& summary) {
  std::ofstream log(run_log_path, std::ios::trunc);
  if (!log) {
    throw std::runtime_error("Failed to write run log: " + run_log_path.string());
  }
  log << "windloft " << summary.case_type << " case\n";
  log << "version=" << version() << "\n";
  log << "openmp=" << (openmp_enabled() ? "on" : "off") << "\n";
  log << "case_path=" << case_path << "\n";
  log << "case_type=" << summary.case_type << "\n";
  log << "output_name=" << output_name << "\n";
  log << "part_count=" << summary.part_count << "\n";
  log << "node_count=" << summary.node_count << "\n";
  log << "triangle_count=" << summary.triangle_count << "\n";
  for (const std::string& file : summary.files) {
    log << "file=" << file << "\n";
  }
}
}  // namespace

CaseValues parse_case_kv(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open case file: " + path.string());
  }

  CaseValues kv;
  std::string line;
  while (std::getline(in, line)) {
    const std::string stripped = trim_copy(line);
    if (stripped.empty() || stripped[0] == '#') {
      continue;
    }

    std::size_t sep = stripped.find('=');
    if (sep == std::string::npos) {
      sep = stripped.find(':');
    }
    if (sep == std::string::npos) {
      continue;
    }

    const std::string key = trim_copy(stripped.substr(0, sep));
    const std::string value = trim_copy(stripped.substr(sep + 1));
    if (!key.empty()) {
      kv[key] = value;
    }
  }

  return kv;
}

std::vector<double> parse_number_list(const std::string& text) {
  std::string normalized = text;
  std::replace(normalized.begin(), normalized.end(), ',', ' ');
  std::istringstream iss(normalized);
  std::vector<double> values;
  std::string token;
  while (iss >> token) {
    values.push_back(parse_double(token, "list"));
  }
  return values;
}

Contour parse_point_list(const std::string& text) {
  Contour points;
  for (const std::string& item : split(text, ';')) {
    if (item.empty()) {
      continue;
    }
    const std::vector<double> xy = parse_number_list(item);
    if (xy.size() != 2) {
      throw std::invalid_argument("Expected an 'x y' pair, got: " + item);
    }
    points.push_back({xy[0], xy[1]});
  }
  return points;
}

Discretization parse_discretization(const std::string& text) {
  const std::string trimmed = trim_copy(text);
  if (trimmed.find(':') == std::string::npos && trimmed.find('|') == std::string::npos) {
    return UniformDivisions(parse_int(trimmed, "divisions"));
  }

  MultiSection sections;
  for (const std::string& item : split(trimmed, '|')) {
    const std::vector<std::string> fields = split(item, ':');
    if (fields.size() < 2 || fields.size() > 4) {
      throw std::invalid_argument(
        "Section descriptor must read fraction:count[:stretching[:reverse]], got: " + item);
    }
    DiscretizationSection section;
    section.fraction = parse_double(fields[0], "section fraction");
    section.divisions = parse_int(fields[1], "section divisions");
    if (fields.size() > 2) {
      section.stretching = parse_double(fields[2], "section stretching");
    }
    if (fields.size() > 3) {
      section.reverse = parse_on_off(fields[3], "section reverse");
    }
    sections.push_back(section);
  }
  validate_discretization(sections);
  return sections;
}

TurbineGeometry turbine_geometry_from_case(const CaseValues& values) {
  TurbineGeometry geometry = default_turbine_geometry();
  const int points = get_int(values, "airfoil_points", 60);

  if (has_key(values, "data_path")) {
    geometry.blade = load_blade_definition(get_string(values, "data_path", "."),
                                           get_string(values, "blade_name", "NREL5MW"), points);
  } else {
    geometry.blade = default_blade_definition(points);
    Contour airfoil;
    if (has_key(values, "airfoil_file")) {
      airfoil = resample_closed_curve(
        load_airfoil_coordinate_file(get_string(values, "airfoil_file", "")), points);
    } else if (has_key(values, "naca_code")) {
      airfoil = generate_naca4_profile(get_string(values, "naca_code", "4412"), points);
    }
    if (!airfoil.empty()) {
      // Root cylinders stay, every airfoil section takes the requested profile.
      for (CrossSection& section : geometry.blade.sections) {
        if (section.position >= 0.3) {
          section.contour = airfoil;
        }
      }
    }
  }

  geometry.blade_divisions = parse_discretization(get_string(values, "span_divisions", "30"));
  geometry.blade_spline.degree = get_int(values, "spline_degree", geometry.blade_spline.degree);
  geometry.blade_spline.smoothing =
    get_double(values, "spline_smoothing", geometry.blade_spline.smoothing);
  return geometry;
}

RunSummary run_case(const std::string& case_path, const std::string& out_dir) {
  const std::filesystem::path output_dir(out_dir.empty() ? "." : out_dir);
  std::filesystem::create_directories(output_dir);
  const CaseValues case_kv = parse_case_kv(case_path);
  const std::string case_type = to_lower_copy(get_string(case_kv, "case_type", "blade"));
  const std::string output_name = get_string(case_kv, "output_name", case_type);
  const std::filesystem::path run_log_path = output_dir / "run.log";

  RunSummary summary;
  summary.case_type = case_type;

  if (case_type == "blade") {
    const TurbineGeometry geometry = turbine_geometry_from_case(case_kv);
    const double rtip = get_double(case_kv, "rtip", 63.0);
    const double rhub = get_double(case_kv, "rhub", geometry.hub_radius * rtip);
    const TriangleSurface blade =
      generate_blade(rtip, rhub, geometry.blade_divisions, geometry.blade, geometry.blade_spline);

    const std::filesystem::path vtu_path = output_dir / (output_name + ".vtu");
    if (!write_surface_vtu(vtu_path, blade)) {
      throw std::runtime_error("Failed to write VTU output.");
    }
    summary.part_count = 1;
    summary.node_count = node_count(blade);
    summary.triangle_count = blade.triangles.size();
    summary.files.push_back(vtu_path.string());
  } else if (case_type == "turbine") {
    TurbineGeometry geometry = turbine_geometry_from_case(case_kv);
    const double rtip = get_double(case_kv, "rtip", 63.0);
    if (has_key(case_kv, "rhub")) {
      geometry.hub_radius = get_double(case_kv, "rhub", 0.0) / rtip;
    }
    const MultiPartMesh turbine = generate_windturbine(
      rtip, get_double(case_kv, "height", 90.0), get_int(case_kv, "blades", 3), geometry);

    for (const auto& path : write_multipart_vtu(output_dir, output_name, turbine)) {
      summary.files.push_back(path.string());
    }
    summary.part_count = static_cast<int>(collect_leaves(turbine).size());
    summary.node_count = total_node_count(turbine);
    summary.triangle_count = total_triangle_count(turbine);
  } else if (case_type == "farm") {
    if (!has_key(case_kv, "perimeter")) {
      throw std::invalid_argument("Farm cases need a 'perimeter' entry.");
    }
    const FarmLayout layout = layout_from_case(case_kv);
    const Contour perimeter = parse_point_list(case_kv.at("perimeter"));

    WindFarmConfig config;
    config.domain = domain_from_case(case_kv);
    config.turbine = turbine_geometry_from_case(case_kv);
    const Vec3 wake_velocity {get_double(case_kv, "wake_u", 1.0), get_double(case_kv, "wake_v", 0.0),
                              get_double(case_kv, "wake_w", 0.0)};
    const WindFarm farm = generate_windfarm(
      layout, perimeter, [wake_velocity](const Vec3&) { return wake_velocity; }, config);

    for (const auto& path : write_multipart_vtu(output_dir, output_name, farm.farm)) {
      summary.files.push_back(path.string());
    }
    const std::filesystem::path perimeter_path = output_dir / (output_name + "_perimeter.vtu");
    const std::filesystem::path fdom_path = output_dir / (output_name + "_fdom.vtu");
    if (!write_grid_vtu(perimeter_path, farm.perimeter_grid) ||
        !write_grid_vtu(fdom_path, farm.fluid_domain)) {
      throw std::runtime_error("Failed to write VTU output.");
    }
    summary.files.push_back(perimeter_path.string());
    summary.files.push_back(fdom_path.string());

    summary.part_count = static_cast<int>(collect_leaves(farm.farm).size()) + 2;
    summary.node_count = total_node_count(farm.farm) + node_count(farm.perimeter_grid) +
                         node_count(farm.fluid_domain);
    summary.triangle_count = total_triangle_count(farm.farm);
  } else {
    throw std::invalid_argument("Unsupported case_type '" + case_type +
                                "'. Use blade, turbine or farm.");
  }

  write_log(run_log_path, case_path, output_name, summary);
  summary.status = "ok";
  summary.run_log = run_log_path.string();
  return summary;
}
}  // namespace windloft::core
