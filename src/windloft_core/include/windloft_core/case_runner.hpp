#pragma once

#include "windloft_core/assembly/windfarm.hpp"
#include "windloft_core/mesh/contour.hpp"
#include "windloft_core/numerics/discretization.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace windloft::core {
struct RunSummary {
  std::string status;
  std::string case_type;
  std::string run_log;
  int part_count = 0;
  std::size_t node_count = 0;
  std::size_t triangle_count = 0;
  std::vector<std::string> files;
};

using CaseValues = std::unordered_map<std::string, std::string>;

// "key = value" or "key: value" lines, '#' starts a comment line.
CaseValues parse_case_kv(const std::filesystem::path& path);

// Comma and/or whitespace separated numbers.
std::vector<double> parse_number_list(const std::string& text);
// "x y; x y; ..." points.
Contour parse_point_list(const std::string& text);
// A plain division count, or "fraction:count[:stretching[:reverse]]" sections joined by '|'.
Discretization parse_discretization(const std::string& text);

TurbineGeometry turbine_geometry_from_case(const CaseValues& values);

// Builds the case_type (blade, turbine or farm) described by the case file,
// writes VTU files and run.log into out_dir.
RunSummary run_case(const std::string& case_path, const std::string& out_dir);
}  // namespace windloft::core
