#pragma once

#include "windloft_core/mesh/contour.hpp"
#include "windloft_core/numerics/spline.hpp"

#include <filesystem>
#include <string>

namespace windloft::core {
// Unit-chord NACA 4-digit section, leading edge at the origin, counter-clockwise
// from the trailing edge, resampled to num_points evenly spaced points.
Contour generate_naca4_profile(const std::string& code, int num_points, double chord = 1.0);

// Unit-diameter circle touching the origin, counter-clockwise from (1, 0).
Contour generate_circle_profile(int num_points);

// Resamples an implicitly closed curve to target_count points equally spaced in arclength.
Contour resample_closed_curve(const Contour& input, int target_count);

// Whitespace or comma separated "x y" rows; non-numeric rows (headers) are skipped.
Contour load_airfoil_coordinate_file(const std::filesystem::path& path, double chord = 1.0);
DistributionCurve load_distribution_table(const std::filesystem::path& path);
}  // namespace windloft::core
