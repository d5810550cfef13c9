#include "windloft_core/mesh/airfoil_mesh.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace windloft::core {
namespace {
constexpr double kEps = 1.0e-12;

std::vector<Vec2> remove_duplicate_points(const std::vector<Vec2>& input) {
  std::vector<Vec2> unique_points;
  unique_points.reserve(input.size());
  for (const auto& point : input) {
    if (!unique_points.empty() && distance(unique_points.back(), point) < 1.0e-9) {
      continue;
    }
    unique_points.push_back(point);
  }
  if (unique_points.size() >= 2 && distance(unique_points.front(), unique_points.back()) < 1.0e-9) {
    unique_points.pop_back();
  }
  return unique_points;
}

std::string extract_naca_digits(const std::string& code) {
  std::string digits;
  digits.reserve(code.size());
  for (char ch : code) {
    if (ch >= '0' && ch <= '9') {
      digits.push_back(ch);
    }
  }
  if (digits.size() < 4) {
    throw std::invalid_argument("NACA code must contain four digits.");
  }
  return digits.substr(0, 4);
}

// Reads the first two numbers of every row that has them.
std::vector<std::array<double, 2>> read_numeric_pairs(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open table file: " + path.string());
  }

  std::vector<std::array<double, 2>> rows;
  std::string line;
  while (std::getline(in, line)) {
    std::replace(line.begin(), line.end(), ',', ' ');
    std::istringstream iss(line);
    double a = 0.0;
    double b = 0.0;
    if (!(iss >> a >> b)) {
      continue;
    }
    rows.push_back({a, b});
  }
  return rows;
}
}  // namespace

Contour resample_closed_curve(const Contour& input, const int target_count) {
  if (target_count < 3) {
    throw std::invalid_argument("Target curve resolution must be >= 3.");
  }
  const auto points = remove_duplicate_points(input);
  if (points.size() < 3) {
    throw std::invalid_argument("Closed curve has too few distinct points.");
  }

  const std::size_t n = points.size();
  std::vector<double> cumulative(n + 1, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t j = (i + 1) % n;
    cumulative[i + 1] = cumulative[i] + distance(points[i], points[j]);
  }

  const double total_length = cumulative.back();
  if (total_length < kEps) {
    throw std::invalid_argument("Closed curve has near-zero length.");
  }

  Contour sampled;
  sampled.reserve(static_cast<std::size_t>(target_count));

  std::size_t segment = 0;
  for (int k = 0; k < target_count; ++k) {
    const double target_s = total_length * static_cast<double>(k) / static_cast<double>(target_count);
    while (segment + 1 < cumulative.size() && cumulative[segment + 1] < target_s) {
      ++segment;
    }
    const std::size_t i0 = segment % n;
    const std::size_t i1 = (segment + 1) % n;
    const double s0 = cumulative[segment];
    const double s1 = cumulative[segment + 1];
    const double denom = std::max(s1 - s0, kEps);
    const double t = (target_s - s0) / denom;
    sampled.push_back({points[i0][0] + t * (points[i1][0] - points[i0][0]),
                       points[i0][1] + t * (points[i1][1] - points[i0][1])});
  }

  return sampled;
}

Contour generate_naca4_profile(const std::string& code, const int num_points, const double chord) {
  if (chord <= 0.0) {
    throw std::invalid_argument("Airfoil chord must be positive.");
  }
  const std::string digits = extract_naca_digits(code);

  const double m = static_cast<double>(digits[0] - '0') / 100.0;
  const double p = static_cast<double>(digits[1] - '0') / 10.0;
  const double t = static_cast<double>(10 * (digits[2] - '0') + (digits[3] - '0')) / 100.0;

  const int points_per_surface = std::max(16, num_points / 2 + 1);
  std::vector<Vec2> upper(static_cast<std::size_t>(points_per_surface));
  std::vector<Vec2> lower(static_cast<std::size_t>(points_per_surface));

  for (int i = 0; i < points_per_surface; ++i) {
    const double beta = kPi * static_cast<double>(i) / static_cast<double>(points_per_surface - 1);
    const double x = 0.5 * (1.0 - std::cos(beta));
    const double sqrt_x = std::sqrt(std::max(x, 0.0));
    // Closed trailing edge coefficient (-0.1036).
    const double yt = 5.0 * t *
                      (0.2969 * sqrt_x - 0.1260 * x - 0.3516 * x * x + 0.2843 * x * x * x -
                       0.1036 * x * x * x * x);

    double yc = 0.0;
    double dyc_dx = 0.0;
    if (m > 0.0 && p > 0.0 && p < 1.0) {
      if (x < p) {
        yc = m / (p * p) * (2.0 * p * x - x * x);
        dyc_dx = 2.0 * m / (p * p) * (p - x);
      } else {
        const double one_minus_p = 1.0 - p;
        yc = m / (one_minus_p * one_minus_p) * (1.0 - 2.0 * p + 2.0 * p * x - x * x);
        dyc_dx = 2.0 * m / (one_minus_p * one_minus_p) * (p - x);
      }
    }

    const double theta = std::atan(dyc_dx);
    upper[static_cast<std::size_t>(i)] = {(x - yt * std::sin(theta)) * chord,
                                          (yc + yt * std::cos(theta)) * chord};
    lower[static_cast<std::size_t>(i)] = {(x + yt * std::sin(theta)) * chord,
                                          (yc - yt * std::cos(theta)) * chord};
  }

  Contour contour;
  contour.reserve(static_cast<std::size_t>(2 * points_per_surface - 1));
  for (int i = points_per_surface - 1; i >= 0; --i) {
    contour.push_back(upper[static_cast<std::size_t>(i)]);
  }
  for (int i = 1; i < points_per_surface; ++i) {
    contour.push_back(lower[static_cast<std::size_t>(i)]);
  }

  if (polygon_signed_area(contour) < 0.0) {
    std::reverse(contour.begin(), contour.end());
  }

  return resample_closed_curve(contour, num_points);
}

Contour generate_circle_profile(const int num_points) {
  if (num_points < 3) {
    throw std::invalid_argument("Circle profile needs at least three points.");
  }
  Contour contour;
  contour.reserve(static_cast<std::size_t>(num_points));
  for (int k = 0; k < num_points; ++k) {
    const double theta = 2.0 * kPi * static_cast<double>(k) / static_cast<double>(num_points);
    contour.push_back({0.5 + 0.5 * std::cos(theta), 0.5 * std::sin(theta)});
  }
  return contour;
}

Contour load_airfoil_coordinate_file(const std::filesystem::path& path, const double chord) {
  Contour points;
  for (const auto& row : read_numeric_pairs(path)) {
    points.push_back({row[0] * chord, row[1] * chord});
  }

  points = remove_duplicate_points(points);
  if (points.size() < 3) {
    throw std::invalid_argument("Coordinate file contains too few airfoil points: " +
                                path.string());
  }

  if (polygon_signed_area(points) < 0.0) {
    std::reverse(points.begin(), points.end());
  }

  return points;
}

DistributionCurve load_distribution_table(const std::filesystem::path& path) {
  DistributionCurve table = read_numeric_pairs(path);
  if (table.empty()) {
    throw std::invalid_argument("Distribution table has no numeric rows: " + path.string());
  }
  return table;
}
}  // namespace windloft::core
