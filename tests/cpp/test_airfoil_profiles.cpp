#include "windloft_core/mesh/airfoil_mesh.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {
namespace wl = windloft::core;

double max_y(const wl::Contour& c) {
  double out = c.front()[1];
  for (const auto& p : c) {
    out = std::max(out, p[1]);
  }
  return out;
}

double min_y(const wl::Contour& c) {
  double out = c.front()[1];
  for (const auto& p : c) {
    out = std::min(out, p[1]);
  }
  return out;
}
}  // namespace

int main() {
  const wl::Contour naca0012 = wl::generate_naca4_profile("NACA0012", 80);
  if (naca0012.size() != 80) {
    std::cerr << "NACA0012 has " << naca0012.size() << " points, expected 80.\n";
    return 1;
  }
  if (!(wl::polygon_signed_area(naca0012) > 0.0)) {
    std::cerr << "NACA0012 is not counter-clockwise.\n";
    return 2;
  }
  const double thickness = max_y(naca0012) - min_y(naca0012);
  if (std::abs(thickness - 0.12) > 5.0e-3) {
    std::cerr << "NACA0012 thickness " << thickness << " is not close to 0.12.\n";
    return 3;
  }
  if (std::abs(naca0012.front()[0] - 1.0) > 1.0e-9 || std::abs(naca0012.front()[1]) > 1.0e-9) {
    std::cerr << "NACA0012 does not start at the trailing edge.\n";
    return 4;
  }
  const wl::ContourSplit sides = wl::split_contour(naca0012);
  if (sides.upper.size() + sides.lower.size() != naca0012.size() + 2) {
    std::cerr << "Split chains do not share the leading and trailing edge points.\n";
    return 5;
  }

  const wl::Contour naca4412 = wl::generate_naca4_profile("4412", 80);
  if (!(max_y(naca4412) > -min_y(naca4412) + 0.05)) {
    std::cerr << "NACA4412 shows no camber.\n";
    return 6;
  }

  const wl::Contour circle = wl::generate_circle_profile(24);
  for (const auto& p : circle) {
    if (std::abs(std::hypot(p[0] - 0.5, p[1]) - 0.5) > 1.0e-12) {
      std::cerr << "Circle profile point off radius 0.5.\n";
      return 7;
    }
  }

  const wl::Contour square {{0.0, 0.0}, {1.0, 0.0}, {1.0, 1.0}, {0.0, 1.0}};
  const wl::Contour resampled = wl::resample_closed_curve(square, 8);
  for (std::size_t i = 0; i < resampled.size(); ++i) {
    const double gap = wl::distance(resampled[i], resampled[(i + 1) % resampled.size()]);
    if (std::abs(gap - 0.5) > 1.0e-12) {
      std::cerr << "Resampled square spacing " << gap << " at point " << i << ".\n";
      return 8;
    }
  }

  const std::filesystem::path dir("out/tests/airfoil_profiles");
  std::filesystem::create_directories(dir);
  {
    std::ofstream out(dir / "square_cw.csv");
    out << "x,y\n0,0\n0,1\n1,1\n1,0\n";
  }
  const wl::Contour loaded = wl::load_airfoil_coordinate_file(dir / "square_cw.csv", 2.0);
  if (loaded.size() != 4 || std::abs(wl::polygon_signed_area(loaded) - 4.0) > 1.0e-12) {
    std::cerr << "Coordinate file was not scaled and reoriented counter-clockwise.\n";
    return 9;
  }

  {
    std::ofstream out(dir / "chord.csv");
    out << "r, chord\n0.0, 1.0\n0.5 0.8\n1.0, 0.2\n";
  }
  const wl::DistributionCurve table = wl::load_distribution_table(dir / "chord.csv");
  if (table.size() != 3 || table[1][0] != 0.5 || table[2][1] != 0.2) {
    std::cerr << "Distribution table rows were not read.\n";
    return 10;
  }

  bool missing_throws = false;
  try {
    static_cast<void>(wl::load_distribution_table(dir / "missing.csv"));
  } catch (const std::runtime_error&) {
    missing_throws = true;
  }
  if (!missing_throws) {
    std::cerr << "Missing table file did not throw.\n";
    return 11;
  }

  return 0;
}
