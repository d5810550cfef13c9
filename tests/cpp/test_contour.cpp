#include "windloft_core/mesh/contour.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {
namespace wl = windloft::core;

bool split_throws(const wl::Contour& contour) {
  try {
    static_cast<void>(wl::split_contour(contour));
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

bool strictly_increasing_x(const std::vector<wl::Vec2>& chain) {
  for (std::size_t i = 1; i < chain.size(); ++i) {
    if (!(chain[i][0] > chain[i - 1][0])) {
      return false;
    }
  }
  return true;
}

std::vector<wl::Vec2> semicircle(const int points) {
  std::vector<wl::Vec2> chain;
  for (int i = 0; i < points; ++i) {
    const double theta = wl::kPi * (1.0 - static_cast<double>(i) / (points - 1));
    chain.push_back({std::cos(theta), std::sin(theta)});
  }
  return chain;
}

double reconstruction_error(const int input_points) {
  wl::ParameterizeOptions options;
  options.smoothing = 0.0;
  const wl::ParametricCurve curve = wl::parameterize(semicircle(input_points), options);
  const std::vector<wl::Vec2> sampled = wl::discretize(curve, 0.0, 1.0, 200);
  return wl::hausdorff_distance(sampled, semicircle(2001));
}
}  // namespace

int main() {
  // Rectangle with vertical extreme edges, listed clockwise and explicitly closed.
  const wl::Contour rectangle {{0.0, 0.0}, {0.0, 5.0}, {10.0, 5.0}, {10.0, 0.0}, {0.0, 0.0}};
  const wl::ContourSplit sides = wl::split_contour(rectangle);
  if (sides.upper.size() != 2 || sides.lower.size() != 2) {
    std::cerr << "Rectangle chains have " << sides.upper.size() << " and " << sides.lower.size()
              << " points.\n";
    return 1;
  }
  if (sides.upper[0][1] != 5.0 || sides.upper[1][0] != 10.0 || sides.lower[0][1] != 0.0) {
    std::cerr << "Rectangle chains are not the expected edges.\n";
    return 2;
  }

  wl::Contour circle;
  for (int k = 0; k < 64; ++k) {
    const double theta = 2.0 * wl::kPi * k / 64.0;
    circle.push_back({std::cos(theta), std::sin(theta)});
  }
  const wl::ContourSplit halves = wl::split_contour(circle);
  if (!strictly_increasing_x(halves.upper) || !strictly_increasing_x(halves.lower)) {
    std::cerr << "Split chains are not injective in x.\n";
    return 3;
  }
  if (std::abs(halves.upper.front()[0] + 1.0) > 1.0e-12 ||
      std::abs(halves.upper.back()[0] - 1.0) > 1.0e-12) {
    std::cerr << "Upper chain does not run between the x-extrema.\n";
    return 4;
  }
  for (const wl::Vec2& p : halves.upper) {
    if (p[1] < -1.0e-12) {
      std::cerr << "Upper chain dips below the axis.\n";
      return 5;
    }
  }

  if (!split_throws({{0.0, 0.0}, {1.0, 1.0}})) {
    std::cerr << "Two points were accepted as a closed contour.\n";
    return 6;
  }
  if (!split_throws({{0.0, 0.0}, {1.0, 1.0}, {2.0, 2.0}})) {
    std::cerr << "A degenerate contour was accepted.\n";
    return 7;
  }
  // U shape: the top chain folds back in x.
  if (!split_throws({{0.0, 0.0}, {3.0, 0.0}, {3.0, 3.0}, {2.0, 3.0}, {2.0, 1.0}, {1.0, 1.0},
                     {1.0, 3.0}, {0.0, 3.0}})) {
    std::cerr << "A U-shaped contour was accepted.\n";
    return 8;
  }
  // Minimum-x points separated by other points.
  if (!split_throws({{0.0, 0.0}, {2.0, 1.0}, {0.0, 2.0}, {1.0, 1.0}})) {
    std::cerr << "Non-contiguous extremes were accepted.\n";
    return 9;
  }

  wl::ParameterizeOptions injective;
  injective.parameter = wl::ParameterKind::kInjectiveCoordinate;
  const wl::ParametricCurve top = wl::parameterize(sides.upper, injective);
  const wl::Vec2 mid = top(0.5);
  if (std::abs(mid[0] - 5.0) > 1.0e-12 || std::abs(mid[1] - 5.0) > 1.0e-12) {
    std::cerr << "Injective parameterization mismatch: " << mid[0] << ", " << mid[1] << "\n";
    return 10;
  }

  const double coarse = reconstruction_error(9);
  const double fine = reconstruction_error(33);
  if (!(fine < coarse) || fine > 1.0e-2) {
    std::cerr << "Reparameterization error does not converge: " << coarse << " -> " << fine
              << "\n";
    return 11;
  }

  if (std::abs(wl::polygon_signed_area(rectangle) + 50.0) > 1.0e-12) {
    std::cerr << "Clockwise rectangle area should be -50.\n";
    return 12;
  }

  return 0;
}
