#include "windloft_core/numerics/spline.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <vector>

int main() {
  namespace wl = windloft::core;

  // Two points always degrade to a straight line.
  const wl::Spline line = wl::fit_spline(wl::DistributionCurve {{0.0, 1.0}, {1.0, 0.5}});
  if (line.degree() != 1) {
    std::cerr << "Expected degree 1 for two points, got " << line.degree() << "\n";
    return 1;
  }
  if (std::abs(line(0.5) - 0.75) > 1.0e-14) {
    std::cerr << "Linear interpolation mismatch: " << line(0.5) << "\n";
    return 2;
  }
  if (std::abs(line(2.0) - 0.0) > 1.0e-14) {
    std::cerr << "Linear extrapolation mismatch: " << line(2.0) << "\n";
    return 3;
  }

  const wl::Spline clamped =
    wl::fit_spline(wl::DistributionCurve {{0.0, 0.0}, {1.0, 1.0}, {2.0, 0.0}, {3.0, 1.0}});
  if (clamped.degree() != 3) {
    std::cerr << "Degree should clamp to point count - 1, got " << clamped.degree() << "\n";
    return 4;
  }

  // Smoothing zero reproduces the samples.
  std::vector<double> x;
  std::vector<double> y;
  for (int i = 0; i <= 10; ++i) {
    x.push_back(0.1 * i);
    y.push_back(std::sin(3.0 * x.back()));
  }
  wl::SplineOptions exact;
  exact.degree = 3;
  exact.smoothing = 0.0;
  const wl::Spline interpolant = wl::fit_spline(x, y, exact);
  for (std::size_t i = 0; i < x.size(); ++i) {
    if (std::abs(interpolant(x[i]) - y[i]) > 1.0e-10) {
      std::cerr << "Interpolant misses sample " << i << "\n";
      return 5;
    }
  }
  if (std::abs(interpolant(0.55) - std::sin(1.65)) > 2.0e-3) {
    std::cerr << "Interpolant is inaccurate between samples: " << interpolant(0.55) << "\n";
    return 6;
  }

  // Smoothing keeps the residual sum within the requested bound.
  std::vector<double> noisy = y;
  for (std::size_t i = 0; i < noisy.size(); ++i) {
    noisy[i] += (i % 2 == 0 ? 0.02 : -0.02);
  }
  wl::SplineOptions smooth;
  smooth.smoothing = 0.002;
  const wl::Spline smoothed = wl::fit_spline(x, noisy, smooth);
  double residual_sum = 0.0;
  for (std::size_t i = 0; i < x.size(); ++i) {
    const double r = smoothed(x[i]) - noisy[i];
    residual_sum += r * r;
  }
  if (residual_sum > 0.002 + 1.0e-9) {
    std::cerr << "Residual sum " << residual_sum << " exceeds smoothing bound.\n";
    return 7;
  }
  if (residual_sum < 1.0e-4) {
    std::cerr << "Smoothing spline did not smooth the alternating noise.\n";
    return 8;
  }

  // Linear data is untouched by smoothing.
  const wl::Spline straight = wl::fit_spline(
    wl::DistributionCurve {{0.0, 1.0}, {0.2, 1.4}, {0.5, 2.0}, {0.7, 2.4}, {1.0, 3.0}, {1.3, 3.6}});
  if (std::abs(straight(0.37) - 1.74) > 1.0e-9) {
    std::cerr << "Smoothing distorted linear data: " << straight(0.37) << "\n";
    return 9;
  }

  wl::SplineOptions nearest;
  nearest.degree = 1;
  nearest.boundary = wl::SplineBoundary::kNearest;
  const wl::Spline held = wl::fit_spline(wl::DistributionCurve {{0.0, 2.0}, {1.0, 4.0}}, nearest);
  if (held(-1.0) != 2.0 || held(3.0) != 4.0) {
    std::cerr << "Nearest boundary does not hold the end values.\n";
    return 10;
  }

  wl::SplineOptions zero = nearest;
  zero.boundary = wl::SplineBoundary::kZero;
  if (wl::fit_spline(wl::DistributionCurve {{0.0, 2.0}, {1.0, 4.0}}, zero)(1.5) != 0.0) {
    return 11;
  }

  wl::SplineOptions strict = nearest;
  strict.boundary = wl::SplineBoundary::kError;
  const wl::Spline bounded = wl::fit_spline(wl::DistributionCurve {{0.0, 2.0}, {1.0, 4.0}}, strict);
  bool threw = false;
  try {
    static_cast<void>(bounded(1.01));
  } catch (const std::out_of_range&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Error boundary did not throw outside the range.\n";
    return 12;
  }

  threw = false;
  try {
    static_cast<void>(wl::fit_spline(wl::DistributionCurve {{0.0, 1.0}, {0.5, 2.0}, {0.4, 3.0}}));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "Unsorted positions were accepted.\n";
    return 13;
  }

  threw = false;
  try {
    static_cast<void>(wl::fit_spline(wl::DistributionCurve {{0.0, 1.0}}));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    std::cerr << "A single point was accepted.\n";
    return 14;
  }

  // k + 1 samples of a degree-k polynomial give back that polynomial.
  wl::SplineOptions cubic;
  cubic.degree = 3;
  cubic.smoothing = 0.0;
  const wl::Spline cube =
    wl::fit_spline(wl::DistributionCurve {{0.0, 0.0}, {1.0, 1.0}, {2.0, 8.0}, {3.0, 27.0}}, cubic);
  if (std::abs(cube(0.5) - 0.125) > 1.0e-9 || std::abs(cube(2.5) - 15.625) > 1.0e-9 ||
      std::abs(cube.derivative(2.0) - 12.0) > 1.0e-9) {
    std::cerr << "Cubic fit of x^3 gives " << cube(0.5) << ", " << cube(2.5) << "\n";
    return 16;
  }
  wl::SplineOptions quadratic = cubic;
  quadratic.degree = 2;
  const wl::Spline square =
    wl::fit_spline(wl::DistributionCurve {{0.0, 0.0}, {1.0, 1.0}, {2.0, 4.0}}, quadratic);
  if (square.degree() != 2 || std::abs(square(0.5) - 0.25) > 1.0e-12 ||
      std::abs(square(-1.0) - 1.0) > 1.0e-12) {
    std::cerr << "Quadratic fit of x^2 gives " << square(0.5) << "\n";
    return 17;
  }

  // Uneven sites and more samples than coefficients still reproduce the polynomial.
  const std::vector<double> sites {0.0, 0.4, 1.1, 1.5, 2.2, 3.0, 3.3};
  std::vector<double> cubic_values;
  for (const double s : sites) {
    cubic_values.push_back(s * s * s - 2.0 * s);
  }
  const wl::Spline uneven = wl::fit_spline(sites, cubic_values, cubic);
  for (const double s : {0.7, 2.6, 4.0, -1.0}) {
    if (std::abs(uneven(s) - (s * s * s - 2.0 * s)) > 1.0e-9) {
      std::cerr << "Not-a-knot cubic misses x^3 - 2x at " << s << "\n";
      return 18;
    }
  }
  const std::vector<double> quartic_sites {0.0, 0.5, 0.9, 1.6, 2.0, 2.4, 3.1, 3.5};
  std::vector<double> quartic_values;
  for (const double s : quartic_sites) {
    quartic_values.push_back(s * s * s * s - s * s + 1.0);
  }
  wl::SplineOptions quartic;
  quartic.degree = 4;
  quartic.smoothing = 0.0;
  const wl::Spline even = wl::fit_spline(quartic_sites, quartic_values, quartic);
  if (std::abs(even(2.6) - (std::pow(2.6, 4) - 2.6 * 2.6 + 1.0)) > 1.0e-9 ||
      std::abs(even.derivative(1.0) - 2.0) > 1.0e-9) {
    std::cerr << "Quartic fit does not reproduce its polynomial.\n";
    return 19;
  }
  wl::SplineOptions loose = cubic;
  loose.smoothing = 0.01;
  const wl::Spline relaxed = wl::fit_spline(sites, cubic_values, loose);
  if (std::abs(relaxed(2.6) - (2.6 * 2.6 * 2.6 - 5.2)) > 1.0e-9) {
    std::cerr << "Smoothing bent exact cubic data: " << relaxed(2.6) << "\n";
    return 20;
  }

  const std::vector<double> samples = wl::sample(line, {0.0, 0.25, 1.0});
  if (samples.size() != 3 || std::abs(samples[1] - 0.875) > 1.0e-14) {
    return 15;
  }

  return 0;
}
