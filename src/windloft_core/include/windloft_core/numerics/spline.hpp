#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace windloft::core {
enum class SplineBoundary {
  kExtrapolate = 0,
  kNearest,
  kZero,
  kError,
};

struct SplineOptions {
  int degree = 5;
  double smoothing = 0.001;  // upper bound on the sum of squared residuals
  SplineBoundary boundary = SplineBoundary::kExtrapolate;
};

// (position, value) pairs, strictly increasing in position.
using DistributionCurve = std::vector<std::array<double, 2>>;

// Fitted 1D curve stored as a clamped B-spline of the effective degree.
// Smoothing pulls the node values towards a smoother curve before the
// degree-k interpolant is built; polynomials of the fitted degree are
// reproduced exactly.
class Spline {
 public:
  Spline() = default;

  double evaluate(double x) const;
  double derivative(double x) const;
  double operator()(const double x) const { return evaluate(x); }

  int degree() const { return degree_; }
  double x_min() const { return x_min_; }
  double x_max() const { return x_max_; }
  const std::vector<double>& knots() const { return knots_; }
  const std::vector<double>& coefficients() const { return coefficients_; }

 private:
  friend Spline fit_spline(const std::vector<double>& x, const std::vector<double>& y,
                           const SplineOptions& options);

  void require_fitted() const;

  int degree_ = 1;
  SplineBoundary boundary_ = SplineBoundary::kExtrapolate;
  double x_min_ = 0.0;
  double x_max_ = 0.0;
  std::vector<double> knots_;
  std::vector<double> coefficients_;
  // Coefficients of the derivative on knots_[1 .. size - 2], degree_ - 1.
  std::vector<double> derivative_coefficients_;
};

// The effective degree is min(options.degree, points.size() - 1).
Spline fit_spline(const DistributionCurve& points, const SplineOptions& options = {});
Spline fit_spline(const std::vector<double>& x, const std::vector<double>& y,
                  const SplineOptions& options = {});

std::vector<double> sample(const Spline& spline, const std::vector<double>& xs);
}  // namespace windloft::core
