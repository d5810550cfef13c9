#include "windloft_core/numerics/spline.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace windloft::core {
namespace {
constexpr int kMaxSmoothingBisections = 200;
constexpr double kLambdaDecades = 14.0;

struct PentadiagonalSystem {
  // Symmetric band storage: diag[i] = A(i,i), upper1[i] = A(i,i+1), upper2[i] = A(i,i+2).
  std::vector<double> diag;
  std::vector<double> upper1;
  std::vector<double> upper2;
};

// LDL^T solve of a symmetric positive definite pentadiagonal system.
std::vector<double> solve_pentadiagonal(const PentadiagonalSystem& system,
                                        const std::vector<double>& rhs) {
  const std::size_t m = system.diag.size();
  std::vector<double> d(m, 0.0);
  std::vector<double> l1(m, 0.0);
  std::vector<double> l2(m, 0.0);

  for (std::size_t i = 0; i < m; ++i) {
    if (i >= 2) {
      l2[i] = system.upper2[i - 2] / d[i - 2];
    }
    if (i >= 1) {
      double a = system.upper1[i - 1];
      if (i >= 2) {
        a -= l2[i] * d[i - 2] * l1[i - 1];
      }
      l1[i] = a / d[i - 1];
    }
    double di = system.diag[i];
    if (i >= 1) {
      di -= l1[i] * l1[i] * d[i - 1];
    }
    if (i >= 2) {
      di -= l2[i] * l2[i] * d[i - 2];
    }
    if (!(std::abs(di) > 0.0)) {
      throw std::runtime_error("Singular spline system.");
    }
    d[i] = di;
  }

  std::vector<double> z(rhs);
  for (std::size_t i = 0; i < m; ++i) {
    if (i >= 1) {
      z[i] -= l1[i] * z[i - 1];
    }
    if (i >= 2) {
      z[i] -= l2[i] * z[i - 2];
    }
  }
  for (std::size_t i = 0; i < m; ++i) {
    z[i] /= d[i];
  }
  for (std::size_t k = m; k-- > 0;) {
    if (k + 1 < m) {
      z[k] -= l1[k + 1] * z[k + 1];
    }
    if (k + 2 < m) {
      z[k] -= l2[k + 2] * z[k + 2];
    }
  }
  return z;
}

// Second-difference operator Q (Green & Silverman): column c belongs to interior
// node c + 1 and touches rows c, c + 1, c + 2.
struct SecondDifference {
  std::vector<std::array<double, 3>> columns;
};

SecondDifference build_second_difference(const std::vector<double>& h) {
  SecondDifference q;
  const std::size_t m = h.size() - 1;
  q.columns.resize(m);
  for (std::size_t c = 0; c < m; ++c) {
    q.columns[c] = {1.0 / h[c], -1.0 / h[c] - 1.0 / h[c + 1], 1.0 / h[c + 1]};
  }
  return q;
}

struct SmoothingSolution {
  std::vector<double> values;
  double residual_sum = 0.0;
};

// Solves (R + lambda Q^T Q) gamma = Q^T y and returns g = y - lambda Q gamma.
SmoothingSolution solve_smoothing(const std::vector<double>& h, const SecondDifference& q,
                                  const std::vector<double>& y, const double lambda) {
  const std::size_t n = y.size();
  const std::size_t m = q.columns.size();

  PentadiagonalSystem system;
  system.diag.assign(m, 0.0);
  system.upper1.assign(m, 0.0);
  system.upper2.assign(m, 0.0);
  std::vector<double> rhs(m, 0.0);

  for (std::size_t c = 0; c < m; ++c) {
    const auto& col = q.columns[c];
    system.diag[c] = (h[c] + h[c + 1]) / 3.0 +
                     lambda * (col[0] * col[0] + col[1] * col[1] + col[2] * col[2]);
    if (c + 1 < m) {
      const auto& next = q.columns[c + 1];
      system.upper1[c] = h[c + 1] / 6.0 + lambda * (col[1] * next[0] + col[2] * next[1]);
    }
    if (c + 2 < m) {
      system.upper2[c] = lambda * col[2] * q.columns[c + 2][0];
    }
    rhs[c] = col[0] * y[c] + col[1] * y[c + 1] + col[2] * y[c + 2];
  }

  const std::vector<double> gamma = solve_pentadiagonal(system, rhs);

  std::vector<double> q_gamma(n, 0.0);
  for (std::size_t c = 0; c < m; ++c) {
    for (std::size_t r = 0; r < 3; ++r) {
      q_gamma[c + r] += q.columns[c][r] * gamma[c];
    }
  }

  SmoothingSolution solution;
  solution.values.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double residual = lambda * q_gamma[i];
    solution.values[i] = y[i] - residual;
    solution.residual_sum += residual * residual;
  }
  return solution;
}

// Node values of the natural cubic smoothing spline whose residual sum stays
// within the smoothing bound.
std::vector<double> smooth_values(const std::vector<double>& x, const std::vector<double>& y,
                                  const double smoothing) {
  if (smoothing <= 0.0 || x.size() < 3) {
    return y;
  }
  std::vector<double> h(x.size() - 1);
  for (std::size_t i = 0; i + 1 < x.size(); ++i) {
    h[i] = x[i + 1] - x[i];
  }
  const SecondDifference q = build_second_difference(h);

  // Residual sum grows monotonically with lambda; bisect in log space.
  const double span = x.back() - x.front();
  const double log_center = std::log10(span * span * span / static_cast<double>(x.size()));
  double log_lo = log_center - kLambdaDecades;
  double log_hi = log_center + kLambdaDecades;

  SmoothingSolution upper = solve_smoothing(h, q, y, std::pow(10.0, log_hi));
  if (upper.residual_sum <= smoothing) {
    return upper.values;
  }
  SmoothingSolution best = solve_smoothing(h, q, y, std::pow(10.0, log_lo));
  if (best.residual_sum > smoothing) {
    return y;
  }

  for (int iter = 0; iter < kMaxSmoothingBisections; ++iter) {
    const double log_mid = 0.5 * (log_lo + log_hi);
    SmoothingSolution trial = solve_smoothing(h, q, y, std::pow(10.0, log_mid));
    if (trial.residual_sum <= smoothing) {
      best = std::move(trial);
      log_lo = log_mid;
    } else {
      log_hi = log_mid;
    }
    if (log_hi - log_lo < 1.0e-10) {
      break;
    }
  }
  return best.values;
}

// Dense Gaussian elimination with partial pivoting; a is row-major n x n.
std::vector<double> solve_dense(std::vector<double> a, std::vector<double> b) {
  const std::size_t n = b.size();
  for (std::size_t col = 0; col < n; ++col) {
    std::size_t pivot = col;
    for (std::size_t row = col + 1; row < n; ++row) {
      if (std::abs(a[row * n + col]) > std::abs(a[pivot * n + col])) {
        pivot = row;
      }
    }
    if (!(std::abs(a[pivot * n + col]) > 0.0)) {
      throw std::runtime_error("Singular spline system.");
    }
    if (pivot != col) {
      for (std::size_t k = col; k < n; ++k) {
        std::swap(a[col * n + k], a[pivot * n + k]);
      }
      std::swap(b[col], b[pivot]);
    }
    for (std::size_t row = col + 1; row < n; ++row) {
      const double factor = a[row * n + col] / a[col * n + col];
      if (factor == 0.0) {
        continue;
      }
      for (std::size_t k = col; k < n; ++k) {
        a[row * n + k] -= factor * a[col * n + k];
      }
      b[row] -= factor * b[col];
    }
  }
  std::vector<double> x(n, 0.0);
  for (std::size_t row = n; row-- > 0;) {
    double sum = b[row];
    for (std::size_t k = row + 1; k < n; ++k) {
      sum -= a[row * n + k] * x[k];
    }
    x[row] = sum / a[row * n + row];
  }
  return x;
}

// Knot span holding x, clamped to the first and last polynomial pieces so that
// points outside the knot range extend the end polynomials.
std::size_t find_span(const std::vector<double>& knots, const int degree,
                      const std::size_t n_coefficients, const double x) {
  const auto it = std::upper_bound(knots.begin(), knots.end(), x);
  const std::ptrdiff_t upper = it - knots.begin() - 1;
  const std::ptrdiff_t lo = degree;
  const std::ptrdiff_t hi = static_cast<std::ptrdiff_t>(n_coefficients) - 1;
  return static_cast<std::size_t>(std::min(std::max(upper, lo), hi));
}

// Non-zero B-spline basis functions N[span - degree .. span] at x.
std::vector<double> basis_functions(const std::vector<double>& knots, const int degree,
                                    const std::size_t span, const double x) {
  const std::size_t p = static_cast<std::size_t>(degree);
  std::vector<double> n(p + 1, 0.0);
  std::vector<double> left(p + 1, 0.0);
  std::vector<double> right(p + 1, 0.0);
  n[0] = 1.0;
  for (std::size_t j = 1; j <= p; ++j) {
    left[j] = x - knots[span + 1 - j];
    right[j] = knots[span + j] - x;
    double saved = 0.0;
    for (std::size_t r = 0; r < j; ++r) {
      const double temp = n[r] / (right[r + 1] + left[j - r]);
      n[r] = saved + right[r + 1] * temp;
      saved = left[j - r] * temp;
    }
    n[j] = saved;
  }
  return n;
}

double evaluate_bspline(const std::vector<double>& knots, const std::vector<double>& coefficients,
                        const int degree, const double x) {
  const std::size_t span = find_span(knots, degree, coefficients.size(), x);
  const std::vector<double> n = basis_functions(knots, degree, span, x);
  const std::size_t first = span - static_cast<std::size_t>(degree);
  double value = 0.0;
  for (std::size_t j = 0; j < n.size(); ++j) {
    value += coefficients[first + j] * n[j];
  }
  return value;
}

// Clamped knot vector with not-a-knot interior knots: data sites for odd
// degree, midpoints between sites for even degree.
std::vector<double> interpolation_knots(const std::vector<double>& x, const int degree) {
  const std::size_t n = x.size();
  const std::size_t k = static_cast<std::size_t>(degree);
  std::vector<double> knots(k + 1, x.front());
  if (k % 2 == 1) {
    const std::size_t k2 = (k + 1) / 2;
    for (std::size_t i = k2; i + k2 < n; ++i) {
      knots.push_back(x[i]);
    }
  } else {
    const std::size_t k2 = k / 2;
    for (std::size_t i = k2; i + k2 + 1 < n; ++i) {
      knots.push_back(0.5 * (x[i] + x[i + 1]));
    }
  }
  knots.insert(knots.end(), k + 1, x.back());
  return knots;
}

// Coefficients of the degree-k spline on knots that passes through (x, y).
std::vector<double> interpolate(const std::vector<double>& knots, const int degree,
                                const std::vector<double>& x, const std::vector<double>& y) {
  const std::size_t n = x.size();
  std::vector<double> a(n * n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t span = find_span(knots, degree, n, x[i]);
    const std::vector<double> basis = basis_functions(knots, degree, span, x[i]);
    const std::size_t first = span - static_cast<std::size_t>(degree);
    for (std::size_t j = 0; j < basis.size(); ++j) {
      a[i * n + first + j] = basis[j];
    }
  }
  return solve_dense(std::move(a), y);
}

struct PolynomialFit {
  std::vector<double> knots;
  std::vector<double> coefficients;
  double residual_sum = 0.0;
};

// Least-squares polynomial of the given degree in Bernstein form.
PolynomialFit fit_polynomial(const std::vector<double>& x, const std::vector<double>& y,
                             const int degree) {
  const std::size_t m = static_cast<std::size_t>(degree) + 1;
  PolynomialFit fit;
  fit.knots.assign(m, x.front());
  fit.knots.insert(fit.knots.end(), m, x.back());

  std::vector<double> normal(m * m, 0.0);
  std::vector<double> rhs(m, 0.0);
  for (std::size_t i = 0; i < x.size(); ++i) {
    const std::vector<double> basis =
      basis_functions(fit.knots, degree, static_cast<std::size_t>(degree), x[i]);
    for (std::size_t r = 0; r < m; ++r) {
      rhs[r] += basis[r] * y[i];
      for (std::size_t c = 0; c < m; ++c) {
        normal[r * m + c] += basis[r] * basis[c];
      }
    }
  }
  fit.coefficients = solve_dense(std::move(normal), rhs);
  for (std::size_t i = 0; i < x.size(); ++i) {
    const double r = evaluate_bspline(fit.knots, fit.coefficients, degree, x[i]) - y[i];
    fit.residual_sum += r * r;
  }
  return fit;
}

void validate_points(const std::vector<double>& x, const std::vector<double>& y) {
  if (x.size() != y.size()) {
    throw std::invalid_argument("Spline positions and values must have the same length.");
  }
  if (x.size() < 2) {
    throw std::invalid_argument("Spline fit needs at least two control points.");
  }
  for (std::size_t i = 0; i < x.size(); ++i) {
    if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
      throw std::invalid_argument("Spline control points must be finite.");
    }
    if (i > 0 && !(x[i] > x[i - 1])) {
      throw std::invalid_argument("Spline positions must be strictly increasing (index " +
                                  std::to_string(i) + ").");
    }
  }
}
}  // namespace

Spline fit_spline(const std::vector<double>& x, const std::vector<double>& y,
                  const SplineOptions& options) {
  validate_points(x, y);
  if (options.degree < 1) {
    throw std::invalid_argument("Spline degree must be >= 1.");
  }
  if (!(options.smoothing >= 0.0)) {
    throw std::invalid_argument("Spline smoothing must be non-negative.");
  }

  Spline spline;
  spline.degree_ = std::min(options.degree, static_cast<int>(x.size()) - 1);
  spline.boundary_ = options.boundary;
  spline.x_min_ = x.front();
  spline.x_max_ = x.back();

  bool fitted = false;
  if (spline.degree_ >= 2 && options.smoothing > 0.0 &&
      x.size() > static_cast<std::size_t>(spline.degree_) + 1) {
    // A single polynomial piece is the smoothest candidate; take it when it
    // already meets the residual bound.
    PolynomialFit polynomial = fit_polynomial(x, y, spline.degree_);
    if (polynomial.residual_sum <= options.smoothing) {
      spline.knots_ = std::move(polynomial.knots);
      spline.coefficients_ = std::move(polynomial.coefficients);
      fitted = true;
    }
  }
  if (!fitted) {
    // Degree 1 passes through the samples regardless of smoothing.
    const std::vector<double> values =
      spline.degree_ == 1 ? y : smooth_values(x, y, options.smoothing);
    spline.knots_ = interpolation_knots(x, spline.degree_);
    spline.coefficients_ = interpolate(spline.knots_, spline.degree_, x, values);
  }

  const std::size_t nc = spline.coefficients_.size();
  const double k = static_cast<double>(spline.degree_);
  spline.derivative_coefficients_.resize(nc - 1);
  for (std::size_t i = 0; i + 1 < nc; ++i) {
    const double dt =
      spline.knots_[i + static_cast<std::size_t>(spline.degree_) + 1] - spline.knots_[i + 1];
    spline.derivative_coefficients_[i] =
      dt > 0.0 ? k * (spline.coefficients_[i + 1] - spline.coefficients_[i]) / dt : 0.0;
  }
  return spline;
}

Spline fit_spline(const DistributionCurve& points, const SplineOptions& options) {
  std::vector<double> x;
  std::vector<double> y;
  x.reserve(points.size());
  y.reserve(points.size());
  for (const auto& point : points) {
    x.push_back(point[0]);
    y.push_back(point[1]);
  }
  return fit_spline(x, y, options);
}

void Spline::require_fitted() const {
  if (coefficients_.empty()) {
    throw std::logic_error("Spline has not been fitted.");
  }
}

double Spline::evaluate(const double x) const {
  require_fitted();
  if (x < x_min_ || x > x_max_) {
    switch (boundary_) {
      case SplineBoundary::kNearest:
        return evaluate_bspline(knots_, coefficients_, degree_, x < x_min_ ? x_min_ : x_max_);
      case SplineBoundary::kZero:
        return 0.0;
      case SplineBoundary::kError:
        throw std::out_of_range("Spline evaluated outside its fitted range at x=" +
                                std::to_string(x) + ".");
      case SplineBoundary::kExtrapolate:
      default:
        break;
    }
  }
  return evaluate_bspline(knots_, coefficients_, degree_, x);
}

double Spline::derivative(const double x) const {
  require_fitted();
  if (x < x_min_ || x > x_max_) {
    switch (boundary_) {
      case SplineBoundary::kNearest:
      case SplineBoundary::kZero:
        return 0.0;
      case SplineBoundary::kError:
        throw std::out_of_range("Spline derivative evaluated outside its fitted range.");
      case SplineBoundary::kExtrapolate:
      default:
        break;
    }
  }
  const std::vector<double> knots(knots_.begin() + 1, knots_.end() - 1);
  return evaluate_bspline(knots, derivative_coefficients_, degree_ - 1, x);
}

std::vector<double> sample(const Spline& spline, const std::vector<double>& xs) {
  std::vector<double> out;
  out.reserve(xs.size());
  for (const double x : xs) {
    out.push_back(spline.evaluate(x));
  }
  return out;
}
}  // namespace windloft::core
