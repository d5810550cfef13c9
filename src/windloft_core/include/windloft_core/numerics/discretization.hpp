#pragma once

#include <functional>
#include <variant>
#include <vector>

namespace windloft::core {
struct UniformDivisions {
  UniformDivisions(const int count = 0, const double ratio = 1.0, const bool is_central = false)
      : divisions(count), stretching(ratio), central(is_central) {}

  int divisions;
  double stretching;  // last element length / first element length
  bool central;       // stretch symmetrically about the midpoint
};

// One piece of a multi-section descriptor.
struct DiscretizationSection {
  double fraction = 1.0;  // share of the total length
  int divisions = 1;
  double stretching = 1.0;
  bool reverse = false;  // stretch from the far end of the section
};

using MultiSection = std::vector<DiscretizationSection>;

// Either a plain division count or a multi-section descriptor.
using Discretization = std::variant<UniformDivisions, MultiSection>;

// Sum of divisions; the discretization yields total_divisions + 1 points.
int total_divisions(const Discretization& discretization);

// Throws std::invalid_argument on negative counts, non-positive stretching,
// empty descriptors or section fractions that do not sum to 1.
void validate_discretization(const Discretization& discretization);

// Parameter values in [t0, t1], first and last included.
std::vector<double> discretize_parameter(double t0, double t1,
                                         const Discretization& discretization);

template <typename Point>
std::vector<Point> discretize(const std::function<Point(double)>& fun, const double t0,
                              const double t1, const Discretization& discretization) {
  const std::vector<double> ts = discretize_parameter(t0, t1, discretization);
  std::vector<Point> out;
  out.reserve(ts.size());
  for (const double t : ts) {
    out.push_back(fun(t));
  }
  return out;
}
}  // namespace windloft::core
