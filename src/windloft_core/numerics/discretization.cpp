#include "windloft_core/numerics/discretization.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace windloft::core {
namespace {
constexpr double kFractionTolerance = 1.0e-6;
constexpr double kUnitRatioTolerance = 1.0e-12;

// Element lengths of n elements spanning `length`, growing geometrically so
// that last / first == ratio.
std::vector<double> stretched_lengths(const double length, const int n, const double ratio) {
  std::vector<double> lengths(static_cast<std::size_t>(n), 0.0);
  if (n <= 0) {
    return lengths;
  }
  const double p = (n > 1) ? std::pow(ratio, 1.0 / static_cast<double>(n - 1)) : 1.0;
  if (std::abs(p - 1.0) < kUnitRatioTolerance) {
    for (double& l : lengths) {
      l = length / static_cast<double>(n);
    }
    return lengths;
  }
  const double first = length * (1.0 - p) / (1.0 - std::pow(p, static_cast<double>(n)));
  double current = first;
  for (int k = 0; k < n; ++k) {
    lengths[static_cast<std::size_t>(k)] = current;
    current *= p;
  }
  return lengths;
}

void append_elements(const std::vector<double>& lengths, std::vector<double>* ts) {
  for (const double l : lengths) {
    ts->push_back(ts->back() + l);
  }
}

void validate_uniform(const UniformDivisions& uniform) {
  if (uniform.divisions < 0) {
    throw std::invalid_argument("Division count must be non-negative, got " +
                                std::to_string(uniform.divisions) + ".");
  }
  if (!(uniform.stretching > 0.0) || !std::isfinite(uniform.stretching)) {
    throw std::invalid_argument("Stretching ratio must be positive and finite.");
  }
}

void validate_sections(const MultiSection& sections) {
  if (sections.empty()) {
    throw std::invalid_argument("Multi-section descriptor must contain at least one section.");
  }
  double fraction_sum = 0.0;
  for (std::size_t i = 0; i < sections.size(); ++i) {
    const DiscretizationSection& section = sections[i];
    if (!(section.fraction > 0.0)) {
      throw std::invalid_argument("Section " + std::to_string(i) +
                                  " must cover a positive length fraction.");
    }
    if (section.divisions < 1) {
      throw std::invalid_argument("Section " + std::to_string(i) +
                                  " must have at least one division.");
    }
    if (!(section.stretching > 0.0) || !std::isfinite(section.stretching)) {
      throw std::invalid_argument("Section " + std::to_string(i) +
                                  " stretching ratio must be positive and finite.");
    }
    fraction_sum += section.fraction;
  }
  if (std::abs(fraction_sum - 1.0) > kFractionTolerance) {
    throw std::invalid_argument("Section length fractions must sum to 1, got " +
                                std::to_string(fraction_sum) + ".");
  }
}
}  // namespace

int total_divisions(const Discretization& discretization) {
  if (const auto* uniform = std::get_if<UniformDivisions>(&discretization)) {
    return uniform->divisions;
  }
  int total = 0;
  for (const DiscretizationSection& section : std::get<MultiSection>(discretization)) {
    total += section.divisions;
  }
  return total;
}

void validate_discretization(const Discretization& discretization) {
  std::visit(
    [](const auto& value) {
      using T = std::decay_t<decltype(value)>;
      if constexpr (std::is_same_v<T, UniformDivisions>) {
        validate_uniform(value);
      } else {
        validate_sections(value);
      }
    },
    discretization);
}

std::vector<double> discretize_parameter(const double t0, const double t1,
                                         const Discretization& discretization) {
  validate_discretization(discretization);

  const double length = t1 - t0;
  std::vector<double> ts;
  ts.reserve(static_cast<std::size_t>(total_divisions(discretization)) + 1);
  ts.push_back(t0);

  if (const auto* uniform = std::get_if<UniformDivisions>(&discretization)) {
    const int n = uniform->divisions;
    if (n == 0) {
      return ts;
    }
    if (uniform->central && n > 1) {
      const int n_first = n / 2;
      const int n_second = n - n_first;
      append_elements(stretched_lengths(0.5 * length, n_first, uniform->stretching), &ts);
      append_elements(stretched_lengths(0.5 * length, n_second, 1.0 / uniform->stretching), &ts);
    } else {
      append_elements(stretched_lengths(length, n, uniform->stretching), &ts);
    }
  } else {
    for (const DiscretizationSection& section : std::get<MultiSection>(discretization)) {
      const double ratio = section.reverse ? 1.0 / section.stretching : section.stretching;
      append_elements(stretched_lengths(section.fraction * length, section.divisions, ratio),
                      &ts);
    }
  }

  ts.back() = t1;
  return ts;
}
}  // namespace windloft::core
