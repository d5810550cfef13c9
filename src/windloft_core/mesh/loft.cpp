#include "windloft_core/mesh/loft.hpp"

#include "windloft_core/mesh/triangulation.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace windloft::core {
SectionBracket find_bounding_sections(const std::vector<CrossSection>& sections,
                                      const double position) {
  if (sections.size() < 2) {
    throw std::invalid_argument("At least two cross sections are required to bracket a position.");
  }

  SectionBracket bracket;
  for (std::size_t k = 1; k < sections.size(); ++k) {
    bracket.index_in = k - 1;
    bracket.index_out = k;
    if (sections[k].position >= position) {
      break;
    }
  }

  const double pos_in = sections[bracket.index_in].position;
  const double pos_out = sections[bracket.index_out].position;
  bracket.weight = std::clamp((position - pos_in) / (pos_out - pos_in), 0.0, 1.0);
  return bracket;
}

void validate_loft_definition(const LoftDefinition& definition) {
  const auto& sections = definition.sections;
  if (sections.size() < 2) {
    throw std::invalid_argument("A loft needs at least two cross sections, got " +
                                std::to_string(sections.size()) + ".");
  }
  const std::size_t points = sections.front().contour.size();
  if (points < 3) {
    throw std::invalid_argument("Cross-section contours need at least three points.");
  }
  for (std::size_t i = 0; i < sections.size(); ++i) {
    if (sections[i].contour.size() != points) {
      throw std::invalid_argument("All cross sections must have the same number of points: section " +
                                  std::to_string(i) + " has " +
                                  std::to_string(sections[i].contour.size()) + ", expected " +
                                  std::to_string(points) + ".");
    }
    if (!std::isfinite(sections[i].position)) {
      throw std::invalid_argument("Cross-section positions must be finite.");
    }
    if (i > 0 && !(sections[i].position > sections[i - 1].position)) {
      throw std::invalid_argument("Cross sections must be sorted by strictly increasing position.");
    }
  }

  validate_discretization(definition.b_divisions);
  if (total_divisions(definition.b_divisions) < 1) {
    throw std::invalid_argument("A loft needs at least one span division.");
  }
  if (!(definition.bscale > 0.0)) {
    throw std::invalid_argument("Loft span scale must be positive.");
  }
  if (!(definition.b_up > definition.b_low)) {
    throw std::invalid_argument("Loft upper span bound must exceed the lower bound.");
  }
}

LoftSpaceTransform::LoftSpaceTransform(const LoftDefinition& definition)
    : bscale_(definition.bscale),
      chord_(fit_spline(definition.chords, definition.spline)),
      twist_(fit_spline(definition.twists, definition.spline)),
      le_x_(fit_spline(definition.le_x, definition.spline)),
      le_z_(fit_spline(definition.le_z, definition.spline)),
      sections_(definition.sections) {
  if (definition.tilt_z) {
    tilt_ = fit_spline(*definition.tilt_z, definition.spline);
  }
}

double LoftSpaceTransform::tilt(const double span) const {
  return tilt_ ? tilt_->evaluate(span) : 0.0;
}

Vec3 LoftSpaceTransform::operator()(const Vec3& coords, const GridIndex& index) const {
  const double span = coords[1];
  const double s = std::abs(span);

  const SectionBracket bracket = find_bounding_sections(sections_, s);
  const std::size_t i = static_cast<std::size_t>(index[0]);
  const Vec2& p_in = sections_[bracket.index_in].contour.at(i);
  const Vec2& p_out = sections_[bracket.index_out].contour.at(i);
  const Vec2 blended = bracket.weight * p_out + (1.0 - bracket.weight) * p_in;

  const double c = chord_.evaluate(s);
  const Vec3 scaled {c * blended[0], c * blended[1], 0.0};
  const Vec3 p = multiply(rotation_matrix(-twist_.evaluate(s), -tilt(s), 0.0), scaled);

  return {
    bscale_ * (p[0] + le_x_.evaluate(s)),
    bscale_ * (span + p[2]),
    bscale_ * (p[1] + le_z_.evaluate(s)),
  };
}

StructuredGrid generate_loft_grid(const LoftDefinition& definition) {
  validate_loft_definition(definition);
  const LoftSpaceTransform transform(definition);

  const int contour_divisions = static_cast<int>(definition.sections.front().contour.size()) - 1;
  StructuredGrid grid = make_grid({0.0, definition.b_low, 0.0}, {1.0, definition.b_up, 0.0},
                                  {contour_divisions, definition.b_divisions, 0}, 0);
  apply_transform(&grid, transform);
  return grid;
}

TriangleSurface generate_loft(const LoftDefinition& definition) {
  return triangulate(generate_loft_grid(definition), 1);
}
}  // namespace windloft::core
